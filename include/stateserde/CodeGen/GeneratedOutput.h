//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Writing generated headers and the make depfiles that describe them.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_CODEGEN_GENERATEDOUTPUT_H
#define STATESERDE_CODEGEN_GENERATEDOUTPUT_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace stateserde
{

/// @brief How `stateserdec cpp` touches the output tree.
struct OutputPolicy final
{
    /// @brief Report outputs without creating or modifying any file.
    bool dryRun{false};

    /// @brief Fail instead of replacing a file that already exists.
    bool noOverwrite{false};

    /// @brief Leave written files at mode 0444 rather than 0644.
    bool readOnly{true};

    /// @brief When set, receives the absolute path of every file written, or in a dry run, every file that would be.
    std::vector<std::string>* written{nullptr};
};

/// @brief One rendered header and the schema files it was generated from.
struct GeneratedHeader final
{
    std::string path;
    std::string content;
    std::vector<std::string> schemaSources;
};

/// @brief Returns `path` made absolute with `.` and `..` components folded away.
std::string absoluteOutputPath(llvm::StringRef path);

/// @brief Writes `content` to `path`, creating parent directories.
///
/// @details
/// An existing file is removed first so read-only output from an earlier
/// run is replaced, unless @ref OutputPolicy::noOverwrite is set.
///
/// @return Success or an I/O error naming the path.
llvm::Error writeOutputFile(llvm::StringRef path, llvm::StringRef content, const OutputPolicy& policy);

/// @brief Renders `target: source...` as one make rule.
///
/// Sources are sorted and de-duplicated. Spaces, `#`, `:` and `\` are
/// backslash-escaped and `$` is doubled.
std::string renderDepfileRule(llvm::StringRef target, const std::vector<std::string>& sources);

/// @brief Writes `header` and, when `withDepfile` is set, `<header.path>.d` listing its schema sources.
///
/// Paths in the depfile are absolute.
llvm::Error writeGeneratedHeader(const GeneratedHeader& header, bool withDepfile, const OutputPolicy& policy);

}  // namespace stateserde

#endif  // STATESERDE_CODEGEN_GENERATEDOUTPUT_H
