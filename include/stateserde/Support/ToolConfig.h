//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Configuration model for the `stateserdec` generator.
///
/// Values come from an optional JSON file and are then overridden by
/// command-line flags.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_SUPPORT_TOOL_CONFIG_H
#define STATESERDE_SUPPORT_TOOL_CONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace stateserde
{

/// @brief Generator settings shared by the driver and the emitter.
struct ToolConfig final
{
    /// @brief Root directory receiving generated headers.
    std::string outDir;

    /// @brief Extension of generated headers, including the dot.
    std::string headerExtension{".hpp"};

    /// @brief Header included by every generated file to pull in the runtime protocols.
    std::string runtimeInclude{"stateserde/Runtime/StateSerde.h"};

    /// @brief Namespace components prepended to every schema namespace.
    std::vector<std::string> namespacePrefix;

    /// @brief Compute outputs without writing files.
    bool dryRun{false};

    /// @brief Fail instead of replacing existing files.
    bool noOverwrite{false};

    /// @brief Also write a make depfile next to every header.
    bool depfile{false};

    /// @brief Print inference notes and per-file progress.
    bool verbose{false};
};

/// @brief Splits `a::b`, `a.b` or `a` into namespace components.
/// @param[in] text Namespace spelling; empty text yields no components.
/// @return Components, or an error when a component is empty.
llvm::Expected<std::vector<std::string>> splitNamespace(llvm::StringRef text);

/// @brief Applies a JSON configuration document on top of `config`.
/// @details Unknown keys and values of the wrong kind are errors so that typos do not go unnoticed.
/// @param[in] text JSON text.
/// @param[in,out] config Configuration to update.
/// @return Success or a descriptive error.
llvm::Error applyToolConfigJson(llvm::StringRef text, ToolConfig& config);

/// @brief Reads a JSON configuration file and applies it on top of `config`.
/// @param[in] path File path.
/// @param[in,out] config Configuration to update.
/// @return Success or a descriptive error naming the file.
llvm::Error loadToolConfigFile(llvm::StringRef path, ToolConfig& config);

}  // namespace stateserde

#endif  // STATESERDE_SUPPORT_TOOL_CONFIG_H
