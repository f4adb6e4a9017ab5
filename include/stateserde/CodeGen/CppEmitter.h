//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Public entry points and options for C++ header emission.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_CODEGEN_CPPEMITTER_H
#define STATESERDE_CODEGEN_CPPEMITTER_H

#include "stateserde/CodeGen/GeneratedOutput.h"

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace stateserde
{
class DiagnosticEngine;
struct SchemaUnit;
struct SemanticModule;

/// @file
/// @brief C++ backend emission entry points.

/// @brief Configuration options for C++ code generation.
struct CppEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief Extension of generated headers, including the dot.
    std::string headerExtension{".hpp"};

    /// @brief Runtime header included by every generated header.
    std::string runtimeInclude{"stateserde/Runtime/StateSerde.h"};

    /// @brief Relative schema paths to emit; empty selects every schema file.
    std::vector<std::string> selectedSchemas;

    /// @brief Also write `<header>.d` make depfiles.
    bool writeDepfiles{false};

    /// @brief How headers and depfiles are written.
    OutputPolicy outputPolicy;
};

/// @brief Returns the output path of a unit's header, relative to the output root.
/// @param[in] unit Schema file.
/// @param[in] headerExtension Extension replacing the schema extension.
/// @return Path such as `demo/model.hpp`.
std::string generatedHeaderPath(const SchemaUnit& unit, llvm::StringRef headerExtension);

/// @brief Renders the header for one schema file.
///
/// @details
/// The header defines every type of the file and specializes
/// `stateserde::StateEncoder` / `stateserde::StateDecoder` for each of them.
/// Specializations that still have template parameters carry their inferred
/// constraints as a requires-clause and define their members in class. Full
/// specializations (a pinned context and no generic parameters) are declared
/// first and defined after every declaration, so mutually recursive types
/// can refer to each other.
///
/// @param[in] semantic Analyzed module; used to resolve referenced headers.
/// @param[in] unit Schema file to render.
/// @param[in] options Backend configuration.
/// @return Header text.
std::string renderCppHeader(const SemanticModule& semantic, const SchemaUnit& unit, const CppEmitOptions& options);

/// @brief Emits one header per selected schema file.
/// @param[in] semantic Analyzed module.
/// @param[in] options Backend configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or detailed failure.
llvm::Error emitCpp(const SemanticModule& semantic, const CppEmitOptions& options, DiagnosticEngine& diagnostics);

}  // namespace stateserde

#endif  // STATESERDE_CODEGEN_CPPEMITTER_H
