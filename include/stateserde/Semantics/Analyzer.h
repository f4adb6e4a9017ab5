//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Public semantic analysis entry points converting parsed schemas into the resolved schema model.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_SEMANTICS_ANALYZER_H
#define STATESERDE_SEMANTICS_ANALYZER_H

#include "stateserde/Semantics/Model.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace stateserde
{
class DiagnosticEngine;
struct ASTModule;

/// @file
/// @brief Semantic analysis entry points.

/// @brief Options that control semantic analysis.
struct AnalyzeOptions final
{
    /// @brief Namespace components prepended to every schema namespace.
    std::vector<std::string> namespacePrefix;
};

/// @brief Builds shapes, resolves attributes and infers bounds for every schema type.
/// @param[in] module Parsed schema files.
/// @param[in,out] diagnostics Diagnostic sink for schema and recursion errors.
/// @return Resolved module on success.
llvm::Expected<SemanticModule> analyze(const ASTModule& module, DiagnosticEngine& diagnostics);

/// @brief Same as @ref analyze with explicit options.
/// @param[in] module Parsed schema files.
/// @param[in,out] diagnostics Diagnostic sink for schema and recursion errors.
/// @param[in] options Analysis options.
/// @return Resolved module on success.
llvm::Expected<SemanticModule> analyze(const ASTModule&      module,
                                       DiagnosticEngine&     diagnostics,
                                       const AnalyzeOptions& options);

/// @brief Returns true when `name` cannot be used as a C++ identifier in generated code.
bool isReservedIdentifier(const std::string& name);

}  // namespace stateserde

#endif  // STATESERDE_SEMANTICS_ANALYZER_H
