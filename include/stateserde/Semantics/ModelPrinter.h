//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Resolved schema model pretty-printing for `stateserdec check`.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_SEMANTICS_MODEL_PRINTER_H
#define STATESERDE_SEMANTICS_MODEL_PRINTER_H

#include <string>

namespace stateserde
{
struct AnalyzedType;
struct SemanticModule;

/// @brief Renders one container with its resolved modes, wire keys and bounds.
std::string printAnalyzedType(const AnalyzedType& type);

/// @brief Renders every schema unit of an analyzed module.
/// @param[in] semantic Analysis result.
/// @return Human-readable model text.
std::string printModel(const SemanticModule& semantic);

}  // namespace stateserde

#endif  // STATESERDE_SEMANTICS_MODEL_PRINTER_H
