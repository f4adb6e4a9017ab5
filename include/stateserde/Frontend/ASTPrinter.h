//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// AST pretty-printing declarations for debugging and diagnostics.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_FRONTEND_AST_PRINTER_H
#define STATESERDE_FRONTEND_AST_PRINTER_H

#include <string>

namespace stateserde
{
struct ASTModule;

/// @file
/// @brief AST pretty-printer entry points.

/// @brief Produces a human-readable representation of an AST module.
/// @param[in] module Parsed AST module.
/// @return Pretty-printed AST text.
std::string printAST(const ASTModule& module);

}  // namespace stateserde

#endif  // STATESERDE_FRONTEND_AST_PRINTER_H
