//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// C++ spelling of schema types and inferred constraints.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_CODEGEN_TYPE_RENDER_H
#define STATESERDE_CODEGEN_TYPE_RENDER_H

#include "stateserde/Semantics/Model.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace stateserde
{

/// @brief Name of the context template parameter in generated specializations.
inline constexpr const char* ContextTypeParameter = "State";

/// @brief Joins namespace components with `::`.
std::string cppNamespacePath(const std::vector<std::string>& components);

/// @brief Spells a resolved type reference as a C++ type.
/// @details Schema and external types are spelled fully qualified with a leading `::`.
std::string renderCppType(const TypeRef& type);

/// @brief Spells a container as a fully qualified C++ type, applied to its own generic parameters.
std::string renderValueType(const TypeShape& shape);

/// @brief Spells one constraint as a C++ requires-clause term.
/// @param[in] constraint Constraint to render.
/// @param[in] decode Selects the decode concept for protocol constraints.
/// @param[in] contextType C++ spelling of the context type.
/// @return Term such as `::stateserde::StateEncodable<T, State>`.
std::string renderConstraint(const Constraint& constraint, bool decode, const std::string& contextType);

/// @brief Joins rendered constraints with `&&`; empty when there are none.
std::string renderRequiresExpression(const std::vector<Constraint>& constraints,
                                     bool                           decode,
                                     const std::string&             contextType);

/// @brief Quotes text as a C++ narrow string literal.
std::string cppStringLiteral(llvm::StringRef text);

}  // namespace stateserde

#endif  // STATESERDE_CODEGEN_TYPE_RENDER_H
