//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Attribute resolution: turns raw annotations into concrete modes, wire keys and omission decisions.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_SEMANTICS_ATTRIBUTE_RESOLVER_H
#define STATESERDE_SEMANTICS_ATTRIBUTE_RESOLVER_H

#include "stateserde/Frontend/AST.h"
#include "stateserde/Semantics/Model.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stateserde
{

class DiagnosticEngine;

/// @file
/// @brief Annotation interpretation and mode precedence.

/// @brief Element an annotation is attached to.
enum class AnnotationTarget
{
    Container,
    Variant,
    Field,
};

/// @brief Resolves a type written in an annotation argument; reports and returns `std::nullopt` on failure.
using TypeRefResolver = std::function<std::optional<TypeRef>(const TypeRefAST&)>;

/// @brief Applies annotations of one declaration to its structurally built shape.
///
/// Every problem is reported as a schema diagnostic naming the element and the annotation text.
class AttributeResolver final
{
public:
    /// @brief Creates a resolver.
    /// @param[in,out] diagnostics Sink for schema errors.
    /// @param[in] resolveType Resolver for `@state` and `@state_implements` arguments.
    AttributeResolver(DiagnosticEngine& diagnostics, TypeRefResolver resolveType);

    /// @brief Resolves container, variant and field annotations.
    /// @param[in] decl Declaration carrying the raw annotations.
    /// @param[in,out] shape Shape whose variants and fields are index-aligned with `decl`.
    /// @return True when no schema error was found.
    bool resolve(const TypeDeclAST& decl, TypeShape& shape);

    /// @brief Mode precedence: field beats variant beats container.
    /// @param[in] containerDefault Container-level mode (`Stateful` unless annotated).
    /// @param[in] variantOverride Variant-level annotation, if any.
    /// @param[in] fieldOverride Field-level annotation, if any.
    /// @return Effective field mode.
    static Mode effectiveMode(Mode containerDefault, std::optional<Mode> variantOverride, std::optional<Mode> fieldOverride);

private:
    bool resolveContainer(const TypeDeclAST& decl, TypeShape& shape);
    bool resolveVariant(const VariantDeclAST& decl, const TypeShape& owner, VariantSpec& variant);
    bool resolveFields(const std::vector<FieldDeclAST>& decls,
                       PayloadStyle                     style,
                       Mode                             inheritedMode,
                       const std::string&               owner,
                       std::vector<FieldSpec>&          fields);

    /// @brief Checks the annotation is known, allowed on `target` and not repeated.
    bool checkPlacement(const std::vector<AnnotationAST>& annotations,
                        AnnotationTarget                  target,
                        const std::string&                element);

    /// @brief Reads `@stateless` / `@stateful`; reports when both are present.
    std::optional<Mode> modeAnnotation(const std::vector<AnnotationAST>& annotations,
                                       const std::string&                element,
                                       bool&                             ok);

    /// @brief Reads the single string argument of `@rename`.
    std::optional<std::string> stringArgument(const AnnotationAST& annotation, const std::string& element);

    void schemaError(const SourceLocation& location, const std::string& message);

    DiagnosticEngine& diagnostics_;
    TypeRefResolver   resolveType_;
};

/// @brief Finds the first annotation with the given name.
const AnnotationAST* findAnnotation(const std::vector<AnnotationAST>& annotations, const std::string& name);

}  // namespace stateserde

#endif  // STATESERDE_SEMANTICS_ATTRIBUTE_RESOLVER_H
