//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements attribute resolution.
///
/// Each element's annotations are validated against a fixed table, then folded into the resolved mode, wire key and
/// omission of every field and variant.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Semantics/AttributeResolver.h"

#include "stateserde/Frontend/Parser.h"
#include "stateserde/Support/Diagnostics.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <array>
#include <map>
#include <set>
#include <utility>

namespace stateserde
{
namespace
{

enum class ArgumentKind
{
    None,
    String,
    Type,
};

struct AnnotationRule
{
    const char*  name;
    bool         onContainer;
    bool         onVariant;
    bool         onField;
    ArgumentKind arguments;
};

constexpr std::array<AnnotationRule, 7> AnnotationRules{{
    {"stateless", true, true, true, ArgumentKind::None},
    {"stateful", true, true, true, ArgumentKind::None},
    {"rename", false, true, true, ArgumentKind::String},
    {"skip", false, false, true, ArgumentKind::None},
    {"state", true, false, false, ArgumentKind::Type},
    {"state_implements", true, false, false, ArgumentKind::Type},
    {"transparent", true, false, false, ArgumentKind::None},
}};

const AnnotationRule* findRule(const std::string& name)
{
    for (const AnnotationRule& rule : AnnotationRules)
    {
        if (name == rule.name)
        {
            return &rule;
        }
    }
    return nullptr;
}

bool allowedOn(const AnnotationRule& rule, const AnnotationTarget target)
{
    switch (target)
    {
    case AnnotationTarget::Container:
        return rule.onContainer;
    case AnnotationTarget::Variant:
        return rule.onVariant;
    case AnnotationTarget::Field:
        return rule.onField;
    }
    return false;
}

std::string describeContainer(const TypeShape& shape)
{
    return std::string(shape.kind == ShapeKind::Union ? "union '" : "record '") + shape.name + "'";
}

}  // namespace

const AnnotationAST* findAnnotation(const std::vector<AnnotationAST>& annotations, const std::string& name)
{
    for (const AnnotationAST& annotation : annotations)
    {
        if (annotation.name == name)
        {
            return &annotation;
        }
    }
    return nullptr;
}

AttributeResolver::AttributeResolver(DiagnosticEngine& diagnostics, TypeRefResolver resolveType)
    : diagnostics_(diagnostics)
    , resolveType_(std::move(resolveType))
{
}

Mode AttributeResolver::effectiveMode(const Mode                containerDefault,
                                      const std::optional<Mode> variantOverride,
                                      const std::optional<Mode> fieldOverride)
{
    if (fieldOverride)
    {
        return *fieldOverride;
    }
    if (variantOverride)
    {
        return *variantOverride;
    }
    return containerDefault;
}

void AttributeResolver::schemaError(const SourceLocation& location, const std::string& message)
{
    diagnostics_.error(DiagnosticCategory::Schema, location, message);
}

bool AttributeResolver::checkPlacement(const std::vector<AnnotationAST>& annotations,
                                       const AnnotationTarget            target,
                                       const std::string&                element)
{
    bool                  ok = true;
    std::set<std::string> seen;
    for (const AnnotationAST& annotation : annotations)
    {
        const AnnotationRule* rule = findRule(annotation.name);
        if (!rule)
        {
            std::string message = "unknown annotation " + annotation.str() + " on " + element;
            if (annotation.name == "recursive")
            {
                message += "; break recursion with @state(...) or @state_implements(...) on the container";
            }
            schemaError(annotation.location, message);
            ok = false;
            continue;
        }
        if (!allowedOn(*rule, target))
        {
            schemaError(annotation.location, annotation.str() + " cannot be applied to " + element);
            ok = false;
            continue;
        }
        if (!seen.insert(annotation.name).second)
        {
            schemaError(annotation.location, "duplicate " + annotation.str() + " on " + element);
            ok = false;
            continue;
        }
        if (rule->arguments == ArgumentKind::None && annotation.hasArguments)
        {
            schemaError(annotation.location, annotation.str() + " on " + element + " takes no arguments");
            ok = false;
        }
        else if (rule->arguments != ArgumentKind::None && annotation.argumentTokens.empty())
        {
            schemaError(annotation.location, annotation.str() + " on " + element + " requires an argument");
            ok = false;
        }
    }
    return ok;
}

std::optional<Mode> AttributeResolver::modeAnnotation(const std::vector<AnnotationAST>& annotations,
                                                      const std::string&                element,
                                                      bool&                             ok)
{
    const AnnotationAST* stateless = findAnnotation(annotations, "stateless");
    const AnnotationAST* stateful  = findAnnotation(annotations, "stateful");
    if (stateless && stateful)
    {
        schemaError(stateful->location, "@stateless and @stateful are both present on " + element);
        ok = false;
        return std::nullopt;
    }
    if (stateless)
    {
        return Mode::Stateless;
    }
    if (stateful)
    {
        return Mode::Stateful;
    }
    return std::nullopt;
}

std::optional<std::string> AttributeResolver::stringArgument(const AnnotationAST& annotation, const std::string& element)
{
    if (annotation.argumentTokens.size() != 1 || annotation.argumentTokens.front().kind != TokenKind::String)
    {
        schemaError(annotation.location,
                    "malformed " + annotation.str() + " on " + element + ": expected a single quoted string");
        return std::nullopt;
    }
    const std::string& value = annotation.argumentTokens.front().text;
    if (value.empty())
    {
        schemaError(annotation.location, "malformed " + annotation.str() + " on " + element + ": empty name");
        return std::nullopt;
    }
    if (!llvm::json::isUTF8(value))
    {
        schemaError(annotation.location, "malformed " + annotation.str() + " on " + element + ": name is not valid UTF-8");
        return std::nullopt;
    }
    return value;
}

bool AttributeResolver::resolve(const TypeDeclAST& decl, TypeShape& shape)
{
    bool ok = resolveContainer(decl, shape);

    if (shape.kind == ShapeKind::Record)
    {
        ok = resolveFields(decl.fields, shape.style, shape.containerMode, shape.name, shape.fields) && ok;

        if (shape.transparent)
        {
            std::size_t included = 0;
            for (const FieldSpec& field : shape.fields)
            {
                included += field.omission == Omission::Include ? 1U : 0U;
            }
            if (included != 1)
            {
                const AnnotationAST* transparent = findAnnotation(decl.annotations, "transparent");
                schemaError(transparent ? transparent->location : decl.location,
                            "@transparent on " + describeContainer(shape) +
                                " requires exactly one non-skipped field, found " + std::to_string(included));
                ok = false;
            }
        }
        return ok;
    }

    if (decl.variants.empty())
    {
        schemaError(decl.location, describeContainer(shape) + " declares no variants");
        ok = false;
    }

    std::map<std::string, std::string> tags;
    for (std::size_t i = 0; i < decl.variants.size() && i < shape.variants.size(); ++i)
    {
        VariantSpec& variant = shape.variants[i];
        ok                   = resolveVariant(decl.variants[i], shape, variant) && ok;

        const auto [it, inserted] = tags.emplace(variant.wireTag, variant.name);
        if (!inserted)
        {
            schemaError(variant.location,
                        "variant tag '" + variant.wireTag + "' of variant '" + shape.name + "::" + variant.name +
                            "' collides with variant '" + it->second + "'");
            ok = false;
        }
    }
    return ok;
}

bool AttributeResolver::resolveContainer(const TypeDeclAST& decl, TypeShape& shape)
{
    const std::string element = describeContainer(shape);
    bool              ok      = checkPlacement(decl.annotations, AnnotationTarget::Container, element);

    shape.containerMode = modeAnnotation(decl.annotations, element, ok).value_or(Mode::Stateful);

    if (const AnnotationAST* transparent = findAnnotation(decl.annotations, "transparent"))
    {
        if (shape.kind == ShapeKind::Union)
        {
            schemaError(transparent->location, "@transparent cannot be applied to " + element);
            ok = false;
        }
        else
        {
            shape.transparent = true;
        }
    }

    const AnnotationAST* state      = findAnnotation(decl.annotations, "state");
    const AnnotationAST* implements = findAnnotation(decl.annotations, "state_implements");
    if (state && implements)
    {
        schemaError(implements->location,
                    "@state and @state_implements are mutually exclusive on " + element + "; keep one of " +
                        state->str() + " and " + implements->str());
        return false;
    }

    const AnnotationAST* markerAnnotation = state ? state : implements;
    if (!markerAnnotation || markerAnnotation->argumentTokens.empty())
    {
        return ok;
    }

    auto parsed = parseTypeRefTokens(markerAnnotation->argumentTokens);
    if (!parsed)
    {
        schemaError(markerAnnotation->location,
                    "malformed " + markerAnnotation->str() + " on " + element + ": " +
                        llvm::toString(parsed.takeError()));
        return false;
    }
    auto subject = resolveType_(*parsed);
    if (!subject)
    {
        return false;
    }

    if (subject->mentionsGeneric())
    {
        schemaError(markerAnnotation->location,
                    "malformed " + markerAnnotation->str() + " on " + element +
                        ": the context cannot depend on the container's generic parameters");
        return false;
    }

    RecursionMarker marker;
    marker.subject = std::move(*subject);
    if (state)
    {
        marker.kind = RecursionMarkerKind::ExplicitContextType;
    }
    else
    {
        marker.kind = RecursionMarkerKind::ExplicitCapability;
        if (marker.subject.kind != TypeRefKind::External || !marker.subject.arguments.empty())
        {
            schemaError(markerAnnotation->location,
                        "malformed " + markerAnnotation->str() + " on " + element +
                            ": expected the name of an external capability concept");
            return false;
        }
    }
    shape.recursionMarker = std::move(marker);
    return ok;
}

bool AttributeResolver::resolveVariant(const VariantDeclAST& decl, const TypeShape& owner, VariantSpec& variant)
{
    const std::string element = "variant '" + owner.name + "::" + decl.name + "'";
    bool              ok      = checkPlacement(decl.annotations, AnnotationTarget::Variant, element);

    variant.containerModeOverride = modeAnnotation(decl.annotations, element, ok);
    variant.wireTag               = decl.name;
    if (const AnnotationAST* rename = findAnnotation(decl.annotations, "rename"))
    {
        if (auto tag = stringArgument(*rename, element))
        {
            variant.wireTag = *tag;
        }
        else
        {
            ok = false;
        }
    }

    const Mode inherited = effectiveMode(owner.containerMode, variant.containerModeOverride, std::nullopt);
    ok = resolveFields(decl.fields, variant.style, inherited, owner.name + "::" + decl.name, variant.fields) && ok;
    return ok;
}

bool AttributeResolver::resolveFields(const std::vector<FieldDeclAST>& decls,
                                      const PayloadStyle               style,
                                      const Mode                       inheritedMode,
                                      const std::string&               owner,
                                      std::vector<FieldSpec>&          fields)
{
    bool                               ok            = true;
    std::size_t                        wirePosition  = 0;
    std::map<std::string, std::string> keysInUse;

    for (std::size_t i = 0; i < decls.size() && i < fields.size(); ++i)
    {
        const FieldDeclAST& decl    = decls[i];
        FieldSpec&          field   = fields[i];
        const std::string   element = "field '" + owner + "." + field.declaredName + "'";

        ok = checkPlacement(decl.annotations, AnnotationTarget::Field, element) && ok;

        field.mode     = effectiveMode(inheritedMode, std::nullopt, modeAnnotation(decl.annotations, element, ok));
        field.omission = findAnnotation(decl.annotations, "skip") ? Omission::SkipWithDefault : Omission::Include;
        field.wireKey  = field.declaredName;

        const AnnotationAST* rename = findAnnotation(decl.annotations, "rename");
        if (rename && style == PayloadStyle::Positional)
        {
            schemaError(rename->location, rename->str() + " cannot be applied to positional " + element);
            ok = false;
        }
        else if (rename && field.omission == Omission::SkipWithDefault)
        {
            schemaError(rename->location,
                        rename->str() + " has no effect on skipped " + element + "; remove @skip or the rename");
            ok = false;
        }
        else if (rename)
        {
            if (auto key = stringArgument(*rename, element))
            {
                field.wireKey = *key;
            }
            else
            {
                ok = false;
            }
        }

        if (field.omission == Omission::SkipWithDefault)
        {
            continue;
        }
        if (style == PayloadStyle::Positional)
        {
            field.wireKey = std::to_string(wirePosition);
        }
        ++wirePosition;

        const auto [it, inserted] = keysInUse.emplace(field.wireKey, field.declaredName);
        if (!inserted)
        {
            schemaError(field.location,
                        "wire key '" + field.wireKey + "' of " + element + " collides with field '" + it->second + "'");
            ok = false;
        }
    }
    return ok;
}

}  // namespace stateserde
