//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements schema model helpers: builtin lookup, type rendering and generic substitution.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Semantics/Model.h"

#include <algorithm>
#include <array>
#include <utility>

namespace stateserde
{
namespace
{

struct ScalarSpelling
{
    const char*   name;
    BuiltinScalar scalar;
};

constexpr std::array<ScalarSpelling, 12> ScalarSpellings{{
    {"bool", BuiltinScalar::Bool},
    {"i8", BuiltinScalar::I8},
    {"i16", BuiltinScalar::I16},
    {"i32", BuiltinScalar::I32},
    {"i64", BuiltinScalar::I64},
    {"u8", BuiltinScalar::U8},
    {"u16", BuiltinScalar::U16},
    {"u32", BuiltinScalar::U32},
    {"u64", BuiltinScalar::U64},
    {"f32", BuiltinScalar::F32},
    {"f64", BuiltinScalar::F64},
    {"string", BuiltinScalar::String},
}};

struct ContainerSpelling
{
    const char*      name;
    BuiltinContainer container;
};

constexpr std::array<ContainerSpelling, 4> ContainerSpellings{{
    {"list", BuiltinContainer::List},
    {"optional", BuiltinContainer::Optional},
    {"map", BuiltinContainer::Map},
    {"box", BuiltinContainer::Box},
}};

enum class Reach
{
    Everything,
    ByValue,
    ByValueWithArguments,
    DefaultConstruction,
};

void collectSchemaTypes(const TypeRef& type, const Reach reach, std::vector<std::string>& out)
{
    if (type.kind == TypeRefKind::SchemaType && std::find(out.begin(), out.end(), type.name) == out.end())
    {
        out.push_back(type.name);
    }
    if (reach == Reach::DefaultConstruction && type.kind == TypeRefKind::BuiltinContainer &&
        type.container != BuiltinContainer::Box)
    {
        return;
    }
    if (reach != Reach::Everything && reach != Reach::DefaultConstruction &&
        type.kind == TypeRefKind::BuiltinContainer && type.container != BuiltinContainer::Optional)
    {
        return;
    }
    if ((reach == Reach::ByValue || reach == Reach::DefaultConstruction) && type.kind == TypeRefKind::SchemaType)
    {
        return;
    }
    for (const TypeRef& argument : type.arguments)
    {
        collectSchemaTypes(argument, reach, out);
    }
}

template <typename Visitor>
void forEachField(const TypeShape& shape, Visitor&& visit)
{
    for (const FieldSpec& field : shape.fields)
    {
        visit(field);
    }
    for (const VariantSpec& variant : shape.variants)
    {
        for (const FieldSpec& field : variant.fields)
        {
            visit(field);
        }
    }
}

}  // namespace

std::optional<BuiltinScalar> builtinScalarFromName(const std::string& name)
{
    for (const auto& s : ScalarSpellings)
    {
        if (name == s.name)
        {
            return s.scalar;
        }
    }
    return std::nullopt;
}

std::optional<BuiltinContainer> builtinContainerFromName(const std::string& name)
{
    for (const auto& c : ContainerSpellings)
    {
        if (name == c.name)
        {
            return c.container;
        }
    }
    return std::nullopt;
}

const char* builtinScalarName(const BuiltinScalar scalar)
{
    for (const auto& s : ScalarSpellings)
    {
        if (s.scalar == scalar)
        {
            return s.name;
        }
    }
    return "?";
}

const char* builtinContainerName(const BuiltinContainer container)
{
    for (const auto& c : ContainerSpellings)
    {
        if (c.container == container)
        {
            return c.name;
        }
    }
    return "?";
}

bool TypeRef::mentionsGeneric() const
{
    if (kind == TypeRefKind::GenericParam)
    {
        return true;
    }
    return std::any_of(arguments.begin(), arguments.end(), [](const TypeRef& a) { return a.mentionsGeneric(); });
}

std::string TypeRef::str() const
{
    std::string out = name;
    if (arguments.empty())
    {
        return out;
    }
    out += '<';
    for (std::size_t i = 0; i < arguments.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += arguments[i].str();
    }
    out += '>';
    return out;
}

TypeRef substituteGenerics(const TypeRef& type, const std::map<std::string, TypeRef>& bindings)
{
    if (type.kind == TypeRefKind::GenericParam)
    {
        const auto it = bindings.find(type.name);
        return it == bindings.end() ? type : it->second;
    }
    TypeRef out = type;
    for (TypeRef& argument : out.arguments)
    {
        argument = substituteGenerics(argument, bindings);
    }
    return out;
}

std::string RecursionMarker::str() const
{
    const char* name = kind == RecursionMarkerKind::ExplicitContextType ? "@state" : "@state_implements";
    return std::string(name) + "(" + subject.str() + ")";
}

bool isNewtypePayload(const PayloadStyle style, const std::vector<FieldSpec>& fields)
{
    return style == PayloadStyle::Positional && fields.size() == 1 && fields.front().omission == Omission::Include;
}

bool TypeShape::isNewtype() const
{
    return kind == ShapeKind::Record && isNewtypePayload(style, fields);
}

std::vector<std::string> valueDependencies(const TypeShape& shape, const bool throughSchemaArguments)
{
    const Reach              reach = throughSchemaArguments ? Reach::ByValueWithArguments : Reach::ByValue;
    std::vector<std::string> out;
    forEachField(shape, [&](const FieldSpec& field) { collectSchemaTypes(field.declaredType, reach, out); });
    return out;
}

std::vector<std::string> defaultConstructionDependencies(const TypeShape& shape)
{
    std::vector<std::string> out;
    const auto               collect = [&](const FieldSpec& field) {
        collectSchemaTypes(field.declaredType, Reach::DefaultConstruction, out);
    };
    if (shape.kind == ShapeKind::Record)
    {
        std::for_each(shape.fields.begin(), shape.fields.end(), collect);
    }
    else if (!shape.variants.empty())
    {
        std::for_each(shape.variants.front().fields.begin(), shape.variants.front().fields.end(), collect);
    }
    return out;
}

std::vector<std::string> referencedSchemaTypes(const TypeShape& shape)
{
    std::vector<std::string> out;
    forEachField(shape, [&](const FieldSpec& field) { collectSchemaTypes(field.declaredType, Reach::Everything, out); });
    if (shape.recursionMarker)
    {
        collectSchemaTypes(shape.recursionMarker->subject, Reach::Everything, out);
    }
    return out;
}

const char* constraintKindName(const ConstraintKind kind)
{
    switch (kind)
    {
    case ConstraintKind::StateProtocol:
        return "state";
    case ConstraintKind::PlainProtocol:
        return "plain";
    case ConstraintKind::ZeroValue:
        return "zero";
    case ConstraintKind::Capability:
        return "capability";
    }
    return "state";
}

std::string Constraint::str() const
{
    return std::string(constraintKindName(kind)) + "(" + subject.str() + ")";
}

const AnalyzedType* SemanticModule::find(const std::string& qualifiedName) const
{
    for (const SchemaUnit& unit : units)
    {
        for (const AnalyzedType& type : unit.types)
        {
            if (type.shape.qualifiedName == qualifiedName)
            {
                return &type;
            }
        }
    }
    return nullptr;
}

}  // namespace stateserde
