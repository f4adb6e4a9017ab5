//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements C++ type and constraint spelling.
///
//===----------------------------------------------------------------------===//

#include "stateserde/CodeGen/TypeRender.h"

#include <cstdio>

namespace stateserde
{
namespace
{

const char* scalarCppType(const BuiltinScalar scalar)
{
    switch (scalar)
    {
    case BuiltinScalar::Bool:
        return "bool";
    case BuiltinScalar::I8:
        return "std::int8_t";
    case BuiltinScalar::I16:
        return "std::int16_t";
    case BuiltinScalar::I32:
        return "std::int32_t";
    case BuiltinScalar::I64:
        return "std::int64_t";
    case BuiltinScalar::U8:
        return "std::uint8_t";
    case BuiltinScalar::U16:
        return "std::uint16_t";
    case BuiltinScalar::U32:
        return "std::uint32_t";
    case BuiltinScalar::U64:
        return "std::uint64_t";
    case BuiltinScalar::F32:
        return "float";
    case BuiltinScalar::F64:
        return "double";
    case BuiltinScalar::String:
        return "std::string";
    }
    return "void";
}

std::string renderArguments(const std::vector<TypeRef>& arguments)
{
    if (arguments.empty())
    {
        return "";
    }
    std::string out = "<";
    for (std::size_t i = 0; i < arguments.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += renderCppType(arguments[i]);
    }
    return out + ">";
}

}  // namespace

std::string cppNamespacePath(const std::vector<std::string>& components)
{
    std::string out;
    for (const auto& component : components)
    {
        if (!out.empty())
        {
            out += "::";
        }
        out += component;
    }
    return out;
}

std::string renderCppType(const TypeRef& type)
{
    switch (type.kind)
    {
    case TypeRefKind::GenericParam:
        return type.name;
    case TypeRefKind::BuiltinScalar:
        return scalarCppType(type.scalar);
    case TypeRefKind::BuiltinContainer: {
        const std::string element = type.arguments.empty() ? "void" : renderCppType(type.arguments.front());
        switch (type.container)
        {
        case BuiltinContainer::List:
            return "std::vector<" + element + ">";
        case BuiltinContainer::Optional:
            return "std::optional<" + element + ">";
        case BuiltinContainer::Map:
            return "std::map<std::string, " + element + ">";
        case BuiltinContainer::Box:
            return "::stateserde::Box<" + element + ">";
        }
        return element;
    }
    case TypeRefKind::SchemaType:
        return "::" + type.name + renderArguments(type.arguments);
    case TypeRefKind::External:
        return type.name + renderArguments(type.arguments);
    }
    return type.name;
}

std::string renderValueType(const TypeShape& shape)
{
    std::string out = "::" + shape.qualifiedName;
    if (shape.genericParams.empty())
    {
        return out;
    }
    out += '<';
    for (std::size_t i = 0; i < shape.genericParams.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += shape.genericParams[i];
    }
    return out + ">";
}

std::string renderConstraint(const Constraint& constraint, const bool decode, const std::string& contextType)
{
    const std::string subject = renderCppType(constraint.subject);
    switch (constraint.kind)
    {
    case ConstraintKind::StateProtocol:
        return std::string("::stateserde::") + (decode ? "StateDecodable<" : "StateEncodable<") + subject + ", " +
               contextType + ">";
    case ConstraintKind::PlainProtocol:
        return std::string("::stateserde::") + (decode ? "PlainDecodable<" : "PlainEncodable<") + subject + ">";
    case ConstraintKind::ZeroValue:
        return "std::default_initializable<" + subject + ">";
    case ConstraintKind::Capability:
        return subject + "<" + contextType + ">";
    }
    return "true";
}

std::string renderRequiresExpression(const std::vector<Constraint>& constraints,
                                     const bool                     decode,
                                     const std::string&             contextType)
{
    std::string out;
    for (const Constraint& constraint : constraints)
    {
        if (!out.empty())
        {
            out += " && ";
        }
        out += renderConstraint(constraint, decode, contextType);
    }
    return out;
}

std::string cppStringLiteral(llvm::StringRef text)
{
    std::string out = "\"";
    for (const char c : text)
    {
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20U)
            {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\%03o", static_cast<unsigned>(c));
                out += escaped;
            }
            else
            {
                out += c;
            }
            break;
        }
    }
    return out + "\"";
}

}  // namespace stateserde
