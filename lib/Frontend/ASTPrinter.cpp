//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the schema syntax tree pretty-printer used by `stateserdec ast`.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Frontend/ASTPrinter.h"

#include "stateserde/Frontend/AST.h"

#include <sstream>

namespace stateserde
{
namespace
{

void printAnnotations(std::ostringstream& out, const std::vector<AnnotationAST>& annotations)
{
    for (const auto& annotation : annotations)
    {
        out << ' ' << annotation.str();
    }
}

void printFields(std::ostringstream& out, const std::vector<FieldDeclAST>& fields, const std::string& indent)
{
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        const auto& field = fields[i];
        out << indent << "field " << (field.name.empty() ? std::to_string(i) : field.name) << ": "
            << field.type.str();
        printAnnotations(out, field.annotations);
        out << "\n";
    }
}

void printGenerics(std::ostringstream& out, const std::vector<std::string>& params)
{
    if (params.empty())
    {
        return;
    }
    out << '<';
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        if (i > 0)
        {
            out << ", ";
        }
        out << params[i];
    }
    out << '>';
}

}  // namespace

std::string printAST(const ASTModule& module)
{
    std::ostringstream out;
    out << "module {\n";
    for (const auto& schema : module.schemas)
    {
        out << "  schema \"" << schema.info.relativePath << "\"";
        if (!schema.ast.namespaceComponents.empty())
        {
            out << " namespace ";
            for (std::size_t i = 0; i < schema.ast.namespaceComponents.size(); ++i)
            {
                out << (i > 0 ? "." : "") << schema.ast.namespaceComponents[i];
            }
        }
        out << " {\n";

        for (const auto& include : schema.ast.includes)
        {
            out << "    include \"" << include.path << "\"\n";
        }

        for (const auto& type : schema.ast.types)
        {
            out << "    " << (type.kind == TypeDeclKind::Record ? "record " : "union ") << type.name;
            printGenerics(out, type.genericParams);
            if (type.kind == TypeDeclKind::Record)
            {
                out << ' ' << payloadStyleName(type.style);
            }
            printAnnotations(out, type.annotations);
            out << " {\n";
            if (type.kind == TypeDeclKind::Record)
            {
                printFields(out, type.fields, "      ");
            }
            for (const auto& variant : type.variants)
            {
                out << "      variant " << variant.name << ' ' << payloadStyleName(variant.style);
                printAnnotations(out, variant.annotations);
                if (variant.fields.empty())
                {
                    out << "\n";
                    continue;
                }
                out << " {\n";
                printFields(out, variant.fields, "        ");
                out << "      }\n";
            }
            out << "    }\n";
        }

        out << "  }\n";
    }
    out << "}\n";
    return out.str();
}

}  // namespace stateserde
