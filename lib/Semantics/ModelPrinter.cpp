//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the resolved schema model pretty-printer.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Semantics/ModelPrinter.h"

#include "stateserde/Semantics/Model.h"

#include <sstream>

namespace stateserde
{
namespace
{

const char* modeName(const Mode mode)
{
    return mode == Mode::Stateful ? "stateful" : "stateless";
}

void printFields(std::ostringstream& out, const std::vector<FieldSpec>& fields, const std::string& indent)
{
    for (const auto& field : fields)
    {
        out << indent << "field " << field.declaredName << ": " << field.declaredType.str();
        if (field.omission == Omission::SkipWithDefault)
        {
            out << " skip\n";
            continue;
        }
        out << ' ' << modeName(field.mode) << " key \"" << field.wireKey << "\"\n";
    }
}

void printConstraints(std::ostringstream& out, const char* label, const std::vector<Constraint>& constraints)
{
    out << "    " << label << " requires";
    if (constraints.empty())
    {
        out << " nothing\n";
        return;
    }
    for (std::size_t i = 0; i < constraints.size(); ++i)
    {
        out << (i == 0 ? " " : ", ") << constraints[i].str();
    }
    out << "\n";
}

}  // namespace

std::string printAnalyzedType(const AnalyzedType& type)
{
    const TypeShape&   shape = type.shape;
    std::ostringstream out;
    out << "  " << (shape.kind == ShapeKind::Record ? "record " : "union ") << shape.qualifiedName;
    if (!shape.genericParams.empty())
    {
        out << '<';
        for (std::size_t i = 0; i < shape.genericParams.size(); ++i)
        {
            out << (i > 0 ? ", " : "") << shape.genericParams[i];
        }
        out << '>';
    }
    if (shape.kind == ShapeKind::Record)
    {
        out << ' ' << payloadStyleName(shape.style);
    }
    out << " default " << modeName(shape.containerMode);
    if (shape.transparent)
    {
        out << " transparent";
    }
    if (shape.recursionMarker)
    {
        out << ' ' << shape.recursionMarker->str();
    }
    out << " {\n";

    printFields(out, shape.fields, "    ");
    for (const auto& variant : shape.variants)
    {
        out << "    variant " << variant.name << " tag \"" << variant.wireTag << "\" " << payloadStyleName(variant.style);
        if (variant.containerModeOverride)
        {
            out << " default " << modeName(*variant.containerModeOverride);
        }
        out << "\n";
        printFields(out, variant.fields, "      ");
    }

    out << "    bounds " << (type.bounds.coarse ? "coarse" : "per-field") << "\n";
    printConstraints(out, "encode", type.bounds.encode);
    printConstraints(out, "decode", type.bounds.decode);
    out << "  }\n";
    return out.str();
}

std::string printModel(const SemanticModule& semantic)
{
    std::ostringstream out;
    for (const auto& unit : semantic.units)
    {
        out << "schema \"" << unit.relativePath << "\" {\n";
        for (const auto& dependency : unit.dependencies)
        {
            out << "  uses \"" << dependency << "\"\n";
        }
        for (const auto& type : unit.types)
        {
            out << printAnalyzedType(type);
        }
        out << "}\n";
    }
    return out.str();
}

}  // namespace stateserde
