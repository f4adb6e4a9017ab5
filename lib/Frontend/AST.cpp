//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements textual rendering of schema syntax tree nodes.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Frontend/AST.h"

#include <sstream>

namespace stateserde
{

std::string TypeRefAST::qualifiedName() const
{
    std::ostringstream out;
    if (globalQualified)
    {
        out << "::";
    }
    for (std::size_t i = 0; i < path.size(); ++i)
    {
        if (i > 0)
        {
            out << "::";
        }
        out << path[i];
    }
    return out.str();
}

std::string TypeRefAST::str() const
{
    std::string out = qualifiedName();
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

std::string AnnotationAST::str() const
{
    std::string out = "@" + name;
    if (hasArguments)
    {
        out += "(" + argumentText + ")";
    }
    return out;
}

const char* payloadStyleName(const PayloadStyle style)
{
    switch (style)
    {
    case PayloadStyle::Named:
        return "named";
    case PayloadStyle::Positional:
        return "positional";
    case PayloadStyle::Unit:
        return "unit";
    }
    return "unit";
}

}  // namespace stateserde
