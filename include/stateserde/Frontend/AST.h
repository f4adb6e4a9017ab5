//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Syntax tree for schema files.
///
/// Declarations keep their annotations raw (name plus argument tokens); interpretation happens during
/// attribute resolution.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_FRONTEND_AST_H
#define STATESERDE_FRONTEND_AST_H

#include "stateserde/Frontend/Lexer.h"
#include "stateserde/Frontend/SourceLocation.h"

#include <string>
#include <vector>

namespace stateserde
{

/// @brief Reference to a type by (possibly qualified) name with optional generic arguments.
struct TypeRefAST
{
    SourceLocation location;

    /// @brief Name components split on `::`.
    std::vector<std::string> path;

    /// @brief True when the reference was written with a leading `::`.
    bool globalQualified{false};

    /// @brief Generic arguments in declaration order.
    std::vector<TypeRefAST> arguments;

    /// @brief Returns the joined name without arguments.
    [[nodiscard]] std::string qualifiedName() const;

    /// @brief Renders the reference back to schema syntax.
    [[nodiscard]] std::string str() const;
};

/// @brief Annotation as written in the source, not yet interpreted.
struct AnnotationAST
{
    SourceLocation location;

    /// @brief Annotation name without the `@`.
    std::string name;

    /// @brief True when a parenthesized argument list was present (possibly empty).
    bool hasArguments{false};

    /// @brief Tokens between the parentheses.
    std::vector<Token> argumentTokens;

    /// @brief Argument tokens re-joined into text, for messages.
    std::string argumentText;

    /// @brief Renders the annotation as written, e.g. `@rename("k")`.
    [[nodiscard]] std::string str() const;
};

/// @brief Field declaration inside a record or a variant.
struct FieldDeclAST
{
    SourceLocation             location;
    std::vector<AnnotationAST> annotations;

    /// @brief Declared name; empty for positional fields.
    std::string name;

    TypeRefAST type;
};

/// @brief Layout of a field list.
enum class PayloadStyle
{
    /// @brief `{ name: type; ... }`
    Named,

    /// @brief `( type, type, ... )`
    Positional,

    /// @brief No payload.
    Unit,
};

/// @brief Returns `named`, `positional` or `unit`.
const char* payloadStyleName(PayloadStyle style);

/// @brief One alternative of a union declaration.
struct VariantDeclAST
{
    SourceLocation             location;
    std::vector<AnnotationAST> annotations;
    std::string                name;
    PayloadStyle               style{PayloadStyle::Unit};
    std::vector<FieldDeclAST>  fields;
};

/// @brief Top-level declaration kind.
enum class TypeDeclKind
{
    Record,
    Union,
};

/// @brief A `record` or `union` declaration.
struct TypeDeclAST
{
    SourceLocation             location;
    TypeDeclKind               kind{TypeDeclKind::Record};
    std::string                name;
    std::vector<std::string>   genericParams;
    std::vector<AnnotationAST> annotations;

    /// @brief Field layout for records.
    PayloadStyle style{PayloadStyle::Unit};

    /// @brief Record fields.
    std::vector<FieldDeclAST> fields;

    /// @brief Union alternatives.
    std::vector<VariantDeclAST> variants;
};

/// @brief `include "path";` statement.
struct IncludeDeclAST
{
    SourceLocation location;
    std::string    path;
};

/// @brief One parsed schema file.
struct SchemaFileAST
{
    SourceLocation location;

    /// @brief Components of the `namespace a.b;` statement; empty when absent.
    std::vector<std::string> namespaceComponents;

    std::vector<IncludeDeclAST> includes;
    std::vector<TypeDeclAST>    types;
};

/// @brief Schema file located on disk.
struct DiscoveredSchema
{
    /// @brief Absolute path of the file.
    std::string filePath;

    /// @brief Path relative to the schema root, with forward slashes.
    std::string relativePath;

    /// @brief Full source text.
    std::string text;
};

/// @brief Schema file with its syntax tree.
struct ParsedSchema
{
    DiscoveredSchema info;
    SchemaFileAST    ast;
};

/// @brief All parsed schema files of one run.
struct ASTModule
{
    std::vector<ParsedSchema> schemas;
};

}  // namespace stateserde

#endif  // STATESERDE_FRONTEND_AST_H
