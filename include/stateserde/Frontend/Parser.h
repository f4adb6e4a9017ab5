//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Parser declarations for constructing schema syntax trees from token streams.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_FRONTEND_PARSER_H
#define STATESERDE_FRONTEND_PARSER_H

#include "stateserde/Frontend/AST.h"
#include "stateserde/Frontend/Lexer.h"

#include "llvm/Support/Error.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stateserde
{

class DiagnosticEngine;

/// @file
/// @brief Recursive-descent parser interfaces.

/// @brief Parses a token stream into a schema file AST.
///
/// Only structural well-formedness is checked here; annotation names and arguments are kept raw.
class Parser final
{
public:
    /// @brief Constructs a parser for one schema file.
    /// @param[in] filePath Source file path for diagnostics.
    /// @param[in] tokens Token stream to parse.
    /// @param[in,out] diagnostics Diagnostic sink for parse errors.
    Parser(std::string filePath, std::vector<Token> tokens, DiagnosticEngine& diagnostics);

    /// @brief Parses the token stream as one schema file.
    /// @return Parsed file or an error when any syntax error was reported.
    llvm::Expected<SchemaFileAST> parseSchemaFile();

    /// @brief Parses the whole token stream as a single type reference.
    /// @return Parsed reference, or `std::nullopt` after reporting a diagnostic.
    std::optional<TypeRefAST> parseStandaloneTypeRef();

private:
    const Token& current() const;
    const Token& previous() const;
    bool         isAtEnd() const;
    bool         check(TokenKind kind) const;
    bool         checkKeyword(const char* keyword) const;
    bool         match(TokenKind kind);
    const Token& advance();

    /// @brief Enforces the next token kind and emits a syntax diagnostic on mismatch.
    bool expect(TokenKind kind, const std::string& what);

    /// @brief Error recovery that skips to the end of the current statement.
    void syncToStatementEnd();

    /// @brief Parses zero or more `@name(...)` annotations.
    std::optional<std::vector<AnnotationAST>> parseAnnotations();

    /// @brief Parses the generic parameter list `<A, B>` if present.
    bool parseGenericParams(std::vector<std::string>& out);

    /// @brief Parses `record Name ...` after its annotations.
    std::optional<TypeDeclAST> parseRecord(std::vector<AnnotationAST> annotations, const SourceLocation& location);

    /// @brief Parses `union Name ...` after its annotations.
    std::optional<TypeDeclAST> parseUnion(std::vector<AnnotationAST> annotations, const SourceLocation& location);

    /// @brief Parses `{ name: type; ... }` including braces.
    bool parseNamedFields(std::vector<FieldDeclAST>& out);

    /// @brief Parses `( type, ... )` including parentheses.
    bool parsePositionalFields(std::vector<FieldDeclAST>& out);

    /// @brief Parses a type reference such as `a::b<c, list<d>>`.
    std::optional<TypeRefAST> parseTypeRef();

    std::string        filePath_;
    std::vector<Token> tokens_;
    std::size_t        cursor_{0};
    int                braceDepth_{0};
    DiagnosticEngine&  diagnostics_;
};

/// @brief Parses a type reference out of annotation argument tokens.
/// @param[in] tokens Tokens between the annotation parentheses.
/// @return Parsed reference or an error describing why the tokens are not a type.
llvm::Expected<TypeRefAST> parseTypeRefTokens(const std::vector<Token>& tokens);

/// @brief Discovers, lexes, and parses all schema files under the given roots.
/// @param[in] schemaRoots Root directories scanned for `*.ssd` files.
/// @param[in,out] diagnostics Diagnostic sink for discovery and parse issues.
/// @return Parsed module or an error on any failure.
llvm::Expected<ASTModule> parseSchemas(const std::vector<std::string>& schemaRoots, DiagnosticEngine& diagnostics);

/// @brief Lexes and parses one in-memory schema text.
/// @param[in] filePath Logical file name for diagnostics.
/// @param[in] text Schema source.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Parsed file or an error on syntax failure.
llvm::Expected<SchemaFileAST> parseSchemaText(const std::string& filePath,
                                              const std::string& text,
                                              DiagnosticEngine&  diagnostics);

}  // namespace stateserde

#endif  // STATESERDE_FRONTEND_PARSER_H
