//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Token and lexer declarations for transforming schema text into token streams.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_FRONTEND_LEXER_H
#define STATESERDE_FRONTEND_LEXER_H

#include "stateserde/Frontend/SourceLocation.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stateserde
{

/// @file
/// @brief Tokenization interfaces for schema source text.

/// @brief Token categories recognized by the lexer.
enum class TokenKind
{

    /// @brief End-of-file sentinel.
    Eof,

    /// @brief Character that does not start any valid token.
    Invalid,

    /// @brief Identifier or keyword token.
    Identifier,

    /// @brief Integer literal token.
    Integer,

    /// @brief String literal token (spelling holds the unescaped value).
    String,

    /// @brief `@` annotation introducer.
    At,

    /// @brief `(` token.
    LParen,

    /// @brief `)` token.
    RParen,

    /// @brief `{` token.
    LBrace,

    /// @brief `}` token.
    RBrace,

    /// @brief `<` token.
    Less,

    /// @brief `>` token.
    Greater,

    /// @brief `,` token.
    Comma,

    /// @brief `;` token.
    Semicolon,

    /// @brief `:` token.
    Colon,

    /// @brief `::` token.
    ColonColon,

    /// @brief `.` token.
    Dot,
};

/// @brief Returns a display name for a token kind, used in parser messages.
/// @param[in] kind Token kind.
/// @return Short human-readable spelling.
const char* tokenKindName(TokenKind kind);

/// @brief Single lexical token emitted by @ref Lexer.
struct Token
{
    /// @brief Token category.
    TokenKind kind{TokenKind::Eof};

    /// @brief Original token spelling.
    std::string text;

    /// @brief Start location of the token.
    SourceLocation location;
};

/// @brief Converts schema source text into a token stream.
///
/// Whitespace and line breaks are insignificant; `#` starts a comment that runs to the end of the line.
class Lexer final
{
public:
    /// @brief Constructs a lexer for one source file.
    /// @param[in] file Logical file name used in token locations.
    /// @param[in] text Full source text to tokenize.
    Lexer(std::string file, std::string text);

    /// @brief Tokenizes the input source.
    /// @return Token sequence terminated by @ref TokenKind::Eof.
    [[nodiscard]] std::vector<Token> lex();

private:
    /// @brief Returns true when all input characters are consumed.
    [[nodiscard]] bool isAtEnd() const;

    /// @brief Peeks at the current or lookahead character without consuming it.
    /// @param[in] lookahead Character lookahead distance.
    /// @return Character at the requested lookahead position.
    [[nodiscard]] char peek(std::size_t lookahead = 0) const;

    /// @brief Consumes and returns the next character.
    char advance();

    /// @brief Emits one token into the output stream.
    void emit(TokenKind kind, std::string text, std::uint32_t line, std::uint32_t column);

    /// @brief Lexes an identifier or keyword token.
    void lexIdentifier(std::uint32_t line, std::uint32_t column);

    /// @brief Lexes a decimal integer literal token.
    void lexInteger(std::uint32_t line, std::uint32_t column);

    /// @brief Lexes a double-quoted string literal token.
    void lexString(std::uint32_t line, std::uint32_t column);

    std::string           file_;
    std::string           text_;
    std::size_t           index_{0};
    std::uint32_t         line_{1};
    std::uint32_t         column_{1};
    std::vector<Token>    tokens_;
};

}  // namespace stateserde

#endif  // STATESERDE_FRONTEND_LEXER_H
