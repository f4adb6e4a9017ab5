//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements lexical analysis for schema source text.
///
/// The lexer converts source characters into parser tokens while preserving precise source locations for diagnostics.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Frontend/Lexer.h"

#include <cctype>
#include <utility>

namespace stateserde
{

const char* tokenKindName(const TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Eof:
        return "end of file";
    case TokenKind::Invalid:
        return "invalid character";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Integer:
        return "integer";
    case TokenKind::String:
        return "string";
    case TokenKind::At:
        return "'@'";
    case TokenKind::LParen:
        return "'('";
    case TokenKind::RParen:
        return "')'";
    case TokenKind::LBrace:
        return "'{'";
    case TokenKind::RBrace:
        return "'}'";
    case TokenKind::Less:
        return "'<'";
    case TokenKind::Greater:
        return "'>'";
    case TokenKind::Comma:
        return "','";
    case TokenKind::Semicolon:
        return "';'";
    case TokenKind::Colon:
        return "':'";
    case TokenKind::ColonColon:
        return "'::'";
    case TokenKind::Dot:
        return "'.'";
    }
    return "token";
}

Lexer::Lexer(std::string file, std::string text)
    : file_(std::move(file))
    , text_(std::move(text))
{
}

bool Lexer::isAtEnd() const
{
    return index_ >= text_.size();
}

char Lexer::peek(std::size_t lookahead) const
{
    const std::size_t i = index_ + lookahead;
    return i < text_.size() ? text_[i] : '\0';
}

char Lexer::advance()
{
    if (isAtEnd())
    {
        return '\0';
    }
    const char c = text_[index_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

void Lexer::emit(TokenKind kind, std::string text, std::uint32_t line, std::uint32_t column)
{
    tokens_.push_back(Token{kind, std::move(text), SourceLocation{file_, line, column}});
}

void Lexer::lexIdentifier(std::uint32_t line, std::uint32_t column)
{
    std::string text;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
    {
        text.push_back(advance());
    }
    emit(TokenKind::Identifier, text, line, column);
}

void Lexer::lexInteger(std::uint32_t line, std::uint32_t column)
{
    std::string text;
    while (std::isdigit(static_cast<unsigned char>(peek())))
    {
        text.push_back(advance());
    }
    emit(TokenKind::Integer, text, line, column);
}

void Lexer::lexString(std::uint32_t line, std::uint32_t column)
{
    std::string value;
    (void) advance();
    while (!isAtEnd() && peek() != '"' && peek() != '\n')
    {
        const char c = advance();
        if (c == '\\' && !isAtEnd())
        {
            const char esc = advance();
            switch (esc)
            {
            case 'n':
                value.push_back('\n');
                break;
            case 't':
                value.push_back('\t');
                break;
            default:
                value.push_back(esc);
                break;
            }
        }
        else
        {
            value.push_back(c);
        }
    }
    if (peek() != '"')
    {
        emit(TokenKind::Invalid, "unterminated string literal", line, column);
        return;
    }
    (void) advance();
    emit(TokenKind::String, value, line, column);
}

std::vector<Token> Lexer::lex()
{
    while (!isAtEnd())
    {
        const std::uint32_t tokLine = line_;
        const std::uint32_t tokCol  = column_;
        const char          c       = peek();

        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        {
            (void) advance();
            continue;
        }
        if (c == '#')
        {
            while (!isAtEnd() && peek() != '\n')
            {
                (void) advance();
            }
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
        {
            lexIdentifier(tokLine, tokCol);
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            lexInteger(tokLine, tokCol);
            continue;
        }
        if (c == '"')
        {
            lexString(tokLine, tokCol);
            continue;
        }
        if (c == ':' && peek(1) == ':')
        {
            (void) advance();
            (void) advance();
            emit(TokenKind::ColonColon, "::", tokLine, tokCol);
            continue;
        }

        const TokenKind kind = [&]() {
            switch (c)
            {
            case '@':
                return TokenKind::At;
            case '(':
                return TokenKind::LParen;
            case ')':
                return TokenKind::RParen;
            case '{':
                return TokenKind::LBrace;
            case '}':
                return TokenKind::RBrace;
            case '<':
                return TokenKind::Less;
            case '>':
                return TokenKind::Greater;
            case ',':
                return TokenKind::Comma;
            case ';':
                return TokenKind::Semicolon;
            case ':':
                return TokenKind::Colon;
            case '.':
                return TokenKind::Dot;
            default:
                return TokenKind::Invalid;
            }
        }();

        (void) advance();
        emit(kind, std::string(1, c), tokLine, tokCol);
    }

    emit(TokenKind::Eof, "", line_, column_);
    return tokens_;
}

}  // namespace stateserde
