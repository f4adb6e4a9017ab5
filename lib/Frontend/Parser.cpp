//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements recursive-descent parsing for the schema frontend.
///
/// The parser builds record and union declarations with raw annotations. It enforces only the grammar; annotation
/// meaning is checked later by attribute resolution.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Frontend/Parser.h"

#include "stateserde/Frontend/Discovery.h"
#include "stateserde/Frontend/Lexer.h"
#include "stateserde/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

#include <utility>

namespace stateserde
{
namespace
{

std::string describeToken(const Token& token)
{
    switch (token.kind)
    {
    case TokenKind::Identifier:
    case TokenKind::Integer:
        return "'" + token.text + "'";
    case TokenKind::String:
        return "string \"" + token.text + "\"";
    case TokenKind::Invalid:
        return token.text.size() == 1 ? "'" + token.text + "'" : token.text;
    default:
        return tokenKindName(token.kind);
    }
}

std::string quoteString(const std::string& value)
{
    std::string out = "\"";
    for (char c : value)
    {
        if (c == '"' || c == '\\')
        {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string joinTokens(const std::vector<Token>& tokens)
{
    std::string out;
    for (const Token& token : tokens)
    {
        if (token.kind == TokenKind::String)
        {
            out += quoteString(token.text);
        }
        else if (token.kind == TokenKind::Comma)
        {
            out += ", ";
        }
        else
        {
            out += token.text;
        }
    }
    return out;
}

}  // namespace

Parser::Parser(std::string filePath, std::vector<Token> tokens, DiagnosticEngine& diagnostics)
    : filePath_(std::move(filePath))
    , tokens_(std::move(tokens))
    , diagnostics_(diagnostics)
{
    if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof)
    {
        tokens_.push_back(Token{TokenKind::Eof, "", SourceLocation{filePath_, 1, 1}});
    }
}

const Token& Parser::current() const
{
    return tokens_[cursor_];
}

const Token& Parser::previous() const
{
    return tokens_[cursor_ - 1];
}

bool Parser::isAtEnd() const
{
    return current().kind == TokenKind::Eof;
}

bool Parser::check(TokenKind kind) const
{
    return current().kind == kind;
}

bool Parser::checkKeyword(const char* keyword) const
{
    return check(TokenKind::Identifier) && current().text == keyword;
}

bool Parser::match(TokenKind kind)
{
    if (!check(kind))
    {
        return false;
    }
    (void) advance();
    return true;
}

const Token& Parser::advance()
{
    if (!isAtEnd())
    {
        if (current().kind == TokenKind::LBrace)
        {
            ++braceDepth_;
        }
        else if (current().kind == TokenKind::RBrace && braceDepth_ > 0)
        {
            --braceDepth_;
        }
        ++cursor_;
    }
    return previous();
}

bool Parser::expect(TokenKind kind, const std::string& what)
{
    if (check(kind))
    {
        (void) advance();
        return true;
    }
    diagnostics_.error(DiagnosticCategory::Syntax,
                       current().location,
                       "expected " + what + ", found " + describeToken(current()));
    return false;
}

void Parser::syncToStatementEnd()
{
    while (!isAtEnd())
    {
        const TokenKind kind = advance().kind;
        if (braceDepth_ == 0 && (kind == TokenKind::Semicolon || kind == TokenKind::RBrace))
        {
            return;
        }
    }
}

llvm::Expected<SchemaFileAST> Parser::parseSchemaFile()
{
    SchemaFileAST file;
    file.location = SourceLocation{filePath_, 1, 1};

    bool              sawNamespace   = false;
    const std::size_t syntaxErrorsIn = diagnostics_.errorCount(DiagnosticCategory::Syntax);

    while (!isAtEnd())
    {
        const SourceLocation location = current().location;

        if (checkKeyword("namespace"))
        {
            (void) advance();
            std::vector<std::string> components;
            bool                     ok = true;
            do
            {
                if (!check(TokenKind::Identifier))
                {
                    ok = expect(TokenKind::Identifier, "namespace component");
                    break;
                }
                components.push_back(advance().text);
            } while (match(TokenKind::Dot) || match(TokenKind::ColonColon));
            ok = ok && expect(TokenKind::Semicolon, "';' after namespace");
            if (!ok)
            {
                syncToStatementEnd();
                continue;
            }
            if (sawNamespace)
            {
                diagnostics_.error(DiagnosticCategory::Syntax, location, "duplicate namespace statement");
                continue;
            }
            sawNamespace             = true;
            file.namespaceComponents = std::move(components);
            continue;
        }

        if (checkKeyword("include"))
        {
            (void) advance();
            IncludeDeclAST include;
            include.location = location;
            if (!check(TokenKind::String))
            {
                (void) expect(TokenKind::String, "quoted include path");
                syncToStatementEnd();
                continue;
            }
            include.path = advance().text;
            if (!expect(TokenKind::Semicolon, "';' after include"))
            {
                syncToStatementEnd();
                continue;
            }
            file.includes.push_back(std::move(include));
            continue;
        }

        auto annotations = parseAnnotations();
        if (!annotations)
        {
            syncToStatementEnd();
            continue;
        }

        const SourceLocation declLocation = current().location;
        std::optional<TypeDeclAST> decl;
        if (checkKeyword("record"))
        {
            (void) advance();
            decl = parseRecord(std::move(*annotations), declLocation);
        }
        else if (checkKeyword("union"))
        {
            (void) advance();
            decl = parseUnion(std::move(*annotations), declLocation);
        }
        else
        {
            diagnostics_.error(DiagnosticCategory::Syntax,
                               current().location,
                               "expected 'record', 'union', 'namespace' or 'include', found " +
                                   describeToken(current()));
            syncToStatementEnd();
            continue;
        }

        if (!decl)
        {
            syncToStatementEnd();
            continue;
        }
        file.types.push_back(std::move(*decl));
    }

    if (diagnostics_.errorCount(DiagnosticCategory::Syntax) > syntaxErrorsIn)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "schema parse failed: %s", filePath_.c_str());
    }
    return file;
}

std::optional<std::vector<AnnotationAST>> Parser::parseAnnotations()
{
    std::vector<AnnotationAST> out;
    while (check(TokenKind::At))
    {
        AnnotationAST annotation;
        annotation.location = current().location;
        (void) advance();
        if (!check(TokenKind::Identifier))
        {
            (void) expect(TokenKind::Identifier, "annotation name after '@'");
            return std::nullopt;
        }
        annotation.name = advance().text;

        if (match(TokenKind::LParen))
        {
            annotation.hasArguments = true;
            int depth               = 1;
            while (!isAtEnd())
            {
                if (check(TokenKind::LParen))
                {
                    ++depth;
                }
                else if (check(TokenKind::RParen) && --depth == 0)
                {
                    break;
                }
                annotation.argumentTokens.push_back(advance());
            }
            if (!expect(TokenKind::RParen, "')' to close the arguments of @" + annotation.name))
            {
                return std::nullopt;
            }
            annotation.argumentText = joinTokens(annotation.argumentTokens);
        }
        out.push_back(std::move(annotation));
    }
    return out;
}

bool Parser::parseGenericParams(std::vector<std::string>& out)
{
    if (!match(TokenKind::Less))
    {
        return true;
    }
    do
    {
        if (!check(TokenKind::Identifier))
        {
            return expect(TokenKind::Identifier, "generic parameter name");
        }
        out.push_back(advance().text);
    } while (match(TokenKind::Comma));
    return expect(TokenKind::Greater, "'>' to close generic parameters");
}

std::optional<TypeDeclAST> Parser::parseRecord(std::vector<AnnotationAST> annotations, const SourceLocation& location)
{
    TypeDeclAST decl;
    decl.location    = location;
    decl.kind        = TypeDeclKind::Record;
    decl.annotations = std::move(annotations);

    if (!check(TokenKind::Identifier))
    {
        (void) expect(TokenKind::Identifier, "record name");
        return std::nullopt;
    }
    decl.name = advance().text;
    if (!parseGenericParams(decl.genericParams))
    {
        return std::nullopt;
    }

    if (check(TokenKind::LBrace))
    {
        decl.style = PayloadStyle::Named;
        if (!parseNamedFields(decl.fields))
        {
            return std::nullopt;
        }
        (void) match(TokenKind::Semicolon);
        return decl;
    }
    if (check(TokenKind::LParen))
    {
        decl.style = PayloadStyle::Positional;
        if (!parsePositionalFields(decl.fields) || !expect(TokenKind::Semicolon, "';' after positional record"))
        {
            return std::nullopt;
        }
        return decl;
    }
    if (match(TokenKind::Semicolon))
    {
        decl.style = PayloadStyle::Unit;
        return decl;
    }

    (void) expect(TokenKind::LBrace, "'{', '(' or ';' after record name");
    return std::nullopt;
}

std::optional<TypeDeclAST> Parser::parseUnion(std::vector<AnnotationAST> annotations, const SourceLocation& location)
{
    TypeDeclAST decl;
    decl.location    = location;
    decl.kind        = TypeDeclKind::Union;
    decl.annotations = std::move(annotations);

    if (!check(TokenKind::Identifier))
    {
        (void) expect(TokenKind::Identifier, "union name");
        return std::nullopt;
    }
    decl.name = advance().text;
    if (!parseGenericParams(decl.genericParams) || !expect(TokenKind::LBrace, "'{' to open union body"))
    {
        return std::nullopt;
    }

    while (!check(TokenKind::RBrace) && !isAtEnd())
    {
        auto variantAnnotations = parseAnnotations();
        if (!variantAnnotations)
        {
            return std::nullopt;
        }

        VariantDeclAST variant;
        variant.location    = current().location;
        variant.annotations = std::move(*variantAnnotations);
        if (!check(TokenKind::Identifier))
        {
            (void) expect(TokenKind::Identifier, "variant name");
            return std::nullopt;
        }
        variant.name = advance().text;

        if (check(TokenKind::LParen))
        {
            variant.style = PayloadStyle::Positional;
            if (!parsePositionalFields(variant.fields))
            {
                return std::nullopt;
            }
        }
        else if (check(TokenKind::LBrace))
        {
            variant.style = PayloadStyle::Named;
            if (!parseNamedFields(variant.fields))
            {
                return std::nullopt;
            }
        }
        decl.variants.push_back(std::move(variant));

        // A braced payload already closes the variant, so its separator is optional.
        const bool closedByBrace = previous().kind == TokenKind::RBrace;
        if (match(TokenKind::Comma) || match(TokenKind::Semicolon) || closedByBrace)
        {
            continue;
        }
        if (!check(TokenKind::RBrace))
        {
            (void) expect(TokenKind::Comma, "',' or '}' after variant");
            return std::nullopt;
        }
    }

    if (!expect(TokenKind::RBrace, "'}' to close union body"))
    {
        return std::nullopt;
    }
    (void) match(TokenKind::Semicolon);
    return decl;
}

bool Parser::parseNamedFields(std::vector<FieldDeclAST>& out)
{
    if (!expect(TokenKind::LBrace, "'{'"))
    {
        return false;
    }
    while (!check(TokenKind::RBrace) && !isAtEnd())
    {
        auto annotations = parseAnnotations();
        if (!annotations)
        {
            return false;
        }

        FieldDeclAST field;
        field.location    = current().location;
        field.annotations = std::move(*annotations);
        if (!check(TokenKind::Identifier))
        {
            (void) expect(TokenKind::Identifier, "field name");
            return false;
        }
        field.name = advance().text;
        if (!expect(TokenKind::Colon, "':' after field name"))
        {
            return false;
        }
        auto type = parseTypeRef();
        if (!type || !expect(TokenKind::Semicolon, "';' after field declaration"))
        {
            return false;
        }
        field.type = std::move(*type);
        out.push_back(std::move(field));
    }
    return expect(TokenKind::RBrace, "'}' to close field list");
}

bool Parser::parsePositionalFields(std::vector<FieldDeclAST>& out)
{
    if (!expect(TokenKind::LParen, "'('"))
    {
        return false;
    }
    while (!check(TokenKind::RParen) && !isAtEnd())
    {
        auto annotations = parseAnnotations();
        if (!annotations)
        {
            return false;
        }

        FieldDeclAST field;
        field.location    = current().location;
        field.annotations = std::move(*annotations);
        auto type         = parseTypeRef();
        if (!type)
        {
            return false;
        }
        field.type = std::move(*type);
        out.push_back(std::move(field));

        if (!match(TokenKind::Comma))
        {
            break;
        }
    }
    return expect(TokenKind::RParen, "')' to close positional fields");
}

std::optional<TypeRefAST> Parser::parseTypeRef()
{
    TypeRefAST ref;
    ref.location        = current().location;
    ref.globalQualified = match(TokenKind::ColonColon);

    do
    {
        if (!check(TokenKind::Identifier))
        {
            (void) expect(TokenKind::Identifier, "type name");
            return std::nullopt;
        }
        ref.path.push_back(advance().text);
    } while (match(TokenKind::ColonColon));

    if (match(TokenKind::Less))
    {
        do
        {
            auto argument = parseTypeRef();
            if (!argument)
            {
                return std::nullopt;
            }
            ref.arguments.push_back(std::move(*argument));
        } while (match(TokenKind::Comma));
        if (!expect(TokenKind::Greater, "'>' to close type arguments"))
        {
            return std::nullopt;
        }
    }
    return ref;
}

std::optional<TypeRefAST> Parser::parseStandaloneTypeRef()
{
    auto ref = parseTypeRef();
    if (!ref)
    {
        return std::nullopt;
    }
    if (!isAtEnd())
    {
        diagnostics_.error(DiagnosticCategory::Syntax,
                           current().location,
                           "unexpected " + describeToken(current()) + " after type");
        return std::nullopt;
    }
    return ref;
}

llvm::Expected<TypeRefAST> parseTypeRefTokens(const std::vector<Token>& tokens)
{
    const std::string file = tokens.empty() ? std::string() : tokens.front().location.file;
    DiagnosticEngine  scratch;
    Parser            parser(file, tokens, scratch);
    auto              ref = parser.parseStandaloneTypeRef();
    if (!ref)
    {
        const std::string message =
            scratch.diagnostics().empty() ? std::string("invalid type") : scratch.diagnostics().front().message;
        return llvm::createStringError(llvm::inconvertibleErrorCode(), message);
    }
    return *ref;
}

llvm::Expected<SchemaFileAST> parseSchemaText(const std::string& filePath,
                                              const std::string& text,
                                              DiagnosticEngine&  diagnostics)
{
    Lexer  lexer(filePath, text);
    auto   tokens = lexer.lex();
    Parser parser(filePath, std::move(tokens), diagnostics);
    return parser.parseSchemaFile();
}

llvm::Expected<ASTModule> parseSchemas(const std::vector<std::string>& schemaRoots, DiagnosticEngine& diagnostics)
{
    ASTModule module;
    auto      discovered = discoverSchemas(schemaRoots, diagnostics);

    for (auto& schema : discovered)
    {
        auto parsed = parseSchemaText(schema.filePath, schema.text, diagnostics);
        if (!parsed)
        {
            llvm::consumeError(parsed.takeError());
            continue;
        }
        module.schemas.push_back(ParsedSchema{std::move(schema), std::move(*parsed)});
    }

    if (diagnostics.hasErrors())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "parsing failed");
    }
    return module;
}

}  // namespace stateserde
