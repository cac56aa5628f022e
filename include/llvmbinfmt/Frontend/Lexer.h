//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Token and lexer declarations for schema expressions (`condition`, `length_field`, `discriminant`).
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_FRONTEND_LEXER_H
#define LLVMBINFMT_FRONTEND_LEXER_H

#include "llvmbinfmt/Frontend/SourceLocation.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace llvmbinfmt
{

/// @file
/// @brief Tokenization interfaces for schema expression text.

/// @brief Token categories recognized by the lexer.
enum class TokenKind
{

    /// @brief End-of-input sentinel.
    Eof,

    /// @brief Character sequence that does not form a valid token.
    Invalid,

    /// @brief Identifier token.
    Identifier,

    /// @brief Integer literal token.
    Integer,

    /// @brief Real literal token.
    Real,

    /// @brief String literal token.
    String,

    /// @brief `true` keyword token.
    True,

    /// @brief `false` keyword token.
    False,

    /// @brief `(` token.
    LParen,

    /// @brief `)` token.
    RParen,

    /// @brief `[` token.
    LBracket,

    /// @brief `]` token.
    RBracket,

    /// @brief `.` token.
    Dot,

    /// @brief `+` token.
    Plus,

    /// @brief `-` token.
    Minus,

    /// @brief `*` token.
    Star,

    /// @brief `/` token.
    Slash,

    /// @brief `%` token.
    Percent,

    /// @brief `!` token.
    Bang,

    /// @brief `<` token.
    Less,

    /// @brief `>` token.
    Greater,

    /// @brief `<=` token.
    LessEqual,

    /// @brief `>=` token.
    GreaterEqual,

    /// @brief `==` token.
    EqualEqual,

    /// @brief `!=` token.
    BangEqual,

    /// @brief `||` token.
    PipePipe,

    /// @brief `&&` token.
    AmpAmp,
};

/// @brief Single lexical token emitted by @ref Lexer.
struct Token
{
    /// @brief Token category.
    TokenKind kind{TokenKind::Eof};

    /// @brief Token spelling; for string literals, the unescaped contents.
    std::string text;

    /// @brief Start location of the token.
    SourceLocation location;
};

/// @brief Converts one expression string into a token stream.
class Lexer final
{
public:
    /// @brief Constructs a lexer for one expression.
    /// @param[in] path Schema path of the attribute holding the expression.
    /// @param[in] text Full expression text to tokenize.
    Lexer(std::string path, std::string text);

    /// @brief Tokenizes the input.
    /// @return Token sequence terminated by @ref TokenKind::Eof.
    [[nodiscard]] std::vector<Token> lex();

private:
    /// @brief Returns true when all input characters are consumed.
    [[nodiscard]] bool isAtEnd() const;

    /// @brief Peeks at the current or lookahead character without consuming it.
    [[nodiscard]] char peek(std::size_t lookahead = 0) const;

    /// @brief Consumes and returns the next character.
    char advance();

    /// @brief Emits one token into the output stream.
    void emit(TokenKind kind, std::string text, std::uint32_t column);

    /// @brief Lexes an identifier or keyword token.
    void lexIdentifierOrKeyword(std::uint32_t column);

    /// @brief Lexes an integer or real literal token.
    void lexNumber(std::uint32_t column);

    /// @brief Lexes a quoted string literal token.
    void lexString(std::uint32_t column, char quote);

    /// @brief Schema path used in token locations.
    std::string path_;

    /// @brief Full expression text.
    std::string text_;

    /// @brief Current byte offset.
    std::size_t index_{0};

    /// @brief Output token buffer.
    std::vector<Token> tokens_;
};

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_FRONTEND_LEXER_H
