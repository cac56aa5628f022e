//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Parser declarations for constructing expression ASTs from token streams.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_FRONTEND_PARSER_H
#define LLVMBINFMT_FRONTEND_PARSER_H

#include "llvmbinfmt/Frontend/AST.h"
#include "llvmbinfmt/Frontend/Lexer.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace llvmbinfmt
{

class DiagnosticEngine;

/// @file
/// @brief Precedence-climbing expression parser interfaces.

/// @brief Parses a token stream into one expression AST.
class Parser final
{
public:
    /// @brief Constructs a parser for one expression.
    /// @param[in] tokens Token stream to parse.
    /// @param[in,out] diagnostics Diagnostic sink for parse errors.
    Parser(std::vector<Token> tokens, DiagnosticEngine& diagnostics);

    /// @brief Parses the whole token stream as one expression.
    /// @return Parsed expression or an error when the text is malformed or has trailing tokens.
    llvm::Expected<ExprPtr> parseExpressionOnly();

private:
    /// @brief Returns the current token.
    const Token& current() const;

    /// @brief Returns the previous token.
    const Token& previous() const;

    /// @brief Returns true when the current token matches `kind`.
    bool check(TokenKind kind) const;

    /// @brief Consumes current token when it matches `kind`.
    bool match(TokenKind kind);

    /// @brief Consumes current token when it matches any candidate kind.
    bool matchAny(std::initializer_list<TokenKind> kinds);

    /// @brief Consumes and returns the current token.
    const Token& advance();

    /// @brief Enforces the next token kind and emits diagnostics on mismatch.
    bool expect(TokenKind kind, const std::string& message);

    /// @brief Parses a binary expression at or above `precedence`.
    std::shared_ptr<ExprAST> parseExpression(int precedence = 0);

    /// @brief Parses a unary expression.
    std::shared_ptr<ExprAST> parseUnary();

    /// @brief Parses a primary expression atom.
    std::shared_ptr<ExprAST> parsePrimary();

    /// @brief Parses a field path whose head identifier was just consumed.
    std::shared_ptr<ExprAST> parsePath();

    /// @brief Returns binary operator precedence for a token kind, or -1.
    static int precedenceOf(TokenKind kind);

    /// @brief Token stream being parsed.
    std::vector<Token> tokens_;

    /// @brief Diagnostic sink.
    DiagnosticEngine& diagnostics_;

    /// @brief Index of the current token.
    std::size_t cursor_{0};

    /// @brief Set once any syntax error is reported.
    bool failed_{false};
};

/// @brief Lexes and parses one expression string.
/// @param[in] text Expression text.
/// @param[in] path Schema path of the attribute holding the expression.
/// @param[in,out] diagnostics Diagnostic sink for lexical and syntax errors.
/// @return Parsed expression or an error.
llvm::Expected<ExprPtr> parseExpressionText(llvm::StringRef text, const std::string& path, DiagnosticEngine& diagnostics);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_FRONTEND_PARSER_H
