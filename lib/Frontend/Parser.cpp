//===----------------------------------------------------------------------===//
///
/// @file
/// Implements precedence-climbing parsing for schema expressions.
///
/// Expressions are literals, field paths, unary and binary operators, and parentheses. Paths accept
/// dotted members, integer indices, quoted keys, and the `context['name']` spelling.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Frontend/Parser.h"

#include "llvmbinfmt/Support/Diagnostics.h"
#include "llvmbinfmt/Support/Error.h"

#include <cstdlib>
#include <limits>
#include <optional>
#include <utility>

namespace llvmbinfmt
{
namespace
{

std::string removeUnderscores(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        if (c != '_')
        {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::int64_t> parseIntegerLiteral(const std::string& in)
{
    std::string s     = removeUnderscores(in);
    int         base  = 10;
    std::size_t start = 0;

    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
    {
        base  = 16;
        start = 2;
    }
    else if (s.size() > 2 && s[0] == '0' && (s[1] == 'b' || s[1] == 'B'))
    {
        base  = 2;
        start = 2;
    }
    else if (s.size() > 2 && s[0] == '0' && (s[1] == 'o' || s[1] == 'O'))
    {
        base  = 8;
        start = 2;
    }
    if (start >= s.size() && start != 0)
    {
        return std::nullopt;
    }

    std::int64_t out = 0;
    for (std::size_t i = start; i < s.size(); ++i)
    {
        const char c = s[i];
        int        v = -1;
        if (c >= '0' && c <= '9')
        {
            v = c - '0';
        }
        else if (c >= 'a' && c <= 'f')
        {
            v = 10 + (c - 'a');
        }
        else if (c >= 'A' && c <= 'F')
        {
            v = 10 + (c - 'A');
        }
        if (v < 0 || v >= base)
        {
            return std::nullopt;
        }
        if (out > (std::numeric_limits<std::int64_t>::max() - v) / base)
        {
            return std::nullopt;
        }
        out = out * base + v;
    }
    return out;
}

std::optional<double> parseRealLiteral(const std::string& in)
{
    const std::string s   = removeUnderscores(in);
    char*             end = nullptr;
    const double      out = std::strtod(s.c_str(), &end);
    if (end == nullptr || *end != '\0')
    {
        return std::nullopt;
    }
    return out;
}

std::optional<BinaryOp> toBinaryOp(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Star:
        return BinaryOp::Mul;
    case TokenKind::Slash:
        return BinaryOp::Div;
    case TokenKind::Percent:
        return BinaryOp::Mod;
    case TokenKind::Plus:
        return BinaryOp::Add;
    case TokenKind::Minus:
        return BinaryOp::Sub;
    case TokenKind::EqualEqual:
        return BinaryOp::Eq;
    case TokenKind::BangEqual:
        return BinaryOp::Ne;
    case TokenKind::LessEqual:
        return BinaryOp::Le;
    case TokenKind::GreaterEqual:
        return BinaryOp::Ge;
    case TokenKind::Less:
        return BinaryOp::Lt;
    case TokenKind::Greater:
        return BinaryOp::Gt;
    case TokenKind::PipePipe:
        return BinaryOp::LogicalOr;
    case TokenKind::AmpAmp:
        return BinaryOp::LogicalAnd;
    default:
        return std::nullopt;
    }
}

}  // namespace

Parser::Parser(std::vector<Token> tokens, DiagnosticEngine& diagnostics)
    : tokens_(std::move(tokens))
    , diagnostics_(diagnostics)
{
    if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof)
    {
        tokens_.push_back(Token{TokenKind::Eof, "", {}});
    }
}

const Token& Parser::current() const
{
    return tokens_[cursor_];
}

const Token& Parser::previous() const
{
    return tokens_[cursor_ == 0 ? 0 : cursor_ - 1];
}

bool Parser::check(TokenKind kind) const
{
    return current().kind == kind;
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

bool Parser::matchAny(std::initializer_list<TokenKind> kinds)
{
    for (const auto k : kinds)
    {
        if (match(k))
        {
            return true;
        }
    }
    return false;
}

const Token& Parser::advance()
{
    if (current().kind != TokenKind::Eof)
    {
        ++cursor_;
    }
    return previous();
}

bool Parser::expect(TokenKind kind, const std::string& message)
{
    if (match(kind))
    {
        return true;
    }
    diagnostics_.error(current().location, message);
    failed_ = true;
    return false;
}

llvm::Expected<ExprPtr> Parser::parseExpressionOnly()
{
    const SourceLocation start = current().location;
    auto                 expr  = parseExpression();
    if (expr && !check(TokenKind::Eof))
    {
        diagnostics_.error(current().location, "unexpected token '" + current().text + "' after expression");
        failed_ = true;
    }
    if (!expr || failed_)
    {
        return makeCodecError(ErrorKind::Schema, start.path, std::nullopt, "malformed expression at " + start.str());
    }
    return ExprPtr(std::move(expr));
}

std::shared_ptr<ExprAST> Parser::parseExpression(int precedence)
{
    auto lhs = parseUnary();
    if (!lhs)
    {
        return nullptr;
    }

    while (true)
    {
        const TokenKind tk     = current().kind;
        const int       opPrec = precedenceOf(tk);
        if (opPrec < 0 || opPrec < precedence)
        {
            break;
        }
        const auto maybeOp = toBinaryOp(tk);
        if (!maybeOp)
        {
            break;
        }
        const SourceLocation loc = current().location;
        (void) advance();

        auto rhs = parseExpression(opPrec + 1);
        if (!rhs)
        {
            diagnostics_.error(loc, "expected right-hand side expression");
            failed_ = true;
            return nullptr;
        }

        auto node      = std::make_shared<ExprAST>();
        node->location = loc;
        node->value    = ExprAST::Binary{*maybeOp, lhs, rhs};
        lhs            = node;
    }

    return lhs;
}

std::shared_ptr<ExprAST> Parser::parseUnary()
{
    if (matchAny({TokenKind::Plus, TokenKind::Minus, TokenKind::Bang}))
    {
        const Token opTok   = previous();
        auto        operand = parseUnary();
        if (!operand)
        {
            diagnostics_.error(opTok.location, "expected expression after unary operator");
            failed_ = true;
            return nullptr;
        }

        UnaryOp op = UnaryOp::Plus;
        if (opTok.kind == TokenKind::Minus)
        {
            op = UnaryOp::Minus;
        }
        else if (opTok.kind == TokenKind::Bang)
        {
            op = UnaryOp::LogicalNot;
        }

        auto node      = std::make_shared<ExprAST>();
        node->location = opTok.location;
        node->value    = ExprAST::Unary{op, operand};
        return node;
    }
    return parsePrimary();
}

std::shared_ptr<ExprAST> Parser::parsePrimary()
{
    if (match(TokenKind::True) || match(TokenKind::False))
    {
        auto n      = std::make_shared<ExprAST>();
        n->location = previous().location;
        n->value    = previous().kind == TokenKind::True;
        return n;
    }

    if (match(TokenKind::Integer))
    {
        const auto maybe = parseIntegerLiteral(previous().text);
        if (!maybe)
        {
            diagnostics_.error(previous().location, "invalid integer literal '" + previous().text + "'");
            failed_ = true;
            return nullptr;
        }
        auto n      = std::make_shared<ExprAST>();
        n->location = previous().location;
        n->value    = *maybe;
        return n;
    }

    if (match(TokenKind::Real))
    {
        const auto maybe = parseRealLiteral(previous().text);
        if (!maybe)
        {
            diagnostics_.error(previous().location, "invalid real literal '" + previous().text + "'");
            failed_ = true;
            return nullptr;
        }
        auto n      = std::make_shared<ExprAST>();
        n->location = previous().location;
        n->value    = *maybe;
        return n;
    }

    if (match(TokenKind::String))
    {
        auto n      = std::make_shared<ExprAST>();
        n->location = previous().location;
        n->value    = previous().text;
        return n;
    }

    if (match(TokenKind::LParen))
    {
        auto e = parseExpression();
        if (!e)
        {
            return nullptr;
        }
        if (!expect(TokenKind::RParen, "expected ')' after expression"))
        {
            return nullptr;
        }
        return e;
    }

    if (match(TokenKind::Identifier))
    {
        return parsePath();
    }

    if (check(TokenKind::Invalid))
    {
        diagnostics_.error(current().location, "invalid token '" + current().text + "'");
    }
    else
    {
        diagnostics_.error(current().location, "expected expression atom");
    }
    failed_ = true;
    return nullptr;
}

std::shared_ptr<ExprAST> Parser::parsePath()
{
    auto n      = std::make_shared<ExprAST>();
    n->location = previous().location;

    ExprAST::Path path;
    path.segments.push_back(PathSegment{PathSegment::Kind::Field, previous().text, 0});

    // `context['name']` addresses the same lookup as a bare `name`.
    if (previous().text == "context" && check(TokenKind::LBracket) && cursor_ + 1 < tokens_.size() &&
        tokens_[cursor_ + 1].kind == TokenKind::String)
    {
        path.segments.clear();
    }

    while (true)
    {
        if (match(TokenKind::Dot))
        {
            if (!expect(TokenKind::Identifier, "expected member name after '.'"))
            {
                return nullptr;
            }
            path.segments.push_back(PathSegment{PathSegment::Kind::Field, previous().text, 0});
            continue;
        }
        if (match(TokenKind::LBracket))
        {
            if (match(TokenKind::String))
            {
                path.segments.push_back(PathSegment{PathSegment::Kind::Field, previous().text, 0});
            }
            else if (match(TokenKind::Integer))
            {
                const auto maybe = parseIntegerLiteral(previous().text);
                if (!maybe)
                {
                    diagnostics_.error(previous().location, "invalid index '" + previous().text + "'");
                    failed_ = true;
                    return nullptr;
                }
                if (path.segments.empty())
                {
                    diagnostics_.error(previous().location, "index must follow a field name");
                    failed_ = true;
                    return nullptr;
                }
                path.segments.push_back(PathSegment{PathSegment::Kind::Index, "", *maybe});
            }
            else
            {
                diagnostics_.error(current().location, "expected integer index or quoted key inside '[]'");
                failed_ = true;
                return nullptr;
            }
            if (!expect(TokenKind::RBracket, "expected ']'"))
            {
                return nullptr;
            }
            continue;
        }
        break;
    }

    n->value = std::move(path);
    return n;
}

int Parser::precedenceOf(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Star:
    case TokenKind::Slash:
    case TokenKind::Percent:
        return 70;
    case TokenKind::Plus:
    case TokenKind::Minus:
        return 60;
    case TokenKind::LessEqual:
    case TokenKind::GreaterEqual:
    case TokenKind::Less:
    case TokenKind::Greater:
        return 40;
    case TokenKind::EqualEqual:
    case TokenKind::BangEqual:
        return 30;
    case TokenKind::AmpAmp:
        return 20;
    case TokenKind::PipePipe:
        return 10;
    default:
        return -1;
    }
}

llvm::Expected<ExprPtr> parseExpressionText(llvm::StringRef text, const std::string& path, DiagnosticEngine& diagnostics)
{
    Lexer  lexer(path, text.str());
    Parser parser(lexer.lex(), diagnostics);
    return parser.parseExpressionOnly();
}

}  // namespace llvmbinfmt
