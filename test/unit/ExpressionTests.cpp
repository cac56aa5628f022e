//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "llvmbinfmt/Frontend/AST.h"
#include "llvmbinfmt/Frontend/Lexer.h"
#include "llvmbinfmt/Frontend/Parser.h"
#include "llvmbinfmt/Semantics/Context.h"
#include "llvmbinfmt/Semantics/Evaluator.h"
#include "llvmbinfmt/Support/Diagnostics.h"
#include "llvmbinfmt/Support/Error.h"

namespace
{

llvm::Expected<llvmbinfmt::Value> evaluateText(const std::string&              text,
                                               const llvmbinfmt::Context&      context,
                                               const llvmbinfmt::InputFallback fallback = llvmbinfmt::InputFallback::Disabled)
{
    llvmbinfmt::DiagnosticEngine diag;
    auto                         expr = llvmbinfmt::parseExpressionText(text, "expr", diag);
    if (!expr)
    {
        return expr.takeError();
    }
    return llvmbinfmt::evaluate(**expr, context, llvmbinfmt::ErrorSite{"expr", std::nullopt}, fallback);
}

bool expectInt(const std::string&              text,
               const std::int64_t              expected,
               const llvmbinfmt::Context&      context,
               const llvmbinfmt::InputFallback fallback = llvmbinfmt::InputFallback::Disabled)
{
    auto value = evaluateText(text, context, fallback);
    if (!value)
    {
        std::cerr << "'" << text << "' failed: " << llvm::toString(value.takeError()) << "\n";
        return false;
    }
    const auto* i = std::get_if<std::int64_t>(&value->data);
    if (i == nullptr || *i != expected)
    {
        std::cerr << "'" << text << "' evaluated to " << value->str() << ", expected " << expected << "\n";
        return false;
    }
    return true;
}

bool expectBool(const std::string&              text,
                const bool                      expected,
                const llvmbinfmt::Context&      context,
                const llvmbinfmt::InputFallback fallback = llvmbinfmt::InputFallback::Disabled)
{
    auto value = evaluateText(text, context, fallback);
    if (!value)
    {
        std::cerr << "'" << text << "' failed: " << llvm::toString(value.takeError()) << "\n";
        return false;
    }
    const auto* b = std::get_if<bool>(&value->data);
    if (b == nullptr || *b != expected)
    {
        std::cerr << "'" << text << "' evaluated to " << value->str() << "\n";
        return false;
    }
    return true;
}

bool expectFailure(const std::string&              text,
                   const llvmbinfmt::ErrorKind     expected,
                   const llvmbinfmt::Context&      context,
                   const llvmbinfmt::InputFallback fallback = llvmbinfmt::InputFallback::Disabled)
{
    auto value = evaluateText(text, context, fallback);
    if (value)
    {
        std::cerr << "'" << text << "' unexpectedly evaluated to " << value->str() << "\n";
        return false;
    }
    const auto kind = llvmbinfmt::consumeErrorKind(value.takeError());
    if (kind != expected)
    {
        std::cerr << "'" << text << "' failed with "
                  << (kind ? llvmbinfmt::errorKindName(*kind) : "a non-codec error") << ", expected "
                  << llvmbinfmt::errorKindName(expected) << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runExpressionTests()
{
    {
        llvmbinfmt::Lexer lexer("lex.expr", "a.b[0] >= 0x1F && !flag || name == 'x\\'y'");
        const auto        tokens = lexer.lex();
        const std::vector<llvmbinfmt::TokenKind> expected = {
            llvmbinfmt::TokenKind::Identifier, llvmbinfmt::TokenKind::Dot,          llvmbinfmt::TokenKind::Identifier,
            llvmbinfmt::TokenKind::LBracket,   llvmbinfmt::TokenKind::Integer,      llvmbinfmt::TokenKind::RBracket,
            llvmbinfmt::TokenKind::GreaterEqual, llvmbinfmt::TokenKind::Integer,    llvmbinfmt::TokenKind::AmpAmp,
            llvmbinfmt::TokenKind::Bang,       llvmbinfmt::TokenKind::Identifier,   llvmbinfmt::TokenKind::PipePipe,
            llvmbinfmt::TokenKind::Identifier, llvmbinfmt::TokenKind::EqualEqual,   llvmbinfmt::TokenKind::String,
            llvmbinfmt::TokenKind::Eof,
        };
        if (tokens.size() != expected.size())
        {
            std::cerr << "unexpected token count: " << tokens.size() << "\n";
            return false;
        }
        for (std::size_t i = 0; i < expected.size(); ++i)
        {
            if (tokens[i].kind != expected[i])
            {
                std::cerr << "unexpected token kind at index " << i << ": '" << tokens[i].text << "'\n";
                return false;
            }
        }
        if (tokens[14].text != "x'y")
        {
            std::cerr << "string escape not decoded: " << tokens[14].text << "\n";
            return false;
        }
        if (tokens[2].location.column != 3)
        {
            std::cerr << "unexpected column for 'b': " << tokens[2].location.column << "\n";
            return false;
        }
    }

    {
        llvmbinfmt::Lexer lexer("lex.expr", "'open");
        const auto        tokens = lexer.lex();
        if (tokens.empty() || tokens.front().kind != llvmbinfmt::TokenKind::Invalid)
        {
            std::cerr << "unterminated string should lex as invalid\n";
            return false;
        }
    }

    {
        llvmbinfmt::DiagnosticEngine diag;
        auto                         expr = llvmbinfmt::parseExpressionText("context['header']['count']", "p", diag);
        if (!expr)
        {
            std::cerr << "context path failed to parse: " << llvm::toString(expr.takeError()) << "\n";
            return false;
        }
        const auto* path = std::get_if<llvmbinfmt::ExprAST::Path>(&(*expr)->value);
        if (path == nullptr || path->segments.size() != 2 || path->segments[0].name != "header" ||
            path->segments[1].name != "count")
        {
            std::cerr << "context prefix should be dropped from subscript paths\n";
            return false;
        }
    }

    {
        llvmbinfmt::DiagnosticEngine diag;
        auto                         expr = llvmbinfmt::parseExpressionText("1 +", "bad", diag);
        if (expr)
        {
            std::cerr << "dangling operator should not parse\n";
            return false;
        }
        if (llvmbinfmt::consumeErrorKind(expr.takeError()) != llvmbinfmt::ErrorKind::Schema || !diag.hasErrors())
        {
            std::cerr << "parse failure should be a schema error with diagnostics\n";
            return false;
        }
    }

    {
        llvmbinfmt::DiagnosticEngine diag;
        auto                         expr = llvmbinfmt::parseExpressionText("(a + 1", "bad", diag);
        if (expr)
        {
            std::cerr << "unbalanced parenthesis should not parse\n";
            return false;
        }
        llvm::consumeError(expr.takeError());
    }

    const llvmbinfmt::Context empty;
    if (!expectInt("1 + 2 * 3", 7, empty) || !expectInt("(1 + 2) * 3", 9, empty) || !expectInt("10 - 4 - 3", 3, empty) ||
        !expectInt("6 / 3", 2, empty) || !expectInt("-7 % 3", -1, empty) || !expectInt("-(2 - 5)", 3, empty) ||
        !expectInt("0x10 + 0b11", 19, empty))
    {
        return false;
    }

    {
        auto value = evaluateText("7 / 2", empty);
        if (!value)
        {
            std::cerr << "7 / 2 failed: " << llvm::toString(value.takeError()) << "\n";
            return false;
        }
        const auto* real = std::get_if<double>(&value->data);
        if (real == nullptr || *real != 3.5)
        {
            std::cerr << "inexact division should yield a real, got " << value->str() << "\n";
            return false;
        }
    }

    {
        auto value = evaluateText("'ab' + \"cd\"", empty);
        if (!value || value->str().find("abcd") == std::string::npos)
        {
            if (!value)
            {
                llvm::consumeError(value.takeError());
            }
            std::cerr << "string concatenation failed\n";
            return false;
        }
    }

    if (!expectBool("1 < 2 && 3 >= 3", true, empty) || !expectBool("!true", false, empty) ||
        !expectBool("1 == 1.0", true, empty) || !expectBool("1 == 'a'", false, empty) ||
        !expectBool("1 != 'a'", true, empty) || !expectBool("'abc' < 'abd'", true, empty) ||
        !expectBool("true || (1 / 0 == 0)", true, empty) || !expectBool("false && (1 / 0 == 0)", false, empty))
    {
        return false;
    }

    if (!expectFailure("1 < 'a'", llvmbinfmt::ErrorKind::TypeMismatch, empty) ||
        !expectFailure("1 / 0", llvmbinfmt::ErrorKind::TypeMismatch, empty) ||
        !expectFailure("5 % 0", llvmbinfmt::ErrorKind::TypeMismatch, empty) ||
        !expectFailure("1 && true", llvmbinfmt::ErrorKind::TypeMismatch, empty) ||
        !expectFailure("9223372036854775807 + 1", llvmbinfmt::ErrorKind::Range, empty) ||
        !expectFailure("missing + 1", llvmbinfmt::ErrorKind::Reference, empty))
    {
        return false;
    }

    {
        const llvm::json::Object input{
            {"header", llvm::json::Object{{"count", 3}, {"items", llvm::json::Array{5, 6}}}},
            {"flag", true},
        };
        const llvmbinfmt::Context context(&input);
        const auto                fromInput = llvmbinfmt::InputFallback::Enabled;
        if (!expectInt("header.count * 2", 6, context, fromInput) ||
            !expectInt("context['header']['count']", 3, context, fromInput) ||
            !expectInt("header.items[1]", 6, context, fromInput) ||
            !expectBool("flag && header.count > 2", true, context, fromInput))
        {
            return false;
        }
        if (!expectFailure("header", llvmbinfmt::ErrorKind::TypeMismatch, context, fromInput) ||
            !expectFailure("header.items[2]", llvmbinfmt::ErrorKind::Reference, context, fromInput))
        {
            return false;
        }
        // Without the fallback only produced values are visible.
        if (!expectFailure("header.count", llvmbinfmt::ErrorKind::Reference, context) ||
            !expectFailure("flag", llvmbinfmt::ErrorKind::Reference, context))
        {
            return false;
        }
    }

    {
        const llvm::json::Object input{{"flags", 0}, {"extra", 7}};
        llvmbinfmt::Context      context(&input);
        if (auto err = context.record("flags", llvm::json::Value(0)))
        {
            std::cerr << "record failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        context.markSkipped("extra");
        if (!expectFailure("extra", llvmbinfmt::ErrorKind::Reference, context, llvmbinfmt::InputFallback::Enabled))
        {
            return false;
        }

        context.pushFrame("header", "header", &input);
        context.markSkipped("flags");
        if (!expectFailure("header.flags + 1",
                           llvmbinfmt::ErrorKind::Reference,
                           context,
                           llvmbinfmt::InputFallback::Enabled) ||
            !expectInt("flags", 0, context, llvmbinfmt::InputFallback::Enabled))
        {
            return false;
        }
        (void) context.popFrame();
    }

    {
        llvmbinfmt::Context context;
        if (auto err = context.record("version", llvm::json::Value(2)))
        {
            std::cerr << "first record failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (llvmbinfmt::consumeErrorKind(context.record("version", llvm::json::Value(3))) !=
            llvmbinfmt::ErrorKind::Schema)
        {
            std::cerr << "context entries must be write-once\n";
            return false;
        }

        context.pushFrame("header", "header", nullptr);
        if (auto err = context.record("length", llvm::json::Value(4)))
        {
            std::cerr << "nested record failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (context.fieldPath("crc") != "header.crc")
        {
            std::cerr << "unexpected nested field path: " << context.fieldPath("crc") << "\n";
            return false;
        }
        if (!expectInt("header.length + version", 6, context) || !expectInt("length", 4, context))
        {
            return false;
        }

        context.pushFrame("", "items[0]", nullptr);
        if (context.scopePath() != "header.items[0]")
        {
            std::cerr << "unexpected element scope path: " << context.scopePath() << "\n";
            return false;
        }
        (void) context.popFrame();

        const auto header = context.popFrame();
        const auto length = header.getInteger("length");
        if (!length || *length != 4)
        {
            std::cerr << "popped frame lost its fields\n";
            return false;
        }
        if (!expectFailure("length", llvmbinfmt::ErrorKind::Reference, context))
        {
            return false;
        }
    }

    {
        const llvm::json::Object input{{"size", 12}};
        const llvmbinfmt::Context context(&input);
        auto value = llvmbinfmt::resolvePath(context,
                                             "size",
                                             llvmbinfmt::ErrorSite{"p", std::nullopt},
                                             llvmbinfmt::InputFallback::Enabled);
        if (!value)
        {
            std::cerr << "resolvePath failed: " << llvm::toString(value.takeError()) << "\n";
            return false;
        }
        const auto size = value->getAsInteger();
        if (!size || *size != 12)
        {
            std::cerr << "resolvePath returned the wrong value\n";
            return false;
        }
        auto notPath = llvmbinfmt::resolvePath(context, "size + 1", llvmbinfmt::ErrorSite{"p", std::nullopt});
        if (llvmbinfmt::consumeErrorKind(notPath.takeError()) != llvmbinfmt::ErrorKind::Reference)
        {
            std::cerr << "resolvePath should reject non-path expressions\n";
            return false;
        }
    }

    return true;
}
