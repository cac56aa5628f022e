//===----------------------------------------------------------------------===//
///
/// @file
/// Implements expression evaluation over the traversal context.
///
/// Integer arithmetic stays integral and is overflow-checked. Mixed integer and real operands are
/// promoted to real. Logical operators short-circuit and require boolean operands.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Semantics/Evaluator.h"

#include "llvm/Support/MathExtras.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace llvmbinfmt
{
namespace
{

bool isNumeric(const Value& v)
{
    return std::holds_alternative<std::int64_t>(v.data) || std::holds_alternative<double>(v.data);
}

double asReal(const Value& v)
{
    if (const auto* i = std::get_if<std::int64_t>(&v.data))
    {
        return static_cast<double>(*i);
    }
    return std::get<double>(v.data);
}

llvm::Expected<Value> evalUnary(const ExprAST::Unary& unary,
                                const Context&        context,
                                const ErrorSite&      site,
                                const InputFallback   fallback)
{
    auto operand = evaluate(*unary.operand, context, site, fallback);
    if (!operand)
    {
        return operand.takeError();
    }

    switch (unary.op)
    {
    case UnaryOp::LogicalNot:
        if (const auto* b = std::get_if<bool>(&operand->data))
        {
            return Value{!*b};
        }
        return makeCodecError(ErrorKind::TypeMismatch, site, "'!' requires a bool operand, got " + operand->typeName());
    case UnaryOp::Plus:
        if (isNumeric(*operand))
        {
            return std::move(*operand);
        }
        break;
    case UnaryOp::Minus:
        if (const auto* i = std::get_if<std::int64_t>(&operand->data))
        {
            if (*i == std::numeric_limits<std::int64_t>::min())
            {
                return makeCodecError(ErrorKind::Range, site, "integer negation overflows");
            }
            return Value{-*i};
        }
        if (const auto* d = std::get_if<double>(&operand->data))
        {
            return Value{-*d};
        }
        break;
    }
    return makeCodecError(ErrorKind::TypeMismatch, site, "unary operator requires a number, got " + operand->typeName());
}

llvm::Expected<Value> evalIntegerArithmetic(BinaryOp op, std::int64_t a, std::int64_t b, const ErrorSite& site)
{
    std::int64_t out = 0;
    switch (op)
    {
    case BinaryOp::Add:
        if (llvm::AddOverflow(a, b, out))
        {
            return makeCodecError(ErrorKind::Range, site, "integer addition overflows");
        }
        return Value{out};
    case BinaryOp::Sub:
        if (llvm::SubOverflow(a, b, out))
        {
            return makeCodecError(ErrorKind::Range, site, "integer subtraction overflows");
        }
        return Value{out};
    case BinaryOp::Mul:
        if (llvm::MulOverflow(a, b, out))
        {
            return makeCodecError(ErrorKind::Range, site, "integer multiplication overflows");
        }
        return Value{out};
    case BinaryOp::Div:
        if (b == 0)
        {
            return makeCodecError(ErrorKind::TypeMismatch, site, "division by zero");
        }
        if (a == std::numeric_limits<std::int64_t>::min() && b == -1)
        {
            return makeCodecError(ErrorKind::Range, site, "integer division overflows");
        }
        if (a % b == 0)
        {
            return Value{a / b};
        }
        return Value{static_cast<double>(a) / static_cast<double>(b)};
    case BinaryOp::Mod:
        if (b == 0)
        {
            return makeCodecError(ErrorKind::TypeMismatch, site, "modulo by zero");
        }
        if (b == -1)
        {
            return Value{std::int64_t{0}};
        }
        return Value{a % b};
    default:
        break;
    }
    return makeCodecError(ErrorKind::TypeMismatch, site, "unsupported integer operator");
}

llvm::Expected<Value> evalRealArithmetic(BinaryOp op, double a, double b, const ErrorSite& site)
{
    switch (op)
    {
    case BinaryOp::Add:
        return Value{a + b};
    case BinaryOp::Sub:
        return Value{a - b};
    case BinaryOp::Mul:
        return Value{a * b};
    case BinaryOp::Div:
        if (b == 0.0)
        {
            return makeCodecError(ErrorKind::TypeMismatch, site, "division by zero");
        }
        return Value{a / b};
    case BinaryOp::Mod:
        if (b == 0.0)
        {
            return makeCodecError(ErrorKind::TypeMismatch, site, "modulo by zero");
        }
        return Value{std::fmod(a, b)};
    default:
        break;
    }
    return makeCodecError(ErrorKind::TypeMismatch, site, "unsupported real operator");
}

template <typename T>
bool compareOrdered(BinaryOp op, const T& a, const T& b)
{
    switch (op)
    {
    case BinaryOp::Eq:
        return a == b;
    case BinaryOp::Ne:
        return a != b;
    case BinaryOp::Lt:
        return a < b;
    case BinaryOp::Le:
        return a <= b;
    case BinaryOp::Gt:
        return a > b;
    case BinaryOp::Ge:
        return a >= b;
    default:
        return false;
    }
}

llvm::Expected<Value> evalComparison(BinaryOp op, const Value& lhs, const Value& rhs, const ErrorSite& site)
{
    const bool equality = op == BinaryOp::Eq || op == BinaryOp::Ne;

    if (isNumeric(lhs) && isNumeric(rhs))
    {
        const auto* li = std::get_if<std::int64_t>(&lhs.data);
        const auto* ri = std::get_if<std::int64_t>(&rhs.data);
        if (li != nullptr && ri != nullptr)
        {
            return Value{compareOrdered(op, *li, *ri)};
        }
        return Value{compareOrdered(op, asReal(lhs), asReal(rhs))};
    }
    if (const auto* ls = std::get_if<std::string>(&lhs.data))
    {
        if (const auto* rs = std::get_if<std::string>(&rhs.data))
        {
            return Value{compareOrdered(op, *ls, *rs)};
        }
    }
    if (equality)
    {
        if (const auto* lb = std::get_if<bool>(&lhs.data))
        {
            if (const auto* rb = std::get_if<bool>(&rhs.data))
            {
                return Value{compareOrdered(op, *lb, *rb)};
            }
        }
        // Values of different kinds are never equal.
        return Value{op == BinaryOp::Ne};
    }
    return makeCodecError(ErrorKind::TypeMismatch,
                          site,
                          "cannot order " + lhs.typeName() + " and " + rhs.typeName());
}

llvm::Expected<bool> requireBool(const Value& v, const char* what, const ErrorSite& site)
{
    if (const auto* b = std::get_if<bool>(&v.data))
    {
        return *b;
    }
    return makeCodecError(ErrorKind::TypeMismatch,
                          site,
                          llvm::Twine("'") + what + "' requires bool operands, got " + v.typeName());
}

llvm::Expected<Value> evalBinary(const ExprAST::Binary& binary,
                                 const Context&         context,
                                 const ErrorSite&       site,
                                 const InputFallback    fallback)
{
    auto lhs = evaluate(*binary.lhs, context, site, fallback);
    if (!lhs)
    {
        return lhs.takeError();
    }

    if (binary.op == BinaryOp::LogicalAnd || binary.op == BinaryOp::LogicalOr)
    {
        const char* spelling = binaryOpSpelling(binary.op);
        auto        l        = requireBool(*lhs, spelling, site);
        if (!l)
        {
            return l.takeError();
        }
        if ((binary.op == BinaryOp::LogicalAnd && !*l) || (binary.op == BinaryOp::LogicalOr && *l))
        {
            return Value{*l};
        }
        auto rhs = evaluate(*binary.rhs, context, site, fallback);
        if (!rhs)
        {
            return rhs.takeError();
        }
        auto r = requireBool(*rhs, spelling, site);
        if (!r)
        {
            return r.takeError();
        }
        return Value{*r};
    }

    auto rhs = evaluate(*binary.rhs, context, site, fallback);
    if (!rhs)
    {
        return rhs.takeError();
    }

    switch (binary.op)
    {
    case BinaryOp::Eq:
    case BinaryOp::Ne:
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
        return evalComparison(binary.op, *lhs, *rhs, site);
    default:
        break;
    }

    if (binary.op == BinaryOp::Add)
    {
        const auto* ls = std::get_if<std::string>(&lhs->data);
        const auto* rs = std::get_if<std::string>(&rhs->data);
        if (ls != nullptr && rs != nullptr)
        {
            return Value{*ls + *rs};
        }
    }

    if (!isNumeric(*lhs) || !isNumeric(*rhs))
    {
        return makeCodecError(ErrorKind::TypeMismatch,
                              site,
                              llvm::Twine("operator '") + binaryOpSpelling(binary.op) + "' cannot combine " +
                                  lhs->typeName() + " and " + rhs->typeName());
    }

    const auto* li = std::get_if<std::int64_t>(&lhs->data);
    const auto* ri = std::get_if<std::int64_t>(&rhs->data);
    if (li != nullptr && ri != nullptr)
    {
        return evalIntegerArithmetic(binary.op, *li, *ri, site);
    }
    return evalRealArithmetic(binary.op, asReal(*lhs), asReal(*rhs), site);
}

}  // namespace

std::string Value::typeName() const
{
    if (std::holds_alternative<bool>(data))
    {
        return "bool";
    }
    if (std::holds_alternative<std::int64_t>(data))
    {
        return "integer";
    }
    if (std::holds_alternative<double>(data))
    {
        return "real";
    }
    return "string";
}

std::string Value::str() const
{
    std::ostringstream out;
    if (const auto* b = std::get_if<bool>(&data))
    {
        out << (*b ? "true" : "false");
    }
    else if (const auto* i = std::get_if<std::int64_t>(&data))
    {
        out << *i;
    }
    else if (const auto* d = std::get_if<double>(&data))
    {
        out << *d;
    }
    else
    {
        out << '\'' << std::get<std::string>(data) << '\'';
    }
    return out.str();
}

llvm::Expected<Value> valueFromJSON(const llvm::json::Value& json, const ErrorSite& site)
{
    if (auto b = json.getAsBoolean())
    {
        return Value{*b};
    }
    if (auto i = json.getAsInteger())
    {
        return Value{*i};
    }
    if (auto u = json.getAsUINT64())
    {
        return Value{static_cast<double>(*u)};
    }
    if (auto d = json.getAsNumber())
    {
        return Value{*d};
    }
    if (auto s = json.getAsString())
    {
        return Value{s->str()};
    }
    return makeCodecError(ErrorKind::TypeMismatch, site, "expression operand is not a scalar value");
}

llvm::Expected<Value> evaluate(const ExprAST&      expr,
                               const Context&      context,
                               const ErrorSite&    site,
                               const InputFallback fallback)
{
    if (const auto* b = std::get_if<bool>(&expr.value))
    {
        return Value{*b};
    }
    if (const auto* i = std::get_if<std::int64_t>(&expr.value))
    {
        return Value{*i};
    }
    if (const auto* d = std::get_if<double>(&expr.value))
    {
        return Value{*d};
    }
    if (const auto* s = std::get_if<std::string>(&expr.value))
    {
        return Value{*s};
    }
    if (const auto* path = std::get_if<ExprAST::Path>(&expr.value))
    {
        auto resolved = context.resolve(*path, site, fallback);
        if (!resolved)
        {
            return resolved.takeError();
        }
        return valueFromJSON(*resolved, site);
    }
    if (const auto* unary = std::get_if<ExprAST::Unary>(&expr.value))
    {
        return evalUnary(*unary, context, site, fallback);
    }
    return evalBinary(std::get<ExprAST::Binary>(expr.value), context, site, fallback);
}

llvm::Expected<bool> evaluateCondition(const ExprAST& expr, const Context& context, const ErrorSite& site)
{
    auto v = evaluate(expr, context, site);
    if (!v)
    {
        return v.takeError();
    }
    if (const auto* b = std::get_if<bool>(&v->data))
    {
        return *b;
    }
    return makeCodecError(ErrorKind::TypeMismatch,
                          site,
                          "condition '" + expr.str() + "' yields " + v->typeName() + ", expected bool");
}

llvm::Expected<std::uint64_t> evaluateCount(const ExprAST& expr, const Context& context, const ErrorSite& site)
{
    auto v = evaluate(expr, context, site, InputFallback::Enabled);
    if (!v)
    {
        return v.takeError();
    }
    if (const auto* i = std::get_if<std::int64_t>(&v->data))
    {
        if (*i < 0)
        {
            return makeCodecError(ErrorKind::TypeMismatch,
                                  site,
                                  "length '" + expr.str() + "' is negative (" + std::to_string(*i) + ")");
        }
        return static_cast<std::uint64_t>(*i);
    }
    return makeCodecError(ErrorKind::TypeMismatch,
                          site,
                          "length '" + expr.str() + "' yields " + v->typeName() + ", expected a non-negative integer");
}

}  // namespace llvmbinfmt
