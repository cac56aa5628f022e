//===----------------------------------------------------------------------===//
///
/// @file
/// Implements textual rendering and traversal helpers for expression AST nodes.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Frontend/AST.h"

#include <sstream>

namespace llvmbinfmt
{

const char* binaryOpSpelling(const BinaryOp op)
{
    switch (op)
    {
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Mod:
        return "%";
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Eq:
        return "==";
    case BinaryOp::Ne:
        return "!=";
    case BinaryOp::Le:
        return "<=";
    case BinaryOp::Ge:
        return ">=";
    case BinaryOp::Lt:
        return "<";
    case BinaryOp::Gt:
        return ">";
    case BinaryOp::LogicalOr:
        return "||";
    case BinaryOp::LogicalAnd:
        return "&&";
    }
    return "?";
}

std::string ExprAST::Path::str() const
{
    std::ostringstream out;
    bool               first = true;
    for (const PathSegment& segment : segments)
    {
        if (segment.kind == PathSegment::Kind::Index)
        {
            out << '[' << segment.index << ']';
        }
        else
        {
            if (!first)
            {
                out << '.';
            }
            out << segment.name;
        }
        first = false;
    }
    return out.str();
}

std::string ExprAST::str() const
{
    std::ostringstream out;
    if (auto p = std::get_if<bool>(&value))
    {
        out << (*p ? "true" : "false");
    }
    else if (auto p = std::get_if<std::int64_t>(&value))
    {
        out << *p;
    }
    else if (auto p = std::get_if<double>(&value))
    {
        out << *p;
    }
    else if (auto p = std::get_if<std::string>(&value))
    {
        out << '\'' << *p << '\'';
    }
    else if (auto p = std::get_if<Path>(&value))
    {
        out << p->str();
    }
    else if (auto p = std::get_if<Unary>(&value))
    {
        out << (p->op == UnaryOp::LogicalNot ? "!" : (p->op == UnaryOp::Minus ? "-" : "+")) << '('
            << p->operand->str() << ')';
    }
    else if (auto p = std::get_if<Binary>(&value))
    {
        out << '(' << p->lhs->str() << ' ' << binaryOpSpelling(p->op) << ' ' << p->rhs->str() << ')';
    }
    return out.str();
}

void collectPaths(const ExprAST& expr, std::vector<const ExprAST::Path*>& out)
{
    if (auto p = std::get_if<ExprAST::Path>(&expr.value))
    {
        out.push_back(p);
    }
    else if (auto p = std::get_if<ExprAST::Unary>(&expr.value))
    {
        collectPaths(*p->operand, out);
    }
    else if (auto p = std::get_if<ExprAST::Binary>(&expr.value))
    {
        collectPaths(*p->lhs, out);
        collectPaths(*p->rhs, out);
    }
}

}  // namespace llvmbinfmt
