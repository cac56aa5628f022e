#ifndef LLVMBINFMT_FRONTEND_AST_H
#define LLVMBINFMT_FRONTEND_AST_H

#include "llvmbinfmt/Frontend/SourceLocation.h"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace llvmbinfmt {

enum class UnaryOp {
  Plus,
  Minus,
  LogicalNot,
};

enum class BinaryOp {
  Mul,
  Div,
  Mod,
  Add,
  Sub,
  Eq,
  Ne,
  Le,
  Ge,
  Lt,
  Gt,
  LogicalOr,
  LogicalAnd,
};

struct PathSegment {
  enum class Kind {
    Field,
    Index,
  };

  Kind kind{Kind::Field};
  std::string name;
  std::int64_t index{0};
};

struct ExprAST {
  struct Path {
    std::vector<PathSegment> segments;

    [[nodiscard]] std::string str() const;
  };

  struct Unary {
    UnaryOp op;
    std::shared_ptr<ExprAST> operand;
  };

  struct Binary {
    BinaryOp op;
    std::shared_ptr<ExprAST> lhs;
    std::shared_ptr<ExprAST> rhs;
  };

  SourceLocation location;
  std::variant<bool, std::int64_t, double, std::string, Path, Unary, Binary>
      value;

  [[nodiscard]] std::string str() const;
};

using ExprPtr = std::shared_ptr<const ExprAST>;

const char *binaryOpSpelling(BinaryOp op);

void collectPaths(const ExprAST &expr,
                  std::vector<const ExprAST::Path *> &out);

} // namespace llvmbinfmt

#endif // LLVMBINFMT_FRONTEND_AST_H
