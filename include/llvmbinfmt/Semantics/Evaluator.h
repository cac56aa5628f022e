//===----------------------------------------------------------------------===//
///
/// @file
/// Expression evaluator declarations used for conditions, lengths, and discriminants.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_SEMANTICS_EVALUATOR_H
#define LLVMBINFMT_SEMANTICS_EVALUATOR_H

#include "llvmbinfmt/Frontend/AST.h"
#include "llvmbinfmt/Semantics/Context.h"
#include "llvmbinfmt/Support/Error.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <string>
#include <variant>

namespace llvmbinfmt
{

/// @file
/// @brief Expression evaluator interfaces.

/// @brief Runtime value produced by expression evaluation.
struct Value final
{
    /// @brief Value payload variant.
    std::variant<bool, std::int64_t, double, std::string> data;

    /// @brief Returns a stable textual type name for the active variant.
    /// @return Value type name string.
    [[nodiscard]] std::string typeName() const;

    /// @brief Returns a human-readable value representation.
    /// @return Value string.
    [[nodiscard]] std::string str() const;
};

/// @brief Converts a scalar JSON value into an evaluator value.
/// @param[in] json JSON scalar.
/// @param[in] site Location attached to errors.
/// @return Converted value, or a `TypeMismatchError` for null, objects, and arrays.
llvm::Expected<Value> valueFromJSON(const llvm::json::Value& json, const ErrorSite& site);

/// @brief Evaluates an expression against a traversal context.
/// @param[in] expr Expression to evaluate.
/// @param[in] context Context used for path lookups.
/// @param[in] site Location attached to errors.
/// @param[in] fallback Whether paths may be read from the input object.
/// @return Evaluated value or an error.
llvm::Expected<Value> evaluate(const ExprAST&   expr,
                               const Context&   context,
                               const ErrorSite& site,
                               InputFallback    fallback = InputFallback::Disabled);

/// @brief Evaluates a field condition, which must yield a boolean.
llvm::Expected<bool> evaluateCondition(const ExprAST& expr, const Context& context, const ErrorSite& site);

/// @brief Evaluates a length or count, which must yield a non-negative integer.
///
/// While encoding, a count whose field has not been written yet is read from the input.
llvm::Expected<std::uint64_t> evaluateCount(const ExprAST& expr, const Context& context, const ErrorSite& site);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_SEMANTICS_EVALUATOR_H
