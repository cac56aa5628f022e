//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Scoped, write-once value context used while walking a record.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_SEMANTICS_CONTEXT_H
#define LLVMBINFMT_SEMANTICS_CONTEXT_H

#include "llvmbinfmt/Frontend/AST.h"
#include "llvmbinfmt/Support/Error.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <string>
#include <vector>

namespace llvmbinfmt
{

/// @file
/// @brief Traversal context shared by the serializer, the deserializer, and the evaluator.

/// @brief Whether a path lookup may fall back to the caller's input values.
enum class InputFallback
{

    /// @brief Only values already produced or consumed are visible.
    Disabled,

    /// @brief Values not yet produced are looked up in the input object.
    Enabled,
};

/// @brief Stack of frames mirroring the struct nesting of the record being walked.
///
/// Each frame collects the values produced for its fields. Encoding additionally
/// attaches the caller's input object to each frame so length expressions may
/// fall back to input values that have not been produced yet. Fields skipped by a
/// false condition are never taken from the input.
class Context final
{
public:
    /// @brief Creates a context with one root frame.
    /// @param[in] rootInput Input object for encoding, or null for decoding.
    explicit Context(const llvm::json::Object* rootInput = nullptr);

    /// @brief Opens a frame for a struct, union, or array element.
    /// @param[in] key Name that paths may use to address the frame, or empty for array elements.
    /// @param[in] label Path component used in error messages, for example `items[3]`.
    /// @param[in] input Input object for the frame, or null.
    void pushFrame(std::string key, std::string label, const llvm::json::Object* input);

    /// @brief Closes the innermost frame.
    /// @return Values produced inside the frame.
    llvm::json::Object popFrame();

    /// @brief Records a produced field value in the innermost frame.
    /// @param[in] name Field name.
    /// @param[in] value Produced value.
    /// @return Error when the name was already recorded in this frame.
    llvm::Error record(llvm::StringRef name, llvm::json::Value value);

    /// @brief Marks @p name in the innermost frame as absent because its condition was false.
    void markSkipped(llvm::StringRef name);

    /// @brief Returns the input object of the innermost frame, or null.
    [[nodiscard]] const llvm::json::Object* currentInput() const;

    /// @brief Returns the dotted path of the innermost frame, empty at the root.
    [[nodiscard]] std::string scopePath() const;

    /// @brief Returns the dotted path of field @p name inside the innermost frame.
    [[nodiscard]] std::string fieldPath(llvm::StringRef name) const;

    /// @brief Resolves a path against produced values, then against input values when allowed.
    /// @param[in] path Parsed path.
    /// @param[in] site Location attached to resolution errors.
    /// @param[in] fallback Whether unresolved paths may be read from the input object.
    /// @return Resolved value or a `ReferenceError`.
    llvm::Expected<llvm::json::Value> resolve(const ExprAST::Path& path,
                                              const ErrorSite&     site,
                                              InputFallback        fallback = InputFallback::Disabled) const;

private:
    struct Frame
    {
        std::string               key;
        std::string               label;
        llvm::json::Object        produced;
        const llvm::json::Object* input{nullptr};
        llvm::StringSet<>         skipped;
    };

    [[nodiscard]] static bool isSkipped(const Frame& frame, const std::vector<PathSegment>& segments);

    std::vector<Frame> frames_;
};

/// @brief Parses @p pathText and resolves it in @p context.
/// @param[in] context Traversal context.
/// @param[in] pathText Path such as `header.count`, `items[0].id`, or `context['a']['b']`.
/// @param[in] site Location attached to errors.
/// @param[in] fallback Whether unresolved paths may be read from the input object.
/// @return Resolved value, or a `ReferenceError` when the text is not a resolvable path.
llvm::Expected<llvm::json::Value> resolvePath(const Context&  context,
                                              llvm::StringRef pathText,
                                              const ErrorSite& site,
                                              InputFallback    fallback = InputFallback::Disabled);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_SEMANTICS_CONTEXT_H
