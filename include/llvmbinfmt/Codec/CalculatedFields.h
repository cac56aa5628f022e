//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Byte-range bookkeeping, calculated-field scope selection, and union selection shared by both
/// traversal directions.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_CODEC_CALCULATED_FIELDS_H
#define LLVMBINFMT_CODEC_CALCULATED_FIELDS_H

#include "llvmbinfmt/Codec/FunctionRegistry.h"
#include "llvmbinfmt/Schema/Model.h"
#include "llvmbinfmt/Semantics/Evaluator.h"
#include "llvmbinfmt/Support/Error.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llvmbinfmt
{

/// @brief Half-open byte interval `[begin, end)`.
struct ByteRange final
{
    std::size_t begin{0};
    std::size_t end{0};
};

/// @brief Byte ranges of every field walked so far, keyed by dotted field path.
class FieldRangeTable final
{
public:
    /// @brief Records the bytes occupied by the field at @p path.
    void record(llvm::StringRef path, ByteRange range);

    /// @brief Finds a field referenced from inside @p scopePath.
    ///
    /// The reference is tried relative to @p scopePath first, then to each
    /// enclosing scope up to the root.
    [[nodiscard]] std::optional<ByteRange> find(llvm::StringRef scopePath, llvm::StringRef reference) const;

private:
    llvm::StringMap<ByteRange> ranges_;
};

/// @brief Calculated field whose value is produced or verified after the traversal.
struct DeferredField final
{
    /// @brief Field being calculated.
    const FieldSpec* spec{nullptr};

    /// @brief Error location of the field.
    ErrorSite site;

    /// @brief Dotted path of the scope that declares the field.
    std::string scopePath;

    /// @brief Bytes occupied by the field.
    ByteRange bytes;
};

/// @brief Returns true when the field must wait until the whole record is walked.
///
/// `entire_file` scopes are always deferred; `field_range` scopes are deferred
/// while their end field has not been walked yet.
bool isDeferred(const CalculatedSpec& calc, llvm::StringRef scopePath, const FieldRangeTable& ranges);

/// @brief Computes a calculated field's value.
/// @param[in] registry Function table.
/// @param[in] spec Calculated primitive field.
/// @param[in] buffer Record bytes available so far.
/// @param[in] own Bytes occupied by the field itself; zeroed before the function runs.
/// @param[in] scopePath Dotted path of the declaring scope.
/// @param[in] ranges Byte ranges of walked fields.
/// @param[in] zeroed Additional placeholder ranges treated as zero.
/// @param[in] site Location attached to errors.
/// @return Function result, already checked to fit the field's kind.
llvm::Expected<std::uint64_t> computeCalculatedValue(const FunctionRegistry&      registry,
                                                     const FieldSpec&             spec,
                                                     llvm::ArrayRef<std::uint8_t> buffer,
                                                     ByteRange                    own,
                                                     llvm::StringRef              scopePath,
                                                     const FieldRangeTable&       ranges,
                                                     llvm::ArrayRef<ByteRange>    zeroed,
                                                     const ErrorSite&             site);

/// @brief Picks the union alternative selected by a discriminant value.
/// @return Selected alternative or a `SchemaError` when nothing matches.
llvm::Expected<const FieldSpec*> selectAlternative(const FieldSpec& unionSpec,
                                                   const Value&     discriminant,
                                                   const ErrorSite& site);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_CODEC_CALCULATED_FIELDS_H
