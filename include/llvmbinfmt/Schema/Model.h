//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Compiled schema model: the immutable field tree walked by the codec.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_SCHEMA_MODEL_H
#define LLVMBINFMT_SCHEMA_MODEL_H

#include "llvmbinfmt/Frontend/AST.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llvmbinfmt
{

/// @file
/// @brief Compiled schema model.

/// @brief Byte order of every multi-byte scalar in a document.
enum class Endianness
{

    /// @brief Least-significant byte first.
    Little,

    /// @brief Most-significant byte first.
    Big,
};

/// @brief Fixed-width scalar kinds.
enum class PrimitiveKind
{
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64,
    Char,
};

/// @brief Field spec categories.
enum class FieldKind
{

    /// @brief Fixed-width scalar.
    Primitive,

    /// @brief Byte string with fixed, field-provided, or prefixed length.
    String,

    /// @brief Homogeneous sequence.
    Array,

    /// @brief Ordered named children.
    Struct,

    /// @brief One alternative selected by a discriminant.
    Union,
};

/// @brief Text encodings accepted by string fields.
enum class StringEncoding
{
    Utf8,
    Ascii,
    Latin1,
};

/// @brief Byte range handed to a calculated-field function.
enum class FunctionScope
{

    /// @brief Buffer start up to the first byte of the calculated field.
    AllPrevious,

    /// @brief First byte of a start field through the last byte of an end field.
    FieldRange,

    /// @brief Whole record with the calculated field's bytes zeroed.
    EntireFile,
};

/// @brief Expression text together with its parsed form.
struct CompiledExpr final
{
    /// @brief Source text as written in the schema.
    std::string text;

    /// @brief Parsed expression.
    ExprPtr ast;
};

/// @brief Calculated-field attributes.
struct CalculatedSpec final
{
    /// @brief Registered function name.
    std::string function;

    /// @brief Scope selector.
    FunctionScope scope{FunctionScope::AllPrevious};

    /// @brief First field of a `field_range` scope.
    std::string rangeStart;

    /// @brief Last field of a `field_range` scope.
    std::string rangeEnd;

    /// @brief Parameters passed to the function.
    llvm::json::Object parameters;
};

/// @brief One compiled field.
struct FieldSpec final
{
    FieldKind   kind{FieldKind::Primitive};
    std::string name;
    std::string description;

    /// @brief Presence condition.
    std::optional<CompiledExpr> condition;

    /// @brief Calculated-field attributes, primitive fields only.
    std::optional<CalculatedSpec> calculated;

    /// @brief Scalar kind for primitive fields.
    PrimitiveKind primitive{PrimitiveKind::UInt8};

    /// @brief Fixed byte size for strings, fixed element count for arrays.
    std::optional<std::uint64_t> size;

    /// @brief String encoding.
    StringEncoding encoding{StringEncoding::Utf8};

    /// @brief Byte length (strings) or element count (arrays) taken from the context.
    std::optional<CompiledExpr> lengthField;

    /// @brief Anonymous element spec for arrays.
    std::shared_ptr<const FieldSpec> element;

    /// @brief Children of struct fields.
    std::vector<FieldSpec> fields;

    /// @brief Union selector.
    std::optional<CompiledExpr> discriminant;

    /// @brief Union alternatives in declaration order.
    std::vector<FieldSpec> alternatives;

    /// @brief Literal that selects this spec when it is a union alternative.
    std::optional<llvm::json::Value> caseValue;

    /// @brief Smallest number of bytes this field can occupy when present.
    std::size_t minWireSize{0};
};

/// @brief Compiled, immutable schema.
struct Document final
{
    Endianness             endianness{Endianness::Little};
    std::string            description;
    std::vector<FieldSpec> fields;
};

/// @brief Returns the encoded width of a primitive kind in bytes.
std::size_t primitiveWidth(PrimitiveKind kind);

/// @brief Returns the schema spelling of a primitive kind, for example `uint16`.
const char* primitiveKindName(PrimitiveKind kind);

/// @brief Parses a schema type name into a primitive kind.
std::optional<PrimitiveKind> parsePrimitiveKind(llvm::StringRef name);

/// @brief Returns true for signed and unsigned integer kinds.
bool isIntegerKind(PrimitiveKind kind);

/// @brief Returns true for signed integer kinds.
bool isSignedKind(PrimitiveKind kind);

/// @brief Returns the schema spelling of a field kind.
const char* fieldKindName(FieldKind kind);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_SCHEMA_MODEL_H
