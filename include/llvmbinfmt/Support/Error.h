//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy shared by the schema compiler, the serializer, and the deserializer.
///
/// Failures travel as `llvm::Error` values whose payload is a @ref llvmbinfmt::CodecError
/// carrying the error kind, the dotted field path, and the byte offset reached.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_SUPPORT_ERROR_H
#define LLVMBINFMT_SUPPORT_ERROR_H

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

namespace llvmbinfmt
{

/// @file
/// @brief Codec error kinds and the `llvm::Error` payload that carries them.

/// @brief Failure categories reported by the codec.
enum class ErrorKind
{

    /// @brief Malformed or incomplete schema definition.
    Schema,

    /// @brief Required input field absent during encode.
    MissingField,

    /// @brief Runtime value type incompatible with the declared kind.
    TypeMismatch,

    /// @brief Numeric overflow for the declared width, or string longer than its fixed size.
    Range,

    /// @brief Path or expression cannot be resolved in the current context.
    Reference,

    /// @brief Decode needs more bytes than remain.
    UnexpectedEndOfData,

    /// @brief Calculated-field verification failed.
    ChecksumMismatch,

    /// @brief Calculated-field function is not registered.
    UnsupportedFunction,

    /// @brief Claimed length exceeds the remaining buffer or a configured ceiling.
    UnboundedAllocation,

    /// @brief Strict-length decode left unconsumed bytes.
    TrailingData,
};

/// @brief Returns the stable name of an error kind, for example `TypeMismatchError`.
/// @param[in] kind Error kind.
/// @return Static name string.
const char* errorKindName(ErrorKind kind);

/// @brief `llvm::Error` payload describing one codec failure.
class CodecError final : public llvm::ErrorInfo<CodecError>
{
public:
    /// @brief Class identifier used by LLVM's error RTTI.
    static char ID;

    /// @brief Constructs a codec error payload.
    /// @param[in] kind Failure category.
    /// @param[in] fieldPath Dotted path of the field being processed, or empty.
    /// @param[in] byteOffset Byte offset reached when the failure happened, if known.
    /// @param[in] message Human-readable detail.
    CodecError(ErrorKind kind, std::string fieldPath, std::optional<std::size_t> byteOffset, std::string message);

    /// @brief Writes `Kind at 'path' (byte N): message`.
    void log(llvm::raw_ostream& os) const override;

    /// @brief Codec errors do not map to a system error code.
    std::error_code convertToErrorCode() const override;

    /// @brief Failure category.
    [[nodiscard]] ErrorKind kind() const
    {
        return kind_;
    }

    /// @brief Dotted path of the field being processed.
    [[nodiscard]] const std::string& fieldPath() const
    {
        return fieldPath_;
    }

    /// @brief Byte offset reached when the failure happened.
    [[nodiscard]] std::optional<std::size_t> byteOffset() const
    {
        return byteOffset_;
    }

    /// @brief Human-readable detail without the kind and location prefix.
    [[nodiscard]] const std::string& detail() const
    {
        return message_;
    }

private:
    ErrorKind                  kind_;
    std::string                fieldPath_;
    std::optional<std::size_t> byteOffset_;
    std::string                message_;
};

/// @brief Creates an `llvm::Error` carrying a @ref CodecError.
/// @param[in] kind Failure category.
/// @param[in] fieldPath Dotted field path, or empty.
/// @param[in] byteOffset Byte offset reached, if known.
/// @param[in] message Human-readable detail.
/// @return Error value.
llvm::Error makeCodecError(ErrorKind                  kind,
                           std::string                fieldPath,
                           std::optional<std::size_t> byteOffset,
                           const llvm::Twine&         message);

/// @brief Field path and byte offset attached to errors raised while processing one field.
struct ErrorSite
{
    /// @brief Dotted field path.
    std::string fieldPath;

    /// @brief Byte offset reached, if known.
    std::optional<std::size_t> byteOffset;
};

/// @brief Creates an `llvm::Error` carrying a @ref CodecError located at @p site.
llvm::Error makeCodecError(ErrorKind kind, const ErrorSite& site, const llvm::Twine& message);

/// @brief Consumes an error and reports its codec kind.
/// @param[in] err Error to consume.
/// @return The codec kind, or `std::nullopt` for success or for errors without a codec payload.
std::optional<ErrorKind> consumeErrorKind(llvm::Error err);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_SUPPORT_ERROR_H
