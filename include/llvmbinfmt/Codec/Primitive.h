//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fixed-width scalar and text codec helpers.
///
/// This header provides byte-order aware integer, floating-point, and character
/// helpers used by the serializer and the deserializer, plus the text
/// encodings accepted by string fields.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_CODEC_PRIMITIVE_H
#define LLVMBINFMT_CODEC_PRIMITIVE_H

#include "llvmbinfmt/Schema/Model.h"
#include "llvmbinfmt/Support/Error.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace llvmbinfmt
{

/// @brief Appends the low @p width bytes of @p value in the given byte order.
void writeUnsigned(std::uint64_t value, std::size_t width, Endianness endianness, std::vector<std::uint8_t>& out);

/// @brief Overwrites @p width bytes at @p offset with the low bytes of @p value.
void patchUnsigned(std::uint64_t              value,
                   std::size_t                width,
                   Endianness                 endianness,
                   std::vector<std::uint8_t>& buffer,
                   std::size_t                offset);

/// @brief Reads an unsigned integer spanning all of @p bytes (at most eight).
std::uint64_t readUnsigned(llvm::ArrayRef<std::uint8_t> bytes, Endianness endianness);

/// @brief Encodes one scalar value.
/// @param[in] kind Scalar kind.
/// @param[in] endianness Byte order.
/// @param[in] value JSON value to encode.
/// @param[in,out] out Output buffer; exactly `primitiveWidth(kind)` bytes are appended on success.
/// @param[in] site Location attached to errors.
/// @return `TypeMismatchError` for a wrong JSON type, `RangeError` for a value the kind cannot hold.
llvm::Error encodePrimitive(PrimitiveKind              kind,
                            Endianness                 endianness,
                            const llvm::json::Value&   value,
                            std::vector<std::uint8_t>& out,
                            const ErrorSite&           site);

/// @brief Checks that an unsigned result fits @p kind.
/// @return `RangeError` when it does not.
llvm::Error checkUnsignedFits(PrimitiveKind kind, std::uint64_t value, const ErrorSite& site);

/// @brief Decodes one scalar value from exactly `primitiveWidth(kind)` bytes.
llvm::json::Value decodePrimitive(PrimitiveKind kind, Endianness endianness, llvm::ArrayRef<std::uint8_t> bytes);

/// @brief Converts UTF-8 text into the bytes of @p encoding.
/// @return Encoded bytes or a `RangeError` for characters the encoding cannot represent.
llvm::Expected<std::string> encodeText(llvm::StringRef text, StringEncoding encoding, const ErrorSite& site);

/// @brief Converts bytes in @p encoding into UTF-8 text, replacing undecodable sequences.
std::string decodeText(llvm::ArrayRef<std::uint8_t> bytes, StringEncoding encoding);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_CODEC_PRIMITIVE_H
