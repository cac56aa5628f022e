//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Deserializer declarations: bytes to value tree.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_CODEC_DESERIALIZER_H
#define LLVMBINFMT_CODEC_DESERIALIZER_H

#include "llvmbinfmt/Codec/CodecOptions.h"
#include "llvmbinfmt/Codec/FunctionRegistry.h"
#include "llvmbinfmt/Schema/Model.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <cstdint>

namespace llvmbinfmt
{

class DiagnosticEngine;

/// @brief Decoded record.
struct DecodeResult final
{
    /// @brief Root object keyed by top-level field names.
    llvm::json::Value value{nullptr};

    /// @brief Number of input bytes the record occupies.
    std::size_t bytesConsumed{0};
};

/// @brief Decodes one record laid out as described by @p document.
///
/// Counts and lengths come only from values already decoded. Claimed sizes are
/// checked against the remaining input and the configured ceilings before any
/// storage is reserved for them.
///
/// @param[in] document Compiled schema.
/// @param[in] bytes Complete input buffer.
/// @param[in] registry Calculated-field functions.
/// @param[in] options Codec settings.
/// @param[in,out] diagnostics Receives checksum warnings under @ref ChecksumPolicy::Report; may be null.
/// @return Decoded record, or the first error met.
llvm::Expected<DecodeResult> decode(const Document&              document,
                                    llvm::ArrayRef<std::uint8_t> bytes,
                                    const FunctionRegistry&      registry,
                                    const CodecOptions&          options     = {},
                                    DiagnosticEngine*            diagnostics = nullptr);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_CODEC_DESERIALIZER_H
