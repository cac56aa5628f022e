//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Serializer declarations: value tree to bytes.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_CODEC_SERIALIZER_H
#define LLVMBINFMT_CODEC_SERIALIZER_H

#include "llvmbinfmt/Codec/CodecOptions.h"
#include "llvmbinfmt/Codec/FunctionRegistry.h"
#include "llvmbinfmt/Schema/Model.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <vector>

namespace llvmbinfmt
{

/// @brief Encodes a value tree into the byte layout described by @p document.
///
/// Fields are walked depth-first in document order. Calculated fields ignore
/// their input value; those whose scope is not complete yet are written as
/// zero placeholders and back-patched once the whole record exists.
///
/// @param[in] document Compiled schema.
/// @param[in] value Root object keyed by top-level field names.
/// @param[in] registry Calculated-field functions.
/// @param[in] options Codec settings.
/// @return Encoded bytes, or the first error met.
llvm::Expected<std::vector<std::uint8_t>> encode(const Document&          document,
                                                 const llvm::json::Value& value,
                                                 const FunctionRegistry&  registry,
                                                 const CodecOptions&      options = {});

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_CODEC_SERIALIZER_H
