//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema-ordered JSON printing for decoded records.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_CODEC_JSON_WRITER_H
#define LLVMBINFMT_CODEC_JSON_WRITER_H

#include "llvmbinfmt/Schema/Model.h"

#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace llvmbinfmt
{

/// @brief Prints @p value with object keys in document order.
///
/// `llvm::json::Object` does not keep insertion order, so decoded records are
/// printed by walking the schema instead. Keys the schema does not name follow
/// in sorted order.
///
/// @param[in] document Schema describing @p value.
/// @param[in] value Record value, typically a decode result.
/// @param[in,out] os Output stream.
/// @param[in] indent Spaces per nesting level; zero prints compactly.
void writeOrderedJSON(const Document& document, const llvm::json::Value& value, llvm::raw_ostream& os, unsigned indent = 2);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_CODEC_JSON_WRITER_H
