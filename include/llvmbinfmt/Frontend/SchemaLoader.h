//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema text and file loading.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_FRONTEND_SCHEMA_LOADER_H
#define LLVMBINFMT_FRONTEND_SCHEMA_LOADER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace llvmbinfmt
{

class DiagnosticEngine;

/// @brief Parses schema JSON text into an object carrying a top-level `fields` array.
/// @param[in] text Schema JSON text.
/// @param[in] sourceName Name used in diagnostics, for example the file path.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Schema object or a `SchemaError`.
llvm::Expected<llvm::json::Object> parseSchemaText(llvm::StringRef   text,
                                                   llvm::StringRef   sourceName,
                                                   DiagnosticEngine& diagnostics);

/// @brief Reads and parses a schema file.
/// @param[in] path File path.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Schema object or a `SchemaError`.
llvm::Expected<llvm::json::Object> loadSchemaFile(llvm::StringRef path, DiagnosticEngine& diagnostics);

/// @brief Reads and parses a JSON document of any shape.
/// @param[in] path File path.
/// @return Parsed value or an error naming the file.
llvm::Expected<llvm::json::Value> loadJSONFile(llvm::StringRef path);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_FRONTEND_SCHEMA_LOADER_H
