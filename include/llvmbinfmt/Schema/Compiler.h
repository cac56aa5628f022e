//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema compiler declarations: JSON schema object to immutable @ref llvmbinfmt::Document.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_SCHEMA_COMPILER_H
#define LLVMBINFMT_SCHEMA_COMPILER_H

#include "llvmbinfmt/Schema/Model.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>

namespace llvmbinfmt
{

class DiagnosticEngine;

/// @file
/// @brief Schema compilation interfaces.

/// @brief Limits applied while compiling a schema.
struct CompileOptions final
{
    /// @brief Deepest permitted struct, array, and union nesting.
    std::size_t maxNestingDepth{64};
};

/// @brief Validates a schema object and compiles it into a document.
///
/// Every structural problem found is reported to @p diagnostics with its schema
/// path; the returned error summarises them.
///
/// @param[in] schema Parsed schema object.
/// @param[in,out] diagnostics Diagnostic sink.
/// @param[in] options Compilation limits.
/// @return Compiled document or a `SchemaError`.
llvm::Expected<Document> compileSchema(const llvm::json::Object& schema,
                                       DiagnosticEngine&         diagnostics,
                                       const CompileOptions&     options = {});

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_SCHEMA_COMPILER_H
