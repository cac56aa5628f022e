//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Facade bundling a compiled schema with its function registry and codec options.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_CODEC_FORMAT_HANDLER_H
#define LLVMBINFMT_CODEC_FORMAT_HANDLER_H

#include "llvmbinfmt/Codec/CodecOptions.h"
#include "llvmbinfmt/Codec/Deserializer.h"
#include "llvmbinfmt/Codec/FunctionRegistry.h"
#include "llvmbinfmt/Schema/Compiler.h"
#include "llvmbinfmt/Schema/Model.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace llvmbinfmt
{

class DiagnosticEngine;

/// @brief Owns everything needed to encode and decode records of one format.
///
/// The compiled document is shared between copies of a handler. Register
/// custom functions through @ref registry before the first encode or decode.
class FormatHandler final
{
public:
    /// @brief Compiles @p schema and builds a handler with the built-in functions.
    /// @param[in] schema Parsed schema object.
    /// @param[in] options Codec settings.
    /// @param[in,out] diagnostics Receives compile diagnostics; may be null.
    /// @param[in] compileOptions Compilation limits.
    /// @return Handler or a `SchemaError`.
    static llvm::Expected<FormatHandler> create(const llvm::json::Object& schema,
                                                const CodecOptions&       options        = {},
                                                DiagnosticEngine*         diagnostics    = nullptr,
                                                const CompileOptions&     compileOptions = {});

    /// @brief Loads and compiles a schema file.
    static llvm::Expected<FormatHandler> createFromFile(llvm::StringRef     schemaPath,
                                                        const CodecOptions& options     = {},
                                                        DiagnosticEngine*   diagnostics = nullptr);

    /// @brief Returns the compiled document.
    [[nodiscard]] const Document& document() const
    {
        return *document_;
    }

    /// @brief Returns the function registry for customisation.
    FunctionRegistry& registry()
    {
        return registry_;
    }

    /// @brief Returns the codec settings for customisation.
    CodecOptions& options()
    {
        return options_;
    }

    /// @brief Encodes one record.
    llvm::Expected<std::vector<std::uint8_t>> encode(const llvm::json::Value& value) const;

    /// @brief Decodes one record.
    /// @param[in] bytes Complete input buffer.
    /// @param[in,out] diagnostics Receives checksum warnings under the report policy; may be null.
    llvm::Expected<DecodeResult> decode(llvm::ArrayRef<std::uint8_t> bytes, DiagnosticEngine* diagnostics = nullptr) const;

    /// @brief Encodes one record and writes it to @p path.
    llvm::Error encodeToFile(const llvm::json::Value& value, llvm::StringRef path) const;

    /// @brief Reads @p path and decodes the record it holds.
    llvm::Expected<DecodeResult> decodeFile(llvm::StringRef path, DiagnosticEngine* diagnostics = nullptr) const;

private:
    FormatHandler(std::shared_ptr<const Document> document, FunctionRegistry registry, CodecOptions options);

    std::shared_ptr<const Document> document_;
    FunctionRegistry                registry_;
    CodecOptions                    options_;
};

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_CODEC_FORMAT_HANDLER_H
