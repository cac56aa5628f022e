//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the format handler facade.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Codec/FormatHandler.h"

#include "llvmbinfmt/Codec/Serializer.h"
#include "llvmbinfmt/Frontend/SchemaLoader.h"
#include "llvmbinfmt/Support/Diagnostics.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace llvmbinfmt
{

FormatHandler::FormatHandler(std::shared_ptr<const Document> document, FunctionRegistry registry, CodecOptions options)
    : document_(std::move(document))
    , registry_(std::move(registry))
    , options_(options)
{
}

llvm::Expected<FormatHandler> FormatHandler::create(const llvm::json::Object& schema,
                                                    const CodecOptions&       options,
                                                    DiagnosticEngine*         diagnostics,
                                                    const CompileOptions&     compileOptions)
{
    DiagnosticEngine  local;
    DiagnosticEngine& sink     = diagnostics != nullptr ? *diagnostics : local;
    auto              document = compileSchema(schema, sink, compileOptions);
    if (!document)
    {
        return document.takeError();
    }
    return FormatHandler(std::make_shared<const Document>(std::move(*document)),
                         FunctionRegistry::withBuiltins(),
                         options);
}

llvm::Expected<FormatHandler> FormatHandler::createFromFile(llvm::StringRef     schemaPath,
                                                            const CodecOptions& options,
                                                            DiagnosticEngine*   diagnostics)
{
    DiagnosticEngine  local;
    DiagnosticEngine& sink   = diagnostics != nullptr ? *diagnostics : local;
    auto              schema = loadSchemaFile(schemaPath, sink);
    if (!schema)
    {
        return schema.takeError();
    }
    return create(*schema, options, &sink);
}

llvm::Expected<std::vector<std::uint8_t>> FormatHandler::encode(const llvm::json::Value& value) const
{
    return llvmbinfmt::encode(*document_, value, registry_, options_);
}

llvm::Expected<DecodeResult> FormatHandler::decode(llvm::ArrayRef<std::uint8_t> bytes,
                                                   DiagnosticEngine*            diagnostics) const
{
    return llvmbinfmt::decode(*document_, bytes, registry_, options_, diagnostics);
}

llvm::Error FormatHandler::encodeToFile(const llvm::json::Value& value, llvm::StringRef path) const
{
    auto bytes = encode(value);
    if (!bytes)
    {
        return bytes.takeError();
    }
    std::error_code      ec;
    llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_None);
    if (ec)
    {
        return llvm::createStringError(ec, "cannot open %s for writing", path.str().c_str());
    }
    os.write(reinterpret_cast<const char*>(bytes->data()), bytes->size());
    os.close();
    if (os.has_error())
    {
        const std::error_code writeError = os.error();
        os.clear_error();
        return llvm::createStringError(writeError, "cannot write %s", path.str().c_str());
    }
    return llvm::Error::success();
}

llvm::Expected<DecodeResult> FormatHandler::decodeFile(llvm::StringRef path, DiagnosticEngine* diagnostics) const
{
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/false, /*RequiresNullTerminator=*/false);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(), "cannot read %s", path.str().c_str());
    }
    const llvm::StringRef raw = (*buffer)->getBuffer();
    return decode(llvm::ArrayRef<std::uint8_t>(reinterpret_cast<const std::uint8_t*>(raw.data()), raw.size()),
                  diagnostics);
}

}  // namespace llvmbinfmt
