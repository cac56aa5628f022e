//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements schema loading from text and files.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Frontend/SchemaLoader.h"

#include "llvmbinfmt/Support/Diagnostics.h"
#include "llvmbinfmt/Support/Error.h"

#include "llvm/Support/MemoryBuffer.h"

#include <string>
#include <utility>

namespace llvmbinfmt
{

llvm::Expected<llvm::json::Object> parseSchemaText(llvm::StringRef   text,
                                                   llvm::StringRef   sourceName,
                                                   DiagnosticEngine& diagnostics)
{
    auto parsed = llvm::json::parse(text);
    if (!parsed)
    {
        const std::string message = llvm::toString(parsed.takeError());
        diagnostics.error(SourceLocation{sourceName.str(), 0}, "invalid JSON: " + message);
        return makeCodecError(ErrorKind::Schema, "", std::nullopt, "invalid schema JSON in " + sourceName + ": " + message);
    }

    auto* object = parsed->getAsObject();
    if (object == nullptr)
    {
        diagnostics.error(SourceLocation{sourceName.str(), 0}, "schema must be a JSON object");
        return makeCodecError(ErrorKind::Schema, "", std::nullopt, "schema in " + sourceName + " is not an object");
    }
    if (object->getArray("fields") == nullptr)
    {
        diagnostics.error(SourceLocation{sourceName.str(), 0}, "schema has no top-level fields array");
        return makeCodecError(ErrorKind::Schema, "", std::nullopt, "schema in " + sourceName + " has no fields array");
    }
    return std::move(*object);
}

llvm::Expected<llvm::json::Object> loadSchemaFile(llvm::StringRef path, DiagnosticEngine& diagnostics)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        diagnostics.error(SourceLocation{path.str(), 0}, "cannot read schema: " + buffer.getError().message());
        return makeCodecError(ErrorKind::Schema,
                              "",
                              std::nullopt,
                              "cannot read schema " + path + ": " + buffer.getError().message());
    }
    return parseSchemaText((*buffer)->getBuffer(), path, diagnostics);
}

llvm::Expected<llvm::json::Value> loadJSONFile(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(), "cannot read %s", path.str().c_str());
    }
    auto parsed = llvm::json::parse((*buffer)->getBuffer());
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid JSON in %s: %s",
                                       path.str().c_str(),
                                       llvm::toString(parsed.takeError()).c_str());
    }
    return std::move(*parsed);
}

}  // namespace llvmbinfmt
