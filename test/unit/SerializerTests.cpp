//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llvmbinfmt/Codec/CodecOptions.h"
#include "llvmbinfmt/Codec/FunctionRegistry.h"
#include "llvmbinfmt/Codec/Serializer.h"
#include "llvmbinfmt/Frontend/SchemaLoader.h"
#include "llvmbinfmt/Schema/Compiler.h"
#include "llvmbinfmt/Schema/Model.h"
#include "llvmbinfmt/Support/Diagnostics.h"
#include "llvmbinfmt/Support/Error.h"

namespace
{

std::optional<llvmbinfmt::Document> compileOrReport(const char* label, const std::string& text)
{
    llvmbinfmt::DiagnosticEngine diag;
    auto                         schema = llvmbinfmt::parseSchemaText(text, label, diag);
    if (!schema)
    {
        std::cerr << label << ": " << llvm::toString(schema.takeError()) << "\n";
        return std::nullopt;
    }
    auto document = llvmbinfmt::compileSchema(*schema, diag);
    if (!document)
    {
        std::cerr << label << ": " << llvm::toString(document.takeError()) << "\n";
        return std::nullopt;
    }
    return std::move(*document);
}

llvm::json::Value parseValue(const std::string& text)
{
    auto parsed = llvm::json::parse(text);
    if (!parsed)
    {
        std::cerr << "bad test input: " << llvm::toString(parsed.takeError()) << "\n";
        return nullptr;
    }
    return std::move(*parsed);
}

bool expectEncoding(const char*                       label,
                    const std::string&                schema,
                    const std::string&                input,
                    const std::vector<std::uint8_t>&  expected,
                    const llvmbinfmt::CodecOptions&   options = {})
{
    auto document = compileOrReport(label, schema);
    if (!document)
    {
        return false;
    }
    const auto registry = llvmbinfmt::FunctionRegistry::withBuiltins();
    auto       bytes    = llvmbinfmt::encode(*document, parseValue(input), registry, options);
    if (!bytes)
    {
        std::cerr << label << ": encode failed: " << llvm::toString(bytes.takeError()) << "\n";
        return false;
    }
    if (*bytes != expected)
    {
        std::cerr << label << ": unexpected bytes:";
        for (const std::uint8_t b : *bytes)
        {
            std::cerr << " " << static_cast<unsigned>(b);
        }
        std::cerr << "\n";
        return false;
    }
    return true;
}

bool expectEncodeFailure(const char*                     label,
                         const std::string&              schema,
                         const std::string&              input,
                         const llvmbinfmt::ErrorKind     expected,
                         const std::string&              expectedPath = "",
                         const llvmbinfmt::CodecOptions& options      = {})
{
    auto document = compileOrReport(label, schema);
    if (!document)
    {
        return false;
    }
    const auto registry = llvmbinfmt::FunctionRegistry::withBuiltins();
    auto       bytes    = llvmbinfmt::encode(*document, parseValue(input), registry, options);
    if (bytes)
    {
        std::cerr << label << ": encode unexpectedly succeeded\n";
        return false;
    }
    bool matched = false;
    llvm::handleAllErrors(bytes.takeError(), [&](const llvmbinfmt::CodecError& e) {
        matched = e.kind() == expected && (expectedPath.empty() || e.fieldPath() == expectedPath);
        if (!matched)
        {
            std::cerr << label << ": got " << llvmbinfmt::errorKindName(e.kind()) << " at '" << e.fieldPath()
                      << "': " << e.detail() << "\n";
        }
    });
    return matched;
}

}  // namespace

bool runSerializerTests()
{
    const std::string header = R"({"endianness": "little", "fields": [
        {"name": "magic", "type": "uint16"},
        {"name": "version", "type": "uint8"},
        {"name": "scale", "type": "float32"}
    ]})";
    if (!expectEncoding("little endian header",
                        header,
                        R"({"magic": 51966, "version": 1, "scale": 1.0})",
                        {0xFE, 0xCA, 0x01, 0x00, 0x00, 0x80, 0x3F}))
    {
        return false;
    }

    const std::string bigHeader = R"({"endianness": "big", "fields": [
        {"name": "magic", "type": "uint16"},
        {"name": "version", "type": "uint8"},
        {"name": "scale", "type": "float32"}
    ]})";
    if (!expectEncoding("big endian header",
                        bigHeader,
                        R"({"magic": 51966, "version": 1, "scale": 1.0})",
                        {0xCA, 0xFE, 0x01, 0x3F, 0x80, 0x00, 0x00}))
    {
        return false;
    }

    const std::string conditional = R"({"fields": [
        {"name": "flags", "type": "uint8"},
        {"name": "extra", "type": "uint16", "condition": "flags == 1"},
        {"name": "tail", "type": "uint8"}
    ]})";
    if (!expectEncoding("condition false", conditional, R"({"flags": 0, "extra": 9, "tail": 7})", {0x00, 0x07}) ||
        !expectEncoding("condition true",
                        conditional,
                        R"({"flags": 1, "extra": 2, "tail": 7})",
                        {0x01, 0x02, 0x00, 0x07}) ||
        !expectEncodeFailure("condition true without value",
                             conditional,
                             R"({"flags": 1, "tail": 7})",
                             llvmbinfmt::ErrorKind::MissingField,
                             "extra"))
    {
        return false;
    }

    // A field skipped by its condition stays absent even when the input carries it.
    const std::string chained = R"({"fields": [
        {"name": "flags", "type": "uint8"},
        {"name": "extra", "type": "uint8", "condition": "flags > 0"},
        {"name": "tail", "type": "uint8", "condition": "extra == 7"}
    ]})";
    const std::string skippedCount = R"({"fields": [
        {"name": "flags", "type": "uint8"},
        {"name": "n", "type": "uint8", "condition": "flags > 0"},
        {"name": "items", "type": "array", "length_field": "n", "element_type": "uint8"}
    ]})";
    if (!expectEncodeFailure("condition on a skipped field",
                             chained,
                             R"({"flags": 0, "extra": 7, "tail": 1})",
                             llvmbinfmt::ErrorKind::Reference,
                             "tail") ||
        !expectEncoding("condition on a present field",
                        chained,
                        R"({"flags": 1, "extra": 7, "tail": 1})",
                        {0x01, 0x07, 0x01}) ||
        !expectEncodeFailure("count from a skipped field",
                             skippedCount,
                             R"({"flags": 0, "n": 2, "items": [1, 2]})",
                             llvmbinfmt::ErrorKind::Reference,
                             "items"))
    {
        return false;
    }

    const std::string strings = R"({"fields": [
        {"name": "len", "type": "uint8"},
        {"name": "name", "type": "string", "length_field": "len"},
        {"name": "tag", "type": "string", "size": 4},
        {"name": "note", "type": "string"}
    ]})";
    if (!expectEncoding("strings",
                        strings,
                        R"({"len": 3, "name": "abc", "tag": "ab", "note": "hi"})",
                        {0x03, 'a', 'b', 'c', 'a', 'b', 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 'h', 'i'}) ||
        !expectEncodeFailure("length mismatch",
                             strings,
                             R"({"len": 2, "name": "abc", "tag": "ab", "note": ""})",
                             llvmbinfmt::ErrorKind::TypeMismatch,
                             "name") ||
        !expectEncodeFailure("fixed string overflow",
                             strings,
                             R"({"len": 0, "name": "", "tag": "abcde", "note": ""})",
                             llvmbinfmt::ErrorKind::Range,
                             "tag") ||
        !expectEncodeFailure("string type", strings, R"({"len": 1, "name": 5})", llvmbinfmt::ErrorKind::TypeMismatch))
    {
        return false;
    }

    const std::string arrays = R"({"fields": [
        {"name": "header", "type": "struct", "fields": [
            {"name": "count", "type": "uint8"}
        ]},
        {"name": "items", "type": "array", "length_field": "context['header']['count']", "element_type": "uint16"},
        {"name": "points", "type": "array", "size": 2, "element_type": "struct", "element_fields": [
            {"name": "x", "type": "int8"},
            {"name": "y", "type": "int8"}
        ]}
    ]})";
    if (!expectEncoding("arrays",
                        arrays,
                        R"({"header": {"count": 2}, "items": [1, 258],
                            "points": [{"x": 1, "y": -1}, {"x": -2, "y": 2}]})",
                        {0x02, 0x01, 0x00, 0x02, 0x01, 0x01, 0xFF, 0xFE, 0x02}) ||
        !expectEncodeFailure("array count mismatch",
                             arrays,
                             R"({"header": {"count": 3}, "items": [1, 2], "points": []})",
                             llvmbinfmt::ErrorKind::TypeMismatch,
                             "items") ||
        !expectEncodeFailure("element path",
                             arrays,
                             R"({"header": {"count": 0}, "items": [], "points": [{"x": 1, "y": 1}, {"x": 1}]})",
                             llvmbinfmt::ErrorKind::MissingField,
                             "points[1].y"))
    {
        return false;
    }

    const std::string selfReference = R"({"fields": [
        {"name": "header", "type": "struct", "fields": [
            {"name": "len", "type": "uint8"},
            {"name": "text", "type": "string", "length_field": "header.len"}
        ]}
    ]})";
    if (!expectEncoding("self reference", selfReference, R"({"header": {"len": 2, "text": "ok"}})", {0x02, 'o', 'k'}))
    {
        return false;
    }

    const std::string unions = R"({"fields": [
        {"name": "kind", "type": "uint8"},
        {"name": "body", "type": "union", "discriminant": "kind", "alternatives": [
            {"name": "small", "type": "uint8", "case": 1},
            {"name": "big", "type": "uint32", "case": 2}
        ]}
    ]})";
    if (!expectEncoding("union case", unions, R"({"kind": 2, "body": {"big": 5}})", {0x02, 0x05, 0x00, 0x00, 0x00}) ||
        !expectEncodeFailure("union mismatch",
                             unions,
                             R"({"kind": 1, "body": {"big": 5}})",
                             llvmbinfmt::ErrorKind::TypeMismatch,
                             "body") ||
        !expectEncodeFailure("union no match", unions, R"({"kind": 3, "body": {}})", llvmbinfmt::ErrorKind::Schema))
    {
        return false;
    }

    const std::string namedUnion = R"({"fields": [
        {"name": "kind", "type": "string", "size": 4},
        {"name": "body", "type": "union", "discriminant": "kind", "alternatives": [
            {"name": "temp", "type": "int16"},
            {"name": "text", "type": "string"}
        ]}
    ]})";
    if (!expectEncoding("union by name", namedUnion, R"({"kind": "temp", "body": {"temp": -1}})",
                        {'t', 'e', 'm', 'p', 0xFF, 0xFF}))
    {
        return false;
    }

    const std::string checksum = R"({"fields": [
        {"name": "payload", "type": "string", "size": 9},
        {"name": "crc", "type": "uint32", "function": "crc32"}
    ]})";
    if (!expectEncoding("crc32 all previous",
                        checksum,
                        R"({"payload": "123456789"})",
                        {'1', '2', '3', '4', '5', '6', '7', '8', '9', 0x26, 0x39, 0xF4, 0xCB}) ||
        !expectEncoding("calculated input ignored",
                        checksum,
                        R"({"payload": "123456789", "crc": 1})",
                        {'1', '2', '3', '4', '5', '6', '7', '8', '9', 0x26, 0x39, 0xF4, 0xCB}))
    {
        return false;
    }

    const std::string entireFile = R"({"fields": [
        {"name": "total", "type": "uint16", "function": "sum16", "function_scope": "entire_file"},
        {"name": "data", "type": "array", "size": 3, "element_type": "uint8"},
        {"name": "count", "type": "uint8", "function": "length"}
    ]})";
    if (!expectEncoding("entire file", entireFile, R"({"data": [1, 2, 3]})", {0x0B, 0x00, 0x01, 0x02, 0x03, 0x05}))
    {
        return false;
    }

    const std::string ranged = R"({"fields": [
        {"name": "sum", "type": "uint8", "function": "sum8", "function_scope": "field_range",
         "function_scope_start": "a", "function_scope_end": "b"},
        {"name": "a", "type": "uint8"},
        {"name": "b", "type": "uint8"},
        {"name": "c", "type": "uint8"}
    ]})";
    if (!expectEncoding("forward field range", ranged, R"({"a": 16, "b": 32, "c": 64})", {0x30, 0x10, 0x20, 0x40}))
    {
        return false;
    }

    if (!expectEncodeFailure("unknown function",
                             R"({"fields": [{"name": "c", "type": "uint8", "function": "md5"}]})",
                             "{}",
                             llvmbinfmt::ErrorKind::UnsupportedFunction,
                             "c") ||
        !expectEncodeFailure("result too wide",
                             R"({"fields": [{"name": "p", "type": "string", "size": 9},
                                 {"name": "c", "type": "uint16", "function": "crc32"}]})",
                             R"({"p": "123456789"})",
                             llvmbinfmt::ErrorKind::Range,
                             "c") ||
        !expectEncodeFailure("value out of range",
                             header,
                             R"({"magic": 70000, "version": 1, "scale": 1.0})",
                             llvmbinfmt::ErrorKind::Range,
                             "magic") ||
        !expectEncodeFailure("root not object", header, "[1, 2]", llvmbinfmt::ErrorKind::TypeMismatch))
    {
        return false;
    }

    {
        llvmbinfmt::CodecOptions tight;
        tight.maxElementCount = 2;
        tight.maxStringBytes  = 3;
        if (!expectEncodeFailure("element ceiling",
                                 arrays,
                                 R"({"header": {"count": 3}, "items": [1, 2, 3], "points": []})",
                                 llvmbinfmt::ErrorKind::UnboundedAllocation,
                                 "items",
                                 tight) ||
            !expectEncodeFailure("string ceiling",
                                 strings,
                                 R"({"len": 4, "name": "abcd", "tag": "", "note": ""})",
                                 llvmbinfmt::ErrorKind::UnboundedAllocation,
                                 "name",
                                 tight))
        {
            return false;
        }
    }

    return true;
}
