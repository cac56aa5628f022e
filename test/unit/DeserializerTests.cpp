//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llvmbinfmt/Codec/CodecOptions.h"
#include "llvmbinfmt/Codec/Deserializer.h"
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

std::optional<llvm::json::Value> decodeOrReport(const char*                      label,
                                                const llvmbinfmt::Document&      document,
                                                const std::vector<std::uint8_t>& bytes,
                                                const llvmbinfmt::CodecOptions&  options     = {},
                                                llvmbinfmt::DiagnosticEngine*    diagnostics = nullptr)
{
    const auto registry = llvmbinfmt::FunctionRegistry::withBuiltins();
    auto       result   = llvmbinfmt::decode(document, bytes, registry, options, diagnostics);
    if (!result)
    {
        std::cerr << label << ": decode failed: " << llvm::toString(result.takeError()) << "\n";
        return std::nullopt;
    }
    if (result->bytesConsumed > bytes.size())
    {
        std::cerr << label << ": consumed more bytes than supplied\n";
        return std::nullopt;
    }
    return std::move(result->value);
}

bool expectDecodeFailure(const char*                      label,
                         const llvmbinfmt::Document&      document,
                         const std::vector<std::uint8_t>& bytes,
                         const llvmbinfmt::ErrorKind      expected,
                         const llvmbinfmt::CodecOptions&  options = {})
{
    const auto registry = llvmbinfmt::FunctionRegistry::withBuiltins();
    auto       result   = llvmbinfmt::decode(document, bytes, registry, options);
    if (result)
    {
        std::cerr << label << ": decode unexpectedly succeeded\n";
        return false;
    }
    bool matched = false;
    llvm::handleAllErrors(result.takeError(), [&](const llvmbinfmt::CodecError& e) {
        matched = e.kind() == expected;
        if (!matched)
        {
            std::cerr << label << ": got " << llvmbinfmt::errorKindName(e.kind()) << " at '" << e.fieldPath()
                      << "': " << e.detail() << "\n";
        }
    });
    return matched;
}

bool hasString(const llvm::json::Object* object, llvm::StringRef key, llvm::StringRef expected)
{
    if (object == nullptr)
    {
        return false;
    }
    const auto value = object->getString(key);
    return value && *value == expected;
}

/// Encodes @p input, decodes the bytes again, and compares the trees.
///
/// Calculated fields are recomputed on encode, so @p calculated names the keys
/// excluded from the comparison.
bool expectRoundTrip(const char*                     label,
                     const llvmbinfmt::Document&     document,
                     const std::string&              input,
                     const std::vector<std::string>& calculated)
{
    const auto registry = llvmbinfmt::FunctionRegistry::withBuiltins();
    auto       original = parseValue(input);
    auto       bytes    = llvmbinfmt::encode(document, original, registry);
    if (!bytes)
    {
        std::cerr << label << ": encode failed: " << llvm::toString(bytes.takeError()) << "\n";
        return false;
    }
    llvmbinfmt::CodecOptions strict;
    strict.strictLength = true;
    auto decoded        = decodeOrReport(label, document, *bytes, strict);
    if (!decoded)
    {
        return false;
    }

    auto reencoded = llvmbinfmt::encode(document, *decoded, registry);
    if (!reencoded)
    {
        std::cerr << label << ": re-encode failed: " << llvm::toString(reencoded.takeError()) << "\n";
        return false;
    }
    if (*reencoded != *bytes)
    {
        std::cerr << label << ": re-encoding the decoded record changed the bytes\n";
        return false;
    }

    auto* decodedRoot  = decoded->getAsObject();
    auto* originalRoot = original.getAsObject();
    for (const std::string& key : calculated)
    {
        decodedRoot->erase(key);
        originalRoot->erase(key);
    }
    if (*decoded != original)
    {
        std::string              text;
        llvm::raw_string_ostream os(text);
        os << *decoded;
        std::cerr << label << ": round trip changed the record: " << os.str() << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runDeserializerTests()
{
    const std::string telemetryText = R"({"endianness": "big", "fields": [
        {"name": "magic", "type": "uint16"},
        {"name": "header", "type": "struct", "fields": [
            {"name": "flags", "type": "uint8"},
            {"name": "count", "type": "uint8"},
            {"name": "name_len", "type": "uint8"},
            {"name": "name", "type": "string", "length_field": "header.name_len"}
        ]},
        {"name": "timestamp", "type": "uint64", "condition": "header.flags == 1"},
        {"name": "readings", "type": "array", "length_field": "context['header']['count']", "element_type": "struct",
         "element_fields": [
            {"name": "channel", "type": "char"},
            {"name": "value", "type": "float64"}
         ]},
        {"name": "unit", "type": "string", "size": 4, "encoding": "ascii"},
        {"name": "kind", "type": "uint8"},
        {"name": "extra", "type": "union", "discriminant": "kind", "alternatives": [
            {"name": "none", "type": "array", "size": 0, "element_type": "uint8"},
            {"name": "note", "type": "string", "encoding": "latin-1"}
        ]},
        {"name": "crc", "type": "uint32", "function": "crc32"}
    ]})";
    const auto telemetry = compileOrReport("telemetry", telemetryText);
    if (!telemetry)
    {
        return false;
    }

    const std::string record = R"({
        "magic": 48879,
        "header": {"flags": 1, "count": 2, "name_len": 5, "name": "probe"},
        "timestamp": 1700000000,
        "readings": [{"channel": "a", "value": 1.5}, {"channel": "b", "value": -0.25}],
        "unit": "degC",
        "kind": 1,
        "extra": {"note": "résumé"},
        "crc": 3405691582
    })";

    {
        // The stored checksum is recomputed on encode, so compare against the encoded value.
        const auto registry = llvmbinfmt::FunctionRegistry::withBuiltins();
        auto       bytes    = llvmbinfmt::encode(*telemetry, parseValue(record), registry);
        if (!bytes)
        {
            std::cerr << "telemetry encode failed: " << llvm::toString(bytes.takeError()) << "\n";
            return false;
        }
        auto decoded = decodeOrReport("telemetry", *telemetry, *bytes);
        if (!decoded)
        {
            return false;
        }
        auto*       root   = decoded->getAsObject();
        const auto* header = root != nullptr ? root->getObject("header") : nullptr;
        if (!hasString(header, "name", "probe"))
        {
            std::cerr << "decoded header lost its name\n";
            return false;
        }
        const auto timestamp = root->getInteger("timestamp");
        if (!timestamp || *timestamp != 1700000000)
        {
            std::cerr << "decoded timestamp mismatch\n";
            return false;
        }
        const auto* extra = root->getObject("extra");
        if (!hasString(extra, "note", "r\xC3\xA9sum\xC3\xA9"))
        {
            std::cerr << "latin-1 union alternative did not decode\n";
            return false;
        }
        const auto crc = root->getInteger("crc");
        if (!crc || *crc == 3405691582LL)
        {
            std::cerr << "checksum should be recomputed rather than copied from the input\n";
            return false;
        }

        // Any single flipped bit before the checksum is detected.
        for (std::size_t bit = 0; bit < (bytes->size() - 4) * 8; bit += 13)
        {
            std::vector<std::uint8_t> corrupted = *bytes;
            corrupted[bit / 8] ^= static_cast<std::uint8_t>(1U << (bit % 8));
            const auto  registryCopy = llvmbinfmt::FunctionRegistry::withBuiltins();
            auto        result       = llvmbinfmt::decode(*telemetry, corrupted, registryCopy);
            if (result)
            {
                std::cerr << "bit flip at " << bit << " went unnoticed\n";
                return false;
            }
            llvm::consumeError(result.takeError());
        }

        // Layout tail: unit[4] kind[1] note prefix[4] note[6] crc[4].
        std::vector<std::uint8_t> flippedUnit = *bytes;
        flippedUnit[bytes->size() - 19] ^= 0x20U;
        if (!expectDecodeFailure("flipped payload", *telemetry, flippedUnit, llvmbinfmt::ErrorKind::ChecksumMismatch))
        {
            return false;
        }

        llvmbinfmt::CodecOptions     report;
        report.checksumPolicy = llvmbinfmt::ChecksumPolicy::Report;
        llvmbinfmt::DiagnosticEngine diagnostics;
        if (!decodeOrReport("report policy", *telemetry, flippedUnit, report, &diagnostics))
        {
            return false;
        }
        if (diagnostics.count(llvmbinfmt::DiagnosticLevel::Warning) != 1 ||
            diagnostics.diagnostics().front().message.find("crc32 mismatch") == std::string::npos ||
            diagnostics.diagnostics().front().location.path != "crc")
        {
            std::cerr << "report policy should record one located warning\n";
            return false;
        }

        llvmbinfmt::CodecOptions     ignore;
        ignore.checksumPolicy = llvmbinfmt::ChecksumPolicy::Ignore;
        llvmbinfmt::DiagnosticEngine quiet;
        if (!decodeOrReport("ignore policy", *telemetry, flippedUnit, ignore, &quiet) || !quiet.diagnostics().empty())
        {
            std::cerr << "ignore policy should decode silently\n";
            return false;
        }

        std::vector<std::uint8_t> truncated(bytes->begin(), bytes->end() - 2);
        if (!expectDecodeFailure("truncated", *telemetry, truncated, llvmbinfmt::ErrorKind::UnexpectedEndOfData))
        {
            return false;
        }

        std::vector<std::uint8_t> trailing = *bytes;
        trailing.push_back(0xAAU);
        llvmbinfmt::CodecOptions strict;
        strict.strictLength = true;
        if (!expectDecodeFailure("strict trailing", *telemetry, trailing, llvmbinfmt::ErrorKind::TrailingData, strict))
        {
            return false;
        }
        const auto lenientRegistry = llvmbinfmt::FunctionRegistry::withBuiltins();
        auto       lenient         = llvmbinfmt::decode(*telemetry, trailing, lenientRegistry);
        if (!lenient)
        {
            std::cerr << "lenient decode failed: " << llvm::toString(lenient.takeError()) << "\n";
            return false;
        }
        if (lenient->bytesConsumed != bytes->size())
        {
            std::cerr << "lenient decode should report the record length\n";
            return false;
        }
    }

    {
        const auto claims = compileOrReport("claims", R"({"fields": [
            {"name": "count", "type": "uint32"},
            {"name": "items", "type": "array", "length_field": "count", "element_type": "uint16"}
        ]})");
        if (!claims)
        {
            return false;
        }
        if (!expectDecodeFailure("oversized array claim",
                                 *claims,
                                 {0xFF, 0xFF, 0xFF, 0xFF, 0x01, 0x00},
                                 llvmbinfmt::ErrorKind::UnboundedAllocation) ||
            !expectDecodeFailure("claim beyond remaining",
                                 *claims,
                                 {0x03, 0x00, 0x00, 0x00, 0x01, 0x00, 0x02, 0x00},
                                 llvmbinfmt::ErrorKind::UnboundedAllocation))
        {
            return false;
        }
        llvmbinfmt::CodecOptions ceiling;
        ceiling.maxElementCount = 1;
        if (!expectDecodeFailure("claim beyond ceiling",
                                 *claims,
                                 {0x02, 0x00, 0x00, 0x00, 0x01, 0x00, 0x02, 0x00},
                                 llvmbinfmt::ErrorKind::UnboundedAllocation,
                                 ceiling))
        {
            return false;
        }

        const auto prefixed = compileOrReport("prefixed", R"({"fields": [{"name": "s", "type": "string"}]})");
        if (!prefixed ||
            !expectDecodeFailure("oversized string claim",
                                 *prefixed,
                                 {0xFF, 0xFF, 0xFF, 0x7F, 'a', 'b'},
                                 llvmbinfmt::ErrorKind::UnboundedAllocation))
        {
            return false;
        }
    }

    {
        const auto ranged = compileOrReport("ranged", R"({"fields": [
            {"name": "a", "type": "uint8"},
            {"name": "b", "type": "uint8"},
            {"name": "sum", "type": "uint8", "function": "sum8", "function_scope": "field_range",
             "function_scope_start": "a", "function_scope_end": "b"},
            {"name": "c", "type": "uint8"}
        ]})");
        if (!ranged)
        {
            return false;
        }
        if (!decodeOrReport("range ok", *ranged, {0x10, 0x20, 0x30, 0x99}) ||
            !decodeOrReport("outside range", *ranged, {0x10, 0x20, 0x30, 0x00}) ||
            !expectDecodeFailure("inside range", *ranged, {0x11, 0x20, 0x30, 0x99}, llvmbinfmt::ErrorKind::ChecksumMismatch))
        {
            return false;
        }
    }

    {
        const auto padded = compileOrReport("padded", R"({"fields": [
            {"name": "tag", "type": "string", "size": 6},
            {"name": "flag", "type": "uint8"},
            {"name": "opt", "type": "uint16", "condition": "flag != 0"}
        ]})");
        if (!padded)
        {
            return false;
        }
        auto value = decodeOrReport("padded", *padded, {'a', 'b', 'c', 0x00, 0x00, 0x00, 0x00});
        if (!value)
        {
            return false;
        }
        const auto* root = value->getAsObject();
        if (!hasString(root, "tag", "abc") || root->get("opt") != nullptr)
        {
            std::cerr << "fixed string padding should be stripped and absent fields omitted\n";
            return false;
        }
    }

    {
        const auto mixed = compileOrReport("mixed", R"({"endianness": "little", "fields": [
            {"name": "total", "type": "uint16", "function": "sum16", "function_scope": "entire_file"},
            {"name": "id", "type": "int32"},
            {"name": "grid", "type": "array", "size": 2, "element":
                {"type": "array", "size": 2, "element_type": "int8"}},
            {"name": "labels", "type": "array", "size": 2, "element_type": "string", "element_size": 3},
            {"name": "sel", "type": "string", "size": 1},
            {"name": "value", "type": "union", "discriminant": "sel", "alternatives": [
                {"name": "i", "type": "int16", "case": "i"},
                {"name": "f", "type": "float32", "case": "f"}
            ]},
            {"name": "check", "type": "uint8", "function": "xor8"}
        ]})");
        if (!mixed)
        {
            return false;
        }
        if (!expectRoundTrip("mixed",
                             *mixed,
                             R"({"total": 0, "id": -123456, "grid": [[1, -1], [127, -128]], "labels": ["ab", "xyz"],
                                 "sel": "f", "value": {"f": 0.5}, "check": 0})",
                             {"total", "check"}))
        {
            return false;
        }
    }

    return true;
}
