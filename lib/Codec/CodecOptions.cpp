//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements codec option parsing and JSON settings updates.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Codec/CodecOptions.h"

#include "llvmbinfmt/Support/Diagnostics.h"

#include "llvm/ADT/StringSwitch.h"

#include <string>

namespace llvmbinfmt
{
namespace
{

void applyCount(const llvm::json::Object& settings,
                llvm::StringRef           key,
                std::uint64_t&            outValue,
                DiagnosticEngine&         diagnostics)
{
    const auto* value = settings.get(key);
    if (!value)
    {
        return;
    }
    const auto parsed = value->getAsInteger();
    if (!parsed || *parsed <= 0)
    {
        diagnostics.warning(SourceLocation{key.str(), 0}, "expected a positive integer; keeping " + std::to_string(outValue));
        return;
    }
    outValue = static_cast<std::uint64_t>(*parsed);
}

}  // namespace

std::optional<ChecksumPolicy> parseChecksumPolicy(llvm::StringRef text)
{
    return llvm::StringSwitch<std::optional<ChecksumPolicy>>(text.lower())
        .Case("enforce", ChecksumPolicy::Enforce)
        .Case("report", ChecksumPolicy::Report)
        .Case("ignore", ChecksumPolicy::Ignore)
        .Default(std::nullopt);
}

const char* checksumPolicyName(const ChecksumPolicy policy)
{
    switch (policy)
    {
    case ChecksumPolicy::Enforce:
        return "enforce";
    case ChecksumPolicy::Report:
        return "report";
    case ChecksumPolicy::Ignore:
        return "ignore";
    }
    return "enforce";
}

void applyCodecOptions(const llvm::json::Object& settings, CodecOptions& options, DiagnosticEngine& diagnostics)
{
    if (const auto* raw = settings.get("checksum_policy"))
    {
        const auto text   = raw->getAsString();
        const auto policy = text ? parseChecksumPolicy(*text) : std::nullopt;
        if (policy)
        {
            options.checksumPolicy = *policy;
        }
        else
        {
            diagnostics.warning(SourceLocation{"checksum_policy", 0},
                                std::string("expected enforce, report, or ignore; keeping ") +
                                    checksumPolicyName(options.checksumPolicy));
        }
    }

    if (const auto* raw = settings.get("strict_length"))
    {
        if (const auto parsed = raw->getAsBoolean())
        {
            options.strictLength = *parsed;
        }
        else
        {
            diagnostics.warning(SourceLocation{"strict_length", 0}, "expected a boolean");
        }
    }

    applyCount(settings, "max_element_count", options.maxElementCount, diagnostics);
    applyCount(settings, "max_string_bytes", options.maxStringBytes, diagnostics);

    for (const auto& entry : settings)
    {
        const llvm::StringRef key = entry.first;
        if (key != "checksum_policy" && key != "strict_length" && key != "max_element_count" &&
            key != "max_string_bytes")
        {
            diagnostics.warning(SourceLocation{key.str(), 0}, "unknown codec option ignored");
        }
    }
}

}  // namespace llvmbinfmt
