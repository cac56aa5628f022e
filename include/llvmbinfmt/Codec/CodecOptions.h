//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration model for encode and decode calls.
///
/// Options have working defaults and may be updated from a JSON settings object,
/// for example the `--config` file of `binfmtc`.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_CODEC_CODEC_OPTIONS_H
#define LLVMBINFMT_CODEC_CODEC_OPTIONS_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>

namespace llvmbinfmt
{

class DiagnosticEngine;

/// @brief Handling of calculated-field mismatches during decode.
enum class ChecksumPolicy
{

    /// @brief Fail the call with `ChecksumMismatchError`.
    Enforce,

    /// @brief Record a warning diagnostic and keep decoding.
    Report,

    /// @brief Skip recomputation entirely.
    Ignore,
};

/// @brief Read-only settings shared by encode and decode calls.
struct CodecOptions final
{
    /// @brief Calculated-field verification policy.
    ChecksumPolicy checksumPolicy{ChecksumPolicy::Enforce};

    /// @brief Rejects unconsumed trailing bytes after decode when true.
    bool strictLength{false};

    /// @brief Largest element count accepted for one array.
    std::uint64_t maxElementCount{1U << 24U};

    /// @brief Largest byte length accepted for one string.
    std::uint64_t maxStringBytes{1U << 26U};
};

/// @brief Parses `enforce`, `report`, or `ignore` (case-insensitive).
std::optional<ChecksumPolicy> parseChecksumPolicy(llvm::StringRef text);

/// @brief Returns the lowercase spelling of a checksum policy.
const char* checksumPolicyName(ChecksumPolicy policy);

/// @brief Applies settings from a JSON object.
///
/// Recognised keys are `checksum_policy`, `strict_length`, `max_element_count`,
/// and `max_string_bytes`. Invalid values and unknown keys are reported as
/// warnings and leave the previous value in place.
///
/// @param[in] settings Settings object.
/// @param[in,out] options Options to update.
/// @param[in,out] diagnostics Sink for warnings.
void applyCodecOptions(const llvm::json::Object& settings, CodecOptions& options, DiagnosticEngine& diagnostics);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_CODEC_CODEC_OPTIONS_H
