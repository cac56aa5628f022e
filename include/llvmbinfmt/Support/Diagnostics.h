//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used by schema compilation and decoding.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_SUPPORT_DIAGNOSTICS_H
#define LLVMBINFMT_SUPPORT_DIAGNOSTICS_H

#include "llvmbinfmt/Frontend/SourceLocation.h"

#include <cstddef>
#include <string>
#include <vector>

namespace llvmbinfmt
{

/// @file
/// @brief Diagnostic collection and reporting interfaces.

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Single diagnostic record.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Schema location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Accumulates diagnostics emitted while compiling schemas and decoding records.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Schema location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SourceLocation& location, std::string message);

    /// @brief Emits a note-level diagnostic.
    void note(const SourceLocation& location, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(const SourceLocation& location, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(const SourceLocation& location, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts recorded diagnostics at one severity.
    /// @param[in] level Severity level to count.
    /// @return Number of matching diagnostics.
    [[nodiscard]] std::size_t count(DiagnosticLevel level) const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Returns the lowercase spelling of a diagnostic level.
/// @param[in] level Severity level.
/// @return `note`, `warning`, or `error`.
const char* diagnosticLevelName(DiagnosticLevel level);

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_SUPPORT_DIAGNOSTICS_H
