//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Location primitives shared by schema compilation, expression parsing, and diagnostics.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_FRONTEND_SOURCE_LOCATION_H
#define LLVMBINFMT_FRONTEND_SOURCE_LOCATION_H

#include <cstdint>
#include <string>

namespace llvmbinfmt
{

/// @file
/// @brief Location primitives shared across schema compilation and diagnostics.

/// @brief Identifies a position inside a schema document.
///
/// Schemas are JSON data, so positions are expressed as a path into the schema
/// (for example `fields[2].element_fields[0].length_field`) plus an optional
/// 1-based column inside an expression string held at that path.
struct SourceLocation
{
    /// @brief Schema path of the attribute or field.
    std::string path;

    /// @brief 1-based column inside an expression string, or zero when not applicable.
    std::uint32_t column{0};

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_FRONTEND_SOURCE_LOCATION_H
