//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Registry of calculated-field functions (checksums, sums, lengths).
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBINFMT_CODEC_FUNCTION_REGISTRY_H
#define LLVMBINFMT_CODEC_FUNCTION_REGISTRY_H

#include "llvmbinfmt/Support/Error.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace llvmbinfmt
{

/// @brief Calculated-field function: bytes of the selected scope plus parameters to a result.
using CalcFunction =
    std::function<llvm::Expected<std::uint64_t>(llvm::ArrayRef<std::uint8_t>, const llvm::json::Object&)>;

/// @brief Name-to-function table consulted by the serializer and the deserializer.
///
/// Populate the registry before use; encode and decode only read it, so one
/// registry may be shared across threads.
class FunctionRegistry final
{
public:
    /// @brief Returns a registry preloaded with `crc32`, `xor8`, `sum8`, `sum16`, `sum32`, and `length`.
    static FunctionRegistry withBuiltins();

    /// @brief Adds or replaces a function.
    void registerFunction(llvm::StringRef name, CalcFunction function);

    /// @brief Returns true when @p name is registered.
    [[nodiscard]] bool contains(llvm::StringRef name) const;

    /// @brief Returns registered names in sorted order.
    [[nodiscard]] std::vector<std::string> names() const;

    /// @brief Runs a function.
    /// @param[in] name Registered function name.
    /// @param[in] bytes Bytes of the selected scope.
    /// @param[in] parameters Function parameters from the schema.
    /// @param[in] site Location attached to errors.
    /// @return Function result, or `UnsupportedFunctionError` for unknown names.
    llvm::Expected<std::uint64_t> invoke(llvm::StringRef              name,
                                         llvm::ArrayRef<std::uint8_t> bytes,
                                         const llvm::json::Object&    parameters,
                                         const ErrorSite&             site) const;

private:
    llvm::StringMap<CalcFunction> functions_;
};

}  // namespace llvmbinfmt

#endif  // LLVMBINFMT_CODEC_FUNCTION_REGISTRY_H
