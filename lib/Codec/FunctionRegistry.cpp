//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the calculated-field function registry and its built-in functions.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Codec/FunctionRegistry.h"

#include "llvm/Support/CRC.h"

#include <algorithm>
#include <utility>

namespace llvmbinfmt
{
namespace
{

/// IEEE 802.3 CRC-32; `initial_value` is the register value before the first byte.
llvm::Expected<std::uint64_t> crc32Function(llvm::ArrayRef<std::uint8_t> bytes, const llvm::json::Object& params)
{
    std::uint32_t initial = 0xFFFFFFFFU;
    if (const auto* raw = params.get("initial_value"))
    {
        const auto value = raw->getAsInteger();
        if (!value || *value < 0 || *value > 0xFFFFFFFFLL)
        {
            return makeCodecError(ErrorKind::TypeMismatch,
                                  "",
                                  std::nullopt,
                                  "crc32 initial_value must be an unsigned 32-bit integer");
        }
        initial = static_cast<std::uint32_t>(*value);
    }
    // llvm::crc32 inverts the running value on entry and on exit.
    return llvm::crc32(initial ^ 0xFFFFFFFFU, bytes);
}

template <std::uint64_t Mask>
llvm::Expected<std::uint64_t> byteSumFunction(llvm::ArrayRef<std::uint8_t> bytes, const llvm::json::Object&)
{
    std::uint64_t sum = 0;
    for (const std::uint8_t b : bytes)
    {
        sum = (sum + b) & Mask;
    }
    return sum;
}

llvm::Expected<std::uint64_t> xor8Function(llvm::ArrayRef<std::uint8_t> bytes, const llvm::json::Object&)
{
    std::uint8_t acc = 0;
    for (const std::uint8_t b : bytes)
    {
        acc = static_cast<std::uint8_t>(acc ^ b);
    }
    return acc;
}

llvm::Expected<std::uint64_t> lengthFunction(llvm::ArrayRef<std::uint8_t> bytes, const llvm::json::Object&)
{
    return static_cast<std::uint64_t>(bytes.size());
}

}  // namespace

FunctionRegistry FunctionRegistry::withBuiltins()
{
    FunctionRegistry registry;
    registry.registerFunction("crc32", crc32Function);
    registry.registerFunction("xor8", xor8Function);
    registry.registerFunction("sum8", byteSumFunction<0xFFU>);
    registry.registerFunction("sum16", byteSumFunction<0xFFFFU>);
    registry.registerFunction("sum32", byteSumFunction<0xFFFFFFFFU>);
    registry.registerFunction("length", lengthFunction);
    return registry;
}

void FunctionRegistry::registerFunction(llvm::StringRef name, CalcFunction function)
{
    functions_[name] = std::move(function);
}

bool FunctionRegistry::contains(llvm::StringRef name) const
{
    return functions_.count(name) != 0U;
}

std::vector<std::string> FunctionRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(functions_.size());
    for (const auto& entry : functions_)
    {
        out.push_back(entry.getKey().str());
    }
    std::sort(out.begin(), out.end());
    return out;
}

llvm::Expected<std::uint64_t> FunctionRegistry::invoke(llvm::StringRef              name,
                                                       llvm::ArrayRef<std::uint8_t> bytes,
                                                       const llvm::json::Object&    parameters,
                                                       const ErrorSite&             site) const
{
    const auto it = functions_.find(name);
    if (it == functions_.end())
    {
        return makeCodecError(ErrorKind::UnsupportedFunction, site, "unknown function '" + name + "'");
    }

    auto result = it->second(bytes, parameters);
    if (result)
    {
        return result;
    }
    // Locate errors raised by the function at the calculated field.
    return llvm::handleErrors(result.takeError(), [&](const CodecError& e) -> llvm::Error {
        return makeCodecError(e.kind(),
                              e.fieldPath().empty() ? site.fieldPath : e.fieldPath(),
                              e.byteOffset() ? e.byteOffset() : site.byteOffset,
                              e.detail());
    });
}

}  // namespace llvmbinfmt
