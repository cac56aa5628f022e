//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements primitive-kind tables for the compiled schema model.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Schema/Model.h"

#include "llvm/ADT/StringSwitch.h"

namespace llvmbinfmt
{

std::size_t primitiveWidth(const PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::Int8:
    case PrimitiveKind::UInt8:
    case PrimitiveKind::Char:
        return 1;
    case PrimitiveKind::Int16:
    case PrimitiveKind::UInt16:
        return 2;
    case PrimitiveKind::Int32:
    case PrimitiveKind::UInt32:
    case PrimitiveKind::Float32:
        return 4;
    case PrimitiveKind::Int64:
    case PrimitiveKind::UInt64:
    case PrimitiveKind::Float64:
        return 8;
    }
    return 0;
}

const char* primitiveKindName(const PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::Int8:
        return "int8";
    case PrimitiveKind::Int16:
        return "int16";
    case PrimitiveKind::Int32:
        return "int32";
    case PrimitiveKind::Int64:
        return "int64";
    case PrimitiveKind::UInt8:
        return "uint8";
    case PrimitiveKind::UInt16:
        return "uint16";
    case PrimitiveKind::UInt32:
        return "uint32";
    case PrimitiveKind::UInt64:
        return "uint64";
    case PrimitiveKind::Float32:
        return "float32";
    case PrimitiveKind::Float64:
        return "float64";
    case PrimitiveKind::Char:
        return "char";
    }
    return "?";
}

std::optional<PrimitiveKind> parsePrimitiveKind(llvm::StringRef name)
{
    return llvm::StringSwitch<std::optional<PrimitiveKind>>(name)
        .Case("int8", PrimitiveKind::Int8)
        .Case("int16", PrimitiveKind::Int16)
        .Case("int32", PrimitiveKind::Int32)
        .Case("int64", PrimitiveKind::Int64)
        .Case("uint8", PrimitiveKind::UInt8)
        .Case("uint16", PrimitiveKind::UInt16)
        .Case("uint32", PrimitiveKind::UInt32)
        .Case("uint64", PrimitiveKind::UInt64)
        .Case("float32", PrimitiveKind::Float32)
        .Case("float64", PrimitiveKind::Float64)
        .Case("char", PrimitiveKind::Char)
        .Default(std::nullopt);
}

bool isIntegerKind(const PrimitiveKind kind)
{
    return kind != PrimitiveKind::Float32 && kind != PrimitiveKind::Float64 && kind != PrimitiveKind::Char;
}

bool isSignedKind(const PrimitiveKind kind)
{
    return kind == PrimitiveKind::Int8 || kind == PrimitiveKind::Int16 || kind == PrimitiveKind::Int32 ||
           kind == PrimitiveKind::Int64;
}

const char* fieldKindName(const FieldKind kind)
{
    switch (kind)
    {
    case FieldKind::Primitive:
        return "primitive";
    case FieldKind::String:
        return "string";
    case FieldKind::Array:
        return "array";
    case FieldKind::Struct:
        return "struct";
    case FieldKind::Union:
        return "union";
    }
    return "?";
}

}  // namespace llvmbinfmt
