//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements fixed-width scalar and text codec helpers.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Codec/Primitive.h"

#include <cmath>
#include <cstring>
#include <limits>

namespace llvmbinfmt
{
namespace
{

static_assert(sizeof(float) == 4 && std::numeric_limits<float>::is_iec559, "Unsupported floating point model");
static_assert(sizeof(double) == 8 && std::numeric_limits<double>::is_iec559, "Unsupported floating point model");

std::int64_t signedMin(const std::size_t width)
{
    return width >= 8 ? std::numeric_limits<std::int64_t>::min() : -(std::int64_t{1} << (width * 8U - 1U));
}

std::int64_t signedMax(const std::size_t width)
{
    return width >= 8 ? std::numeric_limits<std::int64_t>::max() : (std::int64_t{1} << (width * 8U - 1U)) - 1;
}

std::uint64_t unsignedMax(const std::size_t width)
{
    return width >= 8 ? std::numeric_limits<std::uint64_t>::max() : (std::uint64_t{1} << (width * 8U)) - 1U;
}

/// Appends the UTF-8 form of a code point up to U+10FFFF.
void appendUtf8(std::uint32_t cp, std::string& out)
{
    if (cp < 0x80U)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800U)
    {
        out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
    else if (cp < 0x10000U)
    {
        out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
}

/// Splits well-formed UTF-8 into code points.
std::vector<std::uint32_t> codePoints(llvm::StringRef text)
{
    std::vector<std::uint32_t> out;
    std::size_t                i = 0;
    while (i < text.size())
    {
        const auto    lead = static_cast<std::uint8_t>(text[i]);
        std::size_t   len  = 1;
        std::uint32_t cp   = lead;
        if (lead >= 0xF0U)
        {
            len = 4;
            cp  = lead & 0x07U;
        }
        else if (lead >= 0xE0U)
        {
            len = 3;
            cp  = lead & 0x0FU;
        }
        else if (lead >= 0xC0U)
        {
            len = 2;
            cp  = lead & 0x1FU;
        }
        for (std::size_t k = 1; k < len && i + k < text.size(); ++k)
        {
            cp = (cp << 6U) | (static_cast<std::uint8_t>(text[i + k]) & 0x3FU);
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

llvm::Error encodeInteger(PrimitiveKind              kind,
                          Endianness                 endianness,
                          const llvm::json::Value&   value,
                          std::vector<std::uint8_t>& out,
                          const ErrorSite&           site)
{
    const std::size_t width = primitiveWidth(kind);
    if (value.kind() != llvm::json::Value::Number)
    {
        return makeCodecError(ErrorKind::TypeMismatch,
                              site,
                              llvm::Twine("expected a number for ") + primitiveKindName(kind));
    }

    if (auto i = value.getAsInteger())
    {
        if (isSignedKind(kind))
        {
            if (*i < signedMin(width) || *i > signedMax(width))
            {
                return makeCodecError(ErrorKind::Range,
                                      site,
                                      llvm::Twine(*i) + " does not fit " + primitiveKindName(kind));
            }
        }
        else if (*i < 0 || static_cast<std::uint64_t>(*i) > unsignedMax(width))
        {
            return makeCodecError(ErrorKind::Range, site, llvm::Twine(*i) + " does not fit " + primitiveKindName(kind));
        }
        writeUnsigned(static_cast<std::uint64_t>(*i), width, endianness, out);
        return llvm::Error::success();
    }

    if (auto u = value.getAsUINT64())
    {
        if (isSignedKind(kind) || *u > unsignedMax(width))
        {
            return makeCodecError(ErrorKind::Range, site, llvm::Twine(*u) + " does not fit " + primitiveKindName(kind));
        }
        writeUnsigned(*u, width, endianness, out);
        return llvm::Error::success();
    }

    const auto   number = value.getAsNumber();
    const double d      = number ? *number : 0.0;
    if (std::trunc(d) == d)
    {
        return makeCodecError(ErrorKind::Range, site, llvm::Twine("value does not fit ") + primitiveKindName(kind));
    }
    return makeCodecError(ErrorKind::TypeMismatch,
                          site,
                          llvm::Twine("expected an integer for ") + primitiveKindName(kind));
}

llvm::Error encodeChar(Endianness                 endianness,
                       const llvm::json::Value&   value,
                       std::vector<std::uint8_t>& out,
                       const ErrorSite&           site)
{
    if (auto text = value.getAsString())
    {
        const auto cps = codePoints(*text);
        if (cps.size() != 1)
        {
            return makeCodecError(ErrorKind::TypeMismatch, site, "char value must be exactly one character");
        }
        if (cps.front() > 0xFFU)
        {
            return makeCodecError(ErrorKind::Range, site, "character does not fit one byte");
        }
        writeUnsigned(cps.front(), 1, endianness, out);
        return llvm::Error::success();
    }
    if (value.kind() == llvm::json::Value::Number)
    {
        auto i = value.getAsInteger();
        if (!i)
        {
            return makeCodecError(ErrorKind::TypeMismatch, site, "char code must be an integer");
        }
        if (*i < 0 || *i > 0xFF)
        {
            return makeCodecError(ErrorKind::Range, site, llvm::Twine("char code ") + llvm::Twine(*i) + " out of range");
        }
        writeUnsigned(static_cast<std::uint64_t>(*i), 1, endianness, out);
        return llvm::Error::success();
    }
    return makeCodecError(ErrorKind::TypeMismatch, site, "expected a one-character string for char");
}

}  // namespace

void writeUnsigned(const std::uint64_t        value,
                   const std::size_t          width,
                   const Endianness           endianness,
                   std::vector<std::uint8_t>& out)
{
    const std::size_t offset = out.size();
    out.resize(offset + width, 0U);
    patchUnsigned(value, width, endianness, out, offset);
}

void patchUnsigned(const std::uint64_t        value,
                   const std::size_t          width,
                   const Endianness           endianness,
                   std::vector<std::uint8_t>& buffer,
                   const std::size_t          offset)
{
    for (std::size_t i = 0; i < width; ++i)
    {
        const auto byte = static_cast<std::uint8_t>((value >> (8U * i)) & 0xFFU);
        if (endianness == Endianness::Little)
        {
            buffer[offset + i] = byte;
        }
        else
        {
            buffer[offset + width - 1U - i] = byte;
        }
    }
}

std::uint64_t readUnsigned(llvm::ArrayRef<std::uint8_t> bytes, const Endianness endianness)
{
    std::uint64_t out = 0;
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        const std::size_t index = endianness == Endianness::Little ? bytes.size() - 1U - i : i;
        out                     = (out << 8U) | bytes[index];
    }
    return out;
}

llvm::Error encodePrimitive(const PrimitiveKind        kind,
                            const Endianness           endianness,
                            const llvm::json::Value&   value,
                            std::vector<std::uint8_t>& out,
                            const ErrorSite&           site)
{
    switch (kind)
    {
    case PrimitiveKind::Char:
        return encodeChar(endianness, value, out, site);
    case PrimitiveKind::Float32: {
        if (value.kind() != llvm::json::Value::Number)
        {
            return makeCodecError(ErrorKind::TypeMismatch, site, "expected a number for float32");
        }
        const double d = *value.getAsNumber();
        if (std::isfinite(d) && std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max()))
        {
            return makeCodecError(ErrorKind::Range, site, "value does not fit float32");
        }
        const auto    f    = static_cast<float>(d);
        std::uint32_t bits = 0;
        std::memcpy(&bits, &f, sizeof(bits));
        writeUnsigned(bits, 4, endianness, out);
        return llvm::Error::success();
    }
    case PrimitiveKind::Float64: {
        if (value.kind() != llvm::json::Value::Number)
        {
            return makeCodecError(ErrorKind::TypeMismatch, site, "expected a number for float64");
        }
        const double  d    = *value.getAsNumber();
        std::uint64_t bits = 0;
        std::memcpy(&bits, &d, sizeof(bits));
        writeUnsigned(bits, 8, endianness, out);
        return llvm::Error::success();
    }
    default:
        return encodeInteger(kind, endianness, value, out, site);
    }
}

llvm::Error checkUnsignedFits(const PrimitiveKind kind, const std::uint64_t value, const ErrorSite& site)
{
    const std::size_t width = primitiveWidth(kind);
    const std::uint64_t limit =
        isSignedKind(kind) ? static_cast<std::uint64_t>(signedMax(width)) : unsignedMax(width);
    if (value > limit)
    {
        return makeCodecError(ErrorKind::Range,
                              site,
                              llvm::Twine("function result ") + llvm::Twine(value) + " does not fit " +
                                  primitiveKindName(kind));
    }
    return llvm::Error::success();
}

llvm::json::Value decodePrimitive(const PrimitiveKind          kind,
                                  const Endianness             endianness,
                                  llvm::ArrayRef<std::uint8_t> bytes)
{
    const std::uint64_t raw   = readUnsigned(bytes, endianness);
    const std::size_t   width = primitiveWidth(kind);
    switch (kind)
    {
    case PrimitiveKind::Char: {
        std::string text;
        appendUtf8(static_cast<std::uint32_t>(raw & 0xFFU), text);
        return llvm::json::Value(std::move(text));
    }
    case PrimitiveKind::Float32: {
        const auto bits = static_cast<std::uint32_t>(raw);
        float      f    = 0.0F;
        std::memcpy(&f, &bits, sizeof(f));
        return llvm::json::Value(static_cast<double>(f));
    }
    case PrimitiveKind::Float64: {
        double d = 0.0;
        std::memcpy(&d, &raw, sizeof(d));
        return llvm::json::Value(d);
    }
    case PrimitiveKind::Int8:
    case PrimitiveKind::Int16:
    case PrimitiveKind::Int32:
    case PrimitiveKind::Int64: {
        std::uint64_t extended = raw;
        if (width < 8 && ((raw >> (width * 8U - 1U)) & 1U) != 0U)
        {
            extended |= ~unsignedMax(width);
        }
        return llvm::json::Value(static_cast<std::int64_t>(extended));
    }
    default:
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        {
            return llvm::json::Value(raw);
        }
        return llvm::json::Value(static_cast<std::int64_t>(raw));
    }
}

llvm::Expected<std::string> encodeText(llvm::StringRef text, const StringEncoding encoding, const ErrorSite& site)
{
    if (encoding == StringEncoding::Utf8)
    {
        return text.str();
    }
    std::string out;
    out.reserve(text.size());
    const std::uint32_t limit = encoding == StringEncoding::Ascii ? 0x7FU : 0xFFU;
    for (const std::uint32_t cp : codePoints(text))
    {
        if (cp > limit)
        {
            return makeCodecError(ErrorKind::Range,
                                  site,
                                  llvm::Twine("character U+") + llvm::Twine::utohexstr(cp) + " is not representable in " +
                                      (encoding == StringEncoding::Ascii ? "ascii" : "latin-1"));
        }
        out.push_back(static_cast<char>(cp));
    }
    return out;
}

std::string decodeText(llvm::ArrayRef<std::uint8_t> bytes, const StringEncoding encoding)
{
    std::string out;
    if (encoding == StringEncoding::Utf8)
    {
        llvm::StringRef raw(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        return llvm::json::isUTF8(raw) ? raw.str() : llvm::json::fixUTF8(raw);
    }
    for (const std::uint8_t b : bytes)
    {
        // U+FFFD stands in for bytes outside 7-bit ASCII.
        appendUtf8(encoding == StringEncoding::Ascii && b >= 0x80U ? 0xFFFDU : b, out);
    }
    return out;
}

}  // namespace llvmbinfmt
