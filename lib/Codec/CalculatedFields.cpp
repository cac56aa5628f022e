//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements calculated-field scope selection and union alternative selection.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Codec/CalculatedFields.h"

#include "llvmbinfmt/Codec/Primitive.h"

#include <algorithm>

namespace llvmbinfmt
{
namespace
{

void zeroOverlap(std::vector<std::uint8_t>& bytes, const ByteRange window, const ByteRange hole)
{
    const std::size_t begin = std::max(window.begin, hole.begin);
    const std::size_t end   = std::min(window.end, hole.end);
    for (std::size_t i = begin; i < end; ++i)
    {
        bytes[i - window.begin] = 0U;
    }
}

llvm::Expected<ByteRange> selectScope(const CalculatedSpec&  calc,
                                      const std::size_t      bufferSize,
                                      const ByteRange        own,
                                      llvm::StringRef        scopePath,
                                      const FieldRangeTable& ranges,
                                      const ErrorSite&       site)
{
    switch (calc.scope)
    {
    case FunctionScope::AllPrevious:
        return ByteRange{0, own.begin};
    case FunctionScope::EntireFile:
        return ByteRange{0, bufferSize};
    case FunctionScope::FieldRange:
        break;
    }

    const auto start = ranges.find(scopePath, calc.rangeStart);
    if (!start)
    {
        return makeCodecError(ErrorKind::Reference, site, "function_scope_start '" + calc.rangeStart + "' was not walked");
    }
    const auto end = ranges.find(scopePath, calc.rangeEnd);
    if (!end)
    {
        return makeCodecError(ErrorKind::Reference, site, "function_scope_end '" + calc.rangeEnd + "' was not walked");
    }
    if (end->end < start->begin)
    {
        return makeCodecError(ErrorKind::Reference,
                              site,
                              "function_scope_end '" + calc.rangeEnd + "' precedes '" + calc.rangeStart + "'");
    }
    return ByteRange{start->begin, std::min(end->end, bufferSize)};
}

bool caseMatches(const llvm::json::Value& caseValue, const Value& discriminant)
{
    if (const auto* i = std::get_if<std::int64_t>(&discriminant.data))
    {
        const auto c = caseValue.getAsInteger();
        return c && *c == *i;
    }
    if (const auto* s = std::get_if<std::string>(&discriminant.data))
    {
        const auto c = caseValue.getAsString();
        return c && *c == *s;
    }
    if (const auto* b = std::get_if<bool>(&discriminant.data))
    {
        const auto c = caseValue.getAsBoolean();
        return c && *c == *b;
    }
    const auto c = caseValue.getAsNumber();
    return c && *c == std::get<double>(discriminant.data);
}

}  // namespace

void FieldRangeTable::record(llvm::StringRef path, const ByteRange range)
{
    ranges_[path] = range;
}

std::optional<ByteRange> FieldRangeTable::find(llvm::StringRef scopePath, llvm::StringRef reference) const
{
    llvm::StringRef scope = scopePath;
    while (true)
    {
        const std::string candidate = scope.empty() ? reference.str() : (scope + "." + reference).str();
        const auto        it        = ranges_.find(candidate);
        if (it != ranges_.end())
        {
            return it->second;
        }
        if (scope.empty())
        {
            return std::nullopt;
        }
        const std::size_t dot = scope.rfind('.');
        scope                 = dot == llvm::StringRef::npos ? llvm::StringRef() : scope.take_front(dot);
    }
}

bool isDeferred(const CalculatedSpec& calc, llvm::StringRef scopePath, const FieldRangeTable& ranges)
{
    switch (calc.scope)
    {
    case FunctionScope::AllPrevious:
        return false;
    case FunctionScope::EntireFile:
        return true;
    case FunctionScope::FieldRange:
        return !ranges.find(scopePath, calc.rangeEnd).has_value();
    }
    return false;
}

llvm::Expected<std::uint64_t> computeCalculatedValue(const FunctionRegistry&      registry,
                                                     const FieldSpec&             spec,
                                                     llvm::ArrayRef<std::uint8_t> buffer,
                                                     const ByteRange              own,
                                                     llvm::StringRef              scopePath,
                                                     const FieldRangeTable&       ranges,
                                                     llvm::ArrayRef<ByteRange>    zeroed,
                                                     const ErrorSite&             site)
{
    const CalculatedSpec& calc   = *spec.calculated;
    auto                  window = selectScope(calc, buffer.size(), own, scopePath, ranges, site);
    if (!window)
    {
        return window.takeError();
    }

    std::vector<std::uint8_t> bytes(buffer.begin() + static_cast<std::ptrdiff_t>(window->begin),
                                    buffer.begin() + static_cast<std::ptrdiff_t>(window->end));
    zeroOverlap(bytes, *window, own);
    for (const ByteRange& hole : zeroed)
    {
        zeroOverlap(bytes, *window, hole);
    }

    auto result = registry.invoke(calc.function, bytes, calc.parameters, site);
    if (!result)
    {
        return result.takeError();
    }
    if (auto err = checkUnsignedFits(spec.primitive, *result, site))
    {
        return std::move(err);
    }
    return *result;
}

llvm::Expected<const FieldSpec*> selectAlternative(const FieldSpec& unionSpec,
                                                   const Value&     discriminant,
                                                   const ErrorSite& site)
{
    const bool anyCase = std::any_of(unionSpec.alternatives.begin(),
                                     unionSpec.alternatives.end(),
                                     [](const FieldSpec& alt) { return alt.caseValue.has_value(); });

    for (const FieldSpec& alt : unionSpec.alternatives)
    {
        if (alt.caseValue && caseMatches(*alt.caseValue, discriminant))
        {
            return &alt;
        }
    }

    if (const auto* s = std::get_if<std::string>(&discriminant.data))
    {
        for (const FieldSpec& alt : unionSpec.alternatives)
        {
            if (alt.name == *s)
            {
                return &alt;
            }
        }
    }
    else if (const auto* i = std::get_if<std::int64_t>(&discriminant.data); i != nullptr && !anyCase)
    {
        if (*i >= 0 && static_cast<std::uint64_t>(*i) < unionSpec.alternatives.size())
        {
            return &unionSpec.alternatives[static_cast<std::size_t>(*i)];
        }
    }

    return makeCodecError(ErrorKind::Schema,
                          site,
                          "discriminant " + discriminant.str() + " selects no alternative of union '" + unionSpec.name +
                              "'");
}

}  // namespace llvmbinfmt
