//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the bytes-to-value traversal.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Codec/Deserializer.h"

#include "llvmbinfmt/Codec/CalculatedFields.h"
#include "llvmbinfmt/Codec/Primitive.h"
#include "llvmbinfmt/Semantics/Context.h"
#include "llvmbinfmt/Semantics/Evaluator.h"
#include "llvmbinfmt/Support/Diagnostics.h"

#include "llvm/Support/Debug.h"
#include "llvm/Support/Format.h"

#include <string>
#include <utility>

#define DEBUG_TYPE "binfmt-deserializer"

namespace llvmbinfmt
{
namespace
{

std::string hex(std::uint64_t value)
{
    std::string              text;
    llvm::raw_string_ostream os(text);
    os << llvm::format_hex(value, 2);
    return os.str();
}

class Deserializer final
{
public:
    Deserializer(const Document&              document,
                 llvm::ArrayRef<std::uint8_t> bytes,
                 const FunctionRegistry&      registry,
                 const CodecOptions&          options,
                 DiagnosticEngine*            diagnostics)
        : document_(document)
        , bytes_(bytes)
        , registry_(registry)
        , options_(options)
        , diagnostics_(diagnostics)
    {
    }

    llvm::Expected<DecodeResult> run();

private:
    llvm::Error decodeFields(const std::vector<FieldSpec>& fields);
    llvm::Error decodeField(const FieldSpec& spec);

    llvm::Expected<llvm::json::Value> decodeValue(const FieldSpec&   spec,
                                                  llvm::StringRef    key,
                                                  const std::string& label,
                                                  const ErrorSite&   site);
    llvm::Expected<llvm::json::Value> decodeString(const FieldSpec& spec, const ErrorSite& site);
    llvm::Expected<llvm::json::Value> decodeArray(const FieldSpec& spec, const std::string& label, const ErrorSite& site);
    llvm::Expected<llvm::json::Value> decodeStruct(const FieldSpec&   spec,
                                                   llvm::StringRef    key,
                                                   const std::string& label);
    llvm::Expected<llvm::json::Value> decodeUnion(const FieldSpec&   spec,
                                                  llvm::StringRef    key,
                                                  const std::string& label,
                                                  const ErrorSite&   site);

    llvm::Expected<llvm::ArrayRef<std::uint8_t>> take(std::size_t count, const ErrorSite& site);
    llvm::Error checkClaim(std::uint64_t count, std::size_t unitWidth, std::uint64_t ceiling, const ErrorSite& site) const;

    llvm::Error verify(const FieldSpec&          spec,
                       const ErrorSite&          site,
                       llvm::StringRef           scopePath,
                       ByteRange                 own,
                       llvm::ArrayRef<ByteRange> zeroed);
    llvm::Error verifyDeferred();

    std::size_t remaining() const
    {
        return bytes_.size() - cursor_;
    }

    const Document&              document_;
    llvm::ArrayRef<std::uint8_t> bytes_;
    const FunctionRegistry&      registry_;
    const CodecOptions&          options_;
    DiagnosticEngine*            diagnostics_;
    Context                      context_;
    std::size_t                  cursor_{0};
    FieldRangeTable              ranges_;
    std::vector<DeferredField>   deferred_;
};

llvm::Expected<DecodeResult> Deserializer::run()
{
    if (auto err = decodeFields(document_.fields))
    {
        return std::move(err);
    }
    if (auto err = verifyDeferred())
    {
        return std::move(err);
    }
    if (options_.strictLength && cursor_ < bytes_.size())
    {
        return makeCodecError(ErrorKind::TrailingData,
                              "",
                              cursor_,
                              std::to_string(bytes_.size() - cursor_) + " trailing byte(s) after the record");
    }
    LLVM_DEBUG(llvm::dbgs() << "decoded " << cursor_ << " of " << bytes_.size() << " byte(s)\n");
    return DecodeResult{llvm::json::Value(context_.popFrame()), cursor_};
}

llvm::Error Deserializer::decodeFields(const std::vector<FieldSpec>& fields)
{
    for (const FieldSpec& field : fields)
    {
        if (auto err = decodeField(field))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

llvm::Error Deserializer::decodeField(const FieldSpec& spec)
{
    const ErrorSite site{context_.fieldPath(spec.name), cursor_};

    if (spec.condition)
    {
        auto present = evaluateCondition(*spec.condition->ast, context_, site);
        if (!present)
        {
            return present.takeError();
        }
        if (!*present)
        {
            LLVM_DEBUG(llvm::dbgs() << "skip " << site.fieldPath << ": '" << spec.condition->text << "' is false\n");
            return llvm::Error::success();
        }
    }

    const std::size_t begin = cursor_;
    auto              value = decodeValue(spec, spec.name, spec.name, site);
    if (!value)
    {
        return value.takeError();
    }
    const ByteRange own{begin, cursor_};

    if (spec.calculated && options_.checksumPolicy != ChecksumPolicy::Ignore)
    {
        const std::string scopePath = context_.scopePath();
        if (isDeferred(*spec.calculated, scopePath, ranges_))
        {
            deferred_.push_back(DeferredField{&spec, site, scopePath, own});
        }
        else
        {
            std::vector<ByteRange> holes;
            for (const DeferredField& d : deferred_)
            {
                holes.push_back(d.bytes);
            }
            if (auto err = verify(spec, site, scopePath, own, holes))
            {
                return err;
            }
        }
    }

    ranges_.record(site.fieldPath, own);
    return context_.record(spec.name, std::move(*value));
}

llvm::Expected<llvm::json::Value> Deserializer::decodeValue(const FieldSpec&   spec,
                                                            llvm::StringRef    key,
                                                            const std::string& label,
                                                            const ErrorSite&   site)
{
    switch (spec.kind)
    {
    case FieldKind::Primitive: {
        auto raw = take(primitiveWidth(spec.primitive), site);
        if (!raw)
        {
            return raw.takeError();
        }
        return decodePrimitive(spec.primitive, document_.endianness, *raw);
    }
    case FieldKind::String:
        return decodeString(spec, site);
    case FieldKind::Array:
        return decodeArray(spec, label, site);
    case FieldKind::Struct:
        return decodeStruct(spec, key, label);
    case FieldKind::Union:
        return decodeUnion(spec, key, label, site);
    }
    return makeCodecError(ErrorKind::Schema, site, "unknown field kind");
}

llvm::Expected<llvm::json::Value> Deserializer::decodeString(const FieldSpec& spec, const ErrorSite& site)
{
    if (spec.size)
    {
        auto raw = take(static_cast<std::size_t>(*spec.size), site);
        if (!raw)
        {
            return raw.takeError();
        }
        llvm::ArrayRef<std::uint8_t> text = *raw;
        while (!text.empty() && text.back() == 0U)
        {
            text = text.drop_back();
        }
        return llvm::json::Value(decodeText(text, spec.encoding));
    }

    std::uint64_t length = 0;
    if (spec.lengthField)
    {
        auto resolved = evaluateCount(*spec.lengthField->ast, context_, site);
        if (!resolved)
        {
            return resolved.takeError();
        }
        length = *resolved;
    }
    else
    {
        auto prefix = take(4, site);
        if (!prefix)
        {
            return prefix.takeError();
        }
        length = readUnsigned(*prefix, document_.endianness);
    }

    if (auto err = checkClaim(length, 1, options_.maxStringBytes, site))
    {
        return std::move(err);
    }
    auto raw = take(static_cast<std::size_t>(length), site);
    if (!raw)
    {
        return raw.takeError();
    }
    return llvm::json::Value(decodeText(*raw, spec.encoding));
}

llvm::Expected<llvm::json::Value> Deserializer::decodeArray(const FieldSpec&   spec,
                                                            const std::string& label,
                                                            const ErrorSite&   site)
{
    std::uint64_t count = 0;
    if (spec.size)
    {
        count = *spec.size;
    }
    else
    {
        auto resolved = evaluateCount(*spec.lengthField->ast, context_, site);
        if (!resolved)
        {
            return resolved.takeError();
        }
        count = *resolved;
    }

    if (auto err = checkClaim(count, spec.element->minWireSize, options_.maxElementCount, site))
    {
        return std::move(err);
    }

    llvm::json::Array produced;
    if (spec.element->minWireSize > 0)
    {
        produced.reserve(static_cast<std::size_t>(count));
    }
    for (std::uint64_t i = 0; i < count; ++i)
    {
        const std::string elementLabel = label + "[" + std::to_string(i) + "]";
        const ErrorSite   elementSite{context_.fieldPath(elementLabel), cursor_};
        const std::size_t begin = cursor_;
        auto              v     = decodeValue(*spec.element, "", elementLabel, elementSite);
        if (!v)
        {
            return v.takeError();
        }
        ranges_.record(elementSite.fieldPath, ByteRange{begin, cursor_});
        produced.push_back(std::move(*v));
    }
    return llvm::json::Value(std::move(produced));
}

llvm::Expected<llvm::json::Value> Deserializer::decodeStruct(const FieldSpec&   spec,
                                                             llvm::StringRef    key,
                                                             const std::string& label)
{
    context_.pushFrame(key.str(), label, nullptr);
    if (auto err = decodeFields(spec.fields))
    {
        (void) context_.popFrame();
        return std::move(err);
    }
    return llvm::json::Value(context_.popFrame());
}

llvm::Expected<llvm::json::Value> Deserializer::decodeUnion(const FieldSpec&   spec,
                                                            llvm::StringRef    key,
                                                            const std::string& label,
                                                            const ErrorSite&   site)
{
    auto discriminant = evaluate(*spec.discriminant->ast, context_, site);
    if (!discriminant)
    {
        return discriminant.takeError();
    }
    auto alternative = selectAlternative(spec, *discriminant, site);
    if (!alternative)
    {
        return alternative.takeError();
    }
    LLVM_DEBUG(llvm::dbgs() << site.fieldPath << " selects '" << (*alternative)->name << "'\n");

    context_.pushFrame(key.str(), label, nullptr);
    if (auto err = decodeField(**alternative))
    {
        (void) context_.popFrame();
        return std::move(err);
    }
    return llvm::json::Value(context_.popFrame());
}

llvm::Expected<llvm::ArrayRef<std::uint8_t>> Deserializer::take(const std::size_t count, const ErrorSite& site)
{
    if (count > remaining())
    {
        return makeCodecError(ErrorKind::UnexpectedEndOfData,
                              site.fieldPath,
                              cursor_,
                              "needs " + std::to_string(count) + " byte(s) but " + std::to_string(remaining()) +
                                  " remain");
    }
    const auto out = bytes_.slice(cursor_, count);
    cursor_ += count;
    return out;
}

llvm::Error Deserializer::checkClaim(const std::uint64_t count,
                                     const std::size_t   unitWidth,
                                     const std::uint64_t ceiling,
                                     const ErrorSite&    site) const
{
    if (count > ceiling)
    {
        return makeCodecError(ErrorKind::UnboundedAllocation,
                              site.fieldPath,
                              cursor_,
                              "claimed count " + std::to_string(count) + " exceeds the limit of " +
                                  std::to_string(ceiling));
    }
    if (unitWidth > 0 && count > remaining() / unitWidth)
    {
        return makeCodecError(ErrorKind::UnboundedAllocation,
                              site.fieldPath,
                              cursor_,
                              "claimed count " + std::to_string(count) + " needs at least " +
                                  std::to_string(count * unitWidth) + " byte(s) but " + std::to_string(remaining()) +
                                  " remain");
    }
    return llvm::Error::success();
}

llvm::Error Deserializer::verify(const FieldSpec&          spec,
                                 const ErrorSite&          site,
                                 llvm::StringRef           scopePath,
                                 const ByteRange           own,
                                 llvm::ArrayRef<ByteRange> zeroed)
{
    auto expected = computeCalculatedValue(registry_,
                                           spec,
                                           bytes_.take_front(cursor_),
                                           own,
                                           scopePath,
                                           ranges_,
                                           zeroed,
                                           site);
    if (!expected)
    {
        return expected.takeError();
    }
    const std::uint64_t stored = readUnsigned(bytes_.slice(own.begin, own.end - own.begin), document_.endianness);
    if (stored == *expected)
    {
        return llvm::Error::success();
    }

    const std::string message = spec.calculated->function + " mismatch: stored " + hex(stored) + ", computed " +
                                hex(*expected);
    if (options_.checksumPolicy == ChecksumPolicy::Report)
    {
        LLVM_DEBUG(llvm::dbgs() << site.fieldPath << ": " << message << "\n");
        if (diagnostics_ != nullptr)
        {
            diagnostics_->warning(SourceLocation{site.fieldPath, 0}, message);
        }
        return llvm::Error::success();
    }
    return makeCodecError(ErrorKind::ChecksumMismatch, site, message);
}

llvm::Error Deserializer::verifyDeferred()
{
    for (std::size_t k = 0; k < deferred_.size(); ++k)
    {
        std::vector<ByteRange> holes;
        for (std::size_t j = k + 1; j < deferred_.size(); ++j)
        {
            holes.push_back(deferred_[j].bytes);
        }
        const DeferredField& d = deferred_[k];
        if (auto err = verify(*d.spec, d.site, d.scopePath, d.bytes, holes))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

}  // namespace

llvm::Expected<DecodeResult> decode(const Document&              document,
                                    llvm::ArrayRef<std::uint8_t> bytes,
                                    const FunctionRegistry&      registry,
                                    const CodecOptions&          options,
                                    DiagnosticEngine*            diagnostics)
{
    Deserializer deserializer(document, bytes, registry, options, diagnostics);
    return deserializer.run();
}

}  // namespace llvmbinfmt
