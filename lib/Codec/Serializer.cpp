//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the value-to-bytes traversal.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Codec/Serializer.h"

#include "llvmbinfmt/Codec/CalculatedFields.h"
#include "llvmbinfmt/Codec/Primitive.h"
#include "llvmbinfmt/Semantics/Context.h"
#include "llvmbinfmt/Semantics/Evaluator.h"

#include "llvm/Support/Debug.h"

#include <limits>
#include <string>
#include <utility>

#define DEBUG_TYPE "binfmt-serializer"

namespace llvmbinfmt
{
namespace
{

class Serializer final
{
public:
    Serializer(const Document&           document,
               const FunctionRegistry&   registry,
               const CodecOptions&       options,
               const llvm::json::Object* root)
        : document_(document)
        , registry_(registry)
        , options_(options)
        , context_(root)
    {
    }

    llvm::Expected<std::vector<std::uint8_t>> run();

private:
    llvm::Error encodeFields(const std::vector<FieldSpec>& fields);
    llvm::Error encodeField(const FieldSpec& spec);

    llvm::Expected<llvm::json::Value> encodeCalculated(const FieldSpec& spec, const ErrorSite& site);
    llvm::Expected<llvm::json::Value> encodeInput(const FieldSpec& spec, const ErrorSite& site);
    llvm::Expected<llvm::json::Value> encodeValue(const FieldSpec&         spec,
                                                  const llvm::json::Value& value,
                                                  llvm::StringRef          key,
                                                  const std::string&       label,
                                                  const ErrorSite&         site);
    llvm::Expected<llvm::json::Value> encodeString(const FieldSpec&         spec,
                                                   const llvm::json::Value& value,
                                                   const ErrorSite&         site);
    llvm::Expected<llvm::json::Value> encodeArray(const FieldSpec&         spec,
                                                  const llvm::json::Value& value,
                                                  const std::string&       label,
                                                  const ErrorSite&         site);
    llvm::Expected<llvm::json::Value> encodeStruct(const FieldSpec&         spec,
                                                   const llvm::json::Value& value,
                                                   llvm::StringRef          key,
                                                   const std::string&       label,
                                                   const ErrorSite&         site);
    llvm::Expected<llvm::json::Value> encodeUnion(const FieldSpec&         spec,
                                                  const llvm::json::Value& value,
                                                  llvm::StringRef          key,
                                                  const std::string&       label,
                                                  const ErrorSite&         site);
    llvm::Error patchDeferred();

    const Document&            document_;
    const FunctionRegistry&    registry_;
    const CodecOptions&        options_;
    Context                    context_;
    std::vector<std::uint8_t>  out_;
    FieldRangeTable            ranges_;
    std::vector<DeferredField> deferred_;
};

llvm::Expected<std::vector<std::uint8_t>> Serializer::run()
{
    if (auto err = encodeFields(document_.fields))
    {
        return std::move(err);
    }
    if (auto err = patchDeferred())
    {
        return std::move(err);
    }
    LLVM_DEBUG(llvm::dbgs() << "encoded " << out_.size() << " byte(s)\n");
    return std::move(out_);
}

llvm::Error Serializer::encodeFields(const std::vector<FieldSpec>& fields)
{
    for (const FieldSpec& field : fields)
    {
        if (auto err = encodeField(field))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

llvm::Error Serializer::encodeField(const FieldSpec& spec)
{
    const ErrorSite site{context_.fieldPath(spec.name), out_.size()};

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
            context_.markSkipped(spec.name);
            return llvm::Error::success();
        }
    }

    const std::size_t begin    = out_.size();
    auto              produced = spec.calculated ? encodeCalculated(spec, site) : encodeInput(spec, site);
    if (!produced)
    {
        return produced.takeError();
    }

    ranges_.record(site.fieldPath, ByteRange{begin, out_.size()});
    return context_.record(spec.name, std::move(*produced));
}

llvm::Expected<llvm::json::Value> Serializer::encodeCalculated(const FieldSpec& spec, const ErrorSite& site)
{
    const CalculatedSpec& calc  = *spec.calculated;
    const std::size_t     width = primitiveWidth(spec.primitive);
    const ByteRange       own{out_.size(), out_.size() + width};
    const std::string     scopePath = context_.scopePath();

    if (!registry_.contains(calc.function))
    {
        return makeCodecError(ErrorKind::UnsupportedFunction, site, "unknown function '" + calc.function + "'");
    }

    if (isDeferred(calc, scopePath, ranges_))
    {
        writeUnsigned(0, width, document_.endianness, out_);
        deferred_.push_back(DeferredField{&spec, site, scopePath, own});
        LLVM_DEBUG(llvm::dbgs() << "defer " << site.fieldPath << " (" << calc.function << ")\n");
        return llvm::json::Value(0);
    }

    std::vector<ByteRange> holes;
    for (const DeferredField& d : deferred_)
    {
        holes.push_back(d.bytes);
    }
    auto result = computeCalculatedValue(registry_, spec, out_, own, scopePath, ranges_, holes, site);
    if (!result)
    {
        return result.takeError();
    }
    writeUnsigned(*result, width, document_.endianness, out_);
    LLVM_DEBUG(llvm::dbgs() << site.fieldPath << " = " << calc.function << " -> " << *result << "\n");
    return decodePrimitive(spec.primitive, document_.endianness, llvm::ArrayRef<std::uint8_t>(out_).slice(own.begin));
}

llvm::Expected<llvm::json::Value> Serializer::encodeInput(const FieldSpec& spec, const ErrorSite& site)
{
    const llvm::json::Object* input = context_.currentInput();
    const llvm::json::Value*  value = input != nullptr ? input->get(spec.name) : nullptr;
    if (value == nullptr)
    {
        return makeCodecError(ErrorKind::MissingField, site, "required field '" + spec.name + "' is absent");
    }
    return encodeValue(spec, *value, spec.name, spec.name, site);
}

llvm::Expected<llvm::json::Value> Serializer::encodeValue(const FieldSpec&         spec,
                                                          const llvm::json::Value& value,
                                                          llvm::StringRef          key,
                                                          const std::string&       label,
                                                          const ErrorSite&         site)
{
    switch (spec.kind)
    {
    case FieldKind::Primitive: {
        const std::size_t begin = out_.size();
        if (auto err = encodePrimitive(spec.primitive, document_.endianness, value, out_, site))
        {
            return std::move(err);
        }
        return decodePrimitive(spec.primitive, document_.endianness, llvm::ArrayRef<std::uint8_t>(out_).slice(begin));
    }
    case FieldKind::String:
        return encodeString(spec, value, site);
    case FieldKind::Array:
        return encodeArray(spec, value, label, site);
    case FieldKind::Struct:
        return encodeStruct(spec, value, key, label, site);
    case FieldKind::Union:
        return encodeUnion(spec, value, key, label, site);
    }
    return makeCodecError(ErrorKind::Schema, site, "unknown field kind");
}

llvm::Expected<llvm::json::Value> Serializer::encodeString(const FieldSpec&         spec,
                                                           const llvm::json::Value& value,
                                                           const ErrorSite&         site)
{
    const auto text = value.getAsString();
    if (!text)
    {
        return makeCodecError(ErrorKind::TypeMismatch, site, "expected a string");
    }
    auto bytes = encodeText(*text, spec.encoding, site);
    if (!bytes)
    {
        return bytes.takeError();
    }
    if (bytes->size() > options_.maxStringBytes)
    {
        return makeCodecError(ErrorKind::UnboundedAllocation,
                              site,
                              std::to_string(bytes->size()) + " byte(s) exceed the string limit of " +
                                  std::to_string(options_.maxStringBytes));
    }

    if (spec.size)
    {
        if (bytes->size() > *spec.size)
        {
            return makeCodecError(ErrorKind::Range,
                                  site,
                                  std::to_string(bytes->size()) + " byte(s) exceed the fixed size of " +
                                      std::to_string(*spec.size));
        }
        out_.insert(out_.end(), bytes->begin(), bytes->end());
        out_.resize(out_.size() + (*spec.size - bytes->size()), 0U);
    }
    else if (spec.lengthField)
    {
        auto length = evaluateCount(*spec.lengthField->ast, context_, site);
        if (!length)
        {
            return length.takeError();
        }
        if (*length != bytes->size())
        {
            return makeCodecError(ErrorKind::TypeMismatch,
                                  site,
                                  "length '" + spec.lengthField->text + "' is " + std::to_string(*length) +
                                      " but the string encodes to " + std::to_string(bytes->size()) + " byte(s)");
        }
        out_.insert(out_.end(), bytes->begin(), bytes->end());
    }
    else
    {
        if (bytes->size() > std::numeric_limits<std::uint32_t>::max())
        {
            return makeCodecError(ErrorKind::Range, site, "string too long for a 32-bit length prefix");
        }
        writeUnsigned(bytes->size(), 4, document_.endianness, out_);
        out_.insert(out_.end(), bytes->begin(), bytes->end());
    }
    return llvm::json::Value(text->str());
}

llvm::Expected<llvm::json::Value> Serializer::encodeArray(const FieldSpec&         spec,
                                                          const llvm::json::Value& value,
                                                          const std::string&       label,
                                                          const ErrorSite&         site)
{
    const auto* items = value.getAsArray();
    if (items == nullptr)
    {
        return makeCodecError(ErrorKind::TypeMismatch, site, "expected an array");
    }

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
    if (count > options_.maxElementCount)
    {
        return makeCodecError(ErrorKind::UnboundedAllocation,
                              site,
                              std::to_string(count) + " element(s) exceed the array limit of " +
                                  std::to_string(options_.maxElementCount));
    }
    if (items->size() != count)
    {
        return makeCodecError(ErrorKind::TypeMismatch,
                              site,
                              "array has " + std::to_string(items->size()) + " element(s), expected " +
                                  std::to_string(count));
    }

    llvm::json::Array produced;
    for (std::size_t i = 0; i < items->size(); ++i)
    {
        const std::string elementLabel = label + "[" + std::to_string(i) + "]";
        const ErrorSite   elementSite{context_.fieldPath(elementLabel), out_.size()};
        const std::size_t begin = out_.size();
        auto              v     = encodeValue(*spec.element, (*items)[i], "", elementLabel, elementSite);
        if (!v)
        {
            return v.takeError();
        }
        ranges_.record(elementSite.fieldPath, ByteRange{begin, out_.size()});
        produced.push_back(std::move(*v));
    }
    return llvm::json::Value(std::move(produced));
}

llvm::Expected<llvm::json::Value> Serializer::encodeStruct(const FieldSpec&         spec,
                                                           const llvm::json::Value& value,
                                                           llvm::StringRef          key,
                                                           const std::string&       label,
                                                           const ErrorSite&         site)
{
    const auto* object = value.getAsObject();
    if (object == nullptr)
    {
        return makeCodecError(ErrorKind::TypeMismatch, site, "expected an object");
    }
    context_.pushFrame(key.str(), label, object);
    if (auto err = encodeFields(spec.fields))
    {
        (void) context_.popFrame();
        return std::move(err);
    }
    return llvm::json::Value(context_.popFrame());
}

llvm::Expected<llvm::json::Value> Serializer::encodeUnion(const FieldSpec&         spec,
                                                          const llvm::json::Value& value,
                                                          llvm::StringRef          key,
                                                          const std::string&       label,
                                                          const ErrorSite&         site)
{
    const auto* object = value.getAsObject();
    if (object == nullptr)
    {
        return makeCodecError(ErrorKind::TypeMismatch, site, "expected an object holding one alternative");
    }

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
    for (const auto& entry : *object)
    {
        if (llvm::StringRef(entry.first) != (*alternative)->name)
        {
            return makeCodecError(ErrorKind::TypeMismatch,
                                  site,
                                  "input holds alternative '" + llvm::StringRef(entry.first) +
                                      "' but the discriminant selects '" + (*alternative)->name + "'");
        }
    }
    LLVM_DEBUG(llvm::dbgs() << site.fieldPath << " selects '" << (*alternative)->name << "'\n");

    context_.pushFrame(key.str(), label, object);
    if (auto err = encodeField(**alternative))
    {
        (void) context_.popFrame();
        return std::move(err);
    }
    return llvm::json::Value(context_.popFrame());
}

llvm::Error Serializer::patchDeferred()
{
    for (std::size_t k = 0; k < deferred_.size(); ++k)
    {
        const DeferredField&   d = deferred_[k];
        std::vector<ByteRange> holes;
        for (std::size_t j = k + 1; j < deferred_.size(); ++j)
        {
            holes.push_back(deferred_[j].bytes);
        }
        auto result = computeCalculatedValue(registry_, *d.spec, out_, d.bytes, d.scopePath, ranges_, holes, d.site);
        if (!result)
        {
            return result.takeError();
        }
        patchUnsigned(*result, d.bytes.end - d.bytes.begin, document_.endianness, out_, d.bytes.begin);
        LLVM_DEBUG(llvm::dbgs() << "patch " << d.site.fieldPath << " = " << *result << "\n");
    }
    return llvm::Error::success();
}

}  // namespace

llvm::Expected<std::vector<std::uint8_t>> encode(const Document&          document,
                                                 const llvm::json::Value& value,
                                                 const FunctionRegistry&  registry,
                                                 const CodecOptions&      options)
{
    const auto* root = value.getAsObject();
    if (root == nullptr)
    {
        return makeCodecError(ErrorKind::TypeMismatch, "", std::size_t{0}, "record value must be an object");
    }
    Serializer serializer(document, registry, options, root);
    return serializer.run();
}

}  // namespace llvmbinfmt
