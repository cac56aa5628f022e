//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements schema-ordered JSON printing.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Codec/JsonWriter.h"

#include "llvm/ADT/StringSet.h"

#include <algorithm>
#include <string>
#include <vector>

namespace llvmbinfmt
{
namespace
{

void writeValue(llvm::json::OStream& out, const FieldSpec* spec, const llvm::json::Value& value);

void writeObject(llvm::json::OStream&          out,
                 const std::vector<FieldSpec>& fields,
                 const llvm::json::Object&     object)
{
    out.object([&] {
        llvm::StringSet<> written;
        for (const FieldSpec& field : fields)
        {
            const auto* v = object.get(field.name);
            if (v == nullptr)
            {
                continue;
            }
            written.insert(field.name);
            out.attributeBegin(field.name);
            writeValue(out, &field, *v);
            out.attributeEnd();
        }

        std::vector<std::string> extra;
        for (const auto& entry : object)
        {
            if (!written.contains(llvm::StringRef(entry.first)))
            {
                extra.push_back(llvm::StringRef(entry.first).str());
            }
        }
        std::sort(extra.begin(), extra.end());
        for (const std::string& key : extra)
        {
            out.attributeBegin(key);
            writeValue(out, nullptr, *object.get(key));
            out.attributeEnd();
        }
    });
}

void writeValue(llvm::json::OStream& out, const FieldSpec* spec, const llvm::json::Value& value)
{
    if (const auto* object = value.getAsObject())
    {
        if (spec != nullptr && spec->kind == FieldKind::Struct)
        {
            writeObject(out, spec->fields, *object);
            return;
        }
        if (spec != nullptr && spec->kind == FieldKind::Union)
        {
            writeObject(out, spec->alternatives, *object);
            return;
        }
        writeObject(out, {}, *object);
        return;
    }
    if (const auto* array = value.getAsArray())
    {
        const FieldSpec* element = spec != nullptr && spec->kind == FieldKind::Array ? spec->element.get() : nullptr;
        out.array([&] {
            for (const llvm::json::Value& item : *array)
            {
                writeValue(out, element, item);
            }
        });
        return;
    }
    out.value(value);
}

}  // namespace

void writeOrderedJSON(const Document& document, const llvm::json::Value& value, llvm::raw_ostream& os, const unsigned indent)
{
    llvm::json::OStream out(os, indent);
    if (const auto* object = value.getAsObject())
    {
        writeObject(out, document.fields, *object);
    }
    else
    {
        out.value(value);
    }
}

}  // namespace llvmbinfmt
