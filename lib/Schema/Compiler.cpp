//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements schema validation and compilation.
///
/// The compiler walks the schema object once, parses every expression, rejects statically
/// detectable forward references, and derives the minimum wire size of each field.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Schema/Compiler.h"

#include "llvmbinfmt/Frontend/Parser.h"
#include "llvmbinfmt/Support/Diagnostics.h"
#include "llvmbinfmt/Support/Error.h"

#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/Debug.h"

#include <algorithm>
#include <limits>
#include <utility>

#define DEBUG_TYPE "binfmt-schema"

namespace llvmbinfmt
{
namespace
{

/// Names visible at one struct level while its fields are compiled in order.
struct NameScope
{
    llvm::StringSet<> declared;
    llvm::StringSet<> all;

    /// Calculated fields whose value is only known once later bytes are written.
    llvm::StringSet<> deferred;

    /// Name of the struct whose fields this scope holds, empty for the root, elements, and unions.
    std::string owner;
};

std::optional<FunctionScope> parseFunctionScope(llvm::StringRef text)
{
    return llvm::StringSwitch<std::optional<FunctionScope>>(text)
        .Case("all_previous", FunctionScope::AllPrevious)
        .Case("field_range", FunctionScope::FieldRange)
        .Case("entire_file", FunctionScope::EntireFile)
        .Default(std::nullopt);
}

std::optional<StringEncoding> parseEncoding(llvm::StringRef text)
{
    return llvm::StringSwitch<std::optional<StringEncoding>>(text.lower())
        .Cases("utf-8", "utf8", StringEncoding::Utf8)
        .Cases("ascii", "us-ascii", StringEncoding::Ascii)
        .Cases("latin-1", "latin1", "iso-8859-1", StringEncoding::Latin1)
        .Default(std::nullopt);
}

class SchemaCompiler final
{
public:
    SchemaCompiler(DiagnosticEngine& diagnostics, const CompileOptions& options)
        : diagnostics_(diagnostics)
        , options_(options)
    {
    }

    std::vector<FieldSpec> compileFieldList(const llvm::json::Array& list,
                                            const std::string&       path,
                                            std::size_t              depth,
                                            llvm::StringRef          owner = {});

private:
    std::optional<FieldSpec> compileField(const llvm::json::Object& object,
                                          const std::string&        path,
                                          std::size_t               depth,
                                          bool                      anonymous);

    bool compilePrimitive(const llvm::json::Object& object, const std::string& path, FieldSpec& spec);
    bool compileString(const llvm::json::Object& object, const std::string& path, FieldSpec& spec);
    bool compileArray(const llvm::json::Object& object, const std::string& path, std::size_t depth, FieldSpec& spec);
    bool compileStruct(const llvm::json::Object& object, const std::string& path, std::size_t depth, FieldSpec& spec);
    bool compileUnion(const llvm::json::Object& object, const std::string& path, std::size_t depth, FieldSpec& spec);
    bool compileCalculated(const llvm::json::Object& object, const std::string& path, FieldSpec& spec);

    std::optional<CompiledExpr> compileExpr(const llvm::json::Value& value, const std::string& path);
    std::optional<std::uint64_t> readSize(const llvm::json::Object& object,
                                          llvm::StringRef           key,
                                          const std::string&        path,
                                          bool&                     ok);
    bool isForwardLooking(const CalculatedSpec& calc) const;

    void checkReferences(const CompiledExpr& expr, const std::string& path);

    void error(const std::string& path, std::string message)
    {
        diagnostics_.error(SourceLocation{path, 0}, std::move(message));
    }

    DiagnosticEngine&      diagnostics_;
    const CompileOptions&  options_;
    std::vector<NameScope> scopes_;
};

std::size_t computeMinWireSize(const FieldSpec& spec)
{
    switch (spec.kind)
    {
    case FieldKind::Primitive:
        return primitiveWidth(spec.primitive);
    case FieldKind::String:
        if (spec.size)
        {
            return static_cast<std::size_t>(*spec.size);
        }
        return spec.lengthField ? 0 : 4;
    case FieldKind::Array:
        if (spec.size && spec.element)
        {
            const std::uint64_t total = *spec.size * spec.element->minWireSize;
            return static_cast<std::size_t>(std::min<std::uint64_t>(total, std::numeric_limits<std::size_t>::max()));
        }
        return 0;
    case FieldKind::Struct: {
        std::size_t total = 0;
        for (const FieldSpec& child : spec.fields)
        {
            total += child.condition ? 0 : child.minWireSize;
        }
        return total;
    }
    case FieldKind::Union: {
        std::size_t best = std::numeric_limits<std::size_t>::max();
        for (const FieldSpec& alt : spec.alternatives)
        {
            best = std::min(best, alt.condition ? std::size_t{0} : alt.minWireSize);
        }
        return spec.alternatives.empty() ? 0 : best;
    }
    }
    return 0;
}

std::vector<FieldSpec> SchemaCompiler::compileFieldList(const llvm::json::Array& list,
                                                        const std::string&       path,
                                                        const std::size_t        depth,
                                                        llvm::StringRef          owner)
{
    std::vector<FieldSpec> out;
    NameScope              scope;
    scope.owner = owner.str();
    for (const llvm::json::Value& item : list)
    {
        if (const auto* obj = item.getAsObject())
        {
            if (auto name = obj->getString("name"))
            {
                scope.all.insert(*name);
            }
        }
    }
    scopes_.push_back(std::move(scope));

    for (std::size_t i = 0; i < list.size(); ++i)
    {
        const std::string itemPath = path + "[" + std::to_string(i) + "]";
        const auto*       obj      = list[i].getAsObject();
        if (obj == nullptr)
        {
            error(itemPath, "field definition must be an object");
            continue;
        }
        auto spec = compileField(*obj, itemPath, depth, false);
        if (!spec)
        {
            continue;
        }
        if (!scopes_.back().declared.insert(spec->name).second)
        {
            error(itemPath, "duplicate field name '" + spec->name + "'");
            continue;
        }
        if (spec->calculated && isForwardLooking(*spec->calculated))
        {
            scopes_.back().deferred.insert(spec->name);
        }
        out.push_back(std::move(*spec));
    }

    scopes_.pop_back();
    return out;
}

std::optional<FieldSpec> SchemaCompiler::compileField(const llvm::json::Object& object,
                                                      const std::string&        path,
                                                      const std::size_t         depth,
                                                      const bool                anonymous)
{
    FieldSpec spec;
    bool      ok = true;

    if (auto name = object.getString("name"))
    {
        spec.name = name->str();
    }
    if (!anonymous && spec.name.empty())
    {
        error(path, "field has no name");
        ok = false;
    }
    if (auto description = object.getString("description"))
    {
        spec.description = description->str();
    }

    const auto type = object.getString("type");
    if (!type)
    {
        error(path, "field '" + spec.name + "' has no type");
        return std::nullopt;
    }

    if (const auto* condition = object.get("condition"))
    {
        spec.condition = compileExpr(*condition, path + ".condition");
        ok             = ok && spec.condition.has_value();
    }

    if (auto kind = parsePrimitiveKind(*type))
    {
        spec.kind      = FieldKind::Primitive;
        spec.primitive = *kind;
        ok             = compilePrimitive(object, path, spec) && ok;
    }
    else if (*type == "string")
    {
        spec.kind = FieldKind::String;
        ok        = compileString(object, path, spec) && ok;
    }
    else if (*type == "array" || *type == "struct" || *type == "union")
    {
        if (depth > options_.maxNestingDepth)
        {
            error(path,
                  "nesting depth exceeds the limit of " + std::to_string(options_.maxNestingDepth));
            return std::nullopt;
        }
        if (*type == "array")
        {
            spec.kind = FieldKind::Array;
            ok        = compileArray(object, path, depth, spec) && ok;
        }
        else if (*type == "struct")
        {
            spec.kind = FieldKind::Struct;
            ok        = compileStruct(object, path, depth, spec) && ok;
        }
        else
        {
            spec.kind = FieldKind::Union;
            ok        = compileUnion(object, path, depth, spec) && ok;
        }
    }
    else
    {
        error(path, "unknown field type '" + type->str() + "'");
        return std::nullopt;
    }

    if (spec.kind != FieldKind::Primitive && object.get("function") != nullptr)
    {
        error(path, "calculated field '" + spec.name + "' must be an integer primitive, not " + fieldKindName(spec.kind));
        ok = false;
    }
    if (!ok)
    {
        // Keep the name reserved so later siblings still see it as declared.
        if (!spec.name.empty() && !scopes_.empty())
        {
            scopes_.back().declared.insert(spec.name);
        }
        return std::nullopt;
    }

    spec.minWireSize = computeMinWireSize(spec);
    LLVM_DEBUG(llvm::dbgs() << "compiled " << path << " '" << spec.name << "' as " << fieldKindName(spec.kind)
                            << ", min " << spec.minWireSize << " byte(s)\n");
    return spec;
}

bool SchemaCompiler::compilePrimitive(const llvm::json::Object& object, const std::string& path, FieldSpec& spec)
{
    if (object.get("function") == nullptr)
    {
        return true;
    }
    if (!isIntegerKind(spec.primitive))
    {
        error(path,
              "calculated field '" + spec.name + "' must be an integer primitive, not " +
                  primitiveKindName(spec.primitive));
        return false;
    }
    return compileCalculated(object, path, spec);
}

bool SchemaCompiler::compileCalculated(const llvm::json::Object& object, const std::string& path, FieldSpec& spec)
{
    const auto function = object.getString("function");
    if (!function || function->empty())
    {
        error(path + ".function", "calculated field function must be a non-empty string");
        return false;
    }

    CalculatedSpec calc;
    calc.function = function->str();

    if (const auto* params = object.get("function_parameters"))
    {
        const auto* paramObject = params->getAsObject();
        if (paramObject == nullptr)
        {
            error(path + ".function_parameters", "function parameters must be an object");
            return false;
        }
        calc.parameters = *paramObject;
    }

    // Scope attributes inside the parameter object take precedence.
    const auto lookup = [&](llvm::StringRef key) -> std::optional<llvm::StringRef> {
        if (auto v = calc.parameters.getString(key))
        {
            return *v;
        }
        if (auto v = object.getString(key))
        {
            return *v;
        }
        return std::nullopt;
    };

    if (auto scopeText = lookup("function_scope"))
    {
        auto scope = parseFunctionScope(*scopeText);
        if (!scope)
        {
            error(path + ".function_scope", "unknown function scope '" + scopeText->str() + "'");
            return false;
        }
        calc.scope = *scope;
    }

    if (calc.scope == FunctionScope::FieldRange)
    {
        const auto start = lookup("function_scope_start");
        const auto end   = lookup("function_scope_end");
        if (!start || !end || start->empty() || end->empty())
        {
            error(path, "field_range scope of '" + spec.name + "' needs function_scope_start and function_scope_end");
            return false;
        }
        calc.rangeStart = start->str();
        calc.rangeEnd   = end->str();
    }

    spec.calculated = std::move(calc);
    return true;
}

bool SchemaCompiler::compileString(const llvm::json::Object& object, const std::string& path, FieldSpec& spec)
{
    bool ok   = true;
    spec.size = readSize(object, "size", path, ok);

    if (const auto* lengthField = object.get("length_field"))
    {
        spec.lengthField = compileExpr(*lengthField, path + ".length_field");
        ok               = ok && spec.lengthField.has_value();
    }
    if (spec.size && spec.lengthField)
    {
        error(path, "string '" + spec.name + "' declares both size and length_field");
        ok = false;
    }

    if (auto encodingText = object.getString("encoding"))
    {
        auto encoding = parseEncoding(*encodingText);
        if (!encoding)
        {
            error(path + ".encoding", "unsupported string encoding '" + encodingText->str() + "'");
            ok = false;
        }
        else
        {
            spec.encoding = *encoding;
        }
    }
    return ok;
}

bool SchemaCompiler::compileArray(const llvm::json::Object& object,
                                  const std::string&        path,
                                  const std::size_t         depth,
                                  FieldSpec&                spec)
{
    bool ok   = true;
    spec.size = readSize(object, "size", path, ok);
    if (const auto* lengthField = object.get("length_field"))
    {
        spec.lengthField = compileExpr(*lengthField, path + ".length_field");
        ok               = ok && spec.lengthField.has_value();
    }
    if (ok && spec.size.has_value() == spec.lengthField.has_value())
    {
        error(path, "array '" + spec.name + "' must declare exactly one of size and length_field");
        ok = false;
    }

    // Element expressions see the same names as the array itself.
    if (const auto* elementValue = object.get("element"))
    {
        const auto* elementObject = elementValue->getAsObject();
        if (elementObject == nullptr)
        {
            error(path + ".element", "array element must be a field object");
            return false;
        }
        scopes_.push_back(NameScope{});
        auto element = compileField(*elementObject, path + ".element", depth + 1, true);
        scopes_.pop_back();
        if (!element)
        {
            return false;
        }
        spec.element = std::make_shared<const FieldSpec>(std::move(*element));
        return ok;
    }

    const auto elementType = object.getString("element_type");
    if (!elementType)
    {
        error(path, "array '" + spec.name + "' has neither element_type nor element");
        return false;
    }

    FieldSpec element;
    if (auto kind = parsePrimitiveKind(*elementType))
    {
        element.kind      = FieldKind::Primitive;
        element.primitive = *kind;
    }
    else if (*elementType == "string")
    {
        element.kind = FieldKind::String;
        bool sizeOk  = true;
        element.size = readSize(object, "element_size", path, sizeOk);
        ok           = ok && sizeOk;
        if (auto encodingText = object.getString("element_encoding"))
        {
            auto encoding = parseEncoding(*encodingText);
            if (!encoding)
            {
                error(path + ".element_encoding", "unsupported string encoding '" + encodingText->str() + "'");
                ok = false;
            }
            else
            {
                element.encoding = *encoding;
            }
        }
    }
    else if (*elementType == "struct")
    {
        element.kind      = FieldKind::Struct;
        const auto* items = object.getArray("element_fields");
        if (items == nullptr)
        {
            error(path, "array of struct '" + spec.name + "' has no element_fields");
            return false;
        }
        if (depth + 1 > options_.maxNestingDepth)
        {
            error(path, "nesting depth exceeds the limit of " + std::to_string(options_.maxNestingDepth));
            return false;
        }
        const std::size_t errorsBefore = diagnostics_.count(DiagnosticLevel::Error);
        element.fields                 = compileFieldList(*items, path + ".element_fields", depth + 2);
        ok = ok && diagnostics_.count(DiagnosticLevel::Error) == errorsBefore;
    }
    else
    {
        error(path + ".element_type",
              "unsupported element_type '" + elementType->str() + "'; use 'element' for nested arrays and unions");
        return false;
    }

    element.minWireSize = computeMinWireSize(element);
    spec.element        = std::make_shared<const FieldSpec>(std::move(element));
    return ok;
}

bool SchemaCompiler::compileStruct(const llvm::json::Object& object,
                                   const std::string&        path,
                                   const std::size_t         depth,
                                   FieldSpec&                spec)
{
    const auto* items = object.getArray("fields");
    if (items == nullptr)
    {
        error(path, "struct '" + spec.name + "' has no fields array");
        return false;
    }
    // The struct's own name addresses its partially built value.
    const bool selfDeclared =
        !spec.name.empty() && !scopes_.empty() && scopes_.back().declared.insert(spec.name).second;
    const std::size_t errorsBefore = diagnostics_.count(DiagnosticLevel::Error);
    spec.fields = compileFieldList(*items, path + ".fields", depth + 1, selfDeclared ? spec.name : "");
    if (selfDeclared)
    {
        scopes_.back().declared.erase(spec.name);
    }
    return diagnostics_.count(DiagnosticLevel::Error) == errorsBefore;
}

bool SchemaCompiler::compileUnion(const llvm::json::Object& object,
                                  const std::string&        path,
                                  const std::size_t         depth,
                                  FieldSpec&                spec)
{
    bool ok = true;
    if (const auto* discriminant = object.get("discriminant"))
    {
        spec.discriminant = compileExpr(*discriminant, path + ".discriminant");
        ok                = spec.discriminant.has_value();
    }
    else
    {
        error(path, "union '" + spec.name + "' has no discriminant");
        ok = false;
    }

    const auto* alternatives = object.getArray("alternatives");
    if (alternatives == nullptr || alternatives->empty())
    {
        error(path, "union '" + spec.name + "' has no alternatives");
        return false;
    }

    NameScope scope;
    scopes_.push_back(std::move(scope));
    llvm::StringSet<> seen;
    for (std::size_t i = 0; i < alternatives->size(); ++i)
    {
        const std::string altPath = path + ".alternatives[" + std::to_string(i) + "]";
        const auto*       altObj  = (*alternatives)[i].getAsObject();
        if (altObj == nullptr)
        {
            error(altPath, "union alternative must be an object");
            ok = false;
            continue;
        }
        auto alt = compileField(*altObj, altPath, depth + 1, false);
        if (!alt)
        {
            ok = false;
            continue;
        }
        if (!seen.insert(alt->name).second)
        {
            error(altPath, "duplicate alternative name '" + alt->name + "'");
            ok = false;
            continue;
        }
        if (const auto* caseValue = altObj->get("case"))
        {
            if (caseValue->kind() == llvm::json::Value::Object || caseValue->kind() == llvm::json::Value::Array ||
                caseValue->kind() == llvm::json::Value::Null)
            {
                error(altPath + ".case", "case must be a scalar literal");
                ok = false;
                continue;
            }
            alt->caseValue = *caseValue;
        }
        spec.alternatives.push_back(std::move(*alt));
    }
    scopes_.pop_back();
    return ok;
}

std::optional<std::uint64_t> SchemaCompiler::readSize(const llvm::json::Object& object,
                                                      llvm::StringRef           key,
                                                      const std::string&        path,
                                                      bool&                     ok)
{
    const auto* value = object.get(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    auto integer = value->getAsInteger();
    if (!integer || *integer < 0)
    {
        error(path + "." + key.str(), key.str() + " must be a non-negative integer");
        ok = false;
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(*integer);
}

std::optional<CompiledExpr> SchemaCompiler::compileExpr(const llvm::json::Value& value, const std::string& path)
{
    std::string text;
    if (auto s = value.getAsString())
    {
        text = s->str();
    }
    else if (auto i = value.getAsInteger())
    {
        text = std::to_string(*i);
    }
    else
    {
        error(path, "expression must be a string");
        return std::nullopt;
    }

    auto parsed = parseExpressionText(text, path, diagnostics_);
    if (!parsed)
    {
        llvm::consumeError(parsed.takeError());
        error(path, "cannot parse expression '" + text + "'");
        return std::nullopt;
    }
    CompiledExpr out{text, std::move(*parsed)};
    checkReferences(out, path);
    return out;
}

bool SchemaCompiler::isForwardLooking(const CalculatedSpec& calc) const
{
    if (calc.scope == FunctionScope::EntireFile)
    {
        return true;
    }
    if (calc.scope != FunctionScope::FieldRange)
    {
        return false;
    }
    const llvm::StringRef endHead = llvm::StringRef(calc.rangeEnd).split('.').first;
    for (const NameScope& scope : scopes_)
    {
        if (scope.declared.contains(endHead))
        {
            return false;
        }
    }
    return true;
}

void SchemaCompiler::checkReferences(const CompiledExpr& expr, const std::string& path)
{
    std::vector<const ExprAST::Path*> paths;
    collectPaths(*expr.ast, paths);
    for (const ExprAST::Path* ref : paths)
    {
        if (ref->segments.empty())
        {
            continue;
        }
        const std::string& head          = ref->segments.front().name;
        bool               declared      = false;
        bool               declaredLater = false;
        for (std::size_t k = scopes_.size(); k-- > 0;)
        {
            if (scopes_[k].declared.contains(head))
            {
                declared = true;
                if (scopes_[k].deferred.contains(head))
                {
                    error(path, "'" + ref->str() + "' reads calculated field '" + head + "' before its value is final");
                    break;
                }
                // `name.x` inside struct `name` may only read fields of the struct already compiled.
                if (k + 1 < scopes_.size() && scopes_[k + 1].owner == head && ref->segments.size() > 1 &&
                    ref->segments[1].kind == PathSegment::Kind::Field)
                {
                    const NameScope&   own    = scopes_[k + 1];
                    const std::string& member = ref->segments[1].name;
                    if (own.deferred.contains(member))
                    {
                        error(path,
                              "'" + ref->str() + "' reads calculated field '" + member + "' before its value is final");
                    }
                    else if (!own.declared.contains(member))
                    {
                        error(path,
                              own.all.contains(member)
                                  ? "forward reference to '" + ref->str() + "' in '" + expr.text + "'"
                                  : "'" + ref->str() + "' names no field of '" + head + "'");
                    }
                }
                break;
            }
            if (scopes_[k].all.contains(head))
            {
                declaredLater = true;
            }
        }
        if (declared)
        {
            continue;
        }
        if (declaredLater)
        {
            error(path, "forward reference to '" + ref->str() + "' in '" + expr.text + "'");
            continue;
        }
        diagnostics_.warning(SourceLocation{path, 0},
                             "'" + head + "' is not declared in any enclosing scope; it must come from the input");
    }
}

}  // namespace

llvm::Expected<Document> compileSchema(const llvm::json::Object& schema,
                                       DiagnosticEngine&         diagnostics,
                                       const CompileOptions&     options)
{
    const std::size_t errorsBefore = diagnostics.count(DiagnosticLevel::Error);
    Document          document;

    if (const auto* endianness = schema.get("endianness"))
    {
        const auto text = endianness->getAsString();
        if (text && *text == "little")
        {
            document.endianness = Endianness::Little;
        }
        else if (text && *text == "big")
        {
            document.endianness = Endianness::Big;
        }
        else
        {
            diagnostics.error(SourceLocation{"endianness", 0}, "endianness must be 'little' or 'big'");
        }
    }
    if (auto description = schema.getString("description"))
    {
        document.description = description->str();
    }

    const auto* fields = schema.getArray("fields");
    if (fields == nullptr)
    {
        diagnostics.error(SourceLocation{"fields", 0}, "schema has no top-level fields array");
    }
    else
    {
        SchemaCompiler compiler(diagnostics, options);
        document.fields = compiler.compileFieldList(*fields, "fields", 1);
    }

    const std::size_t errors = diagnostics.count(DiagnosticLevel::Error) - errorsBefore;
    if (errors > 0)
    {
        const Diagnostic* first = nullptr;
        std::size_t       seen  = 0;
        for (const Diagnostic& d : diagnostics.diagnostics())
        {
            if (d.level == DiagnosticLevel::Error && seen++ == errorsBefore)
            {
                first = &d;
                break;
            }
        }
        return makeCodecError(ErrorKind::Schema,
                              "",
                              std::nullopt,
                              "schema has " + std::to_string(errors) + " error(s); first: " + first->location.str() +
                                  ": " + first->message);
    }

    LLVM_DEBUG(llvm::dbgs() << "compiled schema with " << document.fields.size() << " top-level field(s)\n");
    return document;
}

}  // namespace llvmbinfmt
