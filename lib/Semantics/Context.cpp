//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements frame management and path lookup for the traversal context.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Semantics/Context.h"

#include "llvmbinfmt/Frontend/Parser.h"
#include "llvmbinfmt/Support/Diagnostics.h"

#include <optional>
#include <utility>

namespace llvmbinfmt
{
namespace
{

std::optional<llvm::json::Value> descend(const llvm::json::Value&         start,
                                         const std::vector<PathSegment>& segments,
                                         std::size_t                     from)
{
    const llvm::json::Value* cur = &start;
    for (std::size_t i = from; i < segments.size(); ++i)
    {
        const PathSegment& seg = segments[i];
        if (seg.kind == PathSegment::Kind::Field)
        {
            const auto* obj = cur->getAsObject();
            if (obj == nullptr)
            {
                return std::nullopt;
            }
            cur = obj->get(seg.name);
        }
        else
        {
            const auto* arr = cur->getAsArray();
            if (arr == nullptr || seg.index < 0 || static_cast<std::size_t>(seg.index) >= arr->size())
            {
                return std::nullopt;
            }
            cur = &(*arr)[static_cast<std::size_t>(seg.index)];
        }
        if (cur == nullptr)
        {
            return std::nullopt;
        }
    }
    return *cur;
}

std::optional<llvm::json::Value> lookupIn(const llvm::json::Object&       object,
                                          llvm::StringRef                 frameKey,
                                          const std::vector<PathSegment>& segments)
{
    const std::string& head = segments.front().name;
    if (const auto* v = object.get(head))
    {
        return descend(*v, segments, 1);
    }
    // A path may name the enclosing struct that is still being built.
    if (!frameKey.empty() && frameKey == head)
    {
        return descend(llvm::json::Value(llvm::json::Object(object)), segments, 1);
    }
    return std::nullopt;
}

}  // namespace

Context::Context(const llvm::json::Object* rootInput)
{
    frames_.push_back(Frame{"", "", llvm::json::Object{}, rootInput, {}});
}

void Context::pushFrame(std::string key, std::string label, const llvm::json::Object* input)
{
    frames_.push_back(Frame{std::move(key), std::move(label), llvm::json::Object{}, input, {}});
}

llvm::json::Object Context::popFrame()
{
    llvm::json::Object out = std::move(frames_.back().produced);
    if (frames_.size() > 1)
    {
        frames_.pop_back();
    }
    return out;
}

llvm::Error Context::record(llvm::StringRef name, llvm::json::Value value)
{
    auto inserted = frames_.back().produced.try_emplace(name, std::move(value));
    if (!inserted.second)
    {
        return makeCodecError(ErrorKind::Schema, fieldPath(name), std::nullopt, "field recorded twice");
    }
    return llvm::Error::success();
}

void Context::markSkipped(llvm::StringRef name)
{
    frames_.back().skipped.insert(name);
}

bool Context::isSkipped(const Frame& frame, const std::vector<PathSegment>& segments)
{
    if (frame.skipped.contains(segments.front().name))
    {
        return true;
    }
    // `header.x` written inside `header` names a field of the frame itself.
    return !frame.key.empty() && frame.key == segments.front().name && segments.size() > 1 &&
           segments[1].kind == PathSegment::Kind::Field && frame.skipped.contains(segments[1].name);
}

const llvm::json::Object* Context::currentInput() const
{
    return frames_.back().input;
}

std::string Context::scopePath() const
{
    std::string out;
    for (const Frame& frame : frames_)
    {
        if (frame.label.empty())
        {
            continue;
        }
        if (!out.empty() && frame.label.front() != '[')
        {
            out += '.';
        }
        out += frame.label;
    }
    return out;
}

std::string Context::fieldPath(llvm::StringRef name) const
{
    std::string out = scopePath();
    if (!out.empty() && !name.empty() && name.front() != '[')
    {
        out += '.';
    }
    out += name.str();
    return out;
}

llvm::Expected<llvm::json::Value> Context::resolve(const ExprAST::Path& path,
                                                   const ErrorSite&     site,
                                                   const InputFallback  fallback) const
{
    if (path.segments.empty() || path.segments.front().kind != PathSegment::Kind::Field)
    {
        return makeCodecError(ErrorKind::Reference, site, "empty path");
    }

    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it)
    {
        if (auto v = lookupIn(it->produced, it->key, path.segments))
        {
            return std::move(*v);
        }
    }
    if (fallback == InputFallback::Enabled)
    {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it)
        {
            if (isSkipped(*it, path.segments))
            {
                return makeCodecError(ErrorKind::Reference,
                                      site,
                                      "'" + path.str() + "' names a field whose condition was false");
            }
            if (it->input == nullptr)
            {
                continue;
            }
            if (auto v = lookupIn(*it->input, it->key, path.segments))
            {
                return std::move(*v);
            }
        }
    }
    return makeCodecError(ErrorKind::Reference, site, "cannot resolve '" + path.str() + "'");
}

llvm::Expected<llvm::json::Value> resolvePath(const Context&      context,
                                              llvm::StringRef     pathText,
                                              const ErrorSite&    site,
                                              const InputFallback fallback)
{
    DiagnosticEngine diagnostics;
    auto             parsed = parseExpressionText(pathText, site.fieldPath, diagnostics);
    if (!parsed)
    {
        llvm::consumeError(parsed.takeError());
        return makeCodecError(ErrorKind::Reference, site, "malformed path '" + pathText + "'");
    }
    const auto* path = std::get_if<ExprAST::Path>(&(*parsed)->value);
    if (path == nullptr)
    {
        return makeCodecError(ErrorKind::Reference, site, "'" + pathText + "' is not a field path");
    }
    return context.resolve(*path, site, fallback);
}

}  // namespace llvmbinfmt
