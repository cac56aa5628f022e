//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the codec error payload and error-kind helpers.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Support/Error.h"

#include <utility>

namespace llvmbinfmt
{

char CodecError::ID = 0;

const char* errorKindName(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Schema:
        return "SchemaError";
    case ErrorKind::MissingField:
        return "MissingFieldError";
    case ErrorKind::TypeMismatch:
        return "TypeMismatchError";
    case ErrorKind::Range:
        return "RangeError";
    case ErrorKind::Reference:
        return "ReferenceError";
    case ErrorKind::UnexpectedEndOfData:
        return "UnexpectedEndOfDataError";
    case ErrorKind::ChecksumMismatch:
        return "ChecksumMismatchError";
    case ErrorKind::UnsupportedFunction:
        return "UnsupportedFunctionError";
    case ErrorKind::UnboundedAllocation:
        return "UnboundedAllocationError";
    case ErrorKind::TrailingData:
        return "TrailingDataError";
    }
    return "CodecError";
}

CodecError::CodecError(const ErrorKind                  kind,
                       std::string                      fieldPath,
                       const std::optional<std::size_t> byteOffset,
                       std::string                      message)
    : kind_(kind)
    , fieldPath_(std::move(fieldPath))
    , byteOffset_(byteOffset)
    , message_(std::move(message))
{
}

void CodecError::log(llvm::raw_ostream& os) const
{
    os << errorKindName(kind_);
    if (!fieldPath_.empty())
    {
        os << " at '" << fieldPath_ << "'";
    }
    if (byteOffset_)
    {
        os << " (byte " << *byteOffset_ << ")";
    }
    os << ": " << message_;
}

std::error_code CodecError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeCodecError(const ErrorKind                  kind,
                           std::string                      fieldPath,
                           const std::optional<std::size_t> byteOffset,
                           const llvm::Twine&               message)
{
    return llvm::make_error<CodecError>(kind, std::move(fieldPath), byteOffset, message.str());
}

llvm::Error makeCodecError(const ErrorKind kind, const ErrorSite& site, const llvm::Twine& message)
{
    return makeCodecError(kind, site.fieldPath, site.byteOffset, message);
}

std::optional<ErrorKind> consumeErrorKind(llvm::Error err)
{
    std::optional<ErrorKind> kind;
    llvm::handleAllErrors(
        std::move(err),
        [&](const CodecError& e) { kind = e.kind(); },
        [](const llvm::ErrorInfoBase&) {});
    return kind;
}

}  // namespace llvmbinfmt
