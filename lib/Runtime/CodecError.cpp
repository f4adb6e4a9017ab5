//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements typed run-time codec errors.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Runtime/CodecError.h"

#include <memory>
#include <utility>

namespace stateserde
{

char CodecError::ID          = 0;
char MissingFieldError::ID   = 0;
char UnknownVariantError::ID = 0;
char InvalidValueError::ID   = 0;

namespace
{

std::string joinTags(const std::vector<std::string>& tags)
{
    std::string out;
    for (std::size_t i = 0; i < tags.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += "'" + tags[i] + "'";
    }
    return out;
}

}  // namespace

CodecError::CodecError(std::string detail)
    : detail_(std::move(detail))
{
}

void CodecError::prependPath(llvm::StringRef segment)
{
    path_.insert(path_.begin(), segment.str());
}

std::string CodecError::path() const
{
    std::string out;
    for (const std::string& segment : path_)
    {
        if (!out.empty() && !segment.empty() && segment.front() != '[')
        {
            out += '.';
        }
        out += segment;
    }
    return out;
}

void CodecError::log(llvm::raw_ostream& os) const
{
    const std::string location = path();
    if (!location.empty())
    {
        os << location << ": ";
    }
    os << detail_;
}

std::error_code CodecError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

MissingFieldError::MissingFieldError(std::string key)
    : llvm::ErrorInfo<MissingFieldError, CodecError>("missing field '" + key + "'")
    , key_(std::move(key))
{
}

UnknownVariantError::UnknownVariantError(std::string tag, std::vector<std::string> validTags)
    : llvm::ErrorInfo<UnknownVariantError, CodecError>("unknown variant '" + tag + "', expected one of " +
                                                       joinTags(validTags))
    , tag_(std::move(tag))
    , validTags_(std::move(validTags))
{
}

InvalidValueError::InvalidValueError(std::string detail)
    : llvm::ErrorInfo<InvalidValueError, CodecError>(std::move(detail))
{
}

llvm::Error makeMissingFieldError(llvm::StringRef key)
{
    return llvm::make_error<MissingFieldError>(key.str());
}

llvm::Error makeUnknownVariantError(llvm::StringRef tag, std::vector<std::string> validTags)
{
    return llvm::make_error<UnknownVariantError>(tag.str(), std::move(validTags));
}

llvm::Error makeInvalidValueError(llvm::StringRef detail)
{
    return llvm::make_error<InvalidValueError>(detail.str());
}

llvm::Error withFieldContext(llvm::Error err, llvm::StringRef segment)
{
    if (!err)
    {
        return err;
    }
    return llvm::handleErrors(
        std::move(err),
        [segment](std::unique_ptr<CodecError> codec) -> llvm::Error {
            codec->prependPath(segment);
            return llvm::Error(std::move(codec));
        },
        [segment](const llvm::ErrorInfoBase& other) -> llvm::Error {
            auto wrapped = std::make_unique<CodecError>(other.message());
            wrapped->prependPath(segment);
            return llvm::Error(std::move(wrapped));
        });
}

std::string indexSegment(const std::size_t index)
{
    return "[" + std::to_string(index) + "]";
}

}  // namespace stateserde
