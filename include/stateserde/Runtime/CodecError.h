//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed run-time errors reported by encode and decode operations.
///
/// Every error carries the path of wire keys and array indices from the
/// top-level value down to the failing field. Generated code prepends one
/// segment per nesting level while the error propagates outward.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_RUNTIME_CODEC_ERROR_H
#define STATESERDE_RUNTIME_CODEC_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <system_error>
#include <vector>

namespace stateserde
{

/// @brief Base of every encode/decode failure.
class CodecError : public llvm::ErrorInfo<CodecError>
{
public:
    static char ID;

    explicit CodecError(std::string detail);

    /// @brief Adds a path segment in front of the current path.
    /// @param[in] segment Wire key, variant tag, or `[index]`.
    void prependPath(llvm::StringRef segment);

    /// @brief Returns the path segments, outermost first.
    [[nodiscard]] const std::vector<std::string>& pathSegments() const
    {
        return path_;
    }

    /// @brief Returns the path joined as `outer.items[2].first`; empty at the top level.
    [[nodiscard]] std::string path() const;

    /// @brief Returns the message without the path.
    [[nodiscard]] const std::string& detail() const
    {
        return detail_;
    }

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    std::string              detail_;
    std::vector<std::string> path_;
};

/// @brief A non-skipped record field is absent from the input.
class MissingFieldError final : public llvm::ErrorInfo<MissingFieldError, CodecError>
{
public:
    static char ID;

    explicit MissingFieldError(std::string key);

    /// @brief Wire key that was expected.
    [[nodiscard]] const std::string& key() const
    {
        return key_;
    }

private:
    std::string key_;
};

/// @brief A union tag does not name any declared variant.
class UnknownVariantError final : public llvm::ErrorInfo<UnknownVariantError, CodecError>
{
public:
    static char ID;

    UnknownVariantError(std::string tag, std::vector<std::string> validTags);

    /// @brief Tag found in the input.
    [[nodiscard]] const std::string& tag() const
    {
        return tag_;
    }

    /// @brief Declared wire tags, in declaration order.
    [[nodiscard]] const std::vector<std::string>& validTags() const
    {
        return validTags_;
    }

private:
    std::string              tag_;
    std::vector<std::string> validTags_;
};

/// @brief Input has the wrong JSON kind, shape, or is out of range.
class InvalidValueError final : public llvm::ErrorInfo<InvalidValueError, CodecError>
{
public:
    static char ID;

    explicit InvalidValueError(std::string detail);
};

llvm::Error makeMissingFieldError(llvm::StringRef key);

llvm::Error makeUnknownVariantError(llvm::StringRef tag, std::vector<std::string> validTags);

llvm::Error makeInvalidValueError(llvm::StringRef detail);

/// @brief Tags a failure with one more path segment.
/// @details A @ref CodecError gets the segment prepended; any other error is converted into a @ref CodecError that
/// keeps the original message, so user codec failures report their location too.
/// @param[in] err Failure to tag; success passes through unchanged.
/// @param[in] segment Wire key, variant tag, or `[index]`.
/// @return The tagged error.
llvm::Error withFieldContext(llvm::Error err, llvm::StringRef segment);

/// @brief Formats an array index as a path segment.
std::string indexSegment(std::size_t index);

}  // namespace stateserde

#endif  // STATESERDE_RUNTIME_CODEC_ERROR_H
