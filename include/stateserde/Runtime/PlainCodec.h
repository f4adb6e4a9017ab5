//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Context-free encode/decode protocol over the `llvm::json` document model.
///
/// The primary templates cover JSON scalars, `std::string`, and every type
/// that follows the `llvm::json` convention of ADL `toJSON` / `fromJSON`
/// functions. Partial specializations cover the builtin containers.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_RUNTIME_PLAIN_CODEC_H
#define STATESERDE_RUNTIME_PLAIN_CODEC_H

#include "stateserde/Runtime/Box.h"
#include "stateserde/Runtime/CodecError.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <concepts>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stateserde
{
namespace detail
{

template <typename T>
concept JsonInteger = std::integral<T> && !std::same_as<T, bool>;

template <typename T>
concept JsonScalar = std::same_as<T, bool> || JsonInteger<T> || std::floating_point<T> || std::same_as<T, std::string>;

template <typename T>
concept JsonSerializable = requires(const T& value) {
    {
        toJSON(value)
    } -> std::convertible_to<llvm::json::Value>;
};

template <typename T>
concept JsonDeserializable = std::default_initializable<T> &&
                             requires(const llvm::json::Value& in, T& out, llvm::json::Path path) {
                                 {
                                     fromJSON(in, out, path)
                                 } -> std::same_as<bool>;
                             };

template <typename T>
const char* scalarKindName()
{
    if constexpr (std::same_as<T, bool>)
    {
        return "a boolean";
    }
    else if constexpr (JsonInteger<T>)
    {
        return "an integer";
    }
    else if constexpr (std::floating_point<T>)
    {
        return "a number";
    }
    else
    {
        return "a string";
    }
}

template <JsonInteger T>
llvm::Expected<T> decodeInteger(const llvm::json::Value& in)
{
    if constexpr (std::unsigned_integral<T> && sizeof(T) == sizeof(std::uint64_t))
    {
        // Values above INT64_MAX only exist as the unsigned kind.
        if (auto value = in.getAsUINT64())
        {
            return static_cast<T>(*value);
        }
    }
    if (auto value = in.getAsInteger())
    {
        if (!std::in_range<T>(*value))
        {
            return makeInvalidValueError("integer " + std::to_string(*value) + " is out of range");
        }
        return static_cast<T>(*value);
    }
    if (in.getAsNumber())
    {
        return makeInvalidValueError("expected an integer, found a non-integral or out-of-range number");
    }
    return makeInvalidValueError("expected an integer");
}

template <std::floating_point T>
llvm::Expected<T> decodeFloating(const llvm::json::Value& in)
{
    const auto value = in.getAsNumber();
    if (!value)
    {
        return makeInvalidValueError("expected a number");
    }
    if constexpr (sizeof(T) < sizeof(double))
    {
        if (std::fabs(*value) > static_cast<double>(std::numeric_limits<T>::max()))
        {
            return makeInvalidValueError("number " + std::to_string(*value) + " is out of range");
        }
    }
    return static_cast<T>(*value);
}

/// @brief Fails when `text` cannot be stored in a JSON document.
inline llvm::Error checkUTF8(llvm::StringRef text, llvm::StringRef what)
{
    if (!llvm::json::isUTF8(text))
    {
        return makeInvalidValueError(what.str() + " is not valid UTF-8");
    }
    return llvm::Error::success();
}

}  // namespace detail

/// @brief Context-free encoder; specialize for types that are not covered by the primary template.
template <typename T>
struct PlainEncoder
{
    static llvm::Error encode(const T& value, llvm::json::Value& out)
        requires detail::JsonScalar<T> || detail::JsonSerializable<T>
    {
        if constexpr (std::same_as<T, bool>)
        {
            out = value;
        }
        else if constexpr (std::same_as<T, std::string>)
        {
            if (llvm::Error err = detail::checkUTF8(value, "string"))
            {
                return err;
            }
            out = value;
        }
        else if constexpr (std::unsigned_integral<T> && sizeof(T) == sizeof(std::uint64_t))
        {
            // The signed kind holds everything up to INT64_MAX, matching what json::parse produces.
            if (std::in_range<std::int64_t>(value))
            {
                out = static_cast<std::int64_t>(value);
            }
            else
            {
                out = static_cast<std::uint64_t>(value);
            }
        }
        else if constexpr (detail::JsonInteger<T>)
        {
            out = static_cast<std::int64_t>(value);
        }
        else if constexpr (std::floating_point<T>)
        {
            out = static_cast<double>(value);
        }
        else
        {
            out = toJSON(value);
        }
        return llvm::Error::success();
    }
};

/// @brief Context-free decoder; specialize for types that are not covered by the primary template.
template <typename T>
struct PlainDecoder
{
    static llvm::Expected<T> decode(const llvm::json::Value& in)
        requires detail::JsonScalar<T> || detail::JsonDeserializable<T>
    {
        if constexpr (std::same_as<T, bool>)
        {
            if (auto value = in.getAsBoolean())
            {
                return *value;
            }
            return makeInvalidValueError("expected a boolean");
        }
        else if constexpr (detail::JsonInteger<T>)
        {
            return detail::decodeInteger<T>(in);
        }
        else if constexpr (std::floating_point<T>)
        {
            return detail::decodeFloating<T>(in);
        }
        else if constexpr (std::same_as<T, std::string>)
        {
            if (auto value = in.getAsString())
            {
                return value->str();
            }
            return makeInvalidValueError("expected a string");
        }
        else
        {
            llvm::json::Path::Root root;
            T                      result{};
            if (!fromJSON(in, result, root))
            {
                return makeInvalidValueError(llvm::toString(root.getError()));
            }
            return result;
        }
    }
};

/// @brief Types with a usable context-free encoder.
template <typename T>
concept PlainEncodable = requires(const T& value, llvm::json::Value& out) {
    {
        PlainEncoder<T>::encode(value, out)
    } -> std::same_as<llvm::Error>;
};

/// @brief Types with a usable context-free decoder.
template <typename T>
concept PlainDecodable = requires(const llvm::json::Value& in) {
    {
        PlainDecoder<T>::decode(in)
    } -> std::same_as<llvm::Expected<T>>;
};

template <typename U>
struct PlainEncoder<std::vector<U>>
{
    static llvm::Error encode(const std::vector<U>& value, llvm::json::Value& out)
        requires PlainEncodable<U>
    {
        llvm::json::Array array;
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            llvm::json::Value element(nullptr);
            if (llvm::Error err = PlainEncoder<U>::encode(value[i], element))
            {
                return withFieldContext(std::move(err), indexSegment(i));
            }
            array.push_back(std::move(element));
        }
        out = std::move(array);
        return llvm::Error::success();
    }
};

template <typename U>
struct PlainDecoder<std::vector<U>>
{
    static llvm::Expected<std::vector<U>> decode(const llvm::json::Value& in)
        requires PlainDecodable<U>
    {
        const auto* array = in.getAsArray();
        if (!array)
        {
            return makeInvalidValueError("expected an array");
        }
        std::vector<U> result;
        result.reserve(array->size());
        for (std::size_t i = 0; i < array->size(); ++i)
        {
            auto element = PlainDecoder<U>::decode((*array)[i]);
            if (!element)
            {
                return withFieldContext(element.takeError(), indexSegment(i));
            }
            result.push_back(std::move(*element));
        }
        return result;
    }
};

template <typename U>
struct PlainEncoder<std::optional<U>>
{
    static llvm::Error encode(const std::optional<U>& value, llvm::json::Value& out)
        requires PlainEncodable<U>
    {
        if (!value)
        {
            out = nullptr;
            return llvm::Error::success();
        }
        return PlainEncoder<U>::encode(*value, out);
    }
};

template <typename U>
struct PlainDecoder<std::optional<U>>
{
    static llvm::Expected<std::optional<U>> decode(const llvm::json::Value& in)
        requires PlainDecodable<U>
    {
        if (in.getAsNull())
        {
            return std::optional<U>{};
        }
        auto inner = PlainDecoder<U>::decode(in);
        if (!inner)
        {
            return inner.takeError();
        }
        return std::optional<U>{std::move(*inner)};
    }
};

template <typename U>
struct PlainEncoder<std::map<std::string, U>>
{
    static llvm::Error encode(const std::map<std::string, U>& value, llvm::json::Value& out)
        requires PlainEncodable<U>
    {
        llvm::json::Object object;
        for (const auto& [key, item] : value)
        {
            if (llvm::Error err = detail::checkUTF8(key, "map key"))
            {
                return err;
            }
            llvm::json::Value element(nullptr);
            if (llvm::Error err = PlainEncoder<U>::encode(item, element))
            {
                return withFieldContext(std::move(err), key);
            }
            object[key] = std::move(element);
        }
        out = std::move(object);
        return llvm::Error::success();
    }
};

template <typename U>
struct PlainDecoder<std::map<std::string, U>>
{
    static llvm::Expected<std::map<std::string, U>> decode(const llvm::json::Value& in)
        requires PlainDecodable<U>
    {
        const auto* object = in.getAsObject();
        if (!object)
        {
            return makeInvalidValueError("expected an object");
        }
        std::map<std::string, U> result;
        for (const auto& [key, item] : *object)
        {
            auto element = PlainDecoder<U>::decode(item);
            if (!element)
            {
                return withFieldContext(element.takeError(), key);
            }
            result.emplace(llvm::StringRef(key).str(), std::move(*element));
        }
        return result;
    }
};

template <typename U>
struct PlainEncoder<Box<U>>
{
    static llvm::Error encode(const Box<U>& value, llvm::json::Value& out)
        requires PlainEncodable<U>
    {
        return PlainEncoder<U>::encode(*value, out);
    }
};

template <typename U>
struct PlainDecoder<Box<U>>
{
    static llvm::Expected<Box<U>> decode(const llvm::json::Value& in)
        requires PlainDecodable<U>
    {
        auto inner = PlainDecoder<U>::decode(in);
        if (!inner)
        {
            return inner.takeError();
        }
        return Box<U>(std::move(*inner));
    }
};

}  // namespace stateserde

#endif  // STATESERDE_RUNTIME_PLAIN_CODEC_H
