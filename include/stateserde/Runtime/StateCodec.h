//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Context-threaded encode/decode protocol.
///
/// `StateEncoder<T, State>` and `StateDecoder<T, State>` receive the caller's
/// context by reference and forward it to every nested value. Generated code
/// specializes both templates for schema types; hand-written leaf types
/// specialize them directly. Any type with a plain codec is accepted in a
/// context-threaded position through the primary templates.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_RUNTIME_STATE_CODEC_H
#define STATESERDE_RUNTIME_STATE_CODEC_H

#include "stateserde/Runtime/Box.h"
#include "stateserde/Runtime/CodecError.h"
#include "stateserde/Runtime/PlainCodec.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stateserde
{

/// @brief Context-threaded encoder; falls back to @ref PlainEncoder when not specialized.
template <typename T, typename State>
struct StateEncoder
{
    static llvm::Error encode(const T& value, State& state, llvm::json::Value& out)
        requires PlainEncodable<T>
    {
        (void) state;
        return PlainEncoder<T>::encode(value, out);
    }
};

/// @brief Context-threaded decoder; falls back to @ref PlainDecoder when not specialized.
template <typename T, typename State>
struct StateDecoder
{
    static llvm::Expected<T> decode(State& state, const llvm::json::Value& in)
        requires PlainDecodable<T>
    {
        (void) state;
        return PlainDecoder<T>::decode(in);
    }
};

/// @brief Types that can be encoded while threading a `State&`.
template <typename T, typename State>
concept StateEncodable = requires(const T& value, State& state, llvm::json::Value& out) {
    {
        StateEncoder<T, State>::encode(value, state, out)
    } -> std::same_as<llvm::Error>;
};

/// @brief Types that can be decoded while threading a `State&`.
template <typename T, typename State>
concept StateDecodable = requires(State& state, const llvm::json::Value& in) {
    {
        StateDecoder<T, State>::decode(state, in)
    } -> std::same_as<llvm::Expected<T>>;
};

template <typename U, typename State>
struct StateEncoder<std::vector<U>, State>
{
    static llvm::Error encode(const std::vector<U>& value, State& state, llvm::json::Value& out)
        requires StateEncodable<U, State>
    {
        llvm::json::Array array;
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            llvm::json::Value element(nullptr);
            if (llvm::Error err = StateEncoder<U, State>::encode(value[i], state, element))
            {
                return withFieldContext(std::move(err), indexSegment(i));
            }
            array.push_back(std::move(element));
        }
        out = std::move(array);
        return llvm::Error::success();
    }
};

template <typename U, typename State>
struct StateDecoder<std::vector<U>, State>
{
    static llvm::Expected<std::vector<U>> decode(State& state, const llvm::json::Value& in)
        requires StateDecodable<U, State>
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
            auto element = StateDecoder<U, State>::decode(state, (*array)[i]);
            if (!element)
            {
                return withFieldContext(element.takeError(), indexSegment(i));
            }
            result.push_back(std::move(*element));
        }
        return result;
    }
};

template <typename U, typename State>
struct StateEncoder<std::optional<U>, State>
{
    static llvm::Error encode(const std::optional<U>& value, State& state, llvm::json::Value& out)
        requires StateEncodable<U, State>
    {
        if (!value)
        {
            out = nullptr;
            return llvm::Error::success();
        }
        return StateEncoder<U, State>::encode(*value, state, out);
    }
};

template <typename U, typename State>
struct StateDecoder<std::optional<U>, State>
{
    static llvm::Expected<std::optional<U>> decode(State& state, const llvm::json::Value& in)
        requires StateDecodable<U, State>
    {
        if (in.getAsNull())
        {
            return std::optional<U>{};
        }
        auto inner = StateDecoder<U, State>::decode(state, in);
        if (!inner)
        {
            return inner.takeError();
        }
        return std::optional<U>{std::move(*inner)};
    }
};

template <typename U, typename State>
struct StateEncoder<std::map<std::string, U>, State>
{
    static llvm::Error encode(const std::map<std::string, U>& value, State& state, llvm::json::Value& out)
        requires StateEncodable<U, State>
    {
        llvm::json::Object object;
        for (const auto& [key, item] : value)
        {
            if (llvm::Error err = detail::checkUTF8(key, "map key"))
            {
                return err;
            }
            llvm::json::Value element(nullptr);
            if (llvm::Error err = StateEncoder<U, State>::encode(item, state, element))
            {
                return withFieldContext(std::move(err), key);
            }
            object[key] = std::move(element);
        }
        out = std::move(object);
        return llvm::Error::success();
    }
};

template <typename U, typename State>
struct StateDecoder<std::map<std::string, U>, State>
{
    static llvm::Expected<std::map<std::string, U>> decode(State& state, const llvm::json::Value& in)
        requires StateDecodable<U, State>
    {
        const auto* object = in.getAsObject();
        if (!object)
        {
            return makeInvalidValueError("expected an object");
        }
        std::map<std::string, U> result;
        for (const auto& [key, item] : *object)
        {
            auto element = StateDecoder<U, State>::decode(state, item);
            if (!element)
            {
                return withFieldContext(element.takeError(), key);
            }
            result.emplace(llvm::StringRef(key).str(), std::move(*element));
        }
        return result;
    }
};

template <typename U, typename State>
struct StateEncoder<Box<U>, State>
{
    static llvm::Error encode(const Box<U>& value, State& state, llvm::json::Value& out)
        requires StateEncodable<U, State>
    {
        return StateEncoder<U, State>::encode(*value, state, out);
    }
};

template <typename U, typename State>
struct StateDecoder<Box<U>, State>
{
    static llvm::Expected<Box<U>> decode(State& state, const llvm::json::Value& in)
        requires StateDecodable<U, State>
    {
        auto inner = StateDecoder<U, State>::decode(state, in);
        if (!inner)
        {
            return inner.takeError();
        }
        return Box<U>(std::move(*inner));
    }
};

//===----------------------------------------------------------------------===//
// Field helpers used by generated specializations.
//===----------------------------------------------------------------------===//

/// @brief Encodes `value` through the context-threaded protocol into `out[key]`.
template <typename T, typename State>
llvm::Error encodeStateField(const T& value, State& state, llvm::json::Object& out, llvm::StringRef key)
{
    if (llvm::Error err = detail::checkUTF8(key, "field key"))
    {
        return err;
    }
    llvm::json::Value element(nullptr);
    if (llvm::Error err = StateEncoder<T, State>::encode(value, state, element))
    {
        return withFieldContext(std::move(err), key);
    }
    out[key.str()] = std::move(element);
    return llvm::Error::success();
}

/// @brief Encodes `value` through the plain protocol into `out[key]`.
template <typename T>
llvm::Error encodePlainField(const T& value, llvm::json::Object& out, llvm::StringRef key)
{
    if (llvm::Error err = detail::checkUTF8(key, "field key"))
    {
        return err;
    }
    llvm::json::Value element(nullptr);
    if (llvm::Error err = PlainEncoder<T>::encode(value, element))
    {
        return withFieldContext(std::move(err), key);
    }
    out[key.str()] = std::move(element);
    return llvm::Error::success();
}

/// @brief Appends `value`, encoded through the context-threaded protocol, as element `index` of `out`.
template <typename T, typename State>
llvm::Error encodeStateElement(const T& value, State& state, llvm::json::Array& out, std::size_t index)
{
    llvm::json::Value element(nullptr);
    if (llvm::Error err = StateEncoder<T, State>::encode(value, state, element))
    {
        return withFieldContext(std::move(err), indexSegment(index));
    }
    out.push_back(std::move(element));
    return llvm::Error::success();
}

/// @brief Appends `value`, encoded through the plain protocol, as element `index` of `out`.
template <typename T>
llvm::Error encodePlainElement(const T& value, llvm::json::Array& out, std::size_t index)
{
    llvm::json::Value element(nullptr);
    if (llvm::Error err = PlainEncoder<T>::encode(value, element))
    {
        return withFieldContext(std::move(err), indexSegment(index));
    }
    out.push_back(std::move(element));
    return llvm::Error::success();
}

/// @brief Decodes `in` through the context-threaded protocol into `slot`.
/// @param[in] segment Path segment attached to failures.
template <typename T, typename State>
llvm::Error decodeStateField(State& state, const llvm::json::Value& in, std::optional<T>& slot, llvm::StringRef segment)
{
    auto decoded = StateDecoder<T, State>::decode(state, in);
    if (!decoded)
    {
        return withFieldContext(decoded.takeError(), segment);
    }
    slot.emplace(std::move(*decoded));
    return llvm::Error::success();
}

/// @brief Decodes `in` through the plain protocol into `slot`.
/// @param[in] segment Path segment attached to failures.
template <typename T>
llvm::Error decodePlainField(const llvm::json::Value& in, std::optional<T>& slot, llvm::StringRef segment)
{
    auto decoded = PlainDecoder<T>::decode(in);
    if (!decoded)
    {
        return withFieldContext(decoded.takeError(), segment);
    }
    slot.emplace(std::move(*decoded));
    return llvm::Error::success();
}

/// @brief Encodes `value` through the context-threaded protocol without adding a path segment.
template <typename T, typename State>
llvm::Error encodeStateValue(const T& value, State& state, llvm::json::Value& out)
{
    return StateEncoder<T, State>::encode(value, state, out);
}

/// @brief Encodes `value` through the plain protocol without adding a path segment.
template <typename T>
llvm::Error encodePlainValue(const T& value, llvm::json::Value& out)
{
    return PlainEncoder<T>::encode(value, out);
}

/// @brief Decodes `in` through the context-threaded protocol into `slot` without adding a path segment.
template <typename T, typename State>
llvm::Error decodeStateValue(State& state, const llvm::json::Value& in, std::optional<T>& slot)
{
    auto decoded = StateDecoder<T, State>::decode(state, in);
    if (!decoded)
    {
        return decoded.takeError();
    }
    slot.emplace(std::move(*decoded));
    return llvm::Error::success();
}

/// @brief Decodes `in` through the plain protocol into `slot` without adding a path segment.
template <typename T>
llvm::Error decodePlainValue(const llvm::json::Value& in, std::optional<T>& slot)
{
    auto decoded = PlainDecoder<T>::decode(in);
    if (!decoded)
    {
        return decoded.takeError();
    }
    slot.emplace(std::move(*decoded));
    return llvm::Error::success();
}

}  // namespace stateserde

#endif  // STATESERDE_RUNTIME_STATE_CODEC_H
