//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime umbrella header included by every generated header, plus the
/// top-level encode/decode entry points.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_RUNTIME_STATE_SERDE_H
#define STATESERDE_RUNTIME_STATE_SERDE_H

#include "stateserde/Runtime/Box.h"
#include "stateserde/Runtime/CodecError.h"
#include "stateserde/Runtime/PlainCodec.h"
#include "stateserde/Runtime/StateCodec.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <utility>

namespace stateserde
{

/// @brief Encodes `value` into a JSON document, threading `state` through every nested value.
template <typename T, typename State>
    requires StateEncodable<T, State>
llvm::Expected<llvm::json::Value> encodeWithState(const T& value, State& state)
{
    llvm::json::Value out(nullptr);
    if (llvm::Error err = StateEncoder<T, State>::encode(value, state, out))
    {
        return std::move(err);
    }
    return std::move(out);
}

/// @brief Decodes a `T` from a JSON document, threading `state` through every nested value.
template <typename T, typename State>
    requires StateDecodable<T, State>
llvm::Expected<T> decodeWithState(State& state, const llvm::json::Value& in)
{
    return StateDecoder<T, State>::decode(state, in);
}

/// @brief Encodes `value` into compact JSON text.
template <typename T, typename State>
    requires StateEncodable<T, State>
llvm::Expected<std::string> encodeWithStateToString(const T& value, State& state)
{
    auto document = encodeWithState(value, state);
    if (!document)
    {
        return document.takeError();
    }
    std::string              text;
    llvm::raw_string_ostream os(text);
    os << *document;
    os.flush();
    return text;
}

/// @brief Parses JSON text and decodes a `T` from it.
template <typename T, typename State>
    requires StateDecodable<T, State>
llvm::Expected<T> decodeWithStateFromString(State& state, llvm::StringRef text)
{
    auto document = llvm::json::parse(text);
    if (!document)
    {
        return makeInvalidValueError("malformed JSON: " + llvm::toString(document.takeError()));
    }
    return decodeWithState<T>(state, *document);
}

}  // namespace stateserde

#endif  // STATESERDE_RUNTIME_STATE_SERDE_H
