//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Hand-written leaf types and contexts used by the integration schemas.
///
/// `CounterValue` has both codecs: the plain one through ADL `toJSON` /
/// `fromJSON`, and a context-threaded one that bumps the counters of any
/// context satisfying `CountingContext`. A test can therefore tell which of
/// the two protocols generated code chose for a field.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_TEST_INTEGRATION_FIXTURES_RECORDER_H
#define STATESERDE_TEST_INTEGRATION_FIXTURES_RECORDER_H

#include "stateserde/Runtime/StateSerde.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <concepts>
#include <cstdint>
#include <string>
#include <vector>

namespace app
{

/// @brief Context that counts every context-threaded leaf visit.
struct Recorder
{
    int serialized{0};
    int deserialized{0};

    /// @brief Values seen on encode, in visit order.
    std::vector<std::int64_t> seen;
};

/// @brief Context whose counters a leaf codec may bump.
template <typename C>
concept CountingContext = requires(C& context) {
    {
        context.serialized
    } -> std::convertible_to<int>;
    {
        context.deserialized
    } -> std::convertible_to<int>;
};

/// @brief Context that satisfies no capability; only plain leaves work with it.
struct Silent
{
};

struct CounterValue
{
    std::int64_t value{0};

    bool operator==(const CounterValue&) const = default;
};

inline llvm::json::Value toJSON(const CounterValue& counter)
{
    return counter.value;
}

inline bool fromJSON(const llvm::json::Value& in, CounterValue& out, llvm::json::Path path)
{
    if (auto value = in.getAsInteger())
    {
        out.value = *value;
        return true;
    }
    path.report("expected an integer counter value");
    return false;
}

}  // namespace app

namespace stateserde
{

template <typename State>
    requires app::CountingContext<State>
struct StateEncoder<app::CounterValue, State>
{
    static llvm::Error encode(const app::CounterValue& counter, State& state, llvm::json::Value& out)
    {
        ++state.serialized;
        if constexpr (std::same_as<State, app::Recorder>)
        {
            state.seen.push_back(counter.value);
        }
        out = counter.value;
        return llvm::Error::success();
    }
};

template <typename State>
    requires app::CountingContext<State>
struct StateDecoder<app::CounterValue, State>
{
    static llvm::Expected<app::CounterValue> decode(State& state, const llvm::json::Value& in)
    {
        ++state.deserialized;
        auto value = in.getAsInteger();
        if (!value)
        {
            return makeInvalidValueError("expected an integer counter value");
        }
        return app::CounterValue{*value};
    }
};

}  // namespace stateserde

#endif  // STATESERDE_TEST_INTEGRATION_FIXTURES_RECORDER_H
