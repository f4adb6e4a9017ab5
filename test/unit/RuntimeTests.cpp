//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "stateserde/Runtime/StateSerde.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace
{

/// Context used by the hand-written leaf codec below.
struct Tally
{
    int encoded{0};
    int decoded{0};
};

struct Ticket
{
    std::uint32_t id{0};

    bool operator==(const Ticket&) const = default;
};

struct Celsius
{
    double degrees{0.0};

    bool operator==(const Celsius&) const = default;
};

llvm::json::Value toJSON(const Celsius& value)
{
    return llvm::json::Object{{"celsius", value.degrees}};
}

bool fromJSON(const llvm::json::Value& in, Celsius& out, llvm::json::Path path)
{
    llvm::json::ObjectMapper mapper(in, path);
    return mapper && mapper.map("celsius", out.degrees);
}

}  // namespace

namespace stateserde
{

template <>
struct StateEncoder<Ticket, Tally>
{
    static llvm::Error encode(const Ticket& value, Tally& state, llvm::json::Value& out)
    {
        ++state.encoded;
        out = static_cast<std::int64_t>(value.id);
        return llvm::Error::success();
    }
};

template <>
struct StateDecoder<Ticket, Tally>
{
    static llvm::Expected<Ticket> decode(Tally& state, const llvm::json::Value& in)
    {
        ++state.decoded;
        auto id = PlainDecoder<std::uint32_t>::decode(in);
        if (!id)
        {
            return id.takeError();
        }
        return Ticket{*id};
    }
};

}  // namespace stateserde

namespace
{

/// Consumes `err` and returns its rendered message; empty on success.
std::string messageOf(llvm::Error err)
{
    if (!err)
    {
        return {};
    }
    return llvm::toString(std::move(err));
}

bool testScalars()
{
    llvm::json::Value out(nullptr);
    if (auto err = stateserde::PlainEncoder<std::int32_t>::encode(-7, out))
    {
        std::cerr << "i32 encode failed: " << messageOf(std::move(err)) << "\n";
        return false;
    }
    if (out.getAsInteger() != std::optional<std::int64_t>(-7))
    {
        std::cerr << "i32 should encode as a JSON integer\n";
        return false;
    }

    auto narrowed = stateserde::PlainDecoder<std::int8_t>::decode(llvm::json::Value(300));
    if (narrowed || messageOf(narrowed.takeError()) != "integer 300 is out of range")
    {
        std::cerr << "i8 decode must reject out-of-range integers\n";
        return false;
    }
    auto negative = stateserde::PlainDecoder<std::uint16_t>::decode(llvm::json::Value(-1));
    if (negative)
    {
        std::cerr << "u16 decode must reject negative integers\n";
        return false;
    }
    llvm::consumeError(negative.takeError());

    auto fractional = stateserde::PlainDecoder<std::int32_t>::decode(llvm::json::Value(1.5));
    if (fractional ||
        messageOf(fractional.takeError()).find("non-integral or out-of-range number") == std::string::npos)
    {
        std::cerr << "integer decode must reject fractional numbers\n";
        return false;
    }

    auto text = stateserde::PlainDecoder<std::string>::decode(llvm::json::Value(3));
    if (text || messageOf(text.takeError()) != "expected a string")
    {
        std::cerr << "string decode must reject numbers\n";
        return false;
    }

    auto flag = stateserde::PlainDecoder<bool>::decode(llvm::json::Value(true));
    if (!flag || !*flag)
    {
        std::cerr << "bool decode failed\n";
        llvm::consumeError(flag.takeError());
        return false;
    }

    auto real = stateserde::PlainDecoder<float>::decode(llvm::json::Value(4));
    if (!real || *real != 4.0F)
    {
        std::cerr << "float decode should accept integral JSON numbers\n";
        llvm::consumeError(real.takeError());
        return false;
    }
    return true;
}

bool testWideAndNarrowNumbers()
{
    llvm::json::Value out(nullptr);
    if (auto err = stateserde::PlainEncoder<std::uint64_t>::encode(77, out))
    {
        std::cerr << "u64 encode failed: " << messageOf(std::move(err)) << "\n";
        return false;
    }
    auto reparsed = llvm::json::parse("77");
    if (!reparsed || out != *reparsed)
    {
        std::cerr << "u64 in the signed range should compare equal to the parsed number\n";
        if (!reparsed)
        {
            llvm::consumeError(reparsed.takeError());
        }
        return false;
    }

    const std::uint64_t widest = std::numeric_limits<std::uint64_t>::max();
    if (auto err = stateserde::PlainEncoder<std::uint64_t>::encode(widest, out))
    {
        std::cerr << "u64 encode failed: " << messageOf(std::move(err)) << "\n";
        return false;
    }
    auto wideBack = stateserde::PlainDecoder<std::uint64_t>::decode(out);
    if (!wideBack || *wideBack != widest)
    {
        std::cerr << "u64 above the signed range should decode unchanged\n";
        llvm::consumeError(wideBack.takeError());
        return false;
    }

    auto integral = stateserde::PlainDecoder<std::uint64_t>::decode(llvm::json::Value(3.0));
    if (!integral || *integral != 3)
    {
        std::cerr << "u64 decode should accept an integral double like the narrower types do\n";
        llvm::consumeError(integral.takeError());
        return false;
    }
    auto negative = stateserde::PlainDecoder<std::uint64_t>::decode(llvm::json::Value(-4));
    if (negative || messageOf(negative.takeError()) != "integer -4 is out of range")
    {
        std::cerr << "u64 decode must reject negative integers\n";
        return false;
    }

    auto huge = stateserde::PlainDecoder<float>::decode(llvm::json::Value(1e300));
    if (huge || messageOf(huge.takeError()).find("is out of range") == std::string::npos)
    {
        std::cerr << "f32 decode must reject numbers beyond the float range\n";
        return false;
    }
    auto wide = stateserde::PlainDecoder<double>::decode(llvm::json::Value(1e300));
    if (!wide || *wide != 1e300)
    {
        std::cerr << "f64 decode should accept large numbers\n";
        llvm::consumeError(wide.takeError());
        return false;
    }
    return true;
}

bool testInvalidUtf8()
{
    llvm::json::Value out(nullptr);
    const std::string garbled = "\xff\xfe";
    if (messageOf(stateserde::PlainEncoder<std::string>::encode(garbled, out)) != "string is not valid UTF-8")
    {
        std::cerr << "string encode must reject invalid UTF-8\n";
        return false;
    }

    Tally      tally;
    const auto nested = std::map<std::string, std::vector<std::string>>{{"names", {"ok", garbled}}};
    auto       text   = stateserde::encodeWithStateToString(nested, tally);
    if (text || messageOf(text.takeError()) != "names[1]: string is not valid UTF-8")
    {
        std::cerr << "invalid UTF-8 inside a container should carry its path\n";
        return false;
    }

    const auto badKey = std::map<std::string, std::int32_t>{{garbled, 1}};
    auto       keyed  = stateserde::encodeWithStateToString(badKey, tally);
    if (keyed || messageOf(keyed.takeError()) != "map key is not valid UTF-8")
    {
        std::cerr << "map keys must be valid UTF-8\n";
        return false;
    }

    llvm::json::Object object;
    if (messageOf(stateserde::encodePlainField(std::int32_t{1}, object, garbled)) != "field key is not valid UTF-8" ||
        !object.empty())
    {
        std::cerr << "field keys must be valid UTF-8\n";
        return false;
    }
    return true;
}

bool testContainersAndPaths()
{
    const std::map<std::string, std::vector<std::optional<std::int32_t>>> value{{"b", {1, std::nullopt}}, {"a", {}}};
    Tally                                                                 tally;
    auto text = stateserde::encodeWithStateToString(value, tally);
    if (!text || *text != R"({"a":[],"b":[1,null]})")
    {
        std::cerr << "container encode mismatch\n";
        if (!text)
        {
            llvm::consumeError(text.takeError());
        }
        return false;
    }

    auto bad = stateserde::decodeWithStateFromString<std::map<std::string, std::vector<std::int32_t>>>(
        tally,
        R"({"ok":[1],"items":[1,"x"]})");
    if (bad)
    {
        std::cerr << "decoding a string element as i32 should fail\n";
        return false;
    }
    const std::string message = messageOf(bad.takeError());
    if (message != "items[1]: expected an integer")
    {
        std::cerr << "container error path mismatch: " << message << "\n";
        return false;
    }

    auto malformed = stateserde::decodeWithStateFromString<std::vector<std::int32_t>>(tally, "[1,");
    if (malformed || messageOf(malformed.takeError()).rfind("malformed JSON: ", 0) != 0)
    {
        std::cerr << "malformed JSON must be reported as an invalid value\n";
        return false;
    }
    return true;
}

bool testBox()
{
    stateserde::Box<std::vector<int>> first(std::vector<int>{1, 2});
    stateserde::Box<std::vector<int>> copy = first;
    copy->push_back(3);
    if (first->size() != 2 || copy->size() != 3 || first == copy)
    {
        std::cerr << "Box copies must be deep\n";
        return false;
    }
    const stateserde::Box<int> zero;
    if (*zero != 0)
    {
        std::cerr << "default Box must hold a value-initialized value\n";
        return false;
    }

    Tally tally;
    auto  decoded = stateserde::decodeWithStateFromString<stateserde::Box<Ticket>>(tally, "42");
    if (!decoded || (*decoded)->id != 42U || tally.decoded != 1)
    {
        std::cerr << "Box must forward the context to its pointee\n";
        if (!decoded)
        {
            llvm::consumeError(decoded.takeError());
        }
        return false;
    }
    return true;
}

bool testCodecErrors()
{
    llvm::Error missing = stateserde::makeMissingFieldError("k");
    if (!missing.isA<stateserde::MissingFieldError>())
    {
        std::cerr << "makeMissingFieldError produced the wrong error class\n";
        llvm::consumeError(std::move(missing));
        return false;
    }
    const std::string nested =
        messageOf(stateserde::withFieldContext(stateserde::withFieldContext(std::move(missing), "inner"), "outer"));
    if (nested != "outer.inner: missing field 'k'")
    {
        std::cerr << "nested field context mismatch: " << nested << "\n";
        return false;
    }

    const std::string indexed = messageOf(stateserde::withFieldContext(
        stateserde::withFieldContext(stateserde::makeInvalidValueError("expected null"), stateserde::indexSegment(2)),
        "items"));
    if (indexed != "items[2]: expected null")
    {
        std::cerr << "index segment path mismatch: " << indexed << "\n";
        return false;
    }

    const std::string unknown = messageOf(stateserde::makeUnknownVariantError("t", {"a", "b"}));
    if (unknown != "unknown variant 't', expected one of 'a', 'b'")
    {
        std::cerr << "unknown variant message mismatch: " << unknown << "\n";
        return false;
    }

    llvm::Error foreign =
        stateserde::withFieldContext(llvm::createStringError(llvm::inconvertibleErrorCode(), "sensor offline"),
                                     "probe");
    bool tagged = false;
    llvm::handleAllErrors(std::move(foreign), [&](const stateserde::CodecError& codec) {
        tagged = codec.path() == "probe" && codec.detail() == "sensor offline";
    });
    if (!tagged)
    {
        std::cerr << "foreign errors must become codec errors that carry the path\n";
        return false;
    }

    if (stateserde::withFieldContext(llvm::Error::success(), "unused"))
    {
        std::cerr << "success must pass through withFieldContext\n";
        return false;
    }
    return true;
}

bool testHandWrittenStateCodec()
{
    Tally                     tally;
    const std::vector<Ticket> tickets{{1}, {2}, {3}};
    auto                      document = stateserde::encodeWithState(tickets, tally);
    if (!document || tally.encoded != 3)
    {
        std::cerr << "context must reach every element of a list\n";
        if (!document)
        {
            llvm::consumeError(document.takeError());
        }
        return false;
    }

    auto decoded = stateserde::decodeWithState<std::vector<Ticket>>(tally, *document);
    if (!decoded || *decoded != tickets || tally.decoded != 3)
    {
        std::cerr << "hand-written decoder did not round-trip the list\n";
        if (!decoded)
        {
            llvm::consumeError(decoded.takeError());
        }
        return false;
    }

    // Types with only a plain codec are accepted in context-threaded positions.
    auto reading = stateserde::decodeWithStateFromString<std::optional<Celsius>>(tally, R"({"celsius":21.5})");
    if (!reading || !*reading || (*reading)->degrees != 21.5)
    {
        std::cerr << "ADL fromJSON type should decode through the plain fallback\n";
        if (!reading)
        {
            llvm::consumeError(reading.takeError());
        }
        return false;
    }
    auto wrong = stateserde::decodeWithStateFromString<Celsius>(tally, R"({"celsius":"warm"})");
    if (wrong)
    {
        std::cerr << "fromJSON failure must surface as an error\n";
        return false;
    }
    const bool invalidValue = wrong.errorIsA<stateserde::InvalidValueError>();
    llvm::consumeError(wrong.takeError());
    if (!invalidValue)
    {
        std::cerr << "fromJSON failure should be an invalid value error\n";
        return false;
    }
    return true;
}

}  // namespace

bool runRuntimeTests()
{
    bool ok = true;
    ok      = testScalars() && ok;
    ok      = testWideAndNarrowNumbers() && ok;
    ok      = testInvalidUtf8() && ok;
    ok      = testContainersAndPaths() && ok;
    ok      = testBox() && ok;
    ok      = testCodecErrors() && ok;
    ok      = testHandWrittenStateCodec() && ok;
    return ok;
}
