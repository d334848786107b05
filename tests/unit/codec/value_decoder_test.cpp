#include <gtest/gtest.h>

#include <chrono>
#include <istream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <kvcall/codec/value_decoder.h>
#include <kvcall/codec/value_encoder.h>
#include <kvcall/core/exceptions.h>
#include <kvcall/core/uuid.h>

#include "common/test_helpers.h"

using namespace kvcall;
using namespace kvcall::codec;

namespace kvcall::codec::test {

struct Point {
    int x{0};
    int y{0};

    bool operator==(const Point&) const = default;

    static std::optional<Point> tryParse(std::string_view text) {
        const auto comma = text.find(',');
        if (comma == std::string_view::npos)
            return std::nullopt;
        auto x = ValueTraits<int>::tryParse(text.substr(0, comma));
        auto y = ValueTraits<int>::tryParse(text.substr(comma + 1));
        if (!x || !y)
            return std::nullopt;
        return Point{*x, *y};
    }
};

struct Label {
    Label() = default;
    explicit Label(std::string v) : value(std::move(v)) {}
    std::string value;
};

struct Pair {
    int first{0};
    int second{0};
};

std::istream& operator>>(std::istream& is, Pair& p) {
    return is >> p.first >> p.second;
}

struct Profile {
    std::string name;
    int age{0};
};

struct Opaque {
    int id{0};
};

ByteVector wire(std::string_view text) {
    return toBytes(text);
}

class ValueDecoderTest : public ::testing::Test {
protected:
    ValueDecoder decoder_;
    ValueEncoder encoder_;

    template <typename T> T roundTrip(const T& value) const {
        return decoder_.decode<T>(encoder_.encode(value).toBytes(TextEncoding::Utf8));
    }
};

TEST_F(ValueDecoderTest, NullPayloadYieldsDefault) {
    EXPECT_EQ(decoder_.decode<int>(std::nullopt), 0);
    EXPECT_EQ(decoder_.decode<bool>(std::nullopt), false);
    EXPECT_EQ(decoder_.decode<std::string>(std::nullopt), "");
    EXPECT_TRUE(decoder_.decode<ByteVector>(std::nullopt).empty());
    EXPECT_FALSE(decoder_.decode<std::optional<int>>(std::nullopt).has_value());
    EXPECT_EQ(decoder_.decode<std::chrono::seconds>(std::nullopt), std::chrono::seconds{0});
    EXPECT_EQ(decoder_.decode<Opaque>(std::nullopt).id, 0);
}

TEST_F(ValueDecoderTest, EmptyPayloadYieldsDefault) {
    const ByteVector empty;
    EXPECT_EQ(decoder_.decode<int>(empty), 0);
    EXPECT_EQ(decoder_.decode<double>(empty), 0.0);
    EXPECT_EQ(decoder_.decode<char>(empty), '\0');
    EXPECT_FALSE(decoder_.decode<std::optional<long>>(empty).has_value());
    EXPECT_EQ(decoder_.decode<Opaque>(empty).id, 0);
}

TEST_F(ValueDecoderTest, BooleanScenario) {
    EXPECT_EQ(encoder_.encode(true).text(), "1");
    EXPECT_TRUE(decoder_.decode<bool>(wire("1")));
    EXPECT_FALSE(decoder_.decode<bool>(wire("0")));
    EXPECT_FALSE(decoder_.decode<bool>(wire("")));
    EXPECT_FALSE(decoder_.decode<bool>(wire("true")));
}

TEST_F(ValueDecoderTest, MalformedNumbersYieldDefault) {
    EXPECT_EQ(decoder_.decode<int>(wire("abc")), 0);
    EXPECT_EQ(decoder_.decode<int>(wire("12abc")), 0);
    EXPECT_EQ(decoder_.decode<int>(wire("4 2")), 0);
    EXPECT_EQ(decoder_.decode<int>(wire("99999999999")), 0);
    EXPECT_EQ(decoder_.decode<unsigned>(wire("-1")), 0u);
    EXPECT_EQ(decoder_.decode<double>(wire("1.5.2")), 0.0);
    EXPECT_FALSE(decoder_.decode<std::optional<int>>(wire("nope")).has_value());
}

TEST_F(ValueDecoderTest, ParsesNumbers) {
    EXPECT_EQ(decoder_.decode<int>(wire("42")), 42);
    EXPECT_EQ(decoder_.decode<int>(wire("+5")), 5);
    EXPECT_EQ(decoder_.decode<long long>(wire("-9223372036854775808")),
              std::numeric_limits<long long>::min());
    EXPECT_DOUBLE_EQ(decoder_.decode<double>(wire("1.5")), 1.5);
    EXPECT_EQ(decoder_.decode<std::optional<int>>(wire("7")), std::optional<int>{7});
}

TEST_F(ValueDecoderTest, ScalarsRoundTripThroughEncoder) {
    EXPECT_EQ(roundTrip(std::string("hello world")), "hello world");
    EXPECT_EQ(roundTrip(true), true);
    EXPECT_EQ(roundTrip(false), false);
    EXPECT_EQ(roundTrip(-123), -123);
    EXPECT_EQ(roundTrip(std::numeric_limits<std::uint64_t>::max()),
              std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(roundTrip(0.1), 0.1);
    EXPECT_EQ(roundTrip(-2.5e-8), -2.5e-8);
    EXPECT_EQ(roundTrip('z'), 'z');
    EXPECT_EQ(roundTrip(std::chrono::milliseconds{1500}), std::chrono::milliseconds{1500});
    EXPECT_EQ(roundTrip(std::chrono::hours{-3}), std::chrono::hours{-3});
}

TEST_F(ValueDecoderTest, BytesAndTextArePassedThrough) {
    ByteVector raw{std::byte{0x01}, std::byte{0x80}, std::byte{0xFF}};
    EXPECT_EQ(decoder_.decode<ByteVector>(raw), raw);
    EXPECT_EQ(decoder_.decode<std::string>(wire("  padded  ")), "  padded  ");
}

TEST_F(ValueDecoderTest, TextUsesRequestedEncoding) {
    ByteVector latin1{std::byte{'n'}, std::byte{0xE9}};
    EXPECT_EQ(decoder_.decode<std::string>(latin1, TextEncoding::Latin1), "n\xC3\xA9");
    EXPECT_EQ(decoder_.decode<std::string>(latin1, TextEncoding::Ascii), "n?");
}

TEST_F(ValueDecoderTest, CharTakesFirstCharacter) {
    EXPECT_EQ(decoder_.decode<char>(wire("xyz")), 'x');
}

TEST_F(ValueDecoderTest, Latin1CharRoundTripsAsSingleByte) {
    const auto wireBytes = encoder_.encode('\xE9').toBytes(TextEncoding::Latin1);
    EXPECT_EQ(wireBytes, ByteVector{std::byte{0xE9}});
    EXPECT_EQ(decoder_.decode<char>(wireBytes, TextEncoding::Latin1), '\xE9');
    EXPECT_EQ(decoder_.decode<std::optional<char>>(wireBytes, TextEncoding::Latin1),
              std::optional<char>('\xE9'));
    EXPECT_EQ(encoder_.encode('\xE9').toBytes(TextEncoding::Ascii), ByteVector{std::byte{'?'}});
}

TEST_F(ValueDecoderTest, FlagSequenceDecodesOneFlagPerByte) {
    auto flags = decoder_.decode<std::vector<bool>>(wire("1011x"));
    EXPECT_EQ(flags, (std::vector<bool>{true, false, true, true, false}));
    EXPECT_TRUE(decoder_.decode<std::vector<bool>>(ByteVector{}).empty());
}

TEST_F(ValueDecoderTest, DurationsParseTickCounts) {
    EXPECT_EQ(decoder_.decode<std::chrono::seconds>(wire("10000000")), std::chrono::seconds{1});
    EXPECT_EQ(decoder_.decode<core::Ticks>(wire("42")), core::Ticks{42});
    EXPECT_EQ(decoder_.decode<std::chrono::seconds>(wire("soon")), std::chrono::seconds{0});
}

TEST_F(ValueDecoderTest, DurationsOutsideTargetRangeDecodeToDefault) {
    using IntMillis = std::chrono::duration<int, std::milli>;
    using FloatSeconds = std::chrono::duration<double>;

    EXPECT_EQ(decoder_.decode<std::chrono::nanoseconds>(wire("12")), std::chrono::nanoseconds{1200});
    EXPECT_EQ(decoder_.decode<std::chrono::nanoseconds>(wire("922337203685477580")),
              std::chrono::nanoseconds{0});
    EXPECT_FALSE(
        decoder_.decode<std::optional<std::chrono::nanoseconds>>(wire("922337203685477580"))
            .has_value());

    EXPECT_EQ(decoder_.decode<IntMillis>(wire("30000")), IntMillis{3});
    EXPECT_EQ(decoder_.decode<IntMillis>(wire("-30000")), IntMillis{-3});
    EXPECT_EQ(decoder_.decode<IntMillis>(wire("922337203685477580")), IntMillis{0});

    EXPECT_DOUBLE_EQ(decoder_.decode<FloatSeconds>(wire("15000000")).count(), 1.5);
    EXPECT_DOUBLE_EQ(decoder_.decode<FloatSeconds>(wire("922337203685477580")).count(),
                     92233720368.547758);
}

TEST_F(ValueDecoderTest, ParseCapableTypesUseTryParse) {
    EXPECT_EQ(decoder_.decode<Point>(wire("3,-4")), (Point{3, -4}));
    EXPECT_EQ(decoder_.decode<Point>(wire("3;4")), Point{});
    EXPECT_FALSE(decoder_.decode<std::optional<Point>>(wire("bad")).has_value());

    auto id = decoder_.decode<core::Uuid>(wire("3f2504e0-4f89-41d3-9a0c-0305e82c3301"));
    EXPECT_EQ(id.toString(), "3f2504e0-4f89-41d3-9a0c-0305e82c3301");
    EXPECT_TRUE(decoder_.decode<core::Uuid>(wire("not-a-uuid")).isNil());
}

TEST_F(ValueDecoderTest, ParsesTimeValues) {
    using namespace std::chrono;
    const core::SystemTime expected{sys_days{year{2024} / 1 / 15} + hours{8}};
    EXPECT_EQ(decoder_.decode<core::SystemTime>(wire("2024-01-15T10:00:00+02:00")), expected);
    EXPECT_EQ(decoder_.decode<core::SystemTime>(wire("garbage")), core::SystemTime{});

    auto dto = decoder_.decode<core::DateTimeOffset>(wire("2024-01-15T10:00:00.0000000+02:00"));
    EXPECT_EQ(dto.utc, expected);
    EXPECT_EQ(dto.offset, minutes{120});
}

TEST_F(ValueDecoderTest, TimePointsRoundTripThroughEncoder) {
    kvcall::test::ScopedTimeZone tz("XYZ+4");
    using namespace std::chrono;
    const core::SystemTime tp{sys_days{year{2022} / 11 / 5} + hours{1} + seconds{7}};
    EXPECT_EQ(roundTrip(tp), tp);
}

TEST_F(ValueDecoderTest, GenericConversionFallbacks) {
    EXPECT_EQ(decoder_.decode<Label>(wire("vip")).value, "vip");

    auto pair = decoder_.decode<Pair>(wire("3 4"));
    EXPECT_EQ(pair.first, 3);
    EXPECT_EQ(pair.second, 4);

    auto bad = decoder_.decode<Pair>(wire("three four"));
    EXPECT_EQ(bad.first, 0);
    EXPECT_EQ(bad.second, 0);
}

TEST_F(ValueDecoderTest, DeserializeHookHandlesUnknownTypes) {
    auto hooks = std::make_shared<CodecHooks>();
    hooks->deserialize = [](std::string_view text, std::type_index type) -> std::any {
        if (type != std::type_index(typeid(Profile)))
            return {};
        const auto colon = text.find(':');
        if (colon == std::string_view::npos)
            return {};
        return Profile{std::string(text.substr(0, colon)),
                       ValueTraits<int>::tryParse(text.substr(colon + 1)).value_or(0)};
    };
    ValueDecoder decoder(hooks);

    auto p = decoder.decode<Profile>(wire("ada:36"));
    EXPECT_EQ(p.name, "ada");
    EXPECT_EQ(p.age, 36);

    // Empty hook result degrades to the default.
    auto none = decoder.decode<Profile>(wire("no colon"));
    EXPECT_TRUE(none.name.empty());
    EXPECT_FALSE(decoder.decode<std::optional<Profile>>(wire("no colon")).has_value());

    // Built-in rules still win.
    EXPECT_EQ(decoder.decode<int>(wire("5")), 5);
}

TEST_F(ValueDecoderTest, HookReturningWrongTypeRaisesCodecError) {
    auto hooks = std::make_shared<CodecHooks>();
    hooks->deserialize = [](std::string_view, std::type_index) -> std::any {
        return std::string("not a profile");
    };
    ValueDecoder decoder(hooks);
    EXPECT_THROW((void)decoder.decode<Profile>(wire("x")), CodecError);
}

TEST_F(ValueDecoderTest, HookExceptionsPropagate) {
    auto hooks = std::make_shared<CodecHooks>();
    hooks->deserialize = [](std::string_view, std::type_index) -> std::any {
        throw std::invalid_argument("bad document");
    };
    ValueDecoder decoder(hooks);
    EXPECT_THROW((void)decoder.decode<Profile>(wire("x")), std::invalid_argument);
}

TEST_F(ValueDecoderTest, TypeWithoutConversionRaisesCodecError) {
    EXPECT_THROW((void)decoder_.decode<Opaque>(wire("7")), CodecError);
}

} // namespace kvcall::codec::test
