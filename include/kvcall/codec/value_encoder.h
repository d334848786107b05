#pragma once

#include <any>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

#include <fmt/format.h>

#include <kvcall/codec/codec_hooks.h>
#include <kvcall/codec/invariant_text.h>
#include <kvcall/codec/value_traits.h>
#include <kvcall/codec/wire_value.h>
#include <kvcall/core/date_time.h>
#include <kvcall/core/uuid.h>

namespace kvcall::codec {

template <typename T> struct is_system_time_point : std::false_type {};
template <typename D>
struct is_system_time_point<std::chrono::time_point<std::chrono::system_clock, D>>
    : std::true_type {};

/**
 * Converts native values into wire-safe scalars for outgoing commands.
 *
 * Rules are applied in a fixed order: null, text/bytes/char passthrough, bool ("1"/"0"),
 * system_clock time points (YYYY-MM-DDThh:mm:ss+hh:mm, local zone), durations (100ns tick
 * count), DateTimeOffset and Uuid (canonical text), numbers (shortest round-trip text), then the
 * serialize hook and finally the generic string conversion.
 *
 * Deterministic and free of I/O. The only exceptions are those thrown by the serialize hook, and
 * CodecError for a type with no conversion at all or a duration outside the tick range.
 */
class ValueEncoder {
public:
    ValueEncoder() = default;
    explicit ValueEncoder(std::shared_ptr<const CodecHooks> hooks) : hooks_(std::move(hooks)) {}

    template <typename T> WireValue encode(const T& value) const {
        using U = std::remove_cvref_t<T>;
        if constexpr (std::is_same_v<U, std::nullptr_t>) {
            return WireValue{};
        } else if constexpr (is_optional_v<U>) {
            return value ? encode(*value) : WireValue{};
        } else if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
            return value ? WireValue{std::string(value)} : WireValue{};
        } else if constexpr (std::is_convertible_v<const U&, std::string_view>) {
            return WireValue{std::string(std::string_view(value))};
        } else if constexpr (std::is_same_v<U, ByteVector>) {
            return WireValue{value};
        } else if constexpr (std::is_same_v<U, char>) {
            return WireValue{value};
        } else if constexpr (std::is_same_v<U, bool>) {
            return WireValue{value ? "1" : "0"};
        } else if constexpr (is_system_time_point<U>::value) {
            return WireValue{core::formatLocalDateTime(
                std::chrono::time_point_cast<core::SystemTime::duration>(value))};
        } else if constexpr (is_duration_v<U>) {
            auto ticks = checkedDurationCast<core::Ticks>(value);
            if (!ticks)
                throwDurationOutOfRange(typeid(U).name());
            return WireValue{static_cast<std::int64_t>(ticks->count())};
        } else if constexpr (std::is_same_v<U, core::DateTimeOffset> ||
                             std::is_same_v<U, core::Uuid>) {
            return WireValue{value.toString()};
        } else if constexpr (NumericValue<U>) {
            return WireValue{fmt::format("{}", value)};
        } else if constexpr (std::is_pointer_v<U>) {
            return value ? encode(*value) : WireValue{};
        } else {
            return encodeFallback(value);
        }
    }

    const std::shared_ptr<const CodecHooks>& hooks() const noexcept { return hooks_; }

private:
    template <typename U> WireValue encodeFallback(const U& value) const {
        if constexpr (std::is_copy_constructible_v<U>) {
            if (hooks_ && hooks_->serialize) {
                if (auto text = hooks_->serialize(std::any(value)); text) {
                    return WireValue{std::move(*text)};
                }
            }
        }
        if constexpr (GenericallyConvertible<U>) {
            return WireValue{genericToString(value)};
        } else {
            throwNoConversion(typeid(U).name());
        }
    }

    [[noreturn]] static void throwNoConversion(const char* typeName);
    [[noreturn]] static void throwDurationOutOfRange(const char* typeName);

    std::shared_ptr<const CodecHooks> hooks_;
};

} // namespace kvcall::codec
