#pragma once

#include <charconv>
#include <chrono>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <ratio>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <kvcall/core/date_time.h>
#include <kvcall/core/types.h>

namespace kvcall::codec {

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
template <typename T> inline constexpr bool is_optional_v = is_optional<std::remove_cvref_t<T>>::value;

template <typename T> struct is_duration : std::false_type {};
template <typename Rep, typename Period>
struct is_duration<std::chrono::duration<Rep, Period>> : std::true_type {};
template <typename T> inline constexpr bool is_duration_v = is_duration<std::remove_cvref_t<T>>::value;

/**
 * duration_cast that refuses to overflow: std::nullopt when the rescaled count does not fit
 * To::rep (or the source count is NaN). Integer to integer conversions stay exact and truncate
 * toward zero like duration_cast.
 */
template <typename To, typename Rep, typename Period>
std::optional<To> checkedDurationCast(std::chrono::duration<Rep, Period> from) {
    using ToRep = typename To::rep;
    using Scale = std::ratio_divide<Period, typename To::period>;
    if constexpr (std::is_integral_v<Rep> && std::is_integral_v<ToRep>) {
        if (!std::in_range<std::intmax_t>(from.count()))
            return std::nullopt;
        auto count = static_cast<std::intmax_t>(from.count());
        if constexpr (Scale::num != 1) {
            constexpr auto kMax = std::numeric_limits<std::intmax_t>::max() / Scale::num;
            constexpr auto kMin = std::numeric_limits<std::intmax_t>::min() / Scale::num;
            if (count > kMax || count < kMin)
                return std::nullopt;
            count *= Scale::num;
        }
        count /= Scale::den;
        if (!std::in_range<ToRep>(count))
            return std::nullopt;
        return To{static_cast<ToRep>(count)};
    } else {
        const long double scaled = static_cast<long double>(from.count()) *
                                   static_cast<long double>(Scale::num) /
                                   static_cast<long double>(Scale::den);
        if (std::isnan(scaled))
            return std::nullopt;
        if constexpr (std::is_floating_point_v<ToRep>) {
            if (std::fabs(scaled) > static_cast<long double>(std::numeric_limits<ToRep>::max()))
                return std::nullopt;
        } else {
            // Exclusive bounds; converting a value outside them is undefined.
            const long double upper =
                static_cast<long double>(std::numeric_limits<ToRep>::max()) + 1.0L;
            const long double lower =
                static_cast<long double>(std::numeric_limits<ToRep>::min()) - 1.0L;
            if (!(scaled < upper && scaled > lower))
                return std::nullopt;
        }
        return To{static_cast<ToRep>(scaled)};
    }
}

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};
template <typename T> inline constexpr bool is_vector_v = is_vector<std::remove_cvref_t<T>>::value;

template <typename T>
concept NumericValue = std::is_arithmetic_v<T> && !std::same_as<T, bool> && !std::same_as<T, char>;

template <typename T>
concept HasStaticTryParse = requires(std::string_view text) {
    { T::tryParse(text) } -> std::same_as<std::optional<T>>;
};

/**
 * Parse capability: ValueTraits<T>::tryParse(text) -> std::optional<T>.
 *
 * Specialize for your own types, or give them a static tryParse member. The primary template
 * has no tryParse; such types fall through to the codec hooks.
 */
template <typename T> struct ValueTraits {};

template <HasStaticTryParse T> struct ValueTraits<T> {
    static std::optional<T> tryParse(std::string_view text) { return T::tryParse(text); }
};

template <NumericValue T> struct ValueTraits<T> {
    static std::optional<T> tryParse(std::string_view text) {
        if (!text.empty() && text.front() == '+')
            text.remove_prefix(1);
        if (text.empty())
            return std::nullopt;
        T value{};
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc{} || ptr != end)
            return std::nullopt;
        return value;
    }
};

template <> struct ValueTraits<core::SystemTime> {
    static std::optional<core::SystemTime> tryParse(std::string_view text) {
        return core::parseDateTime(text);
    }
};

template <typename T>
concept Parsable = requires(std::string_view text) {
    { ValueTraits<T>::tryParse(text) } -> std::same_as<std::optional<T>>;
};

} // namespace kvcall::codec
