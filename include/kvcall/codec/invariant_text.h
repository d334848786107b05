#pragma once

#include <concepts>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <kvcall/codec/text_encoding.h>
#include <kvcall/codec/value_traits.h>
#include <kvcall/codec/wire_value.h>
#include <kvcall/core/date_time.h>
#include <kvcall/core/uuid.h>

namespace kvcall::codec {

template <typename T>
concept OstreamInsertable = requires(std::ostream& os, const T& v) {
    { os << v } -> std::convertible_to<std::ostream&>;
};

template <typename T>
concept GenericallyConvertible = fmt::is_formattable<T>::value || OstreamInsertable<T>;

// Generic value -> text conversion used when no built-in rule or hook applies.
template <GenericallyConvertible T> std::string genericToString(const T& value) {
    if constexpr (fmt::is_formattable<T>::value) {
        return fmt::format("{}", value);
    } else {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << value;
        return oss.str();
    }
}

/**
 * Locale-independent rendering of a call result for traces. Sequences render as
 * "[e1, e2, e3]"; empty optionals render as an empty string.
 */
template <typename T> std::string toInvariantString(const T& value) {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, std::string_view>) {
        return std::string(value);
    } else if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
        return value ? std::string(value) : std::string();
    } else if constexpr (std::is_same_v<U, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_same_v<U, char>) {
        return std::string(1, value);
    } else if constexpr (std::is_arithmetic_v<U>) {
        return fmt::format("{}", value);
    } else if constexpr (std::is_same_v<U, ByteVector>) {
        return decodeText(value, TextEncoding::Utf8);
    } else if constexpr (std::is_same_v<U, WireValue>) {
        return value.toString();
    } else if constexpr (is_optional_v<U>) {
        return value ? toInvariantString(*value) : std::string();
    } else if constexpr (is_vector_v<U>) {
        std::string out = "[";
        bool first = true;
        for (const auto& item : value) {
            if (!first)
                out.append(", ");
            first = false;
            out.append(toInvariantString<typename U::value_type>(item));
        }
        out.push_back(']');
        return out;
    } else if constexpr (std::is_same_v<U, core::Uuid> || std::is_same_v<U, core::DateTimeOffset>) {
        return value.toString();
    } else if constexpr (std::is_same_v<U, core::SystemTime>) {
        return core::formatLocalDateTime(value);
    } else if constexpr (is_duration_v<U>) {
        return fmt::format("{}", value);
    } else if constexpr (requires { { value.toString() } -> std::convertible_to<std::string>; }) {
        return value.toString();
    } else if constexpr (GenericallyConvertible<U>) {
        return genericToString(value);
    } else {
        return typeid(U).name();
    }
}

} // namespace kvcall::codec
