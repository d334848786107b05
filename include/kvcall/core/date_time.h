#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ratio>
#include <string>
#include <string_view>

namespace kvcall::core {

// 100-nanosecond units; the wire unit for durations.
using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;

using SystemTime = std::chrono::system_clock::time_point;

/**
 * An instant paired with the UTC offset it was observed at.
 * Canonical text form: YYYY-MM-DDThh:mm:ss.fffffff+hh:mm
 */
struct DateTimeOffset {
    SystemTime utc{};
    std::chrono::minutes offset{0};

    bool operator==(const DateTimeOffset&) const = default;

    std::string toString() const;

    static std::optional<DateTimeOffset> tryParse(std::string_view text);
};

// YYYY-MM-DDThh:mm:ss+hh:mm in the process-local time zone. Sub-second precision is dropped.
std::string formatLocalDateTime(SystemTime tp);

// Accepts YYYY-MM-DD[Thh:mm:ss[.f...]][Z|+hh:mm|-hh:mm]. Without an offset the text is
// interpreted in the process-local time zone.
std::optional<SystemTime> parseDateTime(std::string_view text);

} // namespace kvcall::core
