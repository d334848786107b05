#include <kvcall/core/date_time.h>

#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace kvcall::core {

namespace {

struct DateTimeParts {
    int year = 0;
    unsigned month = 1;
    unsigned day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::int64_t fractionTicks = 0;
    std::optional<std::chrono::minutes> offset;
};

bool readDigits(std::string_view text, std::size_t& pos, std::size_t width, int& out) {
    if (pos + width > text.size())
        return false;
    int value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + (c - '0');
    }
    pos += width;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c)
        return false;
    ++pos;
    return true;
}

std::optional<DateTimeParts> parseParts(std::string_view text) {
    DateTimeParts p;
    std::size_t pos = 0;
    int month = 0;
    int day = 0;
    if (!readDigits(text, pos, 4, p.year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    p.month = static_cast<unsigned>(month);
    p.day = static_cast<unsigned>(day);

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!readDigits(text, pos, 2, p.hour) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, p.minute) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, p.second)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            std::int64_t scale = 1'000'000;
            std::size_t digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (digits < 7) {
                    p.fractionTicks += (text[pos] - '0') * scale;
                    scale /= 10;
                }
                ++digits;
                ++pos;
            }
            if (digits == 0)
                return std::nullopt;
        }
    }

    if (pos < text.size()) {
        if (text[pos] == 'Z') {
            ++pos;
            p.offset = std::chrono::minutes{0};
        } else if (text[pos] == '+' || text[pos] == '-') {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int oh = 0;
            int om = 0;
            if (!readDigits(text, pos, 2, oh) || !expect(text, pos, ':') ||
                !readDigits(text, pos, 2, om)) {
                return std::nullopt;
            }
            p.offset = std::chrono::minutes{sign * (oh * 60 + om)};
        }
    }
    if (pos != text.size())
        return std::nullopt;

    std::chrono::year_month_day ymd{std::chrono::year{p.year}, std::chrono::month{p.month},
                                    std::chrono::day{p.day}};
    if (!ymd.ok() || p.hour > 23 || p.minute > 59 || p.second > 60)
        return std::nullopt;
    return p;
}

SystemTime wallClockToUtc(const DateTimeParts& p, std::chrono::minutes offset) {
    using namespace std::chrono;
    const sys_days days{year_month_day{year{p.year}, month{p.month}, day{p.day}}};
    auto wall = days + hours{p.hour} + minutes{p.minute} + seconds{p.second};
    return time_point_cast<SystemTime::duration>(wall - offset) +
           duration_cast<SystemTime::duration>(Ticks{p.fractionTicks});
}

std::chrono::minutes localOffsetAt(std::time_t t) {
    std::tm tm_local{};
    localtime_r(&t, &tm_local);
    return std::chrono::minutes{tm_local.tm_gmtoff / 60};
}

} // namespace

std::string formatLocalDateTime(SystemTime tp) {
    const auto t = std::chrono::system_clock::to_time_t(
        std::chrono::floor<std::chrono::seconds>(tp));
    std::tm tm_local{};
    localtime_r(&t, &tm_local);

    long offsetMinutes = tm_local.tm_gmtoff / 60;
    const char sign = offsetMinutes < 0 ? '-' : '+';
    offsetMinutes = std::labs(offsetMinutes);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d%c%02ld:%02ld",
                  tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday,
                  tm_local.tm_hour, tm_local.tm_min, tm_local.tm_sec, sign, offsetMinutes / 60,
                  offsetMinutes % 60);
    return std::string(buf);
}

std::optional<SystemTime> parseDateTime(std::string_view text) {
    auto parts = parseParts(text);
    if (!parts)
        return std::nullopt;
    if (parts->offset)
        return wallClockToUtc(*parts, *parts->offset);

    std::tm tm_local{};
    tm_local.tm_year = parts->year - 1900;
    tm_local.tm_mon = static_cast<int>(parts->month) - 1;
    tm_local.tm_mday = static_cast<int>(parts->day);
    tm_local.tm_hour = parts->hour;
    tm_local.tm_min = parts->minute;
    tm_local.tm_sec = parts->second;
    tm_local.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm_local);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(t) +
           std::chrono::duration_cast<SystemTime::duration>(Ticks{parts->fractionTicks});
}

std::string DateTimeOffset::toString() const {
    using namespace std::chrono;
    const auto local = floor<Ticks>(utc) + offset;
    const auto dayPoint = floor<days>(local);
    const year_month_day ymd{dayPoint};
    const hh_mm_ss<Ticks> hms{local - dayPoint};

    auto off = offset.count();
    const char sign = off < 0 ? '-' : '+';
    off = off < 0 ? -off : off;

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%07lld%c%02d:%02d",
                  static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()),
                  static_cast<long long>(hms.subseconds().count()), sign,
                  static_cast<int>(off / 60), static_cast<int>(off % 60));
    return std::string(buf);
}

std::optional<DateTimeOffset> DateTimeOffset::tryParse(std::string_view text) {
    auto parts = parseParts(text);
    if (!parts)
        return std::nullopt;
    if (parts->offset)
        return DateTimeOffset{wallClockToUtc(*parts, *parts->offset), *parts->offset};

    auto utc = parseDateTime(text);
    if (!utc)
        return std::nullopt;
    return DateTimeOffset{*utc, localOffsetAt(std::chrono::system_clock::to_time_t(*utc))};
}

} // namespace kvcall::core
