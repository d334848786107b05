#pragma once

#include <array>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace kvcall::core {

/**
 * 128-bit unique identifier. Canonical text form is lowercase 8-4-4-4-12 hex,
 * e.g. 3f2504e0-4f89-41d3-9a0c-0305e82c3301.
 */
struct Uuid {
    std::array<std::uint8_t, 16> bytes{};

    bool operator==(const Uuid&) const = default;

    bool isNil() const noexcept {
        for (auto b : bytes) {
            if (b != 0)
                return false;
        }
        return true;
    }

    std::string toString() const {
        char buf[37];
        std::snprintf(buf, sizeof(buf),
                      "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                      bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6],
                      bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13],
                      bytes[14], bytes[15]);
        return std::string(buf);
    }

    // Accepts the canonical form, optionally wrapped in braces, in either case.
    static std::optional<Uuid> tryParse(std::string_view text) {
        if (text.size() == 38 && text.front() == '{' && text.back() == '}') {
            text = text.substr(1, 36);
        }
        if (text.size() != 36) {
            return std::nullopt;
        }
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        };
        Uuid out;
        std::size_t n = 0;
        for (std::size_t i = 0; i < text.size();) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (text[i] != '-')
                    return std::nullopt;
                ++i;
                continue;
            }
            int hi = nibble(text[i]);
            int lo = nibble(text[i + 1]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            out.bytes[n++] = static_cast<std::uint8_t>((hi << 4) | lo);
            i += 2;
        }
        return out;
    }

    // Random version 4 identifier.
    static Uuid generate() {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<std::uint64_t> dist;
        std::uint64_t a = dist(rng);
        std::uint64_t b = dist(rng);

        // Set version 4 (bits 12-15 of time_hi_and_version)
        a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
        // Set variant 1 (bits 6-7 of clock_seq_hi_and_reserved)
        b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

        Uuid out;
        for (int i = 0; i < 8; ++i) {
            out.bytes[i] = static_cast<std::uint8_t>(a >> (56 - 8 * i));
            out.bytes[8 + i] = static_cast<std::uint8_t>(b >> (56 - 8 * i));
        }
        return out;
    }
};

} // namespace kvcall::core
