#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include <kvcall/codec/text_encoding.h>
#include <kvcall/core/types.h>

namespace kvcall::codec {

// Wire-safe scalar produced by ValueEncoder and carried as a command argument.
class WireValue {
public:
    using Storage = std::variant<std::monostate, std::string, ByteVector, char, std::int64_t>;

    WireValue() = default;
    WireValue(std::nullptr_t) {}
    WireValue(std::string text) : data_(std::move(text)) {}
    WireValue(const char* text) : data_(std::string(text)) {}
    WireValue(ByteVector bytes) : data_(std::move(bytes)) {}
    WireValue(char c) : data_(c) {}
    WireValue(std::int64_t n) : data_(n) {}

    bool isNull() const noexcept { return std::holds_alternative<std::monostate>(data_); }
    bool isText() const noexcept { return std::holds_alternative<std::string>(data_); }
    bool isBytes() const noexcept { return std::holds_alternative<ByteVector>(data_); }
    bool isChar() const noexcept { return std::holds_alternative<char>(data_); }
    bool isInteger() const noexcept { return std::holds_alternative<std::int64_t>(data_); }

    const std::string& text() const { return std::get<std::string>(data_); }
    const ByteVector& bytes() const { return std::get<ByteVector>(data_); }
    char character() const { return std::get<char>(data_); }
    std::int64_t integer() const { return std::get<std::int64_t>(data_); }

    const Storage& storage() const noexcept { return data_; }

    // Text as it appears in a command rendering; null renders empty, bytes are taken as UTF-8.
    std::string toString() const;

    // Bytes as sent on the wire.
    ByteVector toBytes(TextEncoding encoding) const;

    bool operator==(const WireValue&) const = default;

private:
    Storage data_;
};

} // namespace kvcall::codec
