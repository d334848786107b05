#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <kvcall/core/types.h>

namespace kvcall::codec {

enum class TextEncoding { Utf8, Latin1, Ascii };

constexpr std::string_view to_string(TextEncoding e) {
    switch (e) {
        case TextEncoding::Utf8:
            return "utf-8";
        case TextEncoding::Latin1:
            return "latin1";
        case TextEncoding::Ascii:
            return "ascii";
    }
    return "utf-8";
}

// Accepts the names above plus common aliases ("utf8", "iso-8859-1", "us-ascii"), any case.
std::optional<TextEncoding> parseTextEncoding(std::string_view name);

// Bytes on the wire -> UTF-8 std::string. Unrepresentable input is replaced with '?'.
std::string decodeText(ByteSpan bytes, TextEncoding encoding);

// UTF-8 std::string -> bytes on the wire.
ByteVector encodeText(std::string_view text, TextEncoding encoding);

inline ByteVector toBytes(std::string_view text) {
    return encodeText(text, TextEncoding::Utf8);
}

} // namespace kvcall::codec
