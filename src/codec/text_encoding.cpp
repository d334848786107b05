#include <kvcall/codec/text_encoding.h>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace kvcall::codec {

namespace {

// Next code point of a UTF-8 string; malformed sequences yield U+FFFD and consume one byte.
std::uint32_t nextCodePoint(std::string_view text, std::size_t& pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        ++pos;
        return 0xFFFD;
    }
    if (pos + len > text.size()) {
        ++pos;
        return 0xFFFD;
    }
    for (std::size_t i = 1; i < len; ++i) {
        const auto c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) {
            ++pos;
            return 0xFFFD;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    pos += len;
    return cp;
}

} // namespace

std::optional<TextEncoding> parseTextEncoding(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "utf-8" || lower == "utf8")
        return TextEncoding::Utf8;
    if (lower == "latin1" || lower == "latin-1" || lower == "iso-8859-1")
        return TextEncoding::Latin1;
    if (lower == "ascii" || lower == "us-ascii")
        return TextEncoding::Ascii;
    return std::nullopt;
}

std::string decodeText(ByteSpan bytes, TextEncoding encoding) {
    std::string out;
    out.reserve(bytes.size());
    switch (encoding) {
        case TextEncoding::Utf8:
            out.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
            break;
        case TextEncoding::Latin1:
            for (auto b : bytes) {
                const auto c = static_cast<unsigned char>(b);
                if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
                    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
            }
            break;
        case TextEncoding::Ascii:
            for (auto b : bytes) {
                const auto c = static_cast<unsigned char>(b);
                out.push_back(c < 0x80 ? static_cast<char>(c) : '?');
            }
            break;
    }
    return out;
}

ByteVector encodeText(std::string_view text, TextEncoding encoding) {
    ByteVector out;
    out.reserve(text.size());
    if (encoding == TextEncoding::Utf8) {
        for (char c : text)
            out.push_back(static_cast<std::byte>(c));
        return out;
    }
    const std::uint32_t limit = encoding == TextEncoding::Latin1 ? 0xFF : 0x7F;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto cp = nextCodePoint(text, pos);
        out.push_back(cp <= limit ? static_cast<std::byte>(cp) : std::byte{'?'});
    }
    return out;
}

} // namespace kvcall::codec
