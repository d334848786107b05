#include <kvcall/codec/wire_value.h>

namespace kvcall::codec {

std::string WireValue::toString() const {
    struct Visitor {
        std::string operator()(std::monostate) const { return {}; }
        std::string operator()(const std::string& s) const { return s; }
        std::string operator()(const ByteVector& b) const {
            return decodeText(b, TextEncoding::Utf8);
        }
        std::string operator()(char c) const { return std::string(1, c); }
        std::string operator()(std::int64_t n) const { return std::to_string(n); }
    };
    return std::visit(Visitor{}, data_);
}

ByteVector WireValue::toBytes(TextEncoding encoding) const {
    if (isBytes())
        return bytes();
    // A Latin-1 char is already a single code unit; transcoding would read it as broken UTF-8.
    if (isChar() && encoding == TextEncoding::Latin1)
        return ByteVector{static_cast<std::byte>(character())};
    return encodeText(toString(), encoding);
}

} // namespace kvcall::codec
