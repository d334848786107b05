#include <kvcall/client/reply.h>
#include <kvcall/codec/text_encoding.h>
#include <kvcall/core/exceptions.h>

namespace kvcall::client {

std::optional<ByteVector> Reply::payload() const {
    switch (kind_) {
        case Kind::Bulk:
            return bytes();
        case Kind::Status:
        case Kind::Error:
            return codec::toBytes(text());
        case Kind::Integer:
            return codec::toBytes(std::to_string(integer()));
        case Kind::Nil:
        case Kind::Array:
            return std::nullopt;
    }
    return std::nullopt;
}

const Reply& Reply::throwOrValue() const& {
    if (isError())
        throw ServerError(text());
    return *this;
}

Reply Reply::throwOrValue() && {
    if (isError())
        throw ServerError(text());
    return std::move(*this);
}

std::string Reply::toString() const {
    switch (kind_) {
        case Kind::Nil:
            return "(nil)";
        case Kind::Status:
            return text();
        case Kind::Error:
            return "(error) " + text();
        case Kind::Integer:
            return std::to_string(integer());
        case Kind::Bulk:
            return codec::decodeText(bytes(), codec::TextEncoding::Utf8);
        case Kind::Array: {
            std::string out = "[";
            const auto& items = elements();
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0)
                    out.append(", ");
                out.append(items[i].toString());
            }
            out.push_back(']');
            return out;
        }
    }
    return {};
}

} // namespace kvcall::client
