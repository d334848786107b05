#pragma once

#include <any>
#include <chrono>
#include <concepts>
#include <istream>
#include <locale>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <vector>

#include <kvcall/codec/codec_hooks.h>
#include <kvcall/codec/text_encoding.h>
#include <kvcall/codec/value_traits.h>
#include <kvcall/core/date_time.h>

namespace kvcall::codec {

template <typename T>
concept IstreamExtractable = requires(std::istream& is, T& v) {
    { is >> v } -> std::convertible_to<std::istream&>;
};

/**
 * Converts a raw reply payload into a value of the requested type.
 *
 * A null payload, an empty decoded text, or text that does not parse yields T{} (std::nullopt
 * for std::optional<U>). Parse failures never throw. Only the deserialize hook, or a type with
 * no conversion at all, can raise.
 */
class ValueDecoder {
public:
    ValueDecoder() = default;
    explicit ValueDecoder(std::shared_ptr<const CodecHooks> hooks) : hooks_(std::move(hooks)) {}

    template <typename T>
    T decode(std::optional<ByteSpan> payload, TextEncoding encoding = TextEncoding::Utf8) const {
        if (!payload)
            return T{};

        if constexpr (std::is_same_v<T, ByteVector>) {
            return ByteVector(payload->begin(), payload->end());
        } else if constexpr (std::is_same_v<T, std::string>) {
            return decodeText(*payload, encoding);
        } else if constexpr (std::is_same_v<T, std::vector<bool>>) {
            std::vector<bool> flags;
            flags.reserve(payload->size());
            for (auto b : *payload)
                flags.push_back(b == std::byte{'1'});
            return flags;
        } else {
            if constexpr (std::is_same_v<T, char> || std::is_same_v<T, std::optional<char>>) {
                if (encoding == TextEncoding::Latin1) {
                    if (payload->empty())
                        return T{};
                    return T{static_cast<char>(payload->front())};
                }
            }
            const auto text = decodeText(*payload, encoding);
            if (text.empty())
                return T{};
            if constexpr (is_optional_v<T>) {
                return fromText<typename T::value_type>(text);
            } else {
                auto value = fromText<T>(text);
                return value ? std::move(*value) : T{};
            }
        }
    }

    template <typename T>
    T decode(const ByteVector& payload, TextEncoding encoding = TextEncoding::Utf8) const {
        return decode<T>(std::optional<ByteSpan>(ByteSpan(payload)), encoding);
    }

    const std::shared_ptr<const CodecHooks>& hooks() const noexcept { return hooks_; }

private:
    template <typename U> std::optional<U> fromText(const std::string& text) const {
        if constexpr (std::is_same_v<U, bool>) {
            return text == "1";
        } else if constexpr (std::is_same_v<U, char>) {
            return text.front();
        } else if constexpr (std::is_same_v<U, std::string>) {
            return text;
        } else if constexpr (std::is_same_v<U, ByteVector>) {
            return toBytes(text);
        } else if constexpr (is_duration_v<U>) {
            auto ticks = ValueTraits<std::int64_t>::tryParse(text);
            if (!ticks)
                return std::nullopt;
            return checkedDurationCast<U>(core::Ticks{*ticks});
        } else if constexpr (Parsable<U>) {
            return ValueTraits<U>::tryParse(text);
        } else {
            return fromTextFallback<U>(text);
        }
    }

    template <typename U> std::optional<U> fromTextFallback(const std::string& text) const {
        if (hooks_ && hooks_->deserialize) {
            std::any result = hooks_->deserialize(text, std::type_index(typeid(U)));
            if (!result.has_value())
                return std::nullopt;
            if (auto* typed = std::any_cast<U>(&result))
                return std::move(*typed);
            throwHookTypeMismatch(typeid(U).name(), result.type().name());
        }
        if constexpr (std::is_constructible_v<U, std::string>) {
            return U(text);
        } else if constexpr (IstreamExtractable<U>) {
            std::istringstream iss(text);
            iss.imbue(std::locale::classic());
            U value{};
            if (!(iss >> value))
                return std::nullopt;
            return value;
        } else {
            throwNoConversion(typeid(U).name());
        }
    }

    [[noreturn]] static void throwNoConversion(const char* typeName);
    [[noreturn]] static void throwHookTypeMismatch(const char* expected, const char* actual);

    std::shared_ptr<const CodecHooks> hooks_;
};

} // namespace kvcall::codec
