#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <kvcall/core/types.h>

namespace kvcall::client {

// One reply from the store, as handed back by an adapter.
class Reply {
public:
    enum class Kind { Nil, Status, Error, Integer, Bulk, Array };

    Reply() = default;

    static Reply nil() { return Reply{}; }
    static Reply status(std::string text) { return Reply{Kind::Status, std::move(text)}; }
    static Reply error(std::string text) { return Reply{Kind::Error, std::move(text)}; }
    static Reply integer(std::int64_t n) { return Reply{Kind::Integer, n}; }
    static Reply bulk(ByteVector bytes) { return Reply{Kind::Bulk, std::move(bytes)}; }
    static Reply array(std::vector<Reply> items) { return Reply{Kind::Array, std::move(items)}; }

    Kind kind() const noexcept { return kind_; }
    bool isNil() const noexcept { return kind_ == Kind::Nil; }
    bool isError() const noexcept { return kind_ == Kind::Error; }
    bool isArray() const noexcept { return kind_ == Kind::Array; }

    // Status or error text.
    const std::string& text() const { return std::get<std::string>(data_); }
    std::int64_t integer() const { return std::get<std::int64_t>(data_); }
    const ByteVector& bytes() const { return std::get<ByteVector>(data_); }
    const std::vector<Reply>& elements() const { return std::get<std::vector<Reply>>(data_); }

    // Scalar payload for the value decoder; std::nullopt for nil and arrays.
    std::optional<ByteVector> payload() const;

    // Throws ServerError for an error reply, otherwise returns *this.
    const Reply& throwOrValue() const&;
    Reply throwOrValue() &&;

    std::string toString() const;

private:
    using Storage = std::variant<std::monostate, std::string, std::int64_t, ByteVector,
                                 std::vector<Reply>>;

    template <typename V> Reply(Kind kind, V&& value) : kind_(kind), data_(std::forward<V>(value)) {}

    Kind kind_{Kind::Nil};
    Storage data_;
};

} // namespace kvcall::client
