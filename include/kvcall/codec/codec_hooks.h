#pragma once

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>

namespace kvcall::codec {

// User extension point consulted after every built-in rule and before the generic conversion.
// Precedence: per-type built-in rule > hook > generic fallback. Either hook may be left empty.
struct CodecHooks {
    // Returning std::nullopt falls through to the generic string conversion.
    std::function<std::optional<std::string>(const std::any& value)> serialize;

    // The returned std::any must hold exactly the requested type.
    std::function<std::any(std::string_view text, std::type_index type)> deserialize;

    bool empty() const noexcept { return !serialize && !deserialize; }
};

} // namespace kvcall::codec
