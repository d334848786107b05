#pragma once

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include <kvcall/codec/codec_hooks.h>
#include <kvcall/core/exceptions.h>

namespace kvcall::codec {

/**
 * Maps registered types to nlohmann::json (de)serialization and exposes the mapping as
 * CodecHooks. Types need the usual ADL to_json/from_json (or NLOHMANN_DEFINE_TYPE_* macros).
 *
 * Unregistered types fall through to the generic conversion on encode and raise CodecError on
 * decode. Malformed JSON decodes to the type's default.
 */
class JsonCodecRegistry {
public:
    template <typename T> JsonCodecRegistry& add() {
        Entry entry;
        entry.dump = [](const std::any& value) {
            return nlohmann::json(std::any_cast<const T&>(value)).dump();
        };
        entry.load = [](std::string_view text) -> std::any {
            auto j = nlohmann::json::parse(text, nullptr, false);
            if (j.is_discarded())
                return {};
            try {
                return j.template get<T>();
            } catch (const nlohmann::json::exception&) {
                return {};
            }
        };
        entries_->insert_or_assign(std::type_index(typeid(T)), std::move(entry));
        return *this;
    }

    bool contains(std::type_index type) const { return entries_->count(type) != 0; }

    // Hooks share this registry's table. Register every type before the hooks are in use.
    CodecHooks toHooks() const {
        CodecHooks hooks;
        auto table = entries_;
        hooks.serialize = [table](const std::any& value) -> std::optional<std::string> {
            auto it = table->find(std::type_index(value.type()));
            if (it == table->end())
                return std::nullopt;
            return it->second.dump(value);
        };
        hooks.deserialize = [table](std::string_view text, std::type_index type) -> std::any {
            auto it = table->find(type);
            if (it == table->end())
                throw CodecError(std::string("No JSON codec registered for '") + type.name() + "'");
            return it->second.load(text);
        };
        return hooks;
    }

private:
    struct Entry {
        std::function<std::string(const std::any&)> dump;
        std::function<std::any(std::string_view)> load;
    };

    std::shared_ptr<std::unordered_map<std::type_index, Entry>> entries_ =
        std::make_shared<std::unordered_map<std::type_index, Entry>>();
};

} // namespace kvcall::codec
