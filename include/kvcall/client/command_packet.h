#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <kvcall/codec/text_encoding.h>
#include <kvcall/codec/wire_value.h>

namespace kvcall::client {

/**
 * A prepared command: name, optional sub-command and arguments already in wire form.
 *
 * Arguments added with key() are subject to the client's key prefix. The destination host is
 * filled in by the adapter once a connection has been chosen.
 */
class CommandPacket {
public:
    explicit CommandPacket(std::string name, std::string subCommand = {});

    CommandPacket& arg(codec::WireValue value);
    CommandPacket& key(std::string key);
    CommandPacket& keys(const std::vector<std::string>& keys);

    const std::string& name() const noexcept { return name_; }
    const std::string& subCommand() const noexcept { return subCommand_; }
    const std::vector<codec::WireValue>& args() const noexcept { return args_; }
    bool isKey(std::size_t index) const noexcept;

    // Prepends prefix to every key argument. Applied at most once per packet.
    void applyPrefix(std::string_view prefix);
    bool prefixApplied() const noexcept { return prefixApplied_; }

    const std::optional<std::string>& writeHost() const noexcept { return writeHost_; }
    void setWriteHost(std::string host) { writeHost_ = std::move(host); }

    // Wire frame: name, sub-command (if any), then each argument.
    std::vector<ByteVector> toFrame(codec::TextEncoding encoding) const;

    // Human readable rendering, e.g. `SET user:1 alice`. Null arguments render as (nil).
    std::string toString() const;

private:
    std::string name_;
    std::string subCommand_;
    std::vector<codec::WireValue> args_;
    std::vector<bool> keyFlags_;
    bool prefixApplied_{false};
    std::optional<std::string> writeHost_;
};

} // namespace kvcall::client
