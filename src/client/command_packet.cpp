#include <kvcall/client/command_packet.h>

namespace kvcall::client {

CommandPacket::CommandPacket(std::string name, std::string subCommand)
    : name_(std::move(name)), subCommand_(std::move(subCommand)) {}

CommandPacket& CommandPacket::arg(codec::WireValue value) {
    args_.push_back(std::move(value));
    keyFlags_.push_back(false);
    return *this;
}

CommandPacket& CommandPacket::key(std::string key) {
    args_.emplace_back(std::move(key));
    keyFlags_.push_back(true);
    return *this;
}

CommandPacket& CommandPacket::keys(const std::vector<std::string>& keys) {
    for (const auto& k : keys)
        key(k);
    return *this;
}

bool CommandPacket::isKey(std::size_t index) const noexcept {
    return index < keyFlags_.size() && keyFlags_[index];
}

void CommandPacket::applyPrefix(std::string_view prefix) {
    if (prefixApplied_)
        return;
    prefixApplied_ = true;
    if (prefix.empty())
        return;
    for (std::size_t i = 0; i < args_.size(); ++i) {
        if (!keyFlags_[i])
            continue;
        std::string prefixed(prefix);
        prefixed.append(args_[i].toString());
        args_[i] = codec::WireValue{std::move(prefixed)};
    }
}

std::vector<ByteVector> CommandPacket::toFrame(codec::TextEncoding encoding) const {
    std::vector<ByteVector> frame;
    frame.reserve(args_.size() + 2);
    frame.push_back(codec::encodeText(name_, encoding));
    if (!subCommand_.empty())
        frame.push_back(codec::encodeText(subCommand_, encoding));
    for (const auto& a : args_)
        frame.push_back(a.toBytes(encoding));
    return frame;
}

std::string CommandPacket::toString() const {
    std::string out = name_;
    if (!subCommand_.empty()) {
        out.push_back(' ');
        out.append(subCommand_);
    }
    for (const auto& a : args_) {
        out.push_back(' ');
        out.append(a.isNull() ? "(nil)" : a.toString());
    }
    return out;
}

} // namespace kvcall::client
