#pragma once

#include <any>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>

#include <kvcall/client/command_packet.h>
#include <kvcall/client/snapshot_list.h>

namespace kvcall::client {

class KvClient;

// Passed to IInterceptor::before. Setting a value whose type matches the call's result type
// replaces the call: the command is not sent and that value is returned.
class InterceptorBeforeArgs {
public:
    InterceptorBeforeArgs(KvClient& client, CommandPacket& command)
        : client_(client), command_(command) {}

    KvClient& client() const noexcept { return client_; }
    CommandPacket& command() const noexcept { return command_; }

    const std::any& value() const noexcept { return value_; }
    void setValue(std::any value) {
        value_ = std::move(value);
        valueChanged_ = true;
    }
    bool valueIsChanged() const noexcept { return valueChanged_; }

private:
    KvClient& client_;
    CommandPacket& command_;
    std::any value_;
    bool valueChanged_{false};
};

// Passed to IInterceptor::after. Exactly one of value / exception is meaningful.
struct InterceptorAfterArgs {
    KvClient& client;
    CommandPacket& command;
    std::any value;
    std::exception_ptr exception;
    std::int64_t elapsedMilliseconds{0};
};

// Per-call hook. A fresh instance is created for every call and dropped after after().
class IInterceptor {
public:
    virtual ~IInterceptor() = default;
    virtual void before(InterceptorBeforeArgs& args) = 0;
    virtual void after(const InterceptorAfterArgs& args) = 0;
};

using InterceptorFactory = std::function<std::unique_ptr<IInterceptor>()>;

// Ordered factory list consulted once per call.
class InterceptorRegistry {
public:
    using Id = SnapshotList<InterceptorFactory>::Id;
    using Snapshot = SnapshotList<InterceptorFactory>::Snapshot;

    Id add(InterceptorFactory factory) { return factories_.add(std::move(factory)); }

    template <typename I> Id add() {
        return add([] { return std::make_unique<I>(); });
    }

    bool remove(Id id) { return factories_.remove(id); }
    void clear() { factories_.clear(); }

    bool empty() const noexcept { return factories_.empty(); }
    std::size_t size() const noexcept { return factories_.size(); }

    Snapshot snapshot() const { return factories_.snapshot(); }

private:
    SnapshotList<InterceptorFactory> factories_;
};

} // namespace kvcall::client
