#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <kvcall/client/adapter.h>
#include <kvcall/codec/text_encoding.h>

namespace kvcall::client {

/**
 * Loopback adapter that executes commands against an in-memory keyspace.
 *
 * Supports PING, ECHO, SET, GET, MGET, DEL, EXISTS, INCRBY and SELECT. Useful for embedding and
 * for exercising the client without a server.
 */
class InProcessAdapter final : public IAdapter {
public:
    struct Options {
        std::string host{"in-process"};
        UseType useType{UseType::SingleInside};
        codec::TextEncoding encoding{codec::TextEncoding::Utf8};
        int databases{16};
        // Initially selected database; must be below `databases`.
        int database{0};
    };

    InProcessAdapter();
    // Throws KvError(InvalidArgument) when options.database is out of range.
    explicit InProcessAdapter(Options options);

    UseType useType() const noexcept override { return options_.useType; }

    Reply execute(CommandPacket& cmd) override;

    void dispose() override;

    bool disposed() const noexcept { return disposed_.load(std::memory_order_acquire); }
    int disposeCount() const noexcept { return disposeCount_.load(std::memory_order_acquire); }

private:
    using Keyspace = std::unordered_map<std::string, ByteVector>;

    Reply dispatch(const std::string& name, const std::vector<ByteVector>& args);

    Options options_;
    std::mutex mutex_;
    std::vector<Keyspace> databases_;
    int selected_{0};
    std::atomic<bool> disposed_{false};
    std::atomic<int> disposeCount_{0};
};

} // namespace kvcall::client
