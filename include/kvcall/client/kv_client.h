#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <kvcall/client/adapter.h>
#include <kvcall/client/call_pipeline.h>
#include <kvcall/client/command_packet.h>
#include <kvcall/client/interceptor.h>
#include <kvcall/client/notice_sink.h>
#include <kvcall/client/reply.h>
#include <kvcall/codec/value_decoder.h>
#include <kvcall/codec/value_encoder.h>
#include <kvcall/config/client_options.h>

namespace kvcall::client {

/**
 * Client facade. Owns the adapter, the codec hooks and the per-client interceptor and notice
 * lists; every command runs through the CallPipeline.
 *
 * Thread-safe for concurrent calls. dispose() releases the adapter exactly once, whether it is
 * called explicitly (from any number of threads) or by the destructor.
 */
class KvClient {
public:
    KvClient(std::unique_ptr<IAdapter> adapter, config::ClientOptions options = {});
    ~KvClient();

    KvClient(const KvClient&) = delete;
    KvClient& operator=(const KvClient&) = delete;

    void dispose() noexcept;
    bool isDisposed() const noexcept { return disposeCounter_.load(std::memory_order_acquire) > 0; }

    UseType useType() const noexcept { return adapter_->useType(); }
    const std::string& prefix() const noexcept { return pipeline_.prefix(); }
    const config::ClientOptions& options() const noexcept { return options_; }

    NoticeSink& notices() noexcept { return notices_; }
    InterceptorRegistry& interceptors() noexcept { return interceptors_; }

    const codec::ValueEncoder& encoder() const noexcept { return encoder_; }
    const codec::ValueDecoder& decoder() const noexcept { return decoder_; }

    // Raw call; error replies are thrown as ServerError.
    Reply call(CommandPacket& cmd);

    template <typename T> T call(CommandPacket& cmd, std::function<T(const Reply&)> parse) {
        return pipeline_.run<T>(cmd, [&] { return adapterCall<T>(cmd, parse); });
    }

    // Commands
    std::string ping();
    std::string echo(const std::string& message);

    template <typename V> void set(const std::string& key, const V& value) {
        CommandPacket cmd("SET");
        cmd.key(key).arg(encoder_.encode(value));
        (void)call<std::string>(cmd, [](const Reply& r) { return r.text(); });
    }

    template <typename T> T get(const std::string& key) {
        CommandPacket cmd("GET");
        cmd.key(key);
        return call<T>(cmd, [this](const Reply& r) { return decodeReply<T>(r); });
    }

    template <typename T> std::vector<T> mget(const std::vector<std::string>& keys) {
        CommandPacket cmd("MGET");
        cmd.keys(keys);
        return call<std::vector<T>>(cmd, [this](const Reply& r) {
            std::vector<T> out;
            if (!r.isArray())
                return out;
            out.reserve(r.elements().size());
            for (const auto& item : r.elements())
                out.push_back(decodeReply<T>(item));
            return out;
        });
    }

    std::int64_t del(const std::vector<std::string>& keys);
    std::int64_t exists(const std::vector<std::string>& keys);
    std::int64_t incrBy(const std::string& key, std::int64_t increment);

    // Not available in Cluster mode.
    std::string select(int database);

    template <typename T> T decodeReply(const Reply& reply) const {
        auto payload = reply.payload();
        if (!payload)
            return decoder_.decode<T>(std::nullopt, options_.connection.encoding);
        return decoder_.decode<T>(*payload, options_.connection.encoding);
    }

protected:
    void checkUseTypeOrThrow(std::initializer_list<UseType> allowed) const;

private:
    template <typename T> T adapterCall(CommandPacket& cmd, const std::function<T(const Reply&)>& parse) {
        return parse(adapter_->execute(cmd).throwOrValue());
    }

    config::ClientOptions options_;
    std::unique_ptr<IAdapter> adapter_;
    std::shared_ptr<const codec::CodecHooks> hooks_;
    codec::ValueEncoder encoder_;
    codec::ValueDecoder decoder_;
    InterceptorRegistry interceptors_;
    NoticeSink notices_;
    CallPipeline pipeline_;
    std::atomic<int> disposeCounter_{0};
};

} // namespace kvcall::client
