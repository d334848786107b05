#include <kvcall/client/kv_client.h>
#include <kvcall/core/exceptions.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace kvcall::client {

namespace {

std::unique_ptr<IAdapter> requireAdapter(std::unique_ptr<IAdapter> adapter) {
    if (!adapter)
        throw KvError(ErrorCode::InvalidArgument, "KvClient requires an adapter");
    return adapter;
}

} // namespace

KvClient::KvClient(std::unique_ptr<IAdapter> adapter, config::ClientOptions options)
    : options_(std::move(options)), adapter_(requireAdapter(std::move(adapter))),
      hooks_(std::make_shared<const codec::CodecHooks>(options_.hooks)), encoder_(hooks_),
      decoder_(hooks_), pipeline_(*this, options_.connection.prefix, interceptors_, notices_) {
    spdlog::debug("KvClient created (mode={}, host={}, prefix='{}')", to_string(useType()),
                  options_.connection.host, options_.connection.prefix);
}

KvClient::~KvClient() {
    dispose();
}

void KvClient::dispose() noexcept {
    if (disposeCounter_.fetch_add(1, std::memory_order_acq_rel) != 0)
        return;
    try {
        adapter_->dispose();
        spdlog::debug("KvClient disposed (host={})", options_.connection.host);
    } catch (const std::exception& e) {
        spdlog::warn("KvClient adapter release failed: {}", e.what());
    } catch (...) {
        spdlog::warn("KvClient adapter release failed with a non-standard exception");
    }
}

void KvClient::checkUseTypeOrThrow(std::initializer_list<UseType> allowed) const {
    const auto mode = useType();
    if (std::find(allowed.begin(), allowed.end(), mode) != allowed.end())
        return;
    throw ClientUsageError(fmt::format("Method cannot be used in {} mode.", to_string(mode)));
}

Reply KvClient::call(CommandPacket& cmd) {
    return call<Reply>(cmd, [](const Reply& r) { return r; });
}

std::string KvClient::ping() {
    CommandPacket cmd("PING");
    return call<std::string>(cmd, [this](const Reply& r) { return decodeReply<std::string>(r); });
}

std::string KvClient::echo(const std::string& message) {
    CommandPacket cmd("ECHO");
    cmd.arg(encoder_.encode(message));
    return call<std::string>(cmd, [this](const Reply& r) { return decodeReply<std::string>(r); });
}

std::int64_t KvClient::del(const std::vector<std::string>& keys) {
    CommandPacket cmd("DEL");
    cmd.keys(keys);
    return call<std::int64_t>(cmd, [](const Reply& r) { return r.integer(); });
}

std::int64_t KvClient::exists(const std::vector<std::string>& keys) {
    CommandPacket cmd("EXISTS");
    cmd.keys(keys);
    return call<std::int64_t>(cmd, [](const Reply& r) { return r.integer(); });
}

std::int64_t KvClient::incrBy(const std::string& key, std::int64_t increment) {
    CommandPacket cmd("INCRBY");
    cmd.key(key).arg(encoder_.encode(increment));
    return call<std::int64_t>(cmd, [](const Reply& r) { return r.integer(); });
}

std::string KvClient::select(int database) {
    checkUseTypeOrThrow({UseType::Pooling, UseType::Sentinel, UseType::SingleInside});
    CommandPacket cmd("SELECT");
    cmd.arg(encoder_.encode(database));
    return call<std::string>(cmd, [](const Reply& r) { return r.text(); });
}

} // namespace kvcall::client
