#include <kvcall/client/in_process_adapter.h>
#include <kvcall/codec/value_traits.h>
#include <kvcall/core/exceptions.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace kvcall::client {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string asKey(const ByteVector& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

Reply wrongArity(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return Reply::error("ERR wrong number of arguments for '" + lower + "' command");
}

} // namespace

InProcessAdapter::InProcessAdapter() : InProcessAdapter(Options{}) {}

InProcessAdapter::InProcessAdapter(Options options)
    : options_(std::move(options)),
      databases_(static_cast<std::size_t>(std::max(1, options_.databases))),
      selected_(options_.database) {
    if (selected_ < 0 || selected_ >= static_cast<int>(databases_.size())) {
        throw KvError(ErrorCode::InvalidArgument,
                      fmt::format("database index {} is out of range (0..{})", selected_,
                                  databases_.size() - 1));
    }
}

Reply InProcessAdapter::execute(CommandPacket& cmd) {
    if (disposed())
        throw KvError(ErrorCode::Disposed, "In-process adapter has been disposed");

    cmd.setWriteHost(options_.host);
    auto frame = cmd.toFrame(options_.encoding);
    const std::string name = upper(asKey(frame.front()));
    std::vector<ByteVector> args(std::make_move_iterator(frame.begin() + 1),
                                 std::make_move_iterator(frame.end()));

    std::lock_guard<std::mutex> lk(mutex_);
    return dispatch(name, args);
}

Reply InProcessAdapter::dispatch(const std::string& name, const std::vector<ByteVector>& args) {
    auto& db = databases_[static_cast<std::size_t>(selected_)];

    if (name == "PING") {
        if (args.empty())
            return Reply::status("PONG");
        if (args.size() == 1)
            return Reply::bulk(args[0]);
        return wrongArity(name);
    }
    if (name == "ECHO") {
        if (args.size() != 1)
            return wrongArity(name);
        return Reply::bulk(args[0]);
    }
    if (name == "SET") {
        if (args.size() != 2)
            return args.size() < 2 ? wrongArity(name) : Reply::error("ERR syntax error");
        db[asKey(args[0])] = args[1];
        return Reply::status("OK");
    }
    if (name == "GET") {
        if (args.size() != 1)
            return wrongArity(name);
        auto it = db.find(asKey(args[0]));
        return it == db.end() ? Reply::nil() : Reply::bulk(it->second);
    }
    if (name == "MGET") {
        if (args.empty())
            return wrongArity(name);
        std::vector<Reply> items;
        items.reserve(args.size());
        for (const auto& k : args) {
            auto it = db.find(asKey(k));
            items.push_back(it == db.end() ? Reply::nil() : Reply::bulk(it->second));
        }
        return Reply::array(std::move(items));
    }
    if (name == "DEL" || name == "EXISTS") {
        if (args.empty())
            return wrongArity(name);
        std::int64_t n = 0;
        for (const auto& k : args) {
            if (name == "DEL")
                n += static_cast<std::int64_t>(db.erase(asKey(k)));
            else
                n += db.count(asKey(k)) ? 1 : 0;
        }
        return Reply::integer(n);
    }
    if (name == "INCRBY") {
        if (args.size() != 2)
            return wrongArity(name);
        auto delta = codec::ValueTraits<std::int64_t>::tryParse(asKey(args[1]));
        if (!delta)
            return Reply::error("ERR value is not an integer or out of range");
        std::int64_t current = 0;
        auto it = db.find(asKey(args[0]));
        if (it != db.end()) {
            auto parsed = codec::ValueTraits<std::int64_t>::tryParse(asKey(it->second));
            if (!parsed)
                return Reply::error("ERR value is not an integer or out of range");
            current = *parsed;
        }
        if ((*delta > 0 && current > std::numeric_limits<std::int64_t>::max() - *delta) ||
            (*delta < 0 && current < std::numeric_limits<std::int64_t>::min() - *delta)) {
            return Reply::error("ERR increment or decrement would overflow");
        }
        current += *delta;
        db[asKey(args[0])] = codec::toBytes(std::to_string(current));
        return Reply::integer(current);
    }
    if (name == "SELECT") {
        if (args.size() != 1)
            return wrongArity(name);
        auto index = codec::ValueTraits<int>::tryParse(asKey(args[0]));
        if (!index || *index < 0 || *index >= static_cast<int>(databases_.size()))
            return Reply::error("ERR DB index is out of range");
        selected_ = *index;
        return Reply::status("OK");
    }
    return Reply::error("ERR unknown command '" + name + "'");
}

void InProcessAdapter::dispose() {
    disposeCount_.fetch_add(1, std::memory_order_acq_rel);
    disposed_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& db : databases_)
        db.clear();
    spdlog::debug("in-process adapter '{}' released", options_.host);
}

} // namespace kvcall::client
