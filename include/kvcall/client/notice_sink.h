#pragma once

#include <any>
#include <exception>
#include <functional>
#include <string>
#include <string_view>

#include <kvcall/client/snapshot_list.h>

namespace kvcall::client {

enum class NoticeType { Call, Info };

constexpr std::string_view to_string(NoticeType t) {
    return t == NoticeType::Call ? "call" : "info";
}

struct NoticeEvent {
    NoticeType type{NoticeType::Info};
    std::exception_ptr exception;
    std::string log;
    // Call result for NoticeType::Call events; empty when the call failed.
    std::any tag;
};

/**
 * Observer list for trace events.
 *
 * Dispatch is synchronous, on the publishing thread, in subscription order. Subscribing or
 * unsubscribing while another thread publishes is safe; that publish sees the list as it was
 * when it started.
 */
class NoticeSink {
public:
    using Handler = std::function<void(const NoticeEvent&)>;
    using SubscriptionId = SnapshotList<Handler>::Id;

    SubscriptionId subscribe(Handler handler);
    bool unsubscribe(SubscriptionId id);
    void clear();

    bool hasSubscribers() const noexcept { return !handlers_.empty(); }
    std::size_t subscriberCount() const noexcept { return handlers_.size(); }

    // Returns false when nobody was subscribed.
    bool publish(const NoticeEvent& event) const;

private:
    SnapshotList<Handler> handlers_;
};

} // namespace kvcall::client
