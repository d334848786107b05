#include <kvcall/client/notice_sink.h>

namespace kvcall::client {

NoticeSink::SubscriptionId NoticeSink::subscribe(Handler handler) {
    return handlers_.add(std::move(handler));
}

bool NoticeSink::unsubscribe(SubscriptionId id) {
    return handlers_.remove(id);
}

void NoticeSink::clear() {
    handlers_.clear();
}

bool NoticeSink::publish(const NoticeEvent& event) const {
    auto snap = handlers_.snapshot();
    if (!snap || snap->empty())
        return false;
    for (const auto& entry : *snap) {
        if (entry.item)
            entry.item(event);
    }
    return true;
}

} // namespace kvcall::client
