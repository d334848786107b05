#pragma once

#include <string_view>

#include <kvcall/client/command_packet.h>
#include <kvcall/client/reply.h>

namespace kvcall::client {

// Connection mode of the adapter behind a client.
enum class UseType { Pooling, Cluster, Sentinel, SingleInside };

constexpr std::string_view to_string(UseType t) {
    switch (t) {
        case UseType::Pooling:
            return "Pooling";
        case UseType::Cluster:
            return "Cluster";
        case UseType::Sentinel:
            return "Sentinel";
        case UseType::SingleInside:
            return "SingleInside";
    }
    return "Pooling";
}

/**
 * Transport seam. Implementations own pooling, topology and the wire protocol; the client only
 * hands them a prepared command and gets a reply back.
 *
 * execute() sets cmd's write host once a connection is chosen and throws on transport failure.
 * Error replies are returned, not thrown; callers apply Reply::throwOrValue().
 */
class IAdapter {
public:
    virtual ~IAdapter() = default;

    virtual UseType useType() const noexcept = 0;

    virtual Reply execute(CommandPacket& cmd) = 0;

    // Releases connections. Called exactly once by the owning client.
    virtual void dispose() = 0;
};

} // namespace kvcall::client
