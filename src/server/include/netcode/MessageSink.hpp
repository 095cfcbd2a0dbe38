#pragma once

#include "ecs/CoreTypes.hpp"
#include <string_view>

// [NETWORK_AGENT] Outbound side of the transport as seen by the relay
// Sends are fire-and-forget; a refused send is handled by the transport.

namespace Colonnade {

class MessageSink {
public:
    virtual ~MessageSink() = default;

    // Queue one reliable, ordered message. Returns false if the connection
    // is unknown, closed, or over its outbound budget.
    virtual bool send(ConnectionID connectionId, std::string_view payload) = 0;
};

} // namespace Colonnade
