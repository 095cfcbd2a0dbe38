#pragma once

#include <string>
#include <string_view>
#include <vector>

// [CLIENT_AGENT] One reliable, ordered message connection to the relay

namespace Colonnade {

enum class ConnectionState {
    Connecting,
    Open,
    Closed     // Terminal; no reconnection
};

class ClientConnection {
public:
    virtual ~ClientConnection() = default;

    [[nodiscard]] virtual ConnectionState getState() const = 0;
    [[nodiscard]] bool isOpen() const { return getState() == ConnectionState::Open; }

    // Queue one message; false unless the connection is open
    virtual bool send(std::string_view payload) = 0;

    // Pump the transport and return messages received since the last call,
    // in arrival order
    virtual std::vector<std::string> poll() = 0;

    virtual void close() = 0;
};

} // namespace Colonnade
