#pragma once

#include "ecs/CoreTypes.hpp"
#include "netcode/MessageSink.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// [NETWORK_AGENT] GameNetworkingSockets wrapper
// Owns the listen socket and connection table. All callbacks fire from
// update() on the calling thread, in the order events were observed.

namespace Colonnade {

// Forward declarations for GNS types (to avoid header dependency)
struct GNSInternal;

// [NETWORK_AGENT] Main network manager
class NetworkManager : public MessageSink {
public:
    using ConnectionCallback = std::function<void(ConnectionID)>;
    using MessageCallback = std::function<void(ConnectionID, std::string_view)>;

public:
    NetworkManager();
    ~NetworkManager() override;

    NetworkManager(const NetworkManager&) = delete;
    NetworkManager& operator=(const NetworkManager&) = delete;

    // Initialize on port, return true if success
    bool initialize(uint16_t port = Constants::DEFAULT_SERVER_PORT);

    // Shutdown and cleanup
    void shutdown();

    // Non-blocking pump - call every tick. Closes overflowed connections,
    // runs connection callbacks, then delivers received messages. Messages
    // over MAX_INBOUND_MESSAGE_BYTES are discarded and counted.
    void update();

    // MessageSink
    bool send(ConnectionID connectionId, std::string_view payload) override;

    // Connection management
    void disconnect(ConnectionID connectionId, const char* reason = nullptr);
    [[nodiscard]] bool isConnected(ConnectionID connectionId) const;

    // Callbacks
    void setOnClientConnected(ConnectionCallback callback) { onConnected_ = std::move(callback); }
    void setOnClientDisconnected(ConnectionCallback callback) { onDisconnected_ = std::move(callback); }
    void setOnMessageReceived(MessageCallback callback) { onMessage_ = std::move(callback); }

    // Statistics
    [[nodiscard]] size_t getConnectionCount() const;
    [[nodiscard]] uint64_t getTotalBytesSent() const;
    [[nodiscard]] uint64_t getTotalBytesReceived() const;
    [[nodiscard]] uint64_t getOverflowDisconnects() const { return overflowDisconnects_; }
    [[nodiscard]] uint64_t getOversizedMessages() const { return oversizedMessages_; }

private:
    friend struct GNSInternal;

    // Close connections whose outbound buffer overflowed since last update
    void closeOverflowedConnections();

private:
    std::unique_ptr<GNSInternal> internal_;

    ConnectionCallback onConnected_;
    ConnectionCallback onDisconnected_;
    MessageCallback onMessage_;

    // Connections refused a send; closed at the start of the next update()
    std::vector<ConnectionID> pendingOverflow_;
    uint64_t overflowDisconnects_{0};
    uint64_t oversizedMessages_{0};

    bool initialized_{false};
};

} // namespace Colonnade
