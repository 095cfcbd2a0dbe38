#pragma once

#include "net/ClientConnection.hpp"
#include <cstdint>
#include <memory>
#include <string>

// [CLIENT_AGENT] GameNetworkingSockets implementation of ClientConnection
// Holds a reference on the shared GNS library for as long as it lives.

namespace Colonnade {

struct GNSClientInternal;

class GNSClientConnection : public ClientConnection {
public:
    GNSClientConnection();
    ~GNSClientConnection() override;

    GNSClientConnection(const GNSClientConnection&) = delete;
    GNSClientConnection& operator=(const GNSClientConnection&) = delete;

    // Start connecting; completion is observed through poll()/getState()
    bool connect(const std::string& address, uint16_t port);

    [[nodiscard]] ConnectionState getState() const override { return state_; }
    bool send(std::string_view payload) override;
    std::vector<std::string> poll() override;
    void close() override;

private:
    friend struct GNSClientInternal;

    std::unique_ptr<GNSClientInternal> internal_;
    ConnectionState state_{ConnectionState::Closed};
    bool libraryAcquired_{false};
};

} // namespace Colonnade
