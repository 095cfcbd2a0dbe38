// [NETWORK_AGENT] GameNetworkingSockets transport for the relay
// Reliable ordered messages only; one text frame per message.

#include "netcode/NetworkManager.hpp"
#include "Constants.hpp"
#include "netcode/NetworkingLibrary.hpp"

#include <steam/steamnetworkingsockets.h>
#include <steam/isteamnetworkingutils.h>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Colonnade {

// ============================================================================
// GNS Internal Structures
// ============================================================================

struct ConnectionState {
    HSteamNetConnection connection{k_HSteamNetConnection_Invalid};
    ConnectionID connectionId{INVALID_CONNECTION};
    std::string ipAddress;
    uint64_t bytesSent{0};
    uint64_t bytesReceived{0};
    bool isActive{false};  // true once the handshake completed
};

struct GNSInternal {
    ISteamNetworkingSockets* interface_{nullptr};
    HSteamListenSocket listenSocket_{k_HSteamListenSocket_Invalid};
    HSteamNetPollGroup pollGroup_{k_HSteamNetPollGroup_Invalid};

    std::unordered_map<ConnectionID, ConnectionState> connections;
    std::unordered_map<HSteamNetConnection, ConnectionID> connToId;
    ConnectionID nextConnectionId_{1};

    uint64_t totalBytesSent_{0};
    uint64_t totalBytesReceived_{0};

    NetworkManager* manager_{nullptr};

    static void SteamNetConnectionStatusChangedCallback(SteamNetConnectionStatusChangedCallback_t* pInfo);

    void onConnectionStatusChanged(SteamNetConnectionStatusChangedCallback_t* pInfo);

    // Drop bookkeeping for a connection; returns its id or INVALID_CONNECTION
    ConnectionID forget(HSteamNetConnection conn);
};

// GNS status callbacks are plain function pointers; route them by listen socket
static std::mutex g_managerMutex;
static std::unordered_map<HSteamListenSocket, NetworkManager*> g_listenSocketToManager;

// ============================================================================
// GNS Callback Implementation
// ============================================================================

// Runs inside RunCallbacks(), on the thread calling update()
void GNSInternal::SteamNetConnectionStatusChangedCallback(SteamNetConnectionStatusChangedCallback_t* pInfo) {
    NetworkManager* manager = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_managerMutex);
        auto it = g_listenSocketToManager.find(pInfo->m_info.m_hListenSocket);
        if (it != g_listenSocketToManager.end()) {
            manager = it->second;
        }
    }

    if (manager && manager->internal_) {
        manager->internal_->onConnectionStatusChanged(pInfo);
    }
}

ConnectionID GNSInternal::forget(HSteamNetConnection conn) {
    auto it = connToId.find(conn);
    if (it == connToId.end()) {
        return INVALID_CONNECTION;
    }

    ConnectionID connId = it->second;
    auto connIt = connections.find(connId);
    if (connIt != connections.end()) {
        totalBytesSent_ += connIt->second.bytesSent;
        totalBytesReceived_ += connIt->second.bytesReceived;
        connections.erase(connIt);
    }
    connToId.erase(it);
    return connId;
}

void GNSInternal::onConnectionStatusChanged(SteamNetConnectionStatusChangedCallback_t* pInfo) {
    switch (pInfo->m_info.m_eState) {
        case k_ESteamNetworkingConnectionState_Connecting: {
            char ipAddrStr[SteamNetworkingIPAddr::k_cchMaxString];
            pInfo->m_info.m_addrRemote.ToString(ipAddrStr, sizeof(ipAddrStr), false);

            if (interface_->AcceptConnection(pInfo->m_hConn) != k_EResultOK) {
                interface_->CloseConnection(pInfo->m_hConn, k_ESteamNetConnectionEnd_App_Generic,
                    "Failed to accept connection", false);
                std::cerr << "[NET] Failed to accept connection from " << ipAddrStr << std::endl;
                break;
            }

            if (!interface_->SetConnectionPollGroup(pInfo->m_hConn, pollGroup_)) {
                interface_->CloseConnection(pInfo->m_hConn, k_ESteamNetConnectionEnd_App_Generic,
                    "Failed to join poll group", false);
                break;
            }

            ConnectionState state;
            state.connection = pInfo->m_hConn;
            state.connectionId = nextConnectionId_++;
            state.ipAddress = ipAddrStr;

            connToId[pInfo->m_hConn] = state.connectionId;
            connections[state.connectionId] = std::move(state);
            break;
        }

        case k_ESteamNetworkingConnectionState_Connected: {
            auto it = connToId.find(pInfo->m_hConn);
            if (it == connToId.end()) {
                break;
            }

            ConnectionID connId = it->second;
            auto& state = connections[connId];
            state.isActive = true;

            std::cout << "[NET] Client connected: " << connId
                      << " from " << state.ipAddress << std::endl;

            if (manager_->onConnected_) {
                manager_->onConnected_(connId);
            }
            break;
        }

        case k_ESteamNetworkingConnectionState_ClosedByPeer:
        case k_ESteamNetworkingConnectionState_ProblemDetectedLocally: {
            const bool wasActive = pInfo->m_eOldState == k_ESteamNetworkingConnectionState_Connected;
            ConnectionID connId = forget(pInfo->m_hConn);

            interface_->CloseConnection(pInfo->m_hConn, 0, nullptr, false);

            if (connId == INVALID_CONNECTION) {
                break;
            }

            std::cout << "[NET] Client disconnected: " << connId
                      << " (" << pInfo->m_info.m_szEndDebug << ")" << std::endl;

            // A connection that never finished its handshake was never announced
            if (wasActive && manager_->onDisconnected_) {
                manager_->onDisconnected_(connId);
            }
            break;
        }

        default:
            break;
    }
}

// ============================================================================
// NetworkManager Implementation
// ============================================================================

NetworkManager::NetworkManager()
    : internal_(std::make_unique<GNSInternal>()) {
    internal_->manager_ = this;
}

NetworkManager::~NetworkManager() {
    shutdown();
}

bool NetworkManager::initialize(uint16_t port) {
    if (initialized_) {
        return true;
    }

    if (!acquireNetworkingLibrary()) {
        return false;
    }

    internal_->interface_ = SteamNetworkingSockets();
    if (!internal_->interface_) {
        releaseNetworkingLibrary();
        return false;
    }

    // Outbound budget per connection; a send past it is refused with
    // k_EResultLimitExceeded and the connection is dropped
    SteamNetworkingUtils()->SetGlobalConfigValueInt32(
        k_ESteamNetworkingConfig_SendBufferSize,
        static_cast<int32_t>(Constants::MAX_SEND_BUFFER_BYTES));

    SteamNetworkingConfigValue_t opts[2];
    opts[0].SetPtr(k_ESteamNetworkingConfig_Callback_ConnectionStatusChanged,
                   reinterpret_cast<void*>(GNSInternal::SteamNetConnectionStatusChangedCallback));
    opts[1].SetInt32(k_ESteamNetworkingConfig_TimeoutInitial,
                     static_cast<int32_t>(Constants::CONNECT_TIMEOUT_MS));

    // Dual-stack bind on all interfaces
    SteamNetworkingIPAddr addr;
    addr.Clear();
    addr.m_port = port;

    internal_->listenSocket_ = internal_->interface_->CreateListenSocketIP(addr, 2, opts);
    if (internal_->listenSocket_ == k_HSteamListenSocket_Invalid) {
        std::cerr << "[NET] Failed to listen on port " << port << std::endl;
        internal_->interface_ = nullptr;
        releaseNetworkingLibrary();
        return false;
    }

    internal_->pollGroup_ = internal_->interface_->CreatePollGroup();
    if (internal_->pollGroup_ == k_HSteamNetPollGroup_Invalid) {
        internal_->interface_->CloseListenSocket(internal_->listenSocket_);
        internal_->listenSocket_ = k_HSteamListenSocket_Invalid;
        internal_->interface_ = nullptr;
        releaseNetworkingLibrary();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(g_managerMutex);
        g_listenSocketToManager[internal_->listenSocket_] = this;
    }

    std::cout << "[NET] Listening on port " << port << std::endl;
    initialized_ = true;
    return true;
}

void NetworkManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (const auto& [id, state] : internal_->connections) {
        internal_->interface_->CloseConnection(state.connection,
            k_ESteamNetConnectionEnd_App_Generic, "Server shutdown", true);
    }
    internal_->connections.clear();
    internal_->connToId.clear();
    pendingOverflow_.clear();

    if (internal_->listenSocket_ != k_HSteamListenSocket_Invalid) {
        {
            std::lock_guard<std::mutex> lock(g_managerMutex);
            g_listenSocketToManager.erase(internal_->listenSocket_);
        }
        internal_->interface_->CloseListenSocket(internal_->listenSocket_);
        internal_->listenSocket_ = k_HSteamListenSocket_Invalid;
    }

    if (internal_->pollGroup_ != k_HSteamNetPollGroup_Invalid) {
        internal_->interface_->DestroyPollGroup(internal_->pollGroup_);
        internal_->pollGroup_ = k_HSteamNetPollGroup_Invalid;
    }

    internal_->interface_ = nullptr;
    releaseNetworkingLibrary();

    initialized_ = false;
}

void NetworkManager::update() {
    if (!initialized_ || !internal_->interface_) {
        return;
    }

    closeOverflowedConnections();

    // Connection status changes
    internal_->interface_->RunCallbacks();

    ISteamNetworkingMessage* msg = nullptr;
    while (initialized_) {
        int numMsgs = internal_->interface_->ReceiveMessagesOnPollGroup(
            internal_->pollGroup_, &msg, 1);
        if (numMsgs <= 0) {
            break;
        }

        ConnectionID connId = INVALID_CONNECTION;
        auto it = internal_->connToId.find(msg->m_conn);
        if (it != internal_->connToId.end()) {
            connId = it->second;
            internal_->connections[connId].bytesReceived += static_cast<uint64_t>(msg->m_cbSize);
        }

        const auto size = static_cast<size_t>(msg->m_cbSize);
        if (connId != INVALID_CONNECTION && size > Constants::MAX_INBOUND_MESSAGE_BYTES) {
            oversizedMessages_++;
            std::cerr << "[NET] Dropped " << size << " byte message from connection "
                      << connId << " (limit " << Constants::MAX_INBOUND_MESSAGE_BYTES << ")" << std::endl;
        } else if (connId != INVALID_CONNECTION && onMessage_) {
            std::string_view payload(static_cast<const char*>(msg->m_pData), size);
            onMessage_(connId, payload);
        }

        msg->Release();
    }
}

bool NetworkManager::send(ConnectionID connectionId, std::string_view payload) {
    if (!initialized_) {
        return false;
    }

    auto it = internal_->connections.find(connectionId);
    if (it == internal_->connections.end() || !it->second.isActive) {
        return false;
    }

    // Already over budget; the close happens on the next update()
    if (std::find(pendingOverflow_.begin(), pendingOverflow_.end(), connectionId)
            != pendingOverflow_.end()) {
        return false;
    }

    EResult result = internal_->interface_->SendMessageToConnection(
        it->second.connection,
        payload.data(),
        static_cast<uint32_t>(payload.size()),
        k_nSteamNetworkingSend_Reliable,
        nullptr);

    if (result == k_EResultLimitExceeded) {
        std::cerr << "[NET] Send buffer full for connection " << connectionId
                  << ", disconnecting" << std::endl;
        pendingOverflow_.push_back(connectionId);
        return false;
    }
    if (result != k_EResultOK) {
        return false;
    }

    it->second.bytesSent += payload.size();
    return true;
}

void NetworkManager::closeOverflowedConnections() {
    if (pendingOverflow_.empty()) {
        return;
    }

    std::vector<ConnectionID> overflowed;
    std::swap(overflowed, pendingOverflow_);
    for (ConnectionID connId : overflowed) {
        if (internal_->connections.count(connId) > 0) {
            overflowDisconnects_++;
            disconnect(connId, "Send buffer overflow");
        }
    }
}

void NetworkManager::disconnect(ConnectionID connectionId, const char* reason) {
    if (!initialized_) {
        return;
    }

    auto it = internal_->connections.find(connectionId);
    if (it == internal_->connections.end()) {
        return;
    }

    HSteamNetConnection conn = it->second.connection;
    const bool wasActive = it->second.isActive;
    internal_->forget(conn);

    internal_->interface_->CloseConnection(conn,
        k_ESteamNetConnectionEnd_App_Generic,
        reason ? reason : "Server disconnected",
        false);

    std::cout << "[NET] Closed connection " << connectionId
              << " (" << (reason ? reason : "server") << ")" << std::endl;

    if (wasActive && onDisconnected_) {
        onDisconnected_(connectionId);
    }
}

bool NetworkManager::isConnected(ConnectionID connectionId) const {
    auto it = internal_->connections.find(connectionId);
    return it != internal_->connections.end() && it->second.isActive;
}

size_t NetworkManager::getConnectionCount() const {
    return static_cast<size_t>(std::count_if(
        internal_->connections.begin(), internal_->connections.end(),
        [](const auto& entry) { return entry.second.isActive; }));
}

uint64_t NetworkManager::getTotalBytesSent() const {
    uint64_t total = internal_->totalBytesSent_;
    for (const auto& [id, state] : internal_->connections) {
        total += state.bytesSent;
    }
    return total;
}

uint64_t NetworkManager::getTotalBytesReceived() const {
    uint64_t total = internal_->totalBytesReceived_;
    for (const auto& [id, state] : internal_->connections) {
        total += state.bytesReceived;
    }
    return total;
}

} // namespace Colonnade
