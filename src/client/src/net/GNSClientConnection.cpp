// [CLIENT_AGENT] GameNetworkingSockets client connection

#include "net/GNSClientConnection.hpp"
#include "netcode/NetworkingLibrary.hpp"

#include <steam/steamnetworkingsockets.h>
#include <steam/isteamnetworkingutils.h>

#include <iostream>
#include <mutex>
#include <unordered_map>

namespace Colonnade {

struct GNSClientInternal {
    ISteamNetworkingSockets* interface_{nullptr};
    HSteamNetConnection connection_{k_HSteamNetConnection_Invalid};
    GNSClientConnection* owner_{nullptr};

    static void StaticConnectionCallback(SteamNetConnectionStatusChangedCallback_t* pInfo);
    void onConnectionStatusChanged(SteamNetConnectionStatusChangedCallback_t* pInfo);
};

// GNS status callbacks are plain function pointers; route them by connection
static std::mutex g_clientsMutex;
static std::unordered_map<HSteamNetConnection, GNSClientConnection*> g_clients;

// Runs inside RunCallbacks(), on the thread calling poll()
void GNSClientInternal::StaticConnectionCallback(SteamNetConnectionStatusChangedCallback_t* pInfo) {
    GNSClientConnection* client = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_clientsMutex);
        auto it = g_clients.find(pInfo->m_hConn);
        if (it != g_clients.end()) {
            client = it->second;
        }
    }
    if (client && client->internal_) {
        client->internal_->onConnectionStatusChanged(pInfo);
    }
}

void GNSClientInternal::onConnectionStatusChanged(SteamNetConnectionStatusChangedCallback_t* pInfo) {
    switch (pInfo->m_info.m_eState) {
        case k_ESteamNetworkingConnectionState_Connected:
            owner_->state_ = ConnectionState::Open;
            std::cout << "[NET] Connected to relay" << std::endl;
            break;

        case k_ESteamNetworkingConnectionState_ClosedByPeer:
        case k_ESteamNetworkingConnectionState_ProblemDetectedLocally:
            owner_->state_ = ConnectionState::Closed;
            std::cout << "[NET] Disconnected from relay: " << pInfo->m_info.m_szEndDebug << std::endl;
            break;

        default:
            break;
    }
}

GNSClientConnection::GNSClientConnection()
    : internal_(std::make_unique<GNSClientInternal>()) {
    internal_->owner_ = this;
}

GNSClientConnection::~GNSClientConnection() {
    close();
    if (libraryAcquired_) {
        releaseNetworkingLibrary();
    }
}

bool GNSClientConnection::connect(const std::string& address, uint16_t port) {
    if (state_ != ConnectionState::Closed || internal_->connection_ != k_HSteamNetConnection_Invalid) {
        return false;
    }

    if (!libraryAcquired_) {
        if (!acquireNetworkingLibrary()) {
            return false;
        }
        libraryAcquired_ = true;
    }

    internal_->interface_ = SteamNetworkingSockets();
    if (!internal_->interface_) {
        return false;
    }

    SteamNetworkingIPAddr addr;
    addr.Clear();
    if (!addr.ParseString(address.c_str())) {
        std::string addrWithPort = address + ":" + std::to_string(port);
        if (!addr.ParseString(addrWithPort.c_str())) {
            std::cerr << "[NET] Failed to parse address " << address << std::endl;
            return false;
        }
    }
    if (addr.m_port == 0) {
        addr.m_port = port;
    }

    SteamNetworkingConfigValue_t opt;
    opt.SetPtr(k_ESteamNetworkingConfig_Callback_ConnectionStatusChanged,
               reinterpret_cast<void*>(GNSClientInternal::StaticConnectionCallback));

    internal_->connection_ = internal_->interface_->ConnectByIPAddress(addr, 1, &opt);
    if (internal_->connection_ == k_HSteamNetConnection_Invalid) {
        std::cerr << "[NET] Failed to start connection to " << address << std::endl;
        return false;
    }

    // Status changes are only delivered from RunCallbacks() in poll()
    {
        std::lock_guard<std::mutex> lock(g_clientsMutex);
        g_clients[internal_->connection_] = this;
    }

    state_ = ConnectionState::Connecting;
    return true;
}

bool GNSClientConnection::send(std::string_view payload) {
    if (state_ != ConnectionState::Open) {
        return false;
    }

    EResult result = internal_->interface_->SendMessageToConnection(
        internal_->connection_,
        payload.data(),
        static_cast<uint32_t>(payload.size()),
        k_nSteamNetworkingSend_Reliable,
        nullptr);
    return result == k_EResultOK;
}

std::vector<std::string> GNSClientConnection::poll() {
    std::vector<std::string> received;
    if (!internal_->interface_ || internal_->connection_ == k_HSteamNetConnection_Invalid) {
        return received;
    }

    internal_->interface_->RunCallbacks();

    ISteamNetworkingMessage* msg = nullptr;
    while (internal_->interface_->ReceiveMessagesOnConnection(internal_->connection_, &msg, 1) > 0) {
        received.emplace_back(static_cast<const char*>(msg->m_pData),
                              static_cast<size_t>(msg->m_cbSize));
        msg->Release();
    }

    if (state_ == ConnectionState::Closed) {
        close();
    }
    return received;
}

void GNSClientConnection::close() {
    if (internal_->connection_ != k_HSteamNetConnection_Invalid) {
        {
            std::lock_guard<std::mutex> lock(g_clientsMutex);
            g_clients.erase(internal_->connection_);
        }
        // Linger so queued reliable messages still go out
        internal_->interface_->CloseConnection(internal_->connection_, 0, "Client disconnect", true);
        internal_->connection_ = k_HSteamNetConnection_Invalid;
    }
    state_ = ConnectionState::Closed;
}

} // namespace Colonnade
