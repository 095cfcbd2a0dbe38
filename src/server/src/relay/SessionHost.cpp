// [NETWORK_AGENT] Relay process host implementation

#include "relay/SessionHost.hpp"
#include <algorithm>
#include <csignal>
#include <iostream>
#include <thread>

namespace Colonnade {

// Global pointer for signal handler access
static SessionHost* g_sessionHostInstance = nullptr;

SessionHost::SessionHost() = default;

SessionHost::~SessionHost() {
    if (initialized_) {
        shutdown();
    }
    if (g_sessionHostInstance == this) {
        g_sessionHostInstance = nullptr;
    }
}

bool SessionHost::initialize(const RelayConfig& config) {
    config_ = config;

    std::cout << "[RELAY] Initializing Colonnade relay v" << Constants::VERSION << std::endl;

    network_ = std::make_unique<NetworkManager>();
    if (!network_->initialize(config_.port)) {
        std::cerr << "[RELAY] Failed to initialize network on port " << config_.port << std::endl;
        return false;
    }

    relay_ = std::make_unique<RelayServer>(*network_, config_.enemies, config_.combat);

    startTime_ = std::chrono::steady_clock::now();

    network_->setOnClientConnected([this](ConnectionID connId) {
        relay_->onConnect(connId);
    });
    network_->setOnClientDisconnected([this](ConnectionID connId) {
        relay_->onDisconnect(connId);
    });
    network_->setOnMessageReceived([this](ConnectionID connId, std::string_view payload) {
        relay_->onMessage(connId, payload, getCurrentTimeMs());
    });

    status_ = std::make_unique<Monitoring::StatusEndpoint>();
    if (config_.statusPort != 0 && !status_->Initialize(config_.statusPort)) {
        // Non-fatal: the relay runs without /health and /metrics
        std::cerr << "[RELAY] Warning: status endpoint unavailable" << std::endl;
    }

    std::cout << "[RELAY] " << relay_->getEnemies().enemyCount() << " enemies spawned, "
              << "attack range " << config_.combat.validationRange << std::endl;

    initialized_ = true;
    return true;
}

void SessionHost::run() {
    if (!initialized_) {
        return;
    }

    setupSignalHandlers();
    running_ = true;
    shutdownRequested_ = false;

    const auto tickInterval = Constants::TICK_INTERVAL;

    std::cout << "[RELAY] Running at " << Constants::TICK_RATE_HZ << "Hz on port "
              << config_.port << std::endl;

    while (running_) {
        auto frameStart = std::chrono::steady_clock::now();

        tick();

        auto frameEnd = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(frameEnd - frameStart);

        const auto elapsedUs = static_cast<uint64_t>(elapsed.count());
        tickMetrics_.maxTickTimeUs = std::max(tickMetrics_.maxTickTimeUs, elapsedUs);

        if (elapsed < tickInterval) {
            std::this_thread::sleep_for(tickInterval - elapsed);
        } else if (elapsed > tickInterval * 2) {
            tickMetrics_.overruns++;
            // Only log every 60 ticks to avoid spam
            if (tickMetrics_.tickCount % 60 == 0) {
                std::cerr << "[RELAY] Tick overrun: " << elapsed.count()
                          << " us (budget: " << tickInterval.count() << " us)" << std::endl;
            }
        }

        if (status_) {
            status_->TickDurationMs().Set(static_cast<double>(elapsedUs) / 1000.0);
        }
    }

    if (shutdownRequested_) {
        std::cout << "[RELAY] Shutdown requested" << std::endl;
    }
    std::cout << "[RELAY] Main loop ended after " << tickMetrics_.tickCount << " ticks" << std::endl;
    shutdown();
}

void SessionHost::tick() {
    // Connects, disconnects and messages, in arrival order
    network_->update();

    relay_->update(getCurrentTimeMs());

    tickMetrics_.tickCount++;
    publishMetrics();
}

void SessionHost::publishMetrics() {
    if (!status_) {
        return;
    }

    const RelayStats& stats = relay_->getStats();
    status_->ConnectionsTotal().SetTotal(static_cast<double>(stats.connectionsAccepted));
    status_->DisconnectionsTotal().SetTotal(static_cast<double>(stats.disconnections));
    // Oversized messages never reach the relay; the transport counts them
    const auto oversized = network_->getOversizedMessages();
    status_->MessagesReceivedTotal().SetTotal(static_cast<double>(stats.messagesReceived + oversized));
    status_->MessagesDroppedTotal().SetTotal(static_cast<double>(stats.messagesDropped + oversized));
    status_->BroadcastsTotal().SetTotal(static_cast<double>(stats.stateBroadcasts), {{"kind", "state"}});
    status_->BroadcastsTotal().SetTotal(static_cast<double>(stats.enemyBroadcasts), {{"kind", "enemies"}});
    status_->AttacksTotal().SetTotal(static_cast<double>(stats.attacksAccepted), {{"result", "accepted"}});
    status_->AttacksTotal().SetTotal(static_cast<double>(stats.attacksRejected), {{"result", "rejected"}});
    status_->OverflowDisconnectsTotal().SetTotal(static_cast<double>(network_->getOverflowDisconnects()));
    status_->TicksTotal().SetTotal(static_cast<double>(tickMetrics_.tickCount));
    status_->TickOverrunsTotal().SetTotal(static_cast<double>(tickMetrics_.overruns));
    status_->TickDurationMaxMs().Set(static_cast<double>(tickMetrics_.maxTickTimeUs) / 1000.0);

    status_->BytesSentTotal().SetTotal(static_cast<double>(network_->getTotalBytesSent()));
    status_->BytesReceivedTotal().SetTotal(static_cast<double>(network_->getTotalBytesReceived()));

    status_->PlayerCount().Set(static_cast<double>(relay_->getActorCount()));
    status_->EnemiesAlive().Set(static_cast<double>(relay_->getEnemies().livingCount()));
}

void SessionHost::setupSignalHandlers() {
    g_sessionHostInstance = this;

    struct sigaction sa{};
    sa.sa_handler = [](int) {
        if (g_sessionHostInstance) {
            g_sessionHostInstance->requestShutdown();
        }
    };
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void SessionHost::requestShutdown() {
    // Async-signal-safe: atomics only
    shutdownRequested_ = true;
    running_ = false;
}

void SessionHost::shutdown() {
    if (!initialized_) {
        return;
    }
    std::cout << "[RELAY] Shutting down..." << std::endl;

    if (status_) {
        status_->Shutdown();
    }

    // Close connections before the relay they report into goes away
    if (network_) {
        network_->setOnClientDisconnected(nullptr);
        network_->shutdown();
    }

    initialized_ = false;
    std::cout << "[RELAY] Shutdown complete" << std::endl;
}

uint32_t SessionHost::getCurrentTimeMs() const {
    auto now = std::chrono::steady_clock::now();
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_).count()
    );
}

} // namespace Colonnade
