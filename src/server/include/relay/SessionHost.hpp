#pragma once

#include "ecs/CoreTypes.hpp"
#include "combat/CombatArbiter.hpp"
#include "monitoring/StatusEndpoint.hpp"
#include "netcode/NetworkManager.hpp"
#include "relay/RelayServer.hpp"
#include "world/EnemyDirector.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

// [NETWORK_AGENT] Relay process host
// Single-threaded fixed-rate loop: network events, relay timers, metrics.

namespace Colonnade {

struct RelayConfig {
    uint16_t port{Constants::DEFAULT_SERVER_PORT};
    uint16_t statusPort{Constants::DEFAULT_STATUS_PORT};  // 0 disables the endpoint
    EnemyConfig enemies{};
    CombatConfig combat{};
};

// Exported on /metrics as ticks_total, tick_duration_max_ms, tick_overruns_total
struct TickMetrics {
    uint64_t tickCount{0};
    uint64_t maxTickTimeUs{0};
    uint64_t overruns{0};
};

class SessionHost {
public:
    SessionHost();
    ~SessionHost();

    SessionHost(const SessionHost&) = delete;
    SessionHost& operator=(const SessionHost&) = delete;

    // Bring up transport, relay and status endpoint
    bool initialize(const RelayConfig& config);

    // Run main loop (blocking)
    void run();

    // Request shutdown (can be called from signal handlers)
    void requestShutdown();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool isShutdownRequested() const { return shutdownRequested_; }

    // Single loop iteration (for external loop control)
    void tick();

    // Milliseconds since initialize(), monotonic
    [[nodiscard]] uint32_t getCurrentTimeMs() const;

    [[nodiscard]] const TickMetrics& getTickMetrics() const { return tickMetrics_; }

    // Null until initialize()
    [[nodiscard]] const Monitoring::StatusEndpoint* getStatus() const { return status_.get(); }

private:
    void setupSignalHandlers();
    void publishMetrics();
    void shutdown();

private:
    RelayConfig config_;

    std::unique_ptr<NetworkManager> network_;
    std::unique_ptr<RelayServer> relay_;
    std::unique_ptr<Monitoring::StatusEndpoint> status_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdownRequested_{false};
    bool initialized_{false};

    std::chrono::steady_clock::time_point startTime_;
    TickMetrics tickMetrics_;
};

} // namespace Colonnade
