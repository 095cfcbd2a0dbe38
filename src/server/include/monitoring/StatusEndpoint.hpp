#pragma once

// [DEVOPS_AGENT] Liveness and Prometheus metrics for the relay
// GET /health answers "ok"; GET /metrics answers the text exposition format

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace Colonnade {
namespace Monitoring {

using Labels = std::map<std::string, std::string>;

// Counter metric - only increases
class Counter {
public:
    Counter(std::string name, std::string help);

    void Increment(const Labels& labels = {});
    void Increment(double value, const Labels& labels = {});

    // Mirror a running total kept elsewhere; never moves backwards
    void SetTotal(double total, const Labels& labels = {});

    double GetValue(const Labels& labels = {}) const;
    std::string Serialize() const;

private:
    std::string name_;
    std::string help_;
    mutable std::mutex mutex_;
    std::map<std::string, double> values_;  // Key is serialized labels
};

// Gauge metric - can go up or down
class Gauge {
public:
    Gauge(std::string name, std::string help);

    void Set(double value, const Labels& labels = {});

    double GetValue(const Labels& labels = {}) const;
    std::string Serialize() const;

private:
    std::string name_;
    std::string help_;
    mutable std::mutex mutex_;
    std::map<std::string, double> values_;
};

// Metric registry plus a one-request-per-connection HTTP listener
class StatusEndpoint {
public:
    StatusEndpoint();
    ~StatusEndpoint();

    StatusEndpoint(const StatusEndpoint&) = delete;
    StatusEndpoint& operator=(const StatusEndpoint&) = delete;

    // Bind and start the accept thread; false if the port is unavailable
    bool Initialize(uint16_t port);
    void Shutdown();
    [[nodiscard]] bool IsRunning() const { return running_; }

    // Receive/send timeout applied to each scrape connection; set before Initialize
    void SetClientTimeout(std::chrono::milliseconds timeout) { clientTimeout_ = timeout; }

    Counter* CreateCounter(const std::string& name, const std::string& help);
    Gauge* CreateGauge(const std::string& name, const std::string& help);

    // Prometheus text for every registered metric, in name order
    std::string SerializeAll() const;

    // Full HTTP response for a raw request
    std::string BuildResponse(std::string_view request) const;

    // Pre-defined relay metrics
    Counter& ConnectionsTotal() { return *connectionsTotal_; }
    Counter& DisconnectionsTotal() { return *disconnectionsTotal_; }
    Counter& MessagesReceivedTotal() { return *messagesReceivedTotal_; }
    Counter& MessagesDroppedTotal() { return *messagesDroppedTotal_; }
    Counter& BroadcastsTotal() { return *broadcastsTotal_; }
    Counter& AttacksTotal() { return *attacksTotal_; }
    Counter& OverflowDisconnectsTotal() { return *overflowDisconnectsTotal_; }
    Counter& TicksTotal() { return *ticksTotal_; }
    Counter& TickOverrunsTotal() { return *tickOverrunsTotal_; }
    Counter& BytesSentTotal() { return *bytesSentTotal_; }
    Counter& BytesReceivedTotal() { return *bytesReceivedTotal_; }

    Gauge& PlayerCount() { return *playerCount_; }
    Gauge& EnemiesAlive() { return *enemiesAlive_; }
    Gauge& TickDurationMs() { return *tickDurationMs_; }
    Gauge& TickDurationMaxMs() { return *tickDurationMaxMs_; }

private:
    void InitDefaultMetrics();
    void HttpServerLoop(int listenSocket);
    void HandleRequest(int clientSocket);

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;

    // HTTP server state
    int serverSocket_ = -1;
    uint16_t port_ = 0;
    std::chrono::milliseconds clientTimeout_{2000};
    std::atomic<bool> running_{false};
    std::thread serverThread_;

    Counter* connectionsTotal_ = nullptr;
    Counter* disconnectionsTotal_ = nullptr;
    Counter* messagesReceivedTotal_ = nullptr;
    Counter* messagesDroppedTotal_ = nullptr;
    Counter* broadcastsTotal_ = nullptr;
    Counter* attacksTotal_ = nullptr;
    Counter* overflowDisconnectsTotal_ = nullptr;
    Counter* ticksTotal_ = nullptr;
    Counter* tickOverrunsTotal_ = nullptr;
    Counter* bytesSentTotal_ = nullptr;
    Counter* bytesReceivedTotal_ = nullptr;

    Gauge* playerCount_ = nullptr;
    Gauge* enemiesAlive_ = nullptr;
    Gauge* tickDurationMs_ = nullptr;
    Gauge* tickDurationMaxMs_ = nullptr;
};

} // namespace Monitoring
} // namespace Colonnade
