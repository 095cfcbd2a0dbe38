// [DEVOPS_AGENT] Status endpoint implementation
// Minimal HTTP/1.1: read one request, answer, close.

#include "monitoring/StatusEndpoint.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <netinet/in.h>
#include <sys/time.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Colonnade {
namespace Monitoring {

namespace {

std::string LabelsToKey(const Labels& labels) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [k, v] : labels) {  // std::map keeps them sorted
        if (!first) oss << ",";
        first = false;
        oss << k << "=\"" << v << "\"";
    }
    return oss.str();
}

void WriteSeries(std::ostringstream& oss, const std::string& name,
                 const std::map<std::string, double>& values, int precision) {
    for (const auto& [key, value] : values) {
        oss << name;
        if (!key.empty()) {
            oss << "{" << key << "}";
        }
        oss << " " << std::fixed << std::setprecision(precision) << value << "\n";
    }
}

std::string MakeResponse(const char* status, const char* contentType, const std::string& body) {
    std::ostringstream response;
    response << "HTTP/1.1 " << status << "\r\n";
    response << "Content-Type: " << contentType << "\r\n";
    response << "Content-Length: " << body.length() << "\r\n";
    response << "Connection: close\r\n";
    response << "\r\n";
    response << body;
    return response.str();
}

} // namespace

// ============================================================================
// Counter Implementation
// ============================================================================

Counter::Counter(std::string name, std::string help)
    : name_(std::move(name)), help_(std::move(help)) {}

void Counter::Increment(const Labels& labels) {
    Increment(1.0, labels);
}

void Counter::Increment(double value, const Labels& labels) {
    if (value < 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    values_[LabelsToKey(labels)] += value;
}

void Counter::SetTotal(double total, const Labels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    double& current = values_[LabelsToKey(labels)];
    current = std::max(current, total);
}

double Counter::GetValue(const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(LabelsToKey(labels));
    return (it != values_.end()) ? it->second : 0.0;
}

std::string Counter::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    oss << "# HELP " << name_ << " " << help_ << "\n";
    oss << "# TYPE " << name_ << " counter\n";
    WriteSeries(oss, name_, values_, 0);
    return oss.str();
}

// ============================================================================
// Gauge Implementation
// ============================================================================

Gauge::Gauge(std::string name, std::string help)
    : name_(std::move(name)), help_(std::move(help)) {}

void Gauge::Set(double value, const Labels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[LabelsToKey(labels)] = value;
}

double Gauge::GetValue(const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(LabelsToKey(labels));
    return (it != values_.end()) ? it->second : 0.0;
}

std::string Gauge::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    oss << "# HELP " << name_ << " " << help_ << "\n";
    oss << "# TYPE " << name_ << " gauge\n";
    WriteSeries(oss, name_, values_, 2);
    return oss.str();
}

// ============================================================================
// StatusEndpoint Implementation
// ============================================================================

StatusEndpoint::StatusEndpoint() {
    InitDefaultMetrics();
}

StatusEndpoint::~StatusEndpoint() {
    Shutdown();
}

bool StatusEndpoint::Initialize(uint16_t port) {
    if (running_) {
        return true;
    }
    port_ = port;

    serverSocket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (serverSocket_ == -1) {
        std::cerr << "[STATUS] Failed to create socket\n";
        return false;
    }

    int opt = 1;
    setsockopt(serverSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port_);

    if (bind(serverSocket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        std::cerr << "[STATUS] Failed to bind port " << port_ << ": " << std::strerror(errno) << "\n";
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    if (listen(serverSocket_, 16) == -1) {
        std::cerr << "[STATUS] Failed to listen on port " << port_ << "\n";
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    running_ = true;
    // The thread gets its own copy of the fd; Shutdown() owns serverSocket_
    serverThread_ = std::thread(&StatusEndpoint::HttpServerLoop, this, serverSocket_);

    std::cout << "[STATUS] Serving /health and /metrics on port " << port_ << "\n";
    return true;
}

void StatusEndpoint::Shutdown() {
    const bool wasRunning = running_.exchange(false);

    if (serverSocket_ != -1) {
        // Wakes the accept() blocked in the server thread
        shutdown(serverSocket_, SHUT_RDWR);
        close(serverSocket_);
        serverSocket_ = -1;
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    if (wasRunning) {
        std::cout << "[STATUS] Status endpoint stopped\n";
    }
}

void StatusEndpoint::InitDefaultMetrics() {
    connectionsTotal_ = CreateCounter("colonnade_connections_total", "Connections accepted by the relay");
    disconnectionsTotal_ = CreateCounter("colonnade_disconnections_total", "Connections closed, clean or abrupt");
    messagesReceivedTotal_ = CreateCounter("colonnade_messages_received_total", "Inbound messages received");
    messagesDroppedTotal_ = CreateCounter("colonnade_messages_dropped_total", "Inbound messages dropped as oversized, malformed or unknown");
    broadcastsTotal_ = CreateCounter("colonnade_broadcasts_total", "Snapshot broadcasts sent");
    attacksTotal_ = CreateCounter("colonnade_attacks_total", "Attack intents by arbitration result");
    overflowDisconnectsTotal_ = CreateCounter("colonnade_overflow_disconnects_total", "Connections closed for exceeding the send buffer");
    ticksTotal_ = CreateCounter("colonnade_ticks_total", "Relay loop iterations");
    tickOverrunsTotal_ = CreateCounter("colonnade_tick_overruns_total", "Relay loop iterations longer than the tick budget");
    bytesSentTotal_ = CreateCounter("colonnade_bytes_sent_total", "Payload bytes queued to clients");
    bytesReceivedTotal_ = CreateCounter("colonnade_bytes_received_total", "Payload bytes received from clients");

    playerCount_ = CreateGauge("colonnade_player_count", "Currently connected players");
    enemiesAlive_ = CreateGauge("colonnade_enemies_alive", "Enemies currently alive");
    tickDurationMs_ = CreateGauge("colonnade_tick_duration_ms", "Last relay loop iteration in milliseconds");
    tickDurationMaxMs_ = CreateGauge("colonnade_tick_duration_max_ms", "Longest relay loop iteration in milliseconds");
}

Counter* StatusEndpoint::CreateCounter(const std::string& name, const std::string& help) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto counter = std::make_unique<Counter>(name, help);
    auto* ptr = counter.get();
    counters_[name] = std::move(counter);
    return ptr;
}

Gauge* StatusEndpoint::CreateGauge(const std::string& name, const std::string& help) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto gauge = std::make_unique<Gauge>(name, help);
    auto* ptr = gauge.get();
    gauges_[name] = std::move(gauge);
    return ptr;
}

std::string StatusEndpoint::SerializeAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [name, counter] : counters_) {
        oss << counter->Serialize() << "\n";
    }
    for (const auto& [name, gauge] : gauges_) {
        oss << gauge->Serialize() << "\n";
    }

    return oss.str();
}

std::string StatusEndpoint::BuildResponse(std::string_view request) const {
    // Request line: METHOD SP PATH SP VERSION
    const size_t lineEnd = request.find("\r\n");
    std::string_view line = request.substr(0, lineEnd);

    const size_t firstSpace = line.find(' ');
    const size_t secondSpace = firstSpace == std::string_view::npos
        ? std::string_view::npos : line.find(' ', firstSpace + 1);

    if (firstSpace == std::string_view::npos || secondSpace == std::string_view::npos) {
        return MakeResponse("400 Bad Request", "text/plain", "bad request\n");
    }

    std::string_view method = line.substr(0, firstSpace);
    std::string_view path = line.substr(firstSpace + 1, secondSpace - firstSpace - 1);

    if (method != "GET") {
        return MakeResponse("405 Method Not Allowed", "text/plain", "method not allowed\n");
    }
    if (path == "/health") {
        return MakeResponse("200 OK", "text/plain", "ok");
    }
    if (path == "/metrics") {
        return MakeResponse("200 OK", "text/plain; version=0.0.4", SerializeAll());
    }
    return MakeResponse("404 Not Found", "text/plain", "not found\n");
}

void StatusEndpoint::HttpServerLoop(int listenSocket) {
    while (running_) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);

        int clientSocket = accept(listenSocket,
            reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);

        if (clientSocket == -1) {
            if (running_) {
                std::cerr << "[STATUS] Accept failed\n";
            }
            continue;
        }

        // A client that connects and stays silent must not stall the loop
        timeval timeout{};
        timeout.tv_sec = static_cast<time_t>(clientTimeout_.count() / 1000);
        timeout.tv_usec = static_cast<suseconds_t>((clientTimeout_.count() % 1000) * 1000);
        setsockopt(clientSocket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(clientSocket, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        HandleRequest(clientSocket);
        close(clientSocket);
    }
}

void StatusEndpoint::HandleRequest(int clientSocket) {
    char buffer[2048];
    ssize_t received = recv(clientSocket, buffer, sizeof(buffer) - 1, 0);
    if (received <= 0) {
        return;
    }

    const std::string response = BuildResponse(std::string_view(buffer, static_cast<size_t>(received)));

    size_t sent = 0;
    while (sent < response.size()) {
        ssize_t n = send(clientSocket, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            break;
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace Monitoring
} // namespace Colonnade
