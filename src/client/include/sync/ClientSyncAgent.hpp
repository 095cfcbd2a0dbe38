#pragma once

#include "net/ClientConnection.hpp"
#include "constants/GameConstants.hpp"
#include "protocol/WireProtocol.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// [CLIENT_AGENT] Client side of the relay session
// Throttles outbound pose updates and keeps the latest server snapshots.
// Snapshots are only ever replaced whole, never merged.

namespace Colonnade {

class ClientSyncAgent {
public:
    using PlayersCallback = std::function<void(const std::vector<Protocol::PlayerRecord>&)>;
    using EnemiesCallback = std::function<void(const std::vector<Protocol::EnemyRecord>&)>;

    explicit ClientSyncAgent(ClientConnection& connection,
                             uint32_t syncIntervalMs = SharedConstants::SYNC_INTERVAL_MS);

    // Send the local pose unless one went out inside the throttle window.
    // Returns true if a message was sent.
    bool sendMove(const glm::dvec3& position, const glm::dquat& orientation, uint32_t nowMs);

    // Report a hit; the relay decides whether it counts
    bool sendAttack(const std::string& enemyId);

    // Drain the connection and apply every message received
    void update();

    // Apply one server payload
    void handleMessage(std::string_view payload);

    // Stop for good; the connection is closed too
    void close();

    [[nodiscard]] bool isClosed() const { return closed_; }
    [[nodiscard]] bool hasWelcome() const { return localId_.has_value(); }

    [[nodiscard]] const std::string& localId() const;
    [[nodiscard]] const std::string& localColor() const { return localColor_; }

    [[nodiscard]] const std::vector<Protocol::PlayerRecord>& players() const { return players_; }
    [[nodiscard]] const std::vector<Protocol::EnemyRecord>& enemies() const { return enemies_; }

    // Snapshot entries other than the local actor
    [[nodiscard]] std::vector<Protocol::PlayerRecord> remotePlayers() const;

    void setOnPlayersChanged(PlayersCallback callback) { onPlayersChanged_ = std::move(callback); }
    void setOnEnemiesChanged(EnemiesCallback callback) { onEnemiesChanged_ = std::move(callback); }

    [[nodiscard]] uint64_t getMessagesSkipped() const { return messagesSkipped_; }

private:
    void replacePlayers(std::vector<Protocol::PlayerRecord> players);
    void replaceEnemies(std::vector<Protocol::EnemyRecord> enemies);

private:
    ClientConnection& connection_;
    uint32_t syncIntervalMs_;

    std::optional<std::string> localId_;
    std::string localColor_;
    std::vector<Protocol::PlayerRecord> players_;
    std::vector<Protocol::EnemyRecord> enemies_;

    std::optional<uint32_t> lastMoveSent_;
    bool closed_{false};
    uint64_t messagesSkipped_{0};

    PlayersCallback onPlayersChanged_;
    EnemiesCallback onEnemiesChanged_;
};

} // namespace Colonnade
