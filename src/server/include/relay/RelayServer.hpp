#pragma once

#include "ecs/CoreTypes.hpp"
#include "combat/CombatArbiter.hpp"
#include "netcode/MessageSink.hpp"
#include "protocol/WireProtocol.hpp"
#include "session/SessionRegistry.hpp"
#include "world/EnemyDirector.hpp"
#include <cstdint>
#include <string>
#include <string_view>

// [NETWORK_AGENT] Authoritative session relay
// Owns the actor and enemy tables. Every accepted change is followed by a
// full snapshot broadcast; nothing is sent between the two.

namespace Colonnade {

// [NETWORK_AGENT] Relay counters, exported on /metrics
struct RelayStats {
    uint64_t connectionsAccepted{0};
    uint64_t disconnections{0};
    uint64_t messagesReceived{0};
    uint64_t messagesDropped{0};     // Undecodable or unrecognized
    uint64_t stateBroadcasts{0};
    uint64_t enemyBroadcasts{0};
    uint64_t attacksAccepted{0};
    uint64_t attacksRejected{0};
    uint64_t sendsRefused{0};
};

class RelayServer {
public:
    explicit RelayServer(MessageSink& sink,
                         const EnemyConfig& enemyConfig = EnemyConfig{},
                         const CombatConfig& combatConfig = CombatConfig{});

    // Deterministic ids, colors and enemy placement
    RelayServer(MessageSink& sink, const EnemyConfig& enemyConfig,
                const CombatConfig& combatConfig, uint64_t seed);

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    // New connection: private welcome, then state to everyone else
    void onConnect(ConnectionID connectionId);

    // One inbound frame from a connection
    void onMessage(ConnectionID connectionId, std::string_view payload, uint32_t currentTimeMs);

    // Closed connection (graceful or not): drop the actor, broadcast state
    void onDisconnect(ConnectionID connectionId);

    // Enemy AI and respawn timers
    void update(uint32_t currentTimeMs);

    [[nodiscard]] const SessionRegistry& getSessions() const { return sessions_; }
    [[nodiscard]] const EnemyDirector& getEnemies() const { return enemies_; }
    [[nodiscard]] const RelayStats& getStats() const { return stats_; }
    [[nodiscard]] size_t getActorCount() const { return sessions_.actorCount(); }

private:
    void handleMove(ConnectionID connectionId, const Protocol::MoveMessage& move);
    void handleAttack(ConnectionID connectionId, const Protocol::AttackMessage& attack,
                      uint32_t currentTimeMs);

    void broadcastState(ConnectionID except = INVALID_CONNECTION);
    void broadcastEnemies();
    void broadcast(const std::string& payload, ConnectionID except);

private:
    MessageSink& sink_;
    Registry registry_;
    SessionRegistry sessions_;
    EnemyDirector enemies_;
    CombatArbiter combat_;
    RelayStats stats_;
};

} // namespace Colonnade
