// [NETWORK_AGENT] Relay server implementation

#include "relay/RelayServer.hpp"
#include <iostream>
#include <type_traits>
#include <variant>

namespace Colonnade {

RelayServer::RelayServer(MessageSink& sink, const EnemyConfig& enemyConfig,
                         const CombatConfig& combatConfig)
    : sink_(sink)
    , sessions_(registry_)
    , enemies_(registry_, enemyConfig)
    , combat_(sessions_, enemies_, combatConfig) {
    enemies_.spawnAll();
}

RelayServer::RelayServer(MessageSink& sink, const EnemyConfig& enemyConfig,
                         const CombatConfig& combatConfig, uint64_t seed)
    : sink_(sink)
    , sessions_(registry_, seed)
    , enemies_(registry_, enemyConfig, seed ^ 0x9E3779B97F4A7C15ULL)
    , combat_(sessions_, enemies_, combatConfig) {
    enemies_.spawnAll();
}

void RelayServer::onConnect(ConnectionID connectionId) {
    if (sessions_.addActor(connectionId) == entt::null) {
        std::cerr << "[RELAY] Connection " << connectionId << " already has an actor" << std::endl;
        return;
    }
    stats_.connectionsAccepted++;

    const ActorInfo* info = sessions_.getInfo(connectionId);

    Protocol::WelcomeMessage welcome;
    welcome.id = info->actorId;
    welcome.color = info->color;
    welcome.players = sessions_.buildSnapshot();
    welcome.enemies = enemies_.buildSnapshot();
    if (!sink_.send(connectionId, Protocol::serializeServerMessage(welcome))) {
        stats_.sendsRefused++;
    }

    std::cout << "[RELAY] Player " << info->actorId << " joined (connection "
              << connectionId << ", " << sessions_.actorCount() << " online)" << std::endl;

    broadcastState(connectionId);
}

void RelayServer::onMessage(ConnectionID connectionId, std::string_view payload,
                            uint32_t currentTimeMs) {
    stats_.messagesReceived++;

    // Traffic from a connection whose actor is already gone
    if (!sessions_.hasActor(connectionId)) {
        stats_.messagesDropped++;
        return;
    }

    auto message = Protocol::deserializeClientMessage(payload);
    if (!message) {
        stats_.messagesDropped++;
        return;
    }

    std::visit([&](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, Protocol::MoveMessage>) {
            handleMove(connectionId, msg);
        } else if constexpr (std::is_same_v<T, Protocol::AttackMessage>) {
            handleAttack(connectionId, msg, currentTimeMs);
        }
    }, *message);
}

void RelayServer::onDisconnect(ConnectionID connectionId) {
    const ActorInfo* info = sessions_.getInfo(connectionId);
    if (!info) {
        return;
    }
    const std::string actorId = info->actorId;

    sessions_.removeActor(connectionId);
    stats_.disconnections++;

    std::cout << "[RELAY] Player " << actorId << " left ("
              << sessions_.actorCount() << " online)" << std::endl;

    broadcastState();
}

void RelayServer::update(uint32_t currentTimeMs) {
    if (enemies_.update(currentTimeMs, sessions_.actorPositions())) {
        broadcastEnemies();
    }
}

void RelayServer::handleMove(ConnectionID connectionId, const Protocol::MoveMessage& move) {
    if (!sessions_.applyMove(connectionId, move.position, move.rotation)) {
        return;
    }
    broadcastState();
}

void RelayServer::handleAttack(ConnectionID connectionId, const Protocol::AttackMessage& attack,
                               uint32_t currentTimeMs) {
    AttackOutcome outcome = combat_.resolveAttack(connectionId, attack.enemyId, currentTimeMs);
    if (!isHit(outcome)) {
        stats_.attacksRejected++;
        std::cout << "[COMBAT] Attack on " << attack.enemyId << " from connection "
                  << connectionId << " rejected: " << toString(outcome) << std::endl;
        return;
    }

    stats_.attacksAccepted++;
    broadcastEnemies();
}

void RelayServer::broadcastState(ConnectionID except) {
    Protocol::StateMessage state;
    state.players = sessions_.buildSnapshot();
    broadcast(Protocol::serializeServerMessage(state), except);
    stats_.stateBroadcasts++;
}

void RelayServer::broadcastEnemies() {
    Protocol::EnemiesMessage message;
    message.enemies = enemies_.buildSnapshot();
    broadcast(Protocol::serializeServerMessage(message), INVALID_CONNECTION);
    stats_.enemyBroadcasts++;
}

void RelayServer::broadcast(const std::string& payload, ConnectionID except) {
    for (ConnectionID connId : sessions_.connections()) {
        if (connId == except) {
            continue;
        }
        // The transport closes a refused connection on its next poll
        if (!sink_.send(connId, payload)) {
            stats_.sendsRefused++;
        }
    }
}

} // namespace Colonnade
