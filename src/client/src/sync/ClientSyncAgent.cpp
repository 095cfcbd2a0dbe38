// [CLIENT_AGENT] Client sync agent implementation

#include "sync/ClientSyncAgent.hpp"

#include <iostream>
#include <type_traits>

namespace Colonnade {

ClientSyncAgent::ClientSyncAgent(ClientConnection& connection, uint32_t syncIntervalMs)
    : connection_(connection), syncIntervalMs_(syncIntervalMs) {}

bool ClientSyncAgent::sendMove(const glm::dvec3& position, const glm::dquat& orientation,
                               uint32_t nowMs) {
    if (closed_ || !connection_.isOpen()) {
        return false;
    }

    // Dropped, not queued: the next pose supersedes this one anyway
    if (lastMoveSent_ && nowMs - *lastMoveSent_ < syncIntervalMs_) {
        return false;
    }

    Protocol::MoveMessage move;
    move.position = position;
    move.rotation = orientation;
    if (!connection_.send(Protocol::serializeClientMessage(move))) {
        return false;
    }

    lastMoveSent_ = nowMs;
    return true;
}

bool ClientSyncAgent::sendAttack(const std::string& enemyId) {
    if (closed_ || !connection_.isOpen() || enemyId.empty()) {
        return false;
    }
    return connection_.send(Protocol::serializeClientMessage(Protocol::AttackMessage{enemyId}));
}

void ClientSyncAgent::update() {
    if (closed_) {
        return;
    }

    // Messages that arrived before a close are still applied
    for (const auto& payload : connection_.poll()) {
        handleMessage(payload);
    }

    if (connection_.getState() == ConnectionState::Closed) {
        closed_ = true;
        std::cout << "[SYNC] Connection closed; holding last snapshot ("
                  << players_.size() << " players)" << std::endl;
    }
}

void ClientSyncAgent::handleMessage(std::string_view payload) {
    if (closed_) {
        return;
    }

    auto decoded = Protocol::deserializeServerMessage(payload);
    if (!decoded) {
        ++messagesSkipped_;
        std::cerr << "[SYNC] Skipping unreadable server message (" << payload.size()
                  << " bytes)" << std::endl;
        return;
    }

    std::visit([this](auto&& message) {
        using T = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<T, Protocol::WelcomeMessage>) {
            localId_ = message.id;
            localColor_ = message.color;
            std::cout << "[SYNC] Joined as " << message.id << " (" << message.color << ")" << std::endl;
            if (message.enemies) {
                replaceEnemies(std::move(*message.enemies));
            }
            replacePlayers(std::move(message.players));
        } else if constexpr (std::is_same_v<T, Protocol::StateMessage>) {
            replacePlayers(std::move(message.players));
        } else if constexpr (std::is_same_v<T, Protocol::EnemiesMessage>) {
            replaceEnemies(std::move(message.enemies));
        }
    }, *decoded);
}

void ClientSyncAgent::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    connection_.close();
    std::cout << "[SYNC] Closed by application" << std::endl;
}

const std::string& ClientSyncAgent::localId() const {
    static const std::string empty;
    return localId_ ? *localId_ : empty;
}

std::vector<Protocol::PlayerRecord> ClientSyncAgent::remotePlayers() const {
    std::vector<Protocol::PlayerRecord> remote;
    remote.reserve(players_.size());
    for (const auto& player : players_) {
        if (!localId_ || player.id != *localId_) {
            remote.push_back(player);
        }
    }
    return remote;
}

void ClientSyncAgent::replacePlayers(std::vector<Protocol::PlayerRecord> players) {
    players_ = std::move(players);
    if (onPlayersChanged_) {
        onPlayersChanged_(players_);
    }
}

void ClientSyncAgent::replaceEnemies(std::vector<Protocol::EnemyRecord> enemies) {
    enemies_ = std::move(enemies);
    if (onEnemiesChanged_) {
        onEnemiesChanged_(enemies_);
    }
}

} // namespace Colonnade
