// [SESSION_AGENT] Session registry implementation

#include "session/SessionRegistry.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <array>
#include <cstdio>

namespace Colonnade {

SessionRegistry::SessionRegistry(Registry& registry)
    : SessionRegistry(registry, std::random_device{}()) {}

SessionRegistry::SessionRegistry(Registry& registry, uint64_t seed)
    : registry_(registry), rng_(seed) {}

EntityID SessionRegistry::addActor(ConnectionID connectionId) {
    if (connectionId == INVALID_CONNECTION || hasActor(connectionId)) {
        return entt::null;
    }

    EntityID entity = registry_.create();

    ActorInfo info;
    info.actorId = generateActorId();
    info.color = generateColor();
    info.connectionId = connectionId;

    registry_.emplace<ActorInfo>(entity, std::move(info));
    registry_.emplace<Position>(entity, Constants::SPAWN_X, Constants::SPAWN_Y, Constants::SPAWN_Z);
    registry_.emplace<Orientation>(entity);
    registry_.emplace<AttackerState>(entity);
    registry_.emplace<PlayerTag>(entity);

    connectionToEntity_[connectionId] = entity;
    joinOrder_.push_back(connectionId);
    return entity;
}

bool SessionRegistry::removeActor(ConnectionID connectionId) {
    auto it = connectionToEntity_.find(connectionId);
    if (it == connectionToEntity_.end()) {
        return false;
    }

    if (registry_.valid(it->second)) {
        registry_.destroy(it->second);
    }
    connectionToEntity_.erase(it);
    joinOrder_.erase(std::remove(joinOrder_.begin(), joinOrder_.end(), connectionId),
                     joinOrder_.end());
    return true;
}

bool SessionRegistry::applyMove(ConnectionID connectionId,
                                const std::optional<glm::dvec3>& position,
                                const std::optional<glm::dquat>& rotation) {
    EntityID entity = findActor(connectionId);
    if (entity == entt::null) {
        return false;
    }

    if (position) {
        registry_.replace<Position>(entity, Position::fromVec3(*position));
    }
    if (rotation) {
        registry_.replace<Orientation>(entity, Orientation::fromQuat(*rotation));
    }
    return true;
}

EntityID SessionRegistry::findActor(ConnectionID connectionId) const {
    auto it = connectionToEntity_.find(connectionId);
    return it != connectionToEntity_.end() ? it->second : entt::null;
}

bool SessionRegistry::hasActor(ConnectionID connectionId) const {
    return connectionToEntity_.find(connectionId) != connectionToEntity_.end();
}

const ActorInfo* SessionRegistry::getInfo(ConnectionID connectionId) const {
    EntityID entity = findActor(connectionId);
    if (entity == entt::null) {
        return nullptr;
    }
    return registry_.try_get<ActorInfo>(entity);
}

std::optional<Position> SessionRegistry::getPosition(ConnectionID connectionId) const {
    EntityID entity = findActor(connectionId);
    if (entity == entt::null) {
        return std::nullopt;
    }
    if (const Position* pos = registry_.try_get<Position>(entity)) {
        return *pos;
    }
    return std::nullopt;
}

std::vector<Protocol::PlayerRecord> SessionRegistry::buildSnapshot() const {
    std::vector<Protocol::PlayerRecord> players;
    players.reserve(joinOrder_.size());

    for (ConnectionID connId : joinOrder_) {
        EntityID entity = connectionToEntity_.at(connId);
        const auto& info = registry_.get<ActorInfo>(entity);
        const auto& pos = registry_.get<Position>(entity);
        const auto& rot = registry_.get<Orientation>(entity);

        Protocol::PlayerRecord record;
        record.id = info.actorId;
        record.color = info.color;
        record.position = pos.toVec3();
        record.rotation = rot.toQuat();
        players.push_back(std::move(record));
    }
    return players;
}

std::vector<Position> SessionRegistry::actorPositions() const {
    std::vector<Position> positions;
    positions.reserve(joinOrder_.size());
    for (ConnectionID connId : joinOrder_) {
        positions.push_back(registry_.get<Position>(connectionToEntity_.at(connId)));
    }
    return positions;
}

// RFC 4122 version 4 text form
std::string SessionRegistry::generateActorId() {
    std::uniform_int_distribution<uint32_t> byteDist(0, 255);

    while (true) {
        std::array<uint8_t, 16> bytes{};
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(byteDist(rng_));
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant 10xx

        char text[37];
        std::snprintf(text, sizeof(text),
            "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
            bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
            bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);

        std::string id(text);
        if (issuedIds_.insert(id).second) {
            return id;
        }
    }
}

std::string SessionRegistry::generateColor() {
    std::uniform_int_distribution<uint32_t> colorDist(0, 0xFFFFFF);
    char text[8];
    std::snprintf(text, sizeof(text), "#%06x", colorDist(rng_));
    return std::string(text);
}

} // namespace Colonnade
