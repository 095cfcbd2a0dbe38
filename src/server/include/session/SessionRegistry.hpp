#pragma once

#include "ecs/CoreTypes.hpp"
#include "protocol/WireProtocol.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// [SESSION_AGENT] In-memory table of connected actors
// One actor per open connection. Identity (id, color) is generated here and
// never changes; pose is replaced only through applyMove().

namespace Colonnade {

class SessionRegistry {
public:
    explicit SessionRegistry(Registry& registry);
    SessionRegistry(Registry& registry, uint64_t seed);

    // Create an actor with the default spawn pose.
    // Returns entt::null if the connection already owns one.
    EntityID addActor(ConnectionID connectionId);

    // Remove the actor owned by the connection; false if there was none
    bool removeActor(ConnectionID connectionId);

    // Replace the supplied fields of the connection's actor.
    // Returns false (and changes nothing) if the actor is gone.
    bool applyMove(ConnectionID connectionId,
                   const std::optional<glm::dvec3>& position,
                   const std::optional<glm::dquat>& rotation);

    [[nodiscard]] EntityID findActor(ConnectionID connectionId) const;
    [[nodiscard]] bool hasActor(ConnectionID connectionId) const;
    [[nodiscard]] const ActorInfo* getInfo(ConnectionID connectionId) const;
    [[nodiscard]] std::optional<Position> getPosition(ConnectionID connectionId) const;

    // Full snapshot in join order
    [[nodiscard]] std::vector<Protocol::PlayerRecord> buildSnapshot() const;

    // Open connections in join order
    [[nodiscard]] const std::vector<ConnectionID>& connections() const { return joinOrder_; }

    [[nodiscard]] size_t actorCount() const { return joinOrder_.size(); }

    // Positions of every actor, for world systems
    [[nodiscard]] std::vector<Position> actorPositions() const;

    [[nodiscard]] Registry& getRegistry() { return registry_; }

private:
    std::string generateActorId();
    std::string generateColor();

private:
    Registry& registry_;
    std::mt19937_64 rng_;

    std::unordered_map<ConnectionID, EntityID> connectionToEntity_;
    std::vector<ConnectionID> joinOrder_;

    // Every id handed out by this process; ids are never reissued
    std::unordered_set<std::string> issuedIds_;
};

} // namespace Colonnade
