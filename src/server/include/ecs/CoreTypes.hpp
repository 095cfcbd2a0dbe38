#pragma once

#include "Constants.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

// [SESSION_AGENT] Core ECS types and components
// Components are plain data; systems own the behaviour

namespace Colonnade {

using EntityID = entt::entity;
using Registry = entt::registry;
using ConnectionID = uint32_t;  // Network connection handle

static constexpr ConnectionID INVALID_CONNECTION = 0;

// ============================================================================
// TRANSFORM COMPONENTS
// ============================================================================

// [SESSION_AGENT] World-space position, kept in doubles so wire values
// come back out exactly as they went in
struct Position {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    [[nodiscard]] glm::dvec3 toVec3() const {
        return glm::dvec3(x, y, z);
    }

    static Position fromVec3(const glm::dvec3& v) {
        return Position{v.x, v.y, v.z};
    }

    // Horizontal distance squared (XZ plane)
    [[nodiscard]] double planarDistanceSqTo(const Position& other) const {
        const double dx = x - other.x;
        const double dz = z - other.z;
        return dx * dx + dz * dz;
    }
};

// [SESSION_AGENT] Orientation quaternion as received; never renormalized
struct Orientation {
    double x{0.0};
    double y{0.0};
    double z{0.0};
    double w{1.0};

    [[nodiscard]] glm::dquat toQuat() const {
        return glm::dquat(w, x, y, z);
    }

    static Orientation fromQuat(const glm::dquat& q) {
        return Orientation{q.x, q.y, q.z, q.w};
    }
};

// ============================================================================
// ACTOR COMPONENTS
// ============================================================================

// [SESSION_AGENT] Identity of a connected participant
struct ActorInfo {
    std::string actorId;       // Opaque id sent on the wire
    std::string color;         // "#rrggbb", fixed for the session
    ConnectionID connectionId{INVALID_CONNECTION};
};

// [COMBAT_AGENT] Per-attacker arbitration state
struct AttackerState {
    std::optional<uint32_t> lastAttackTime;
};

// ============================================================================
// ENEMY COMPONENTS
// ============================================================================

// [WORLD_AGENT] Identity and cosmetics of a hostile entity
struct EnemyInfo {
    std::string enemyId;
    int32_t faceIndex{0};
};

// [COMBAT_AGENT] Health of a hostile entity
struct CombatState {
    int32_t health{Constants::ENEMY_MAX_HEALTH};
    int32_t maxHealth{Constants::ENEMY_MAX_HEALTH};
    bool isDead{false};
};

// [WORLD_AGENT] Heading used by pursuit and wandering
struct WanderState {
    double directionX{0.0};
    double directionZ{0.0};
    std::optional<uint32_t> lastDirectionChange;
};

// ============================================================================
// ENTITY TAGS (empty types for tagging)
// ============================================================================

struct PlayerTag {};      // Entity is a connected actor
struct NPCTag {};         // Entity is a hostile NPC

} // namespace Colonnade
