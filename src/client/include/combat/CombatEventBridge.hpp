#pragma once

#include "constants/GameConstants.hpp"
#include "protocol/WireProtocol.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// [COMBAT_AGENT] Client hit detection
// Turns local input into attack intents against the current enemy snapshot.
// Two detection methods, one cooldown: at most one attack per interval.
// The relay arbitrates; a reported hit is only a request.

namespace Colonnade {

struct CombatBridgeConfig {
    uint32_t cooldownMs{SharedConstants::ATTACK_COOLDOWN_MS};
    double swingSpeedThreshold{SharedConstants::SWING_SPEED_THRESHOLD};
    double swingHitRadius{SharedConstants::SWING_HIT_RADIUS};
    double viewRange{SharedConstants::ATTACK_RANGE};
    double viewMinDot{SharedConstants::ATTACK_CONE_MIN_DOT};
};

class CombatEventBridge {
public:
    using AttackSink = std::function<void(const std::string& enemyId)>;

    explicit CombatEventBridge(AttackSink sink, const CombatBridgeConfig& config = {});

    void setEnemies(std::vector<Protocol::EnemyRecord> enemies) { enemies_ = std::move(enemies); }
    [[nodiscard]] const std::vector<Protocol::EnemyRecord>& getEnemies() const { return enemies_; }

    // Feed one tracked-controller sample. A fast enough grip movement is a
    // swing; returns the enemy hit by the blade tip, if any.
    std::optional<std::string> updateTrackedController(const glm::dvec3& gripPosition,
                                                       const glm::dquat& gripOrientation,
                                                       double dtSeconds, uint32_t nowMs);

    // Attack along the view direction; returns the closest enemy in the cone
    std::optional<std::string> triggerViewAttack(const glm::dvec3& eyePosition,
                                                 const glm::dquat& viewOrientation,
                                                 uint32_t nowMs);

    [[nodiscard]] bool isCoolingDown(uint32_t nowMs) const;

    // Blade tip in world space for a grip pose
    [[nodiscard]] static glm::dvec3 swordTip(const glm::dvec3& gripPosition,
                                             const glm::dquat& gripOrientation);

private:
    void emit(const std::string& enemyId);

private:
    AttackSink sink_;
    CombatBridgeConfig config_;
    std::vector<Protocol::EnemyRecord> enemies_;

    std::optional<glm::dvec3> lastGripPosition_;
    std::optional<uint32_t> lastAttackMs_;
};

} // namespace Colonnade
