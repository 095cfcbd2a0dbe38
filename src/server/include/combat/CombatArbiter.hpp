#pragma once

#include "ecs/CoreTypes.hpp"
#include <cstdint>
#include <string>

// [COMBAT_AGENT] Server-side arbitration of attack intents
// Clients report hits; the relay decides. Every intent is checked against
// the attacker's cooldown, the enemy's state and the attacker's last
// reported position before any damage is applied.

namespace Colonnade {

class SessionRegistry;
class EnemyDirector;

// [COMBAT_AGENT] Combat configuration
struct CombatConfig {
    int32_t attackDamage = Constants::ATTACK_DAMAGE;
    uint32_t attackCooldownMs = Constants::SERVER_ATTACK_COOLDOWN_MS;
    double validationRange = Constants::ATTACK_VALIDATION_RANGE;  // XZ, world units
};

// [COMBAT_AGENT] Outcome of one attack intent
enum class AttackOutcome : uint8_t {
    Killed,
    Damaged,
    UnknownAttacker,
    UnknownEnemy,
    AlreadyDead,
    Cooldown,
    OutOfRange
};

const char* toString(AttackOutcome outcome);

// Accepted hits change the enemy snapshot
[[nodiscard]] inline bool isHit(AttackOutcome outcome) {
    return outcome == AttackOutcome::Killed || outcome == AttackOutcome::Damaged;
}

class CombatArbiter {
public:
    CombatArbiter(SessionRegistry& sessions, EnemyDirector& enemies,
                  const CombatConfig& config = CombatConfig{});

    // Validate and apply one attack
    AttackOutcome resolveAttack(ConnectionID attacker, const std::string& enemyId,
                                uint32_t currentTimeMs);

    // Apply damage to an enemy; returns true if this hit killed it
    bool applyDamage(EntityID enemy, int32_t damage);

    // Check if the attacker's cooldown has elapsed
    [[nodiscard]] bool canAttack(EntityID attacker, uint32_t currentTimeMs) const;

    const CombatConfig& getConfig() const { return config_; }
    void setConfig(const CombatConfig& config) { config_ = config; }

private:
    SessionRegistry& sessions_;
    EnemyDirector& enemies_;
    CombatConfig config_;
};

} // namespace Colonnade
