// [COMBAT_AGENT] Combat arbiter implementation

#include "combat/CombatArbiter.hpp"
#include "session/SessionRegistry.hpp"
#include "world/EnemyDirector.hpp"
#include <iostream>

namespace Colonnade {

const char* toString(AttackOutcome outcome) {
    switch (outcome) {
        case AttackOutcome::Killed:          return "killed";
        case AttackOutcome::Damaged:         return "damaged";
        case AttackOutcome::UnknownAttacker: return "unknown attacker";
        case AttackOutcome::UnknownEnemy:    return "unknown enemy";
        case AttackOutcome::AlreadyDead:     return "already dead";
        case AttackOutcome::Cooldown:        return "cooldown";
        case AttackOutcome::OutOfRange:      return "out of range";
    }
    return "unknown";
}

CombatArbiter::CombatArbiter(SessionRegistry& sessions, EnemyDirector& enemies,
                             const CombatConfig& config)
    : sessions_(sessions), enemies_(enemies), config_(config) {}

AttackOutcome CombatArbiter::resolveAttack(ConnectionID attacker, const std::string& enemyId,
                                           uint32_t currentTimeMs) {
    Registry& registry = sessions_.getRegistry();

    EntityID attackerEntity = sessions_.findActor(attacker);
    if (attackerEntity == entt::null) {
        return AttackOutcome::UnknownAttacker;
    }

    if (!canAttack(attackerEntity, currentTimeMs)) {
        return AttackOutcome::Cooldown;
    }

    EntityID enemy = enemies_.findEnemy(enemyId);
    if (enemy == entt::null) {
        return AttackOutcome::UnknownEnemy;
    }

    if (registry.get<CombatState>(enemy).isDead) {
        return AttackOutcome::AlreadyDead;
    }

    const auto& attackerPos = registry.get<Position>(attackerEntity);
    const auto& enemyPos = registry.get<Position>(enemy);
    const double rangeSq = config_.validationRange * config_.validationRange;
    if (attackerPos.planarDistanceSqTo(enemyPos) > rangeSq) {
        return AttackOutcome::OutOfRange;
    }

    // Accepted; the cooldown only restarts on hits that reach this point
    registry.get<AttackerState>(attackerEntity).lastAttackTime = currentTimeMs;

    if (applyDamage(enemy, config_.attackDamage)) {
        if (const ActorInfo* info = sessions_.getInfo(attacker)) {
            std::cout << "[COMBAT] Player " << info->actorId
                      << " eliminated " << enemyId << std::endl;
        }
        enemies_.onEnemyKilled(currentTimeMs);
        return AttackOutcome::Killed;
    }
    return AttackOutcome::Damaged;
}

bool CombatArbiter::applyDamage(EntityID enemy, int32_t damage) {
    Registry& registry = sessions_.getRegistry();
    auto* combat = registry.try_get<CombatState>(enemy);
    if (!combat || combat->isDead) {
        return false;
    }

    combat->health -= damage;
    if (combat->health <= 0) {
        combat->health = 0;
        combat->isDead = true;
        return true;
    }
    return false;
}

bool CombatArbiter::canAttack(EntityID attacker, uint32_t currentTimeMs) const {
    const auto* state = sessions_.getRegistry().try_get<AttackerState>(attacker);
    if (!state || !state->lastAttackTime) {
        return true;
    }
    return currentTimeMs - *state->lastAttackTime >= config_.attackCooldownMs;
}

} // namespace Colonnade
