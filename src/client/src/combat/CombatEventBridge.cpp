// [COMBAT_AGENT] Client hit detection implementation

#include "combat/CombatEventBridge.hpp"

#include <cmath>
#include <iostream>
#include <limits>

namespace Colonnade {

namespace {

glm::dvec3 torsoPoint(const Protocol::EnemyRecord& enemy) {
    return glm::dvec3(enemy.x, enemy.y + SharedConstants::ENEMY_TORSO_HEIGHT, enemy.z);
}

} // namespace

CombatEventBridge::CombatEventBridge(AttackSink sink, const CombatBridgeConfig& config)
    : sink_(std::move(sink)), config_(config) {}

bool CombatEventBridge::isCoolingDown(uint32_t nowMs) const {
    return lastAttackMs_ && nowMs - *lastAttackMs_ <= config_.cooldownMs;
}

glm::dvec3 CombatEventBridge::swordTip(const glm::dvec3& gripPosition,
                                       const glm::dquat& gripOrientation) {
    const glm::dvec3 tipLocal(
        0.0,
        SharedConstants::SWORD_BLADE_LENGTH + SharedConstants::SWORD_HANDLE_LENGTH +
            SharedConstants::SWORD_GUARD_HEIGHT,
        SharedConstants::SWORD_TIP_OFFSET_Z);
    return gripPosition + gripOrientation * tipLocal;
}

std::optional<std::string> CombatEventBridge::updateTrackedController(
    const glm::dvec3& gripPosition, const glm::dquat& gripOrientation,
    double dtSeconds, uint32_t nowMs) {

    std::optional<glm::dvec3> previous = lastGripPosition_;
    lastGripPosition_ = gripPosition;

    // Need two samples and a usable dt to measure speed
    if (!previous || !std::isfinite(dtSeconds) || dtSeconds <= 0.0) {
        return std::nullopt;
    }

    double speed = glm::length(gripPosition - *previous) / dtSeconds;
    if (!(speed > config_.swingSpeedThreshold) || isCoolingDown(nowMs)) {
        return std::nullopt;
    }

    // A swing starts the cooldown whether or not it connects
    lastAttackMs_ = nowMs;

    glm::dvec3 tip = swordTip(gripPosition, gripOrientation);
    for (const auto& enemy : enemies_) {
        if (!enemy.alive) {
            continue;
        }
        if (glm::distance(tip, torsoPoint(enemy)) < config_.swingHitRadius) {
            emit(enemy.id);
            return enemy.id;
        }
    }
    return std::nullopt;
}

std::optional<std::string> CombatEventBridge::triggerViewAttack(
    const glm::dvec3& eyePosition, const glm::dquat& viewOrientation, uint32_t nowMs) {

    if (isCoolingDown(nowMs)) {
        return std::nullopt;
    }
    lastAttackMs_ = nowMs;

    glm::dvec3 forward = viewOrientation * glm::dvec3(0.0, 0.0, -1.0);

    const Protocol::EnemyRecord* closest = nullptr;
    double closestDistance = std::numeric_limits<double>::infinity();

    for (const auto& enemy : enemies_) {
        if (!enemy.alive) {
            continue;
        }

        glm::dvec3 toEnemy = torsoPoint(enemy) - eyePosition;
        double distance = glm::length(toEnemy);
        if (distance > config_.viewRange || distance <= 0.0) {
            continue;
        }

        double dot = glm::dot(toEnemy / distance, forward);
        if (dot > config_.viewMinDot && distance < closestDistance) {
            closest = &enemy;
            closestDistance = distance;
        }
    }

    if (!closest) {
        return std::nullopt;
    }

    std::string id = closest->id;
    emit(id);
    return id;
}

void CombatEventBridge::emit(const std::string& enemyId) {
    std::cout << "[COMBAT] Hit " << enemyId << std::endl;
    if (sink_) {
        sink_(enemyId);
    }
}

} // namespace Colonnade
