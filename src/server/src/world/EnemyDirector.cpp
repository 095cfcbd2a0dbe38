// [WORLD_AGENT] Enemy director implementation

#include "world/EnemyDirector.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace Colonnade {

namespace {
constexpr double TWO_PI = 6.283185307179586;
}

EnemyDirector::EnemyDirector(Registry& registry, const EnemyConfig& config)
    : EnemyDirector(registry, config, std::random_device{}()) {}

EnemyDirector::EnemyDirector(Registry& registry, const EnemyConfig& config, uint64_t seed)
    : registry_(registry), config_(config), rng_(seed) {}

void EnemyDirector::spawnAll() {
    for (EntityID enemy : enemies_) {
        if (registry_.valid(enemy)) {
            registry_.destroy(enemy);
        }
    }
    enemies_.clear();
    killedAt_.reset();

    std::uniform_real_distribution<double> xDist(-config_.limitX, config_.limitX);
    std::uniform_real_distribution<double> zDist(-config_.limitZ, config_.limitZ);

    enemies_.reserve(config_.enemyCount);
    for (uint32_t i = 0; i < config_.enemyCount; ++i) {
        EntityID enemy = registry_.create();

        EnemyInfo info;
        info.enemyId = "enemy-" + std::to_string(i);
        info.faceIndex = static_cast<int32_t>(i);

        registry_.emplace<EnemyInfo>(enemy, std::move(info));
        registry_.emplace<Position>(enemy, xDist(rng_), 0.0, zDist(rng_));
        registry_.emplace<CombatState>(enemy);
        registry_.emplace<WanderState>(enemy);
        registry_.emplace<NPCTag>(enemy);

        enemies_.push_back(enemy);
    }
}

bool EnemyDirector::update(uint32_t currentTimeMs, const std::vector<Position>& actorPositions) {
    bool changed = false;

    if (killedAt_ && currentTimeMs - *killedAt_ >= config_.respawnDelayMs) {
        spawnAll();
        std::cout << "[ENEMY] Enemies respawned" << std::endl;
        changed = true;
    }

    if (!lastStepTime_) {
        lastStepTime_ = currentTimeMs;
        return changed;
    }

    const uint32_t elapsed = currentTimeMs - *lastStepTime_;
    if (elapsed >= config_.updateIntervalMs) {
        step(static_cast<double>(elapsed) / 1000.0, currentTimeMs, actorPositions);
        lastStepTime_ = currentTimeMs;
        changed = true;
    }

    return changed;
}

void EnemyDirector::step(double deltaSeconds, uint32_t currentTimeMs,
                         const std::vector<Position>& actorPositions) {
    if (!(deltaSeconds > 0.0)) {
        return;
    }
    for (EntityID enemy : enemies_) {
        stepEnemy(enemy, deltaSeconds, currentTimeMs, actorPositions);
    }
}

void EnemyDirector::stepEnemy(EntityID enemy, double deltaSeconds, uint32_t currentTimeMs,
                              const std::vector<Position>& actorPositions) {
    const auto& combat = registry_.get<CombatState>(enemy);
    if (combat.isDead) {
        return;
    }

    auto& pos = registry_.get<Position>(enemy);
    auto& wander = registry_.get<WanderState>(enemy);

    // Closest actor inside detection range
    const Position* target = nullptr;
    double closest = std::numeric_limits<double>::infinity();
    for (const auto& actorPos : actorPositions) {
        const double distance = std::sqrt(pos.planarDistanceSqTo(actorPos));
        if (distance < closest && distance < config_.detectionRange) {
            closest = distance;
            target = &actorPos;
        }
    }

    if (target) {
        if (closest > config_.stopDistance) {
            const double dx = target->x - pos.x;
            const double dz = target->z - pos.z;
            const double length = std::sqrt(dx * dx + dz * dz);
            if (length > 0.0) {
                wander.directionX = dx / length;
                wander.directionZ = dz / length;
            }
            pos.x += wander.directionX * config_.speed * deltaSeconds;
            pos.z += wander.directionZ * config_.speed * deltaSeconds;
        }
        // Within stop distance: hold position
    } else {
        if (!wander.lastDirectionChange
            || currentTimeMs - *wander.lastDirectionChange > config_.wanderTurnMs) {
            std::uniform_real_distribution<double> angleDist(0.0, TWO_PI);
            const double angle = angleDist(rng_);
            wander.directionX = std::cos(angle);
            wander.directionZ = std::sin(angle);
            wander.lastDirectionChange = currentTimeMs;
        }
        const double wanderSpeed = config_.speed * config_.wanderSpeedFactor;
        pos.x += wander.directionX * wanderSpeed * deltaSeconds;
        pos.z += wander.directionZ * wanderSpeed * deltaSeconds;
    }

    clampToBounds(pos);
}

void EnemyDirector::clampToBounds(Position& pos) const {
    pos.x = std::clamp(pos.x, -config_.limitX, config_.limitX);
    pos.z = std::clamp(pos.z, -config_.limitZ, config_.limitZ);
}

void EnemyDirector::onEnemyKilled(uint32_t currentTimeMs) {
    if (killedAt_ || !allDead()) {
        return;
    }
    killedAt_ = currentTimeMs;
    std::cout << "[ENEMY] All enemies eliminated, respawning in "
              << config_.respawnDelayMs << "ms" << std::endl;
}

EntityID EnemyDirector::findEnemy(const std::string& enemyId) const {
    for (EntityID enemy : enemies_) {
        if (registry_.get<EnemyInfo>(enemy).enemyId == enemyId) {
            return enemy;
        }
    }
    return entt::null;
}

bool EnemyDirector::allDead() const {
    return livingCount() == 0;
}

size_t EnemyDirector::livingCount() const {
    return static_cast<size_t>(std::count_if(enemies_.begin(), enemies_.end(),
        [this](EntityID enemy) { return !registry_.get<CombatState>(enemy).isDead; }));
}

std::vector<Protocol::EnemyRecord> EnemyDirector::buildSnapshot() const {
    std::vector<Protocol::EnemyRecord> records;
    records.reserve(enemies_.size());

    for (EntityID enemy : enemies_) {
        const auto& info = registry_.get<EnemyInfo>(enemy);
        const auto& pos = registry_.get<Position>(enemy);
        const auto& combat = registry_.get<CombatState>(enemy);

        Protocol::EnemyRecord record;
        record.id = info.enemyId;
        record.x = pos.x;
        record.y = pos.y;
        record.z = pos.z;
        record.alive = !combat.isDead;
        record.faceIndex = info.faceIndex;
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace Colonnade
