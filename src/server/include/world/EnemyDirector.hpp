#pragma once

#include "ecs/CoreTypes.hpp"
#include "protocol/WireProtocol.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

// [WORLD_AGENT] Server-owned hostile NPCs
// Pursues the closest actor, wanders when nobody is connected, and
// re-creates the whole set a fixed delay after the last one dies.

namespace Colonnade {

// [WORLD_AGENT] Enemy tuning
struct EnemyConfig {
    uint32_t enemyCount = Constants::ENEMY_COUNT;
    double speed = Constants::ENEMY_SPEED;                       // units per second
    double wanderSpeedFactor = Constants::ENEMY_WANDER_SPEED_FACTOR;
    uint32_t updateIntervalMs = Constants::ENEMY_UPDATE_INTERVAL_MS;
    double stopDistance = Constants::ENEMY_STOP_DISTANCE;        // hold position inside this
    double detectionRange = Constants::ENEMY_DETECTION_RANGE;
    uint32_t wanderTurnMs = Constants::ENEMY_WANDER_TURN_MS;
    uint32_t respawnDelayMs = Constants::ENEMY_RESPAWN_DELAY_MS;
    double limitX = Constants::ENEMY_LIMIT_X;                    // |x| bound
    double limitZ = Constants::ENEMY_LIMIT_Z;                    // |z| bound
};

class EnemyDirector {
public:
    explicit EnemyDirector(Registry& registry, const EnemyConfig& config = EnemyConfig{});
    EnemyDirector(Registry& registry, const EnemyConfig& config, uint64_t seed);

    // Destroy any existing enemies and create a fresh full-health set
    void spawnAll();

    // Advance timers. Runs a pursuit step every updateIntervalMs and the
    // pending respawn when due. Returns true if the enemy snapshot changed.
    bool update(uint32_t currentTimeMs, const std::vector<Position>& actorPositions);

    // One pursuit/wander step of deltaSeconds for every living enemy
    void step(double deltaSeconds, uint32_t currentTimeMs, const std::vector<Position>& actorPositions);

    // Called after an enemy dies; schedules a respawn once all are dead
    void onEnemyKilled(uint32_t currentTimeMs);

    [[nodiscard]] EntityID findEnemy(const std::string& enemyId) const;
    [[nodiscard]] bool allDead() const;
    [[nodiscard]] size_t livingCount() const;
    [[nodiscard]] size_t enemyCount() const { return enemies_.size(); }
    // Due time modulo 2^32; the timer itself compares elapsed time since the kill
    [[nodiscard]] std::optional<uint32_t> respawnDueAt() const {
        if (!killedAt_) {
            return std::nullopt;
        }
        return *killedAt_ + config_.respawnDelayMs;
    }

    // Snapshot in spawn order
    [[nodiscard]] std::vector<Protocol::EnemyRecord> buildSnapshot() const;

    [[nodiscard]] const EnemyConfig& getConfig() const { return config_; }

private:
    void stepEnemy(EntityID enemy, double deltaSeconds, uint32_t currentTimeMs,
                   const std::vector<Position>& actorPositions);
    void clampToBounds(Position& pos) const;

private:
    Registry& registry_;
    EnemyConfig config_;
    std::mt19937_64 rng_;

    std::vector<EntityID> enemies_;  // Spawn order
    std::optional<uint32_t> lastStepTime_;
    std::optional<uint32_t> killedAt_;  // Time the last enemy died
};

} // namespace Colonnade
