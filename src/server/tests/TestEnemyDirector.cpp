// [WORLD_AGENT] Unit tests for EnemyDirector

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "world/EnemyDirector.hpp"
#include "ecs/CoreTypes.hpp"
#include <cstdint>
#include <cmath>

using namespace Colonnade;
using Catch::Approx;

namespace {

Position& positionOf(Registry& registry, EnemyDirector& director, const std::string& id) {
    return registry.get<Position>(director.findEnemy(id));
}

void kill(Registry& registry, EnemyDirector& director, const std::string& id) {
    auto& combat = registry.get<CombatState>(director.findEnemy(id));
    combat.health = 0;
    combat.isDead = true;
}

} // namespace

TEST_CASE("EnemyDirector spawn", "[enemy]") {
    Registry registry;
    EnemyDirector director(registry, EnemyConfig{}, 5);
    director.spawnAll();

    auto snapshot = director.buildSnapshot();
    REQUIRE(snapshot.size() == 3);

    for (size_t i = 0; i < snapshot.size(); ++i) {
        REQUIRE(snapshot[i].id == "enemy-" + std::to_string(i));
        REQUIRE(snapshot[i].faceIndex == static_cast<int32_t>(i));
        REQUIRE(snapshot[i].alive);
        REQUIRE(snapshot[i].y == 0.0);
        REQUIRE(std::abs(snapshot[i].x) <= 500.0);
        REQUIRE(std::abs(snapshot[i].z) <= 1325.0);
    }

    REQUIRE(registry.view<NPCTag>().size() == 3);
    REQUIRE(director.livingCount() == 3);
}

TEST_CASE("EnemyDirector enemy count is configurable", "[enemy]") {
    Registry registry;
    EnemyConfig config;
    config.enemyCount = 7;
    EnemyDirector director(registry, config, 5);
    director.spawnAll();

    REQUIRE(director.enemyCount() == 7);
    REQUIRE(director.findEnemy("enemy-6") != entt::null);
    REQUIRE(director.findEnemy("enemy-7") == entt::null);
}

TEST_CASE("EnemyDirector pursuit", "[enemy]") {
    Registry registry;
    EnemyDirector director(registry, EnemyConfig{}, 5);
    director.spawnAll();

    positionOf(registry, director, "enemy-0") = Position{100.0, 0.0, 0.0};
    positionOf(registry, director, "enemy-1") = Position{5.0, 0.0, 0.0};
    positionOf(registry, director, "enemy-2") = Position{0.0, 0.0, -200.0};

    std::vector<Position> actors{Position{0.0, 0.9, 0.0}};

    SECTION("Far enemy moves toward the closest actor at full speed") {
        director.step(0.5, 1000, actors);
        const auto& pos = positionOf(registry, director, "enemy-0");
        REQUIRE(pos.x == Approx(98.0));  // 4 u/s * 0.5 s
        REQUIRE(pos.z == Approx(0.0));
    }

    SECTION("Enemy inside stop distance holds position") {
        director.step(0.5, 1000, actors);
        const auto& pos = positionOf(registry, director, "enemy-1");
        REQUIRE(pos.x == 5.0);
        REQUIRE(pos.z == 0.0);
    }

    SECTION("Targets the closest of several actors") {
        actors.push_back(Position{0.0, 0.9, -300.0});
        director.step(1.0, 1000, actors);
        const auto& pos = positionOf(registry, director, "enemy-2");
        REQUIRE(pos.z == Approx(-204.0));
    }

    SECTION("Dead enemies stay put") {
        kill(registry, director, "enemy-0");
        director.step(1.0, 1000, actors);
        REQUIRE(positionOf(registry, director, "enemy-0").x == 100.0);
    }

    SECTION("Non-positive dt is a no-op") {
        director.step(0.0, 1000, actors);
        REQUIRE(positionOf(registry, director, "enemy-0").x == 100.0);
    }
}

TEST_CASE("EnemyDirector wander and bounds", "[enemy]") {
    Registry registry;
    EnemyDirector director(registry, EnemyConfig{}, 9);
    director.spawnAll();

    SECTION("Wanders at half speed with nobody connected") {
        positionOf(registry, director, "enemy-0") = Position{0.0, 0.0, 0.0};
        director.step(1.0, 1000, {});
        const auto& pos = positionOf(registry, director, "enemy-0");
        REQUIRE(std::sqrt(pos.x * pos.x + pos.z * pos.z) == Approx(2.0));
    }

    SECTION("Heading is kept until the turn interval passes") {
        positionOf(registry, director, "enemy-0") = Position{0.0, 0.0, 0.0};
        director.step(1.0, 1000, {});
        const auto& wander = registry.get<WanderState>(director.findEnemy("enemy-0"));
        const double dirX = wander.directionX;
        const double dirZ = wander.directionZ;

        director.step(1.0, 2000, {});
        REQUIRE(wander.directionX == dirX);
        REQUIRE(wander.directionZ == dirZ);
        REQUIRE(wander.lastDirectionChange == 1000u);

        director.step(1.0, 4001, {});
        REQUIRE(wander.lastDirectionChange == 4001u);
    }

    SECTION("Positions are clamped to the hall") {
        positionOf(registry, director, "enemy-0") = Position{499.0, 0.0, 1324.0};
        std::vector<Position> actors{Position{5000.0, 0.9, 5000.0}};
        // Out of detection range, so this is a wander step; push it anyway
        director.step(1000.0, 1000, actors);
        const auto& pos = positionOf(registry, director, "enemy-0");
        REQUIRE(std::abs(pos.x) <= 500.0);
        REQUIRE(std::abs(pos.z) <= 1325.0);
    }
}

TEST_CASE("EnemyDirector update timing", "[enemy]") {
    Registry registry;
    EnemyDirector director(registry, EnemyConfig{}, 3);
    director.spawnAll();
    positionOf(registry, director, "enemy-0") = Position{100.0, 0.0, 0.0};
    std::vector<Position> actors{Position{0.0, 0.9, 0.0}};

    // First call only starts the clock
    REQUIRE_FALSE(director.update(1000, actors));
    REQUIRE(positionOf(registry, director, "enemy-0").x == 100.0);

    REQUIRE_FALSE(director.update(1030, actors));

    // Step uses the real elapsed time since the last step
    REQUIRE(director.update(1100, actors));
    REQUIRE(positionOf(registry, director, "enemy-0").x == Approx(99.6));

    REQUIRE_FALSE(director.update(1120, actors));
    REQUIRE(director.update(1150, actors));
}

TEST_CASE("EnemyDirector respawn", "[enemy]") {
    Registry registry;
    EnemyDirector director(registry, EnemyConfig{}, 3);
    director.spawnAll();
    std::vector<Position> actors;

    kill(registry, director, "enemy-0");
    kill(registry, director, "enemy-1");
    director.onEnemyKilled(1000);
    REQUIRE_FALSE(director.respawnDueAt().has_value());

    kill(registry, director, "enemy-2");
    director.onEnemyKilled(2000);
    REQUIRE(director.allDead());
    REQUIRE(director.respawnDueAt() == 7000u);

    // A second notification does not push the timer back
    director.onEnemyKilled(3000);
    REQUIRE(director.respawnDueAt() == 7000u);

    director.update(2000, actors);
    director.update(6999, actors);
    REQUIRE(director.allDead());

    REQUIRE(director.update(7000, actors));
    REQUIRE(director.livingCount() == 3);
    REQUIRE_FALSE(director.respawnDueAt().has_value());
    REQUIRE(director.findEnemy("enemy-0") != entt::null);
    REQUIRE(registry.view<NPCTag>().size() == 3);
}

TEST_CASE("EnemyDirector respawn across clock wrap", "[enemy]") {
    Registry registry;
    EnemyDirector director(registry, EnemyConfig{}, 3);
    director.spawnAll();
    std::vector<Position> actors;

    const uint32_t killedAt = UINT32_MAX - 1000;
    kill(registry, director, "enemy-0");
    kill(registry, director, "enemy-1");
    kill(registry, director, "enemy-2");
    director.onEnemyKilled(killedAt);
    REQUIRE(director.respawnDueAt() == 3999u);

    // 1001 ms after the kill, past the wrap but before the delay
    director.update(0, actors);
    REQUIRE(director.allDead());
    director.update(3998, actors);
    REQUIRE(director.allDead());

    // 5000 ms after the kill
    REQUIRE(director.update(4000, actors));
    REQUIRE(director.livingCount() == 3);
    REQUIRE_FALSE(director.respawnDueAt().has_value());
}
