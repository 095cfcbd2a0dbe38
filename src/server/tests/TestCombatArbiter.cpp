// [COMBAT_AGENT] Unit tests for CombatArbiter

#include <catch2/catch_test_macros.hpp>
#include "combat/CombatArbiter.hpp"
#include "session/SessionRegistry.hpp"
#include "world/EnemyDirector.hpp"
#include "ecs/CoreTypes.hpp"
#include <entt/entt.hpp>

using namespace Colonnade;

namespace {

// One actor on connection 1 at the spawn point, enemies placed by hand
struct ArenaFixture {
    Registry registry;
    SessionRegistry sessions{registry, 11};
    EnemyDirector enemies{registry, EnemyConfig{}, 11};
    CombatArbiter combat{sessions, enemies};

    ArenaFixture() {
        enemies.spawnAll();
        sessions.addActor(1);
        placeEnemy("enemy-0", 2.0, 0.0);
        placeEnemy("enemy-1", 0.0, 4.0);
        placeEnemy("enemy-2", 100.0, 100.0);
    }

    void placeEnemy(const std::string& id, double x, double z) {
        EntityID enemy = enemies.findEnemy(id);
        registry.replace<Position>(enemy, Position{x, 0.0, z});
    }

    bool isDead(const std::string& id) {
        return registry.get<CombatState>(enemies.findEnemy(id)).isDead;
    }
};

} // namespace

TEST_CASE("CombatArbiter configuration defaults", "[combat]") {
    CombatConfig config;
    REQUIRE(config.attackDamage == 100);
    REQUIRE(config.attackCooldownMs == 250);
    REQUIRE(config.validationRange == 6.0);
}

TEST_CASE_METHOD(ArenaFixture, "CombatArbiter accepts a valid hit", "[combat]") {
    REQUIRE(combat.resolveAttack(1, "enemy-0", 1000) == AttackOutcome::Killed);
    REQUIRE(isDead("enemy-0"));
    REQUIRE_FALSE(isDead("enemy-1"));

    auto snapshot = enemies.buildSnapshot();
    REQUIRE(snapshot[0].id == "enemy-0");
    REQUIRE_FALSE(snapshot[0].alive);
}

TEST_CASE_METHOD(ArenaFixture, "CombatArbiter rejections", "[combat]") {
    SECTION("Unknown attacker") {
        REQUIRE(combat.resolveAttack(99, "enemy-0", 1000) == AttackOutcome::UnknownAttacker);
        REQUIRE_FALSE(isDead("enemy-0"));
    }

    SECTION("Unknown enemy") {
        REQUIRE(combat.resolveAttack(1, "enemy-42", 1000) == AttackOutcome::UnknownEnemy);
    }

    SECTION("Already dead") {
        REQUIRE(combat.resolveAttack(1, "enemy-0", 1000) == AttackOutcome::Killed);
        REQUIRE(combat.resolveAttack(1, "enemy-0", 2000) == AttackOutcome::AlreadyDead);
    }

    SECTION("Out of range on the XZ plane") {
        REQUIRE(combat.resolveAttack(1, "enemy-2", 1000) == AttackOutcome::OutOfRange);
        REQUIRE_FALSE(isDead("enemy-2"));
    }

    SECTION("Height does not count toward range") {
        sessions.applyMove(1, glm::dvec3(0.0, 50.0, 0.0), std::nullopt);
        REQUIRE(combat.resolveAttack(1, "enemy-0", 1000) == AttackOutcome::Killed);
    }

    SECTION("Range is measured from the last reported position") {
        sessions.applyMove(1, glm::dvec3(99.0, 0.9, 99.0), std::nullopt);
        REQUIRE(combat.resolveAttack(1, "enemy-2", 1000) == AttackOutcome::Killed);
        REQUIRE(combat.resolveAttack(1, "enemy-0", 2000) == AttackOutcome::OutOfRange);
    }
}

TEST_CASE_METHOD(ArenaFixture, "CombatArbiter cooldown", "[combat]") {
    REQUIRE(combat.resolveAttack(1, "enemy-0", 1000) == AttackOutcome::Killed);

    SECTION("Second hit inside the window is refused") {
        REQUIRE(combat.resolveAttack(1, "enemy-1", 1100) == AttackOutcome::Cooldown);
        REQUIRE_FALSE(isDead("enemy-1"));
    }

    SECTION("Hit after the window is accepted") {
        REQUIRE(combat.resolveAttack(1, "enemy-1", 1250) == AttackOutcome::Killed);
    }

    SECTION("Rejected intents do not restart the window") {
        REQUIRE(combat.resolveAttack(1, "enemy-2", 1300) == AttackOutcome::OutOfRange);
        REQUIRE(combat.resolveAttack(1, "enemy-1", 1300) == AttackOutcome::Killed);
    }

    SECTION("Cooldown is per attacker") {
        sessions.addActor(2);
        REQUIRE(combat.resolveAttack(2, "enemy-1", 1010) == AttackOutcome::Killed);
    }
}

TEST_CASE_METHOD(ArenaFixture, "CombatArbiter partial damage", "[combat]") {
    CombatConfig config;
    config.attackDamage = 40;
    combat.setConfig(config);

    REQUIRE(combat.resolveAttack(1, "enemy-0", 1000) == AttackOutcome::Damaged);
    REQUIRE(combat.resolveAttack(1, "enemy-0", 2000) == AttackOutcome::Damaged);
    REQUIRE(registry.get<CombatState>(enemies.findEnemy("enemy-0")).health == 20);
    REQUIRE(combat.resolveAttack(1, "enemy-0", 3000) == AttackOutcome::Killed);
    REQUIRE(registry.get<CombatState>(enemies.findEnemy("enemy-0")).health == 0);
}

TEST_CASE_METHOD(ArenaFixture, "CombatArbiter schedules respawn after the last kill", "[combat]") {
    placeEnemy("enemy-2", -3.0, 0.0);

    combat.resolveAttack(1, "enemy-0", 1000);
    combat.resolveAttack(1, "enemy-1", 2000);
    REQUIRE_FALSE(enemies.respawnDueAt().has_value());

    REQUIRE(combat.resolveAttack(1, "enemy-2", 3000) == AttackOutcome::Killed);
    REQUIRE(enemies.allDead());
    REQUIRE(enemies.respawnDueAt() == 8000u);
}

TEST_CASE("AttackOutcome helpers", "[combat]") {
    REQUIRE(isHit(AttackOutcome::Killed));
    REQUIRE(isHit(AttackOutcome::Damaged));
    REQUIRE_FALSE(isHit(AttackOutcome::Cooldown));
    REQUIRE_FALSE(isHit(AttackOutcome::OutOfRange));
    REQUIRE(std::string(toString(AttackOutcome::AlreadyDead)) == "already dead");
}
