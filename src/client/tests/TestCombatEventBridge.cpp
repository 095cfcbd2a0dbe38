// [COMBAT_AGENT] Unit tests for client hit detection

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "combat/CombatEventBridge.hpp"
#include <string>
#include <vector>

using namespace Colonnade;
using namespace Colonnade::Protocol;
using Catch::Approx;

namespace {

const glm::dquat kIdentity(1.0, 0.0, 0.0, 0.0);

EnemyRecord enemy(const std::string& id, double x, double y, double z, bool alive = true) {
    return EnemyRecord{id, x, y, z, alive, 0};
}

// Seed the grip with a zero-dt sample, then move 0.1 m in 1/60 s: 6 m/s
std::optional<std::string> swing(CombatEventBridge& bridge, uint32_t nowMs,
                                 const glm::dvec3& grip = glm::dvec3(0.0, 1.0, 0.0)) {
    bridge.updateTrackedController(grip - glm::dvec3(0.1, 0.0, 0.0), kIdentity, 0.0, nowMs);
    return bridge.updateTrackedController(grip, kIdentity, 1.0 / 60.0, nowMs);
}

} // namespace

TEST_CASE("CombatEventBridge tracked controller", "[combat]") {
    std::vector<std::string> attacks;
    CombatEventBridge bridge([&](const std::string& id) { attacks.push_back(id); });

    SECTION("Blade tip sits above the grip along its local up axis") {
        glm::dvec3 tip = CombatEventBridge::swordTip(glm::dvec3(0.0, 1.0, 0.0), kIdentity);
        REQUIRE(tip.x == Approx(0.0));
        REQUIRE(tip.y == Approx(1.98));
        REQUIRE(tip.z == Approx(-0.05));
    }

    SECTION("A fast swing near an enemy torso hits it") {
        bridge.setEnemies({enemy("far", 10.0, 0.0, 10.0), enemy("near", 0.0, 0.5, 0.0)});
        auto hit = swing(bridge, 1000);
        REQUIRE(hit == std::optional<std::string>("near"));
        REQUIRE(attacks == std::vector<std::string>{"near"});
    }

    SECTION("First sample only records the grip") {
        bridge.setEnemies({enemy("near", 0.0, 0.5, 0.0)});
        REQUIRE_FALSE(bridge.updateTrackedController(glm::dvec3(50.0, 1.0, 0.0), kIdentity, 0.016, 0));
        REQUIRE(attacks.empty());
    }

    SECTION("Slow movement is not a swing") {
        bridge.setEnemies({enemy("near", 0.0, 0.5, 0.0)});
        bridge.updateTrackedController(glm::dvec3(0.0, 1.0, 0.0), kIdentity, 0.1, 0);
        REQUIRE_FALSE(bridge.updateTrackedController(glm::dvec3(0.2, 1.0, 0.0), kIdentity, 0.1, 100));
        REQUIRE_FALSE(bridge.isCoolingDown(100));
    }

    SECTION("Non-positive dt is ignored") {
        bridge.setEnemies({enemy("near", 0.0, 0.5, 0.0)});
        bridge.updateTrackedController(glm::dvec3(0.0, 1.0, 0.0), kIdentity, 0.016, 0);
        REQUIRE_FALSE(bridge.updateTrackedController(glm::dvec3(5.0, 1.0, 0.0), kIdentity, 0.0, 10));
        REQUIRE(attacks.empty());
    }

    SECTION("Dead enemies and distant enemies are not hit") {
        bridge.setEnemies({enemy("dead", 0.0, 0.5, 0.0, false), enemy("far", 0.0, 0.0, -3.0)});
        REQUIRE_FALSE(swing(bridge, 1000));
        REQUIRE(attacks.empty());
    }

    SECTION("A miss still starts the cooldown") {
        bridge.setEnemies({enemy("far", 10.0, 0.0, 10.0)});
        REQUIRE_FALSE(swing(bridge, 1000));
        REQUIRE(bridge.isCoolingDown(1100));

        bridge.setEnemies({enemy("near", 0.0, 0.5, 0.0)});
        REQUIRE_FALSE(swing(bridge, 1200));
        REQUIRE(swing(bridge, 1301) == std::optional<std::string>("near"));
    }
}

TEST_CASE("CombatEventBridge view attack", "[combat]") {
    std::vector<std::string> attacks;
    CombatEventBridge bridge([&](const std::string& id) { attacks.push_back(id); });
    const glm::dvec3 eye(0.0, 1.0, 0.0);

    SECTION("Closest enemy in front within range is hit") {
        bridge.setEnemies({enemy("back", 0.0, 0.0, -2.5), enemy("front", 0.0, 0.0, -2.0)});
        REQUIRE(bridge.triggerViewAttack(eye, kIdentity, 1000) == std::optional<std::string>("front"));
        REQUIRE(attacks == std::vector<std::string>{"front"});
    }

    SECTION("Behind, beside, out of range and dead enemies are skipped") {
        bridge.setEnemies({
            enemy("behind", 0.0, 0.0, 2.0),
            enemy("beside", 2.0, 0.0, 0.0),
            enemy("distant", 0.0, 0.0, -3.5),
            enemy("dead", 0.0, 0.0, -1.0, false)});
        REQUIRE_FALSE(bridge.triggerViewAttack(eye, kIdentity, 1000));
        REQUIRE(attacks.empty());
    }

    SECTION("View orientation turns the cone") {
        // Quarter turn left: forward becomes -X
        glm::dquat left = glm::angleAxis(glm::radians(90.0), glm::dvec3(0.0, 1.0, 0.0));
        bridge.setEnemies({enemy("ahead", 0.0, 0.0, -2.0), enemy("left", -2.0, 0.0, 0.0)});
        REQUIRE(bridge.triggerViewAttack(eye, left, 1000) == std::optional<std::string>("left"));
    }

    SECTION("Trigger during cooldown does nothing") {
        bridge.setEnemies({enemy("front", 0.0, 0.0, -2.0)});
        REQUIRE(bridge.triggerViewAttack(eye, kIdentity, 1000));
        REQUIRE_FALSE(bridge.triggerViewAttack(eye, kIdentity, 1300));
        REQUIRE(bridge.triggerViewAttack(eye, kIdentity, 1301));
        REQUIRE(attacks.size() == 2);
    }
}

TEST_CASE("CombatEventBridge shares one cooldown across methods", "[combat]") {
    std::vector<std::string> attacks;
    CombatEventBridge bridge([&](const std::string& id) { attacks.push_back(id); });
    bridge.setEnemies({enemy("near", 0.0, 0.5, 0.0), enemy("front", 0.0, 0.0, -2.0)});

    REQUIRE(bridge.triggerViewAttack(glm::dvec3(0.0, 1.0, 0.0), kIdentity, 1000));
    REQUIRE_FALSE(swing(bridge, 1150));

    REQUIRE(swing(bridge, 1400));
    REQUIRE_FALSE(bridge.triggerViewAttack(glm::dvec3(0.0, 1.0, 0.0), kIdentity, 1500));

    REQUIRE(attacks.size() == 2);
}
