// [SESSION_AGENT] Unit tests for SessionRegistry

#include <catch2/catch_test_macros.hpp>
#include "session/SessionRegistry.hpp"
#include "ecs/CoreTypes.hpp"
#include <regex>
#include <set>
#include <string>

using namespace Colonnade;

TEST_CASE("SessionRegistry addActor", "[session]") {
    Registry registry;
    SessionRegistry sessions(registry, 42);

    SECTION("New actor gets the default spawn pose") {
        EntityID entity = sessions.addActor(1);
        REQUIRE(entity != entt::null);

        auto pos = sessions.getPosition(1);
        REQUIRE(pos.has_value());
        REQUIRE(pos->x == 0.0);
        REQUIRE(pos->y == 0.9);
        REQUIRE(pos->z == 0.0);

        const auto& rot = registry.get<Orientation>(entity);
        REQUIRE(rot.x == 0.0);
        REQUIRE(rot.y == 0.0);
        REQUIRE(rot.z == 0.0);
        REQUIRE(rot.w == 1.0);
    }

    SECTION("Id is a version 4 UUID and color is #rrggbb") {
        sessions.addActor(1);
        const ActorInfo* info = sessions.getInfo(1);
        REQUIRE(info != nullptr);

        std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
        REQUIRE(std::regex_match(info->actorId, uuid));

        std::regex color("^#[0-9a-f]{6}$");
        REQUIRE(std::regex_match(info->color, color));
        REQUIRE(info->connectionId == 1);
    }

    SECTION("A connection owns at most one actor") {
        REQUIRE(sessions.addActor(7) != entt::null);
        REQUIRE(sessions.addActor(7) == entt::null);
        REQUIRE(sessions.actorCount() == 1);
    }

    SECTION("Invalid connection is rejected") {
        REQUIRE(sessions.addActor(INVALID_CONNECTION) == entt::null);
        REQUIRE(sessions.actorCount() == 0);
    }
}

TEST_CASE("SessionRegistry ids are never reissued", "[session]") {
    Registry registry;
    SessionRegistry sessions(registry, 7);
    std::set<std::string> seen;

    for (ConnectionID conn = 1; conn <= 200; ++conn) {
        sessions.addActor(conn);
        const ActorInfo* info = sessions.getInfo(conn);
        REQUIRE(info != nullptr);
        REQUIRE(seen.insert(info->actorId).second);
        // Churn: close every other connection immediately
        if (conn % 2 == 0) {
            sessions.removeActor(conn);
        }
    }
    REQUIRE(sessions.actorCount() == 100);
}

TEST_CASE("SessionRegistry applyMove", "[session]") {
    Registry registry;
    SessionRegistry sessions(registry, 1);
    sessions.addActor(1);

    SECTION("Position only keeps rotation") {
        REQUIRE(sessions.applyMove(1, glm::dvec3(1.0, 0.9, 2.0), std::nullopt));
        auto snapshot = sessions.buildSnapshot();
        REQUIRE(snapshot.size() == 1);
        REQUIRE(snapshot[0].position == glm::dvec3(1.0, 0.9, 2.0));
        REQUIRE(snapshot[0].rotation.w == 1.0);
    }

    SECTION("Rotation only keeps position") {
        REQUIRE(sessions.applyMove(1, std::nullopt, Protocol::makeRotation(0.0, 0.7071, 0.0, 0.7071)));
        auto snapshot = sessions.buildSnapshot();
        REQUIRE(snapshot[0].position == glm::dvec3(0.0, 0.9, 0.0));
        REQUIRE(snapshot[0].rotation.y == 0.7071);
        REQUIRE(snapshot[0].rotation.w == 0.7071);
    }

    SECTION("Last supplied value wins") {
        sessions.applyMove(1, glm::dvec3(1.0, 0.9, 1.0), std::nullopt);
        sessions.applyMove(1, glm::dvec3(2.0, 0.9, 2.0), std::nullopt);
        sessions.applyMove(1, std::nullopt, Protocol::makeRotation(0.0, 0.0, 1.0, 0.0));
        auto snapshot = sessions.buildSnapshot();
        REQUIRE(snapshot[0].position == glm::dvec3(2.0, 0.9, 2.0));
        REQUIRE(snapshot[0].rotation.z == 1.0);
    }

    SECTION("Rotation is stored without normalization") {
        sessions.applyMove(1, std::nullopt, Protocol::makeRotation(0.0, 0.0, 0.0, 5.0));
        REQUIRE(sessions.buildSnapshot()[0].rotation.w == 5.0);
    }

    SECTION("Move for a removed actor is a no-op") {
        sessions.removeActor(1);
        REQUIRE_FALSE(sessions.applyMove(1, glm::dvec3(9.0), std::nullopt));
        REQUIRE(sessions.actorCount() == 0);
    }

    SECTION("Identical move twice gives equal snapshots") {
        sessions.applyMove(1, glm::dvec3(3.0, 0.9, 4.0), std::nullopt);
        auto first = sessions.buildSnapshot();
        sessions.applyMove(1, glm::dvec3(3.0, 0.9, 4.0), std::nullopt);
        auto second = sessions.buildSnapshot();
        REQUIRE(first[0].id == second[0].id);
        REQUIRE(first[0].position == second[0].position);
        REQUIRE(first[0].rotation == second[0].rotation);
    }
}

TEST_CASE("SessionRegistry snapshot order and removal", "[session]") {
    Registry registry;
    SessionRegistry sessions(registry, 3);
    sessions.addActor(10);
    sessions.addActor(20);
    sessions.addActor(30);

    std::string secondId = sessions.getInfo(20)->actorId;

    SECTION("Snapshot is in join order") {
        auto snapshot = sessions.buildSnapshot();
        REQUIRE(snapshot.size() == 3);
        REQUIRE(snapshot[0].id == sessions.getInfo(10)->actorId);
        REQUIRE(snapshot[1].id == secondId);
        REQUIRE(snapshot[2].id == sessions.getInfo(30)->actorId);
    }

    SECTION("Remove drops exactly one actor") {
        REQUIRE(sessions.removeActor(20));
        REQUIRE_FALSE(sessions.removeActor(20));

        auto snapshot = sessions.buildSnapshot();
        REQUIRE(snapshot.size() == 2);
        for (const auto& player : snapshot) {
            REQUIRE(player.id != secondId);
        }
        REQUIRE(sessions.connections() == std::vector<ConnectionID>{10, 30});
        REQUIRE(registry.view<PlayerTag>().size() == 2);
    }
}
