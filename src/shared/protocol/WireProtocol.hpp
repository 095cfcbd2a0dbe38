#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// [NETWORK_AGENT] Relay wire protocol
// Every transport message is one JSON object discriminated by its "type" field.
// Decoding produces a tagged union and fails closed: anything that is not a
// well-formed known kind decodes to std::nullopt.

namespace Colonnade {
namespace Protocol {

// Message kinds as they appear in the "type" field
inline constexpr std::string_view TYPE_WELCOME = "welcome";
inline constexpr std::string_view TYPE_STATE = "state";
inline constexpr std::string_view TYPE_ENEMIES = "enemies";
inline constexpr std::string_view TYPE_MOVE = "move";
inline constexpr std::string_view TYPE_ATTACK = "attack";

// One actor as carried in welcome/state
struct PlayerRecord {
    std::string id;
    std::string color;
    glm::dvec3 position{0.0};
    glm::dquat rotation{1.0, 0.0, 0.0, 0.0};  // (w, x, y, z) identity
};

// One hostile entity as carried in welcome/enemies
struct EnemyRecord {
    std::string id;
    double x{0.0};
    double y{0.0};
    double z{0.0};
    bool alive{true};
    int32_t faceIndex{0};
};

// ============================================================================
// Server -> client
// ============================================================================

struct WelcomeMessage {
    std::string id;
    std::string color;
    std::vector<PlayerRecord> players;
    std::optional<std::vector<EnemyRecord>> enemies;
};

struct StateMessage {
    std::vector<PlayerRecord> players;
};

struct EnemiesMessage {
    std::vector<EnemyRecord> enemies;
};

using ServerMessage = std::variant<WelcomeMessage, StateMessage, EnemiesMessage>;

// ============================================================================
// Client -> server
// ============================================================================

// Absent fields are left untouched on the relay
struct MoveMessage {
    std::optional<glm::dvec3> position;
    std::optional<glm::dquat> rotation;
};

struct AttackMessage {
    std::string enemyId;
};

using ClientMessage = std::variant<MoveMessage, AttackMessage>;

// Build a quaternion from wire component order (x, y, z, w)
[[nodiscard]] inline glm::dquat makeRotation(double x, double y, double z, double w) {
    return glm::dquat(w, x, y, z);
}

// Serialization
std::string serializeServerMessage(const ServerMessage& message);
std::string serializeClientMessage(const ClientMessage& message);

// Strict decode for relay input: present fields must be complete and numeric
[[nodiscard]] std::optional<ClientMessage> deserializeClientMessage(std::string_view payload);

// Lenient decode for client input: structure is checked, but missing or
// non-numeric pose components decode as NaN so the renderer can substitute
// defaults. Player entries without a string id are skipped.
[[nodiscard]] std::optional<ServerMessage> deserializeServerMessage(std::string_view payload);

} // namespace Protocol
} // namespace Colonnade
