// [NETWORK_AGENT] JSON wire protocol implementation

#include "protocol/WireProtocol.hpp"

#include <nlohmann/json.hpp>
#include <limits>
#include <type_traits>

namespace Colonnade {
namespace Protocol {

using nlohmann::json;

namespace {

constexpr double MISSING = std::numeric_limits<double>::quiet_NaN();

json positionToJson(const glm::dvec3& p) {
    return json{{"x", p.x}, {"y", p.y}, {"z", p.z}};
}

json rotationToJson(const glm::dquat& q) {
    return json{{"x", q.x}, {"y", q.y}, {"z", q.z}, {"w", q.w}};
}

json playerToJson(const PlayerRecord& player) {
    return json{
        {"id", player.id},
        {"color", player.color},
        {"position", positionToJson(player.position)},
        {"rotation", rotationToJson(player.rotation)}
    };
}

json enemyToJson(const EnemyRecord& enemy) {
    return json{
        {"id", enemy.id},
        {"x", enemy.x},
        {"y", enemy.y},
        {"z", enemy.z},
        {"alive", enemy.alive},
        {"faceIndex", enemy.faceIndex}
    };
}

json playersToJson(const std::vector<PlayerRecord>& players) {
    json array = json::array();
    for (const auto& player : players) {
        array.push_back(playerToJson(player));
    }
    return array;
}

json enemiesToJson(const std::vector<EnemyRecord>& enemies) {
    json array = json::array();
    for (const auto& enemy : enemies) {
        array.push_back(enemyToJson(enemy));
    }
    return array;
}

// Strict readers: every component present and numeric, or nothing
std::optional<glm::dvec3> readStrictPosition(const json& j) {
    if (!j.is_object()) return std::nullopt;
    for (const char* key : {"x", "y", "z"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) return std::nullopt;
    }
    return glm::dvec3(j["x"].get<double>(), j["y"].get<double>(), j["z"].get<double>());
}

std::optional<glm::dquat> readStrictRotation(const json& j) {
    if (!j.is_object()) return std::nullopt;
    for (const char* key : {"x", "y", "z", "w"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) return std::nullopt;
    }
    return makeRotation(j["x"].get<double>(), j["y"].get<double>(),
                        j["z"].get<double>(), j["w"].get<double>());
}

// Lenient readers: absent or non-numeric components become NaN
double readNumber(const json& object, const char* key) {
    if (!object.is_object()) return MISSING;
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) return MISSING;
    return it->get<double>();
}

std::string readString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::vector<PlayerRecord> readPlayers(const json& root) {
    std::vector<PlayerRecord> players;
    auto it = root.find("players");
    if (it == root.end() || !it->is_array()) return players;

    players.reserve(it->size());
    for (const auto& entry : *it) {
        if (!entry.is_object()) continue;
        std::string id = readString(entry, "id");
        if (id.empty()) continue;

        PlayerRecord player;
        player.id = std::move(id);
        player.color = readString(entry, "color");

        const json empty = json::object();
        auto pos = entry.find("position");
        const json& p = (pos != entry.end()) ? *pos : empty;
        player.position = glm::dvec3(readNumber(p, "x"), readNumber(p, "y"), readNumber(p, "z"));

        auto rot = entry.find("rotation");
        const json& r = (rot != entry.end()) ? *rot : empty;
        player.rotation = makeRotation(readNumber(r, "x"), readNumber(r, "y"),
                                       readNumber(r, "z"), readNumber(r, "w"));
        players.push_back(std::move(player));
    }
    return players;
}

std::vector<EnemyRecord> readEnemies(const json& array) {
    std::vector<EnemyRecord> enemies;
    if (!array.is_array()) return enemies;

    enemies.reserve(array.size());
    for (const auto& entry : array) {
        if (!entry.is_object()) continue;
        std::string id = readString(entry, "id");
        if (id.empty()) continue;

        EnemyRecord enemy;
        enemy.id = std::move(id);
        enemy.x = readNumber(entry, "x");
        enemy.y = readNumber(entry, "y");
        enemy.z = readNumber(entry, "z");
        auto alive = entry.find("alive");
        enemy.alive = alive != entry.end() && alive->is_boolean() && alive->get<bool>();
        auto face = entry.find("faceIndex");
        if (face != entry.end() && face->is_number_integer()) {
            enemy.faceIndex = face->get<int32_t>();
        }
        enemies.push_back(std::move(enemy));
    }
    return enemies;
}

// Parse without exceptions and pull out the discriminator
std::optional<json> parseObject(std::string_view payload, std::string& outType) {
    json root = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return std::nullopt;
    }
    auto type = root.find("type");
    if (type == root.end() || !type->is_string()) {
        return std::nullopt;
    }
    outType = type->get<std::string>();
    return root;
}

} // namespace

// ============================================================================
// SERIALIZATION
// ============================================================================

std::string serializeServerMessage(const ServerMessage& message) {
    json root = std::visit([](const auto& msg) -> json {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, WelcomeMessage>) {
            json j{
                {"type", std::string(TYPE_WELCOME)},
                {"id", msg.id},
                {"color", msg.color},
                {"players", playersToJson(msg.players)}
            };
            if (msg.enemies) {
                j["enemies"] = enemiesToJson(*msg.enemies);
            }
            return j;
        } else if constexpr (std::is_same_v<T, StateMessage>) {
            return json{{"type", std::string(TYPE_STATE)}, {"players", playersToJson(msg.players)}};
        } else {
            return json{{"type", std::string(TYPE_ENEMIES)}, {"enemies", enemiesToJson(msg.enemies)}};
        }
    }, message);
    return root.dump();
}

std::string serializeClientMessage(const ClientMessage& message) {
    json root = std::visit([](const auto& msg) -> json {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, MoveMessage>) {
            json j{{"type", std::string(TYPE_MOVE)}};
            if (msg.position) j["position"] = positionToJson(*msg.position);
            if (msg.rotation) j["rotation"] = rotationToJson(*msg.rotation);
            return j;
        } else {
            return json{{"type", std::string(TYPE_ATTACK)}, {"enemyId", msg.enemyId}};
        }
    }, message);
    return root.dump();
}

// ============================================================================
// DESERIALIZATION
// ============================================================================

std::optional<ClientMessage> deserializeClientMessage(std::string_view payload) {
    std::string type;
    auto root = parseObject(payload, type);
    if (!root) {
        return std::nullopt;
    }

    if (type == TYPE_MOVE) {
        MoveMessage move;
        // A JSON null field counts as absent
        if (auto it = root->find("position"); it != root->end() && !it->is_null()) {
            move.position = readStrictPosition(*it);
            if (!move.position) return std::nullopt;
        }
        if (auto it = root->find("rotation"); it != root->end() && !it->is_null()) {
            move.rotation = readStrictRotation(*it);
            if (!move.rotation) return std::nullopt;
        }
        return ClientMessage{std::move(move)};
    }

    if (type == TYPE_ATTACK) {
        AttackMessage attack;
        attack.enemyId = readString(*root, "enemyId");
        if (attack.enemyId.empty()) return std::nullopt;
        return ClientMessage{std::move(attack)};
    }

    return std::nullopt;
}

std::optional<ServerMessage> deserializeServerMessage(std::string_view payload) {
    std::string type;
    auto root = parseObject(payload, type);
    if (!root) {
        return std::nullopt;
    }

    if (type == TYPE_WELCOME) {
        WelcomeMessage welcome;
        welcome.id = readString(*root, "id");
        if (welcome.id.empty()) return std::nullopt;
        welcome.color = readString(*root, "color");
        welcome.players = readPlayers(*root);
        if (auto it = root->find("enemies"); it != root->end()) {
            welcome.enemies = readEnemies(*it);
        }
        return ServerMessage{std::move(welcome)};
    }

    if (type == TYPE_STATE) {
        return ServerMessage{StateMessage{readPlayers(*root)}};
    }

    if (type == TYPE_ENEMIES) {
        auto it = root->find("enemies");
        if (it == root->end()) return ServerMessage{EnemiesMessage{}};
        return ServerMessage{EnemiesMessage{readEnemies(*it)}};
    }

    return std::nullopt;
}

} // namespace Protocol
} // namespace Colonnade
