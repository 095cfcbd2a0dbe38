// Colonnade Bot - Headless client
// [CLIENT_AGENT] Joins a relay, walks toward the nearest enemy and attacks it.
// Exercises the same sync, interpolation and hit detection path a renderer uses.

#include "combat/CombatEventBridge.hpp"
#include "constants/GameConstants.hpp"
#include "net/GNSClientConnection.hpp"
#include "sync/ClientSyncAgent.hpp"
#include "sync/RemoteActorInterpolator.hpp"

#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace Colonnade;

namespace {

constexpr uint32_t FRAME_MS = 16;
constexpr double WALK_SPEED = 3.0;          // m/s
constexpr double CONNECT_TIMEOUT_MS = 5000.0;

volatile std::sig_atomic_t g_stopRequested = 0;

void onSignal(int) {
    g_stopRequested = 1;
}

void printUsage(const char* programName) {
    std::cout << "Colonnade Bot\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  --host <addr>         Relay address (default: 127.0.0.1)\n"
              << "  --port <num>          Relay port (default: " << SharedConstants::DEFAULT_RELAY_PORT << ")\n"
              << "  --duration <sec>      Run time, 0 for until Ctrl+C (default: 30)\n"
              << "  --help, -h            Show this help\n";
}

std::optional<long> parseInteger(const char* text, long minValue, long maxValue) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < minValue || value > maxValue) {
        return std::nullopt;
    }
    return value;
}

// Yaw-only orientation whose forward (0,0,-1) points along direction
glm::dquat facing(const glm::dvec3& direction) {
    double yaw = std::atan2(-direction.x, -direction.z);
    return glm::angleAxis(yaw, glm::dvec3(0.0, 1.0, 0.0));
}

const Protocol::EnemyRecord* nearestLiving(const std::vector<Protocol::EnemyRecord>& enemies,
                                           const glm::dvec3& from) {
    const Protocol::EnemyRecord* best = nullptr;
    double bestDistance = 0.0;
    for (const auto& enemy : enemies) {
        if (!enemy.alive) {
            continue;
        }
        double d = glm::length(glm::dvec3(enemy.x - from.x, 0.0, enemy.z - from.z));
        if (!best || d < bestDistance) {
            best = &enemy;
            bestDistance = d;
        }
    }
    return best;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string host = "127.0.0.1";
        uint16_t port = SharedConstants::DEFAULT_RELAY_PORT;
        long durationSec = 30;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            }

            if (i + 1 >= argc) {
                std::cerr << "Missing value for option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
            const char* value = argv[++i];

            if (arg == "--host") {
                host = value;
            } else if (arg == "--port") {
                auto parsed = parseInteger(value, 1, 65535);
                if (!parsed) {
                    std::cerr << "Invalid port: " << value << "\n";
                    return 1;
                }
                port = static_cast<uint16_t>(*parsed);
            } else if (arg == "--duration") {
                auto parsed = parseInteger(value, 0, 86400);
                if (!parsed) {
                    std::cerr << "Invalid duration: " << value << "\n";
                    return 1;
                }
                durationSec = *parsed;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        GNSClientConnection connection;
        if (!connection.connect(host, port)) {
            std::cerr << "[BOT] Could not start connection to " << host << ":" << port << "\n";
            return 1;
        }

        ClientSyncAgent agent(connection);
        RemoteActorInterpolator remotes;
        CombatEventBridge combat([&agent](const std::string& enemyId) {
            agent.sendAttack(enemyId);
        });

        agent.setOnPlayersChanged([&](const std::vector<Protocol::PlayerRecord>& players) {
            remotes.applySnapshot(players, agent.localId());
        });
        agent.setOnEnemiesChanged([&](const std::vector<Protocol::EnemyRecord>& enemies) {
            combat.setEnemies(enemies);
        });

        const auto start = std::chrono::steady_clock::now();
        auto nowMs = [&start]() {
            return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count());
        };

        glm::dvec3 position(0.0, SharedConstants::AVATAR_HEIGHT, 0.0);
        glm::dquat orientation(1.0, 0.0, 0.0, 0.0);
        uint32_t lastFrame = nowMs();
        uint32_t lastReport = 0;

        std::cout << "[BOT] Connecting to " << host << ":" << port << std::endl;

        while (!g_stopRequested) {
            uint32_t now = nowMs();
            double dt = static_cast<double>(now - lastFrame) / 1000.0;
            lastFrame = now;

            agent.update();
            if (agent.isClosed()) {
                std::cout << "[BOT] Relay connection lost" << std::endl;
                break;
            }

            if (!connection.isOpen()) {
                if (now > CONNECT_TIMEOUT_MS) {
                    std::cerr << "[BOT] Timed out connecting" << std::endl;
                    agent.close();
                    return 1;
                }
            } else if (agent.hasWelcome()) {
                // Walk toward the nearest living enemy and swing when close
                if (const auto* target = nearestLiving(combat.getEnemies(), position)) {
                    glm::dvec3 toTarget(target->x - position.x, 0.0, target->z - position.z);
                    double distance = glm::length(toTarget);
                    if (distance > 0.0) {
                        orientation = facing(toTarget);
                    }
                    if (distance > SharedConstants::ATTACK_RANGE * 0.5) {
                        position += (toTarget / distance) * std::min(WALK_SPEED * dt, distance);
                    } else {
                        glm::dvec3 eye(position.x, position.y + 0.1, position.z);
                        combat.triggerViewAttack(eye, orientation, now);
                    }
                }

                agent.sendMove(position, orientation, now);
            }

            remotes.tick(dt);

            if (now - lastReport >= 5000) {
                lastReport = now;
                std::cout << "[BOT] " << agent.localId() << " at (" << position.x << ", "
                          << position.z << "), " << remotes.size() << " remote players, "
                          << combat.getEnemies().size() << " enemies" << std::endl;
            }

            if (durationSec > 0 && now >= static_cast<uint32_t>(durationSec * 1000)) {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(FRAME_MS));
        }

        agent.close();
        std::cout << "[BOT] Done" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
