#pragma once

#include "constants/GameConstants.hpp"
#include <cstdint>
#include <chrono>
#include <cstddef>

// [ALL-AGENTS] Global constants for the Colonnade relay
// All magic numbers MUST be defined here, not scattered in code

namespace Colonnade {
namespace Constants {

inline constexpr const char* VERSION = "0.3.0";

// ============================================================================
// NETWORK CONSTANTS
// ============================================================================

// [NETWORK_AGENT] Relay loop rate
inline constexpr uint32_t TICK_RATE_HZ = 60;
inline constexpr auto TICK_INTERVAL = std::chrono::microseconds(1000000 / TICK_RATE_HZ);

// [NETWORK_AGENT] Ports
inline constexpr uint16_t DEFAULT_SERVER_PORT = SharedConstants::DEFAULT_RELAY_PORT;
inline constexpr uint16_t DEFAULT_STATUS_PORT = SharedConstants::DEFAULT_STATUS_PORT;

// [NETWORK_AGENT] Connection setup
inline constexpr int32_t CONNECT_TIMEOUT_MS = 10000;

// [NETWORK_AGENT] Outbound backpressure: per-connection send buffer cap.
// A send refused for exceeding it closes that connection on the next poll.
inline constexpr int32_t MAX_SEND_BUFFER_BYTES = 512 * 1024;

// [NETWORK_AGENT] Largest inbound message the relay will look at
inline constexpr size_t MAX_INBOUND_MESSAGE_BYTES = 16 * 1024;

// ============================================================================
// SESSION CONSTANTS
// ============================================================================

// [SESSION_AGENT] Default spawn pose for a fresh actor
inline constexpr double SPAWN_X = 0.0;
inline constexpr double SPAWN_Y = SharedConstants::AVATAR_HEIGHT;
inline constexpr double SPAWN_Z = 0.0;

// ============================================================================
// ENEMY CONSTANTS
// ============================================================================

// [WORLD_AGENT] Population and movement
inline constexpr uint32_t ENEMY_COUNT = 3;
inline constexpr double ENEMY_SPEED = 4.0;                 // units/s
inline constexpr double ENEMY_WANDER_SPEED_FACTOR = 0.5;
inline constexpr uint32_t ENEMY_UPDATE_INTERVAL_MS = 50;
inline constexpr double ENEMY_STOP_DISTANCE = 12.0;        // hold position this close to a player
inline constexpr double ENEMY_DETECTION_RANGE = 1000.0;
inline constexpr uint32_t ENEMY_WANDER_TURN_MS = 3000;
inline constexpr uint32_t ENEMY_RESPAWN_DELAY_MS = 5000;   // after the last one dies

// [WORLD_AGENT] Spawn/patrol bounds (hall minus wall margin)
inline constexpr double ENEMY_BOUNDARY_MARGIN = 50.0;
inline constexpr double ENEMY_LIMIT_X = SharedConstants::HALL_HALF_WIDTH - ENEMY_BOUNDARY_MARGIN;
inline constexpr double ENEMY_LIMIT_Z = SharedConstants::HALL_HALF_LENGTH - ENEMY_BOUNDARY_MARGIN;

// ============================================================================
// COMBAT CONSTANTS
// ============================================================================

// [COMBAT_AGENT] Health and damage
inline constexpr int32_t ENEMY_MAX_HEALTH = 100;
inline constexpr int32_t ATTACK_DAMAGE = 100;

// [COMBAT_AGENT] Arbitration limits
inline constexpr uint32_t SERVER_ATTACK_COOLDOWN_MS = 250;
inline constexpr double ATTACK_VALIDATION_RANGE = 6.0;     // XZ distance attacker -> enemy

} // namespace Constants
} // namespace Colonnade
