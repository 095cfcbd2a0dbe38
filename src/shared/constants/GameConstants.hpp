#pragma once

// [ALL-AGENTS] Shared constants between client and relay
// Values that both sides must agree on live here, not in either tree

#include <cstdint>

namespace Colonnade {
namespace SharedConstants {

// Default ports
inline constexpr uint16_t DEFAULT_RELAY_PORT = 4000;
inline constexpr uint16_t DEFAULT_STATUS_PORT = 4080;

// Outbound pose throttle (client)
inline constexpr uint32_t SYNC_INTERVAL_MS = 50;

// Avatar standing height, also the fallback for invalid heights
inline constexpr double AVATAR_HEIGHT = 0.9;

// Remote smoothing rates (1/s) for alpha = 1 - exp(-k * dt)
inline constexpr double REMOTE_POSITION_RATE = 8.0;
inline constexpr double REMOTE_ORIENTATION_RATE = 12.0;

// Hall extents (world units)
inline constexpr double HALL_SCALE = 5.0;
inline constexpr double HALL_WIDTH = HALL_SCALE * 44.0 * 5.0;
inline constexpr double HALL_LENGTH = HALL_SCALE * 110.0 * 5.0;
inline constexpr double HALL_HALF_WIDTH = HALL_WIDTH / 2.0;
inline constexpr double HALL_HALF_LENGTH = HALL_LENGTH / 2.0;

// Combat (client detection)
inline constexpr uint32_t ATTACK_COOLDOWN_MS = 300;
inline constexpr double ATTACK_RANGE = 3.0;            // view-cone reach
inline constexpr double ATTACK_CONE_MIN_DOT = 0.7;     // "in front" threshold
inline constexpr double SWING_SPEED_THRESHOLD = 2.5;   // m/s at the grip
inline constexpr double SWING_HIT_RADIUS = 1.5;
inline constexpr double ENEMY_TORSO_HEIGHT = 1.0;      // aim point above enemy feet

// Sword geometry, grip-local; the tip sits at the end of handle + guard + blade
inline constexpr double SWORD_HANDLE_LENGTH = 0.15;
inline constexpr double SWORD_GUARD_HEIGHT = 0.03;
inline constexpr double SWORD_BLADE_LENGTH = 0.8;
inline constexpr double SWORD_TIP_OFFSET_Z = -0.05;

} // namespace SharedConstants
} // namespace Colonnade
