#pragma once

#include "constants/GameConstants.hpp"
#include "protocol/WireProtocol.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <string>
#include <vector>

// [CLIENT_AGENT] Smooths remote actors toward their latest network pose
// Each render tick moves the rendered pose a frame-rate independent fraction
// alpha = 1 - exp(-k * dt) of the way to the target. It never overshoots.

namespace Colonnade {

// What the renderer draws for one remote actor
struct RemotePose {
    std::string id;
    std::string color;
    glm::dvec3 position{0.0};
    glm::dquat orientation{1.0, 0.0, 0.0, 0.0};
};

struct InterpolationRates {
    double position{SharedConstants::REMOTE_POSITION_RATE};
    double orientation{SharedConstants::REMOTE_ORIENTATION_RATE};
};

class RemoteActorInterpolator {
public:
    explicit RemoteActorInterpolator(const InterpolationRates& rates = {});

    // Retarget from a full snapshot. New actors appear at their target,
    // actors missing from the snapshot are dropped, localId is skipped.
    void applySnapshot(const std::vector<Protocol::PlayerRecord>& players,
                       const std::string& localId);

    // Advance rendered poses by dt seconds
    void tick(double dtSeconds);

    // Rendered poses in snapshot order
    [[nodiscard]] std::vector<RemotePose> poses() const;

    [[nodiscard]] size_t size() const { return actors_.size(); }
    [[nodiscard]] const RemotePose* find(const std::string& id) const;

    void clear() { actors_.clear(); }

    // Replace unusable wire values with safe defaults
    [[nodiscard]] static glm::dvec3 sanitizePosition(const glm::dvec3& position);
    [[nodiscard]] static glm::dquat sanitizeOrientation(const glm::dquat& orientation);

private:
    struct TrackedActor {
        RemotePose rendered;
        glm::dvec3 targetPosition{0.0};
        glm::dquat targetOrientation{1.0, 0.0, 0.0, 0.0};
    };

    InterpolationRates rates_;
    std::vector<TrackedActor> actors_;
};

} // namespace Colonnade
