// [CLIENT_AGENT] Remote actor interpolation

#include "sync/RemoteActorInterpolator.hpp"

#include <cmath>
#include <unordered_map>

namespace Colonnade {

namespace {

constexpr double MIN_QUAT_LENGTH = 1e-9;

double smoothingAlpha(double rate, double dt) {
    return 1.0 - std::exp(-rate * dt);
}

} // namespace

RemoteActorInterpolator::RemoteActorInterpolator(const InterpolationRates& rates)
    : rates_(rates) {}

glm::dvec3 RemoteActorInterpolator::sanitizePosition(const glm::dvec3& position) {
    return glm::dvec3(
        std::isfinite(position.x) ? position.x : 0.0,
        std::isfinite(position.y) ? position.y : SharedConstants::AVATAR_HEIGHT,
        std::isfinite(position.z) ? position.z : 0.0);
}

glm::dquat RemoteActorInterpolator::sanitizeOrientation(const glm::dquat& orientation) {
    if (!std::isfinite(orientation.w) || !std::isfinite(orientation.x) ||
        !std::isfinite(orientation.y) || !std::isfinite(orientation.z)) {
        return glm::dquat(1.0, 0.0, 0.0, 0.0);
    }
    double len = glm::length(orientation);
    if (!std::isfinite(len) || len < MIN_QUAT_LENGTH) {
        return glm::dquat(1.0, 0.0, 0.0, 0.0);
    }
    return orientation / len;
}

void RemoteActorInterpolator::applySnapshot(const std::vector<Protocol::PlayerRecord>& players,
                                            const std::string& localId) {
    std::unordered_map<std::string, size_t> previous;
    previous.reserve(actors_.size());
    for (size_t i = 0; i < actors_.size(); ++i) {
        previous.emplace(actors_[i].rendered.id, i);
    }

    std::vector<TrackedActor> next;
    next.reserve(players.size());

    for (const auto& player : players) {
        if (player.id == localId) {
            continue;
        }

        TrackedActor actor;
        auto it = previous.find(player.id);
        if (it != previous.end()) {
            actor = actors_[it->second];
        }

        actor.targetPosition = sanitizePosition(player.position);
        actor.targetOrientation = sanitizeOrientation(player.rotation);
        actor.rendered.id = player.id;
        actor.rendered.color = player.color;

        if (it == previous.end()) {
            actor.rendered.position = actor.targetPosition;
            actor.rendered.orientation = actor.targetOrientation;
        }

        next.push_back(std::move(actor));
    }

    actors_ = std::move(next);
}

void RemoteActorInterpolator::tick(double dtSeconds) {
    if (!std::isfinite(dtSeconds) || dtSeconds <= 0.0) {
        return;
    }

    double posAlpha = smoothingAlpha(rates_.position, dtSeconds);
    double rotAlpha = smoothingAlpha(rates_.orientation, dtSeconds);

    for (auto& actor : actors_) {
        actor.rendered.position = glm::mix(actor.rendered.position, actor.targetPosition, posAlpha);
        actor.rendered.orientation = glm::normalize(
            glm::slerp(actor.rendered.orientation, actor.targetOrientation, rotAlpha));
    }
}

std::vector<RemotePose> RemoteActorInterpolator::poses() const {
    std::vector<RemotePose> result;
    result.reserve(actors_.size());
    for (const auto& actor : actors_) {
        result.push_back(actor.rendered);
    }
    return result;
}

const RemotePose* RemoteActorInterpolator::find(const std::string& id) const {
    for (const auto& actor : actors_) {
        if (actor.rendered.id == id) {
            return &actor.rendered;
        }
    }
    return nullptr;
}

} // namespace Colonnade
