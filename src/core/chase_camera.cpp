#include "snowcity/core/chase_camera.hpp"
#include <glm/glm.hpp>

namespace snowcity {

ChaseCamera::ChaseCamera(const CollisionIndex& collision, CameraConfig config,
                         const Vec3& initialPlayerPos)
    : collision_(collision), config_(std::move(config)) {
    target_ = targetFor(initialPlayerPos);
    rawOffset_ = nominalOffset();
    smoothedOffset_ = rawOffset_;
    position_ = target_ + smoothedOffset_;
}

Vec3 ChaseCamera::nominalOffset() const {
    if (config_.candidateOffsets.empty()) {
        return Vec3(0.0f);
    }
    return config_.candidateOffsets.front();
}

Vec3 ChaseCamera::selectOffset(const Vec3& target) const {
    const auto& candidates = config_.candidateOffsets;
    if (candidates.empty()) {
        return Vec3(0.0f);
    }

    for (const auto& offset : candidates) {
        float length = glm::length(offset);
        if (length <= 0.0f) {
            return offset;
        }
        auto hit = collision_.raycast(target, offset / length, length);
        if (!hit) {
            return offset;
        }
    }
    return candidates.back();
}

void ChaseCamera::update(const Vec3& playerPos) {
    target_ = targetFor(playerPos);
    rawOffset_ = selectOffset(target_);

    smoothedOffset_ += (rawOffset_ - smoothedOffset_) * config_.smoothing;
    position_ += (target_ + smoothedOffset_ - position_) * config_.smoothing;
}

CameraPose ChaseCamera::pose() const {
    CameraPose p;
    p.position = position_;
    p.target = target_;
    p.fovDegrees = config_.fovDegrees;
    p.aspect = aspect_;
    p.nearPlane = config_.nearPlane;
    p.farPlane = config_.farPlane;
    return p;
}

}  // namespace snowcity
