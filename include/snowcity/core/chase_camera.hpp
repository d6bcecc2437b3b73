#pragma once

/**
 * @file chase_camera.hpp
 * @brief Third-person follow camera that pulls back past buildings
 *
 * Each tick the camera looks for the first candidate offset whose line of
 * sight to the player is clear, then eases both the offset and its own
 * position toward it. Offsets are world-aligned and do not turn with the
 * player.
 */

#include "snowcity/core/collision_index.hpp"
#include "snowcity/core/position.hpp"
#include "snowcity/core/scene.hpp"
#include "snowcity/core/sim_config.hpp"
#include <utility>

namespace snowcity {

class ChaseCamera {
public:
    /// Starts at the nominal offset from the player's baseline position
    ChaseCamera(const CollisionIndex& collision, CameraConfig config,
                const Vec3& initialPlayerPos = Vec3(0.0f));

    void update(const Vec3& playerPos);

    /// First unobstructed candidate for a look-at target, or the farthest
    /// candidate when every one is blocked
    [[nodiscard]] Vec3 selectOffset(const Vec3& target) const;

    /// Look-at point for a player position (height pinned to the baseline)
    [[nodiscard]] Vec3 targetFor(const Vec3& playerPos) const {
        return Vec3(playerPos.x, config_.baselineHeight, playerPos.z);
    }

    [[nodiscard]] const Vec3& position() const { return position_; }
    [[nodiscard]] const Vec3& target() const { return target_; }
    [[nodiscard]] const Vec3& rawOffset() const { return rawOffset_; }
    [[nodiscard]] const Vec3& smoothedOffset() const { return smoothedOffset_; }

    [[nodiscard]] CameraPose pose() const;

    void setAspect(float aspect) { aspect_ = aspect; }
    [[nodiscard]] float aspect() const { return aspect_; }

    [[nodiscard]] const CameraConfig& config() const { return config_; }

private:
    [[nodiscard]] Vec3 nominalOffset() const;

    const CollisionIndex& collision_;
    CameraConfig config_;

    Vec3 target_{0.0f};
    Vec3 rawOffset_{0.0f};
    Vec3 smoothedOffset_{0.0f};
    Vec3 position_{0.0f};
    float aspect_ = 16.0f / 9.0f;
};

}  // namespace snowcity
