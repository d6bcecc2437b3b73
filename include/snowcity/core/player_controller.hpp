#pragma once

/**
 * @file player_controller.hpp
 * @brief Third-person character: kinematics, jump arc, animation
 *
 * Movement is expressed per tick, not per second: one tick moves the player
 * by exactly the configured speed regardless of frame delta. Only the
 * animation mixer runs on dt.
 *
 * Every horizontal move is tested against the CollisionIndex before it is
 * committed. A blocked move on the ground leaves the player in place; a
 * blocked move in the air ends the jump at landing height.
 */

#include "snowcity/core/animation_state.hpp"
#include "snowcity/core/asset_loader.hpp"
#include "snowcity/core/collision_index.hpp"
#include "snowcity/core/input_mapper.hpp"
#include "snowcity/core/logger.hpp"
#include "snowcity/core/position.hpp"
#include "snowcity/core/scene.hpp"
#include "snowcity/core/sim_config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace snowcity {

/// Exists only while airborne
struct JumpState {
    float verticalVelocity = 0.0f;
    int32_t elapsedTicks = 0;
    int32_t maxDuration = 90;

    /// Fraction of the maximum flight time used so far, in [0, 1]
    [[nodiscard]] float progress() const {
        if (maxDuration <= 0) return 1.0f;
        return static_cast<float>(elapsedTicks) / static_cast<float>(maxDuration);
    }
};

class PlayerController {
public:
    PlayerController(SceneGraph& scene, const CollisionIndex& collision,
                     PlayerConfig config = {});
    ~PlayerController();

    PlayerController(const PlayerController&) = delete;
    PlayerController& operator=(const PlayerController&) = delete;

    // ========================================================================
    // Asset loading
    // ========================================================================

    /// Request the skinned character model
    void beginLoad(AssetLoader& loader, const std::string& modelPath);

    /// Check the pending load without blocking.
    /// Returns true on the tick the model becomes ready.
    /// Logs and rethrows AssetLoadError if the load failed.
    bool pollLoad();

    [[nodiscard]] bool isReady() const { return ready_; }

    // ========================================================================
    // Simulation
    // ========================================================================

    /// One simulation step. No-op until ready.
    void tick(float dt, const PlayerIntent& intent);

    /// Start a jump. Returns false if airborne or not ready.
    bool jump();

    [[nodiscard]] bool isAirborne() const { return jump_.has_value(); }
    [[nodiscard]] const std::optional<JumpState>& jumpState() const { return jump_; }

    [[nodiscard]] const Transform& transform() const { return transform_; }
    [[nodiscard]] const Vec3& position() const { return transform_.position; }
    [[nodiscard]] float yaw() const { return transform_.yaw; }

    /// Vertical velocity while airborne, 0 on the ground
    [[nodiscard]] float verticalVelocity() const {
        return jump_ ? jump_->verticalVelocity : 0.0f;
    }

    /// Velocity reflected by the most recent mid-air collision, if any
    [[nodiscard]] std::optional<float> lastLandingImpulse() const { return landingImpulse_; }

    /// Horizontal moves refused by the collision index so far
    [[nodiscard]] uint64_t blockedMoves() const { return blockedMoves_; }

    [[nodiscard]] const AnimationStateMachine& animation() const { return animation_; }
    [[nodiscard]] AnimationState animationState() const { return animation_.current(); }

    [[nodiscard]] RenderableId renderable() const { return renderable_; }
    [[nodiscard]] const PlayerConfig& config() const { return config_; }

private:
    void onModelLoaded(const SkinnedModel& model);

    [[nodiscard]] float horizontalSpeed(int moveAxis) const;
    void moveHorizontal(int moveAxis);
    void stepJump();
    void endJump();
    void pushToScene();

    SceneGraph& scene_;
    const CollisionIndex& collision_;
    PlayerConfig config_;
    Logger log_{"player"};

    PendingAsset<SkinnedModel> pendingModel_;
    bool ready_ = false;
    RenderableId renderable_ = INVALID_RENDERABLE;

    Transform transform_;
    std::optional<JumpState> jump_;
    std::optional<float> landingImpulse_;
    uint64_t blockedMoves_ = 0;

    AnimationStateMachine animation_;
};

}  // namespace snowcity
