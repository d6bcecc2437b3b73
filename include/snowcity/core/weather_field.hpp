#pragma once

/**
 * @file weather_field.hpp
 * @brief Fixed-size falling snow recycled around the player
 *
 * The particle buffer never grows or shrinks. A flake that falls below the
 * ground is moved back to the ceiling somewhere above the player's current
 * position. Fall speed is per tick; the sideways sway follows wall-clock
 * time so it keeps moving even when ticks stall.
 */

#include "snowcity/core/frame_clock.hpp"
#include "snowcity/core/logger.hpp"
#include "snowcity/core/position.hpp"
#include "snowcity/core/scene.hpp"
#include "snowcity/core/sim_config.hpp"
#include <utility>
#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace snowcity {

class WeatherField {
public:
    WeatherField(SceneGraph& scene, SnowConfig config, WallClock wallClock = systemWallClock());
    ~WeatherField();

    WeatherField(const WeatherField&) = delete;
    WeatherField& operator=(const WeatherField&) = delete;

    /// Fall, recycle and sway every particle, then push the buffer to the scene
    void update(float dt, const Vec3& playerPos);

    [[nodiscard]] std::span<const Vec3> particles() const { return particles_; }
    [[nodiscard]] size_t particleCount() const { return particles_.size(); }

    /// Particles moved back to the ceiling since construction
    [[nodiscard]] uint64_t respawnCount() const { return respawns_; }

    [[nodiscard]] RenderableId renderable() const { return renderable_; }
    [[nodiscard]] const SnowConfig& config() const { return config_; }

private:
    void respawn(Vec3& particle, const Vec3& playerPos);
    [[nodiscard]] float uniform(float lo, float hi);

    SceneGraph& scene_;
    SnowConfig config_;
    WallClock wallClock_;
    Logger log_{"snow"};
    std::mt19937 rng_;

    std::vector<Vec3> particles_;
    RenderableId renderable_ = INVALID_RENDERABLE;
    uint64_t respawns_ = 0;
};

}  // namespace snowcity
