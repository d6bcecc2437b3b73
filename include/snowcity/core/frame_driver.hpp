#pragma once

/**
 * @file frame_driver.hpp
 * @brief Owns the simulation components and runs one tick per frame
 *
 * Tick order is fixed:
 *   1. Poll pending asset loads (character, building variants)
 *   2. Poll the input mapper for this tick's intent
 *   3. Player tick (movement, collision, jump, animation)
 *   4. Ground, snow and city streamers follow the committed position
 *   5. Camera follows the player
 *   6. Hand the camera pose to the renderer
 *
 * The host owns the scene, renderer and asset loader; they must outlive
 * the driver. Input and resize events arrive through onKeyDown/onKeyUp
 * and onResize from the host's event loop, on the tick thread.
 */

#include "snowcity/core/asset_loader.hpp"
#include "snowcity/core/chase_camera.hpp"
#include "snowcity/core/city_streamer.hpp"
#include "snowcity/core/collision_index.hpp"
#include "snowcity/core/frame_clock.hpp"
#include "snowcity/core/input_mapper.hpp"
#include "snowcity/core/logger.hpp"
#include "snowcity/core/player_controller.hpp"
#include "snowcity/core/scene.hpp"
#include "snowcity/core/sim_config.hpp"
#include "snowcity/core/weather_field.hpp"
#include "snowcity/core/world_streamer.hpp"
#include <cstdint>
#include <memory>
#include <utility>

namespace snowcity {

/// Numbers for an external FPS overlay
struct FrameStats {
    uint64_t frameCount = 0;
    float lastDelta = 0.0f;     // Seconds
    float smoothedFps = 0.0f;
};

class FrameDriver {
public:
    FrameDriver(SceneGraph& scene, FrameRenderer& renderer, AssetLoader& loader,
                SimulationConfig config = {}, WallClock wallClock = systemWallClock());
    ~FrameDriver();

    // Non-copyable, non-movable
    FrameDriver(const FrameDriver&) = delete;
    FrameDriver& operator=(const FrameDriver&) = delete;

    /// Issue the character and building loads. Call once before ticking.
    void start();
    [[nodiscard]] bool started() const { return started_; }

    /// Advance one frame using the frame clock's delta
    void tick();

    /// Advance one frame with an explicit delta (seconds).
    /// Rethrows AssetLoadError if the character model failed to load.
    void tick(float dt);

    // === Host events ===
    void onKeyDown(int keyCode);
    void onKeyUp(int keyCode);
    /// Zero or negative height is ignored
    void onResize(int width, int height);

    // === Component access ===
    [[nodiscard]] PlayerController& player() { return *player_; }
    [[nodiscard]] const PlayerController& player() const { return *player_; }
    [[nodiscard]] CityStreamer& city() { return *city_; }
    [[nodiscard]] const CityStreamer& city() const { return *city_; }
    [[nodiscard]] const CollisionIndex& collision() const { return *collision_; }
    [[nodiscard]] WorldStreamer& ground() { return *ground_; }
    [[nodiscard]] const WorldStreamer& ground() const { return *ground_; }
    [[nodiscard]] const WeatherField& snow() const { return *snow_; }
    [[nodiscard]] ChaseCamera& camera() { return *camera_; }
    [[nodiscard]] const ChaseCamera& camera() const { return *camera_; }
    [[nodiscard]] InputMapper& input() { return input_; }
    [[nodiscard]] const InputMapper& input() const { return input_; }

    [[nodiscard]] const FrameStats& stats() const { return stats_; }
    [[nodiscard]] const SimulationConfig& config() const { return config_; }

private:
    void updateStats(float dt);

    SimulationConfig config_;
    SceneGraph& scene_;
    FrameRenderer& renderer_;
    AssetLoader& loader_;
    Logger log_{"driver"};

    FrameClock clock_;
    InputMapper input_;

    std::unique_ptr<CityStreamer> city_;
    std::unique_ptr<CollisionIndex> collision_;
    std::unique_ptr<WorldStreamer> ground_;
    std::unique_ptr<WeatherField> snow_;
    std::unique_ptr<PlayerController> player_;
    std::unique_ptr<ChaseCamera> camera_;

    FrameStats stats_;
    bool started_ = false;
};

}  // namespace snowcity
