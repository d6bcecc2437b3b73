#pragma once

/**
 * @file sim_config.hpp
 * @brief Tuning parameters for every simulation component
 *
 * Defaults reproduce the shipped scene. Any value can be overridden from a
 * ConfigFile using the dotted key listed next to it. Kinematic quantities
 * are per tick (one simulation step per display refresh), not per second.
 */

#include "snowcity/core/position.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace snowcity {

class ConfigFile;

/// Player kinematics and jump physics
struct PlayerConfig {
    Vec3 spawnPosition{0.0f, 2.0f, 0.0f};
    float runSpeed = 0.15f;           // player.run_speed (forward)
    float walkSpeed = 0.06f;          // player.walk_speed (backward)
    float rotateSpeed = 0.015f;       // player.rotate_speed (rad/tick)
    float radius = 1.5f;              // player.radius
    float jumpSpeed = 0.19f;          // player.jump_speed (initial vy)
    float gravity = 0.005f;           // player.gravity (per tick^2)
    float jumpForwardSpeed = 0.2f;    // player.jump_forward_speed
    float jumpSpeedDecay = 0.7f;      // player.jump_speed_decay
    float landingHeight = 2.0f;       // player.landing_height
    int32_t maxJumpDuration = 90;     // player.max_jump_ticks
    float modelScale = 4.0f;          // player.model_scale
};

/// One building prefab with its own collision tolerance
struct BuildingVariant {
    std::string modelPath;
    float footprint = 1.0f;   // Collision width as a fraction of final scale
    float height = 2.0f;      // Collision height as a fraction of final scale
    float buffer = 0.1f;      // Extra trigger distance
};

/// Procedural building placement
struct CityConfig {
    float gridSize = 25.0f;            // city.grid_size
    float spacing = 12.0f;             // city.spacing (margin kept free per cell)
    float spawnChance = 0.8f;          // city.spawn_chance
    float exclusionRadius = 0.3f;      // city.exclusion_radius (in cells)
    float baseScale = 25.0f;           // city.base_scale
    float scaleJitter = 0.1f;          // city.scale_jitter (+/- fraction)
    float baseHeight = 6.47f;          // city.base_height
    int32_t windowRadius = 2;          // city.window_radius
    int32_t evictRadius = 3;           // city.evict_radius
    uint64_t seed = 0;                 // city.seed (0 = nondeterministic)
    std::vector<BuildingVariant> variants = defaultVariants();

    [[nodiscard]] static std::vector<BuildingVariant> defaultVariants();
};

/// Ground tile streaming
struct GroundConfig {
    float tileSize = 40.0f;            // ground.tile_size
    int32_t windowRadius = 2;          // ground.window_radius
    int32_t evictRadius = 3;           // ground.evict_radius
    std::string texturePath = "assets/floor.png";  // ground.texture
};

/// Falling snow
struct SnowConfig {
    uint32_t particleCount = 2000;     // snow.particle_count
    float spawnRadius = 50.0f;         // snow.spawn_radius (half-extent of the square)
    float ceilingHeight = 30.0f;       // snow.ceiling
    float groundHeight = 0.0f;         // snow.ground
    float fallRate = 0.01f;            // snow.fall_rate (per tick)
    float swayAmplitude = 0.005f;      // snow.sway_amplitude
    float swayFrequency = 0.0005f;     // snow.sway_frequency (per wall-clock ms)
    uint64_t seed = 0;                 // snow.seed (0 = nondeterministic)
};

/// Chase camera
struct CameraConfig {
    std::vector<Vec3> candidateOffsets = {
        {0.0f, 3.0f, 8.0f},
        {0.0f, 5.0f, 10.0f},
        {0.0f, 8.0f, 12.0f},
        {0.0f, 11.0f, 14.0f},
        {0.0f, 14.0f, 16.0f},
    };
    float smoothing = 0.1f;            // camera.smoothing (per tick)
    float baselineHeight = 2.0f;       // camera.baseline_height
    float fovDegrees = 75.0f;          // camera.fov
    float nearPlane = 0.1f;            // camera.near
    float farPlane = 1000.0f;          // camera.far
};

struct AssetPaths {
    std::string characterModel = "assets/eternauta.fbx";  // assets.character
};

struct SimulationConfig {
    PlayerConfig player;
    CityConfig city;
    GroundConfig ground;
    SnowConfig snow;
    CameraConfig camera;
    AssetPaths assets;
    bool debugLogging = false;         // debug.logging

    /// Overlay values present in the file on top of the defaults
    [[nodiscard]] static SimulationConfig fromFile(const ConfigFile& file);

    /// Load a config file from disk. Missing file -> defaults (with a warning).
    [[nodiscard]] static SimulationConfig load(const std::filesystem::path& path);

    /// Write every scalar setting to the file
    void writeTo(ConfigFile& file) const;
};

}  // namespace snowcity
