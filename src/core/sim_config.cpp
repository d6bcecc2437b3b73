#include "snowcity/core/sim_config.hpp"
#include "snowcity/core/config_file.hpp"
#include "snowcity/core/logger.hpp"

namespace snowcity {

std::vector<BuildingVariant> CityConfig::defaultVariants() {
    return {
        {"assets/building_00.fbx", 1.0f, 2.0f, 0.1f},
        {"assets/building_01.fbx", 0.8f, 3.2f, 0.3f},
        {"assets/building_02.fbx", 0.9f, 1.4f, 0.5f},
    };
}

namespace {

void readFloat(const ConfigFile& file, std::string_view key, float& out) {
    out = static_cast<float>(file.getFloat(key, out));
}

void readInt(const ConfigFile& file, std::string_view key, int32_t& out) {
    out = static_cast<int32_t>(file.getInt(key, out));
}

void readUnsigned(const ConfigFile& file, std::string_view key, uint32_t& out) {
    int64_t v = file.getInt(key, static_cast<int64_t>(out));
    if (v < 0) {
        Logger("config").warn(std::string(key) + " must not be negative, keeping default");
        return;
    }
    out = static_cast<uint32_t>(v);
}

void readSeed(const ConfigFile& file, std::string_view key, uint64_t& out) {
    out = static_cast<uint64_t>(file.getInt(key, static_cast<int64_t>(out)));
}

void readVec3(const ConfigFile& file, const std::string& prefix, Vec3& out) {
    readFloat(file, prefix + ".x", out.x);
    readFloat(file, prefix + ".y", out.y);
    readFloat(file, prefix + ".z", out.z);
}

void writeVec3(ConfigFile& file, const std::string& prefix, const Vec3& v) {
    file.set(prefix + ".x", static_cast<double>(v.x));
    file.set(prefix + ".y", static_cast<double>(v.y));
    file.set(prefix + ".z", static_cast<double>(v.z));
}

std::string variantKey(size_t index, std::string_view field) {
    return "city.variant." + std::to_string(index) + "." + std::string(field);
}

std::string offsetKey(size_t index) {
    return "camera.offset." + std::to_string(index);
}

}  // namespace

SimulationConfig SimulationConfig::fromFile(const ConfigFile& file) {
    SimulationConfig cfg;

    // Player
    auto& p = cfg.player;
    readVec3(file, "player.spawn", p.spawnPosition);
    readFloat(file, "player.run_speed", p.runSpeed);
    readFloat(file, "player.walk_speed", p.walkSpeed);
    readFloat(file, "player.rotate_speed", p.rotateSpeed);
    readFloat(file, "player.radius", p.radius);
    readFloat(file, "player.jump_speed", p.jumpSpeed);
    readFloat(file, "player.gravity", p.gravity);
    readFloat(file, "player.jump_forward_speed", p.jumpForwardSpeed);
    readFloat(file, "player.jump_speed_decay", p.jumpSpeedDecay);
    readFloat(file, "player.landing_height", p.landingHeight);
    readInt(file, "player.max_jump_ticks", p.maxJumpDuration);
    readFloat(file, "player.model_scale", p.modelScale);

    // City
    auto& c = cfg.city;
    readFloat(file, "city.grid_size", c.gridSize);
    readFloat(file, "city.spacing", c.spacing);
    readFloat(file, "city.spawn_chance", c.spawnChance);
    readFloat(file, "city.exclusion_radius", c.exclusionRadius);
    readFloat(file, "city.base_scale", c.baseScale);
    readFloat(file, "city.scale_jitter", c.scaleJitter);
    readFloat(file, "city.base_height", c.baseHeight);
    readInt(file, "city.window_radius", c.windowRadius);
    readInt(file, "city.evict_radius", c.evictRadius);
    readSeed(file, "city.seed", c.seed);

    if (file.has("city.variant_count")) {
        int64_t count = file.getInt("city.variant_count", 0);
        if (count <= 0) {
            Logger("config").warn("city.variant_count must be positive, keeping default variants");
        } else {
            std::vector<BuildingVariant> variants;
            for (size_t i = 0; i < static_cast<size_t>(count); ++i) {
                BuildingVariant v;
                if (i < c.variants.size()) {
                    v = c.variants[i];
                }
                v.modelPath = file.getString(variantKey(i, "model"), v.modelPath);
                readFloat(file, variantKey(i, "footprint"), v.footprint);
                readFloat(file, variantKey(i, "height"), v.height);
                readFloat(file, variantKey(i, "buffer"), v.buffer);
                if (v.modelPath.empty()) {
                    Logger("config").warn(variantKey(i, "model") + " missing, variant skipped");
                    continue;
                }
                variants.push_back(std::move(v));
            }
            if (!variants.empty()) {
                c.variants = std::move(variants);
            }
        }
    } else {
        for (size_t i = 0; i < c.variants.size(); ++i) {
            auto& v = c.variants[i];
            v.modelPath = file.getString(variantKey(i, "model"), v.modelPath);
            readFloat(file, variantKey(i, "footprint"), v.footprint);
            readFloat(file, variantKey(i, "height"), v.height);
            readFloat(file, variantKey(i, "buffer"), v.buffer);
        }
    }

    // Ground
    auto& g = cfg.ground;
    readFloat(file, "ground.tile_size", g.tileSize);
    readInt(file, "ground.window_radius", g.windowRadius);
    readInt(file, "ground.evict_radius", g.evictRadius);
    g.texturePath = file.getString("ground.texture", g.texturePath);

    // Snow
    auto& s = cfg.snow;
    readUnsigned(file, "snow.particle_count", s.particleCount);
    readFloat(file, "snow.spawn_radius", s.spawnRadius);
    readFloat(file, "snow.ceiling", s.ceilingHeight);
    readFloat(file, "snow.ground", s.groundHeight);
    readFloat(file, "snow.fall_rate", s.fallRate);
    readFloat(file, "snow.sway_amplitude", s.swayAmplitude);
    readFloat(file, "snow.sway_frequency", s.swayFrequency);
    readSeed(file, "snow.seed", s.seed);

    // Camera
    auto& cam = cfg.camera;
    for (size_t i = 0; i < cam.candidateOffsets.size(); ++i) {
        readVec3(file, offsetKey(i), cam.candidateOffsets[i]);
    }
    readFloat(file, "camera.smoothing", cam.smoothing);
    readFloat(file, "camera.baseline_height", cam.baselineHeight);
    readFloat(file, "camera.fov", cam.fovDegrees);
    readFloat(file, "camera.near", cam.nearPlane);
    readFloat(file, "camera.far", cam.farPlane);

    cfg.assets.characterModel = file.getString("assets.character", cfg.assets.characterModel);
    cfg.debugLogging = file.getBool("debug.logging", cfg.debugLogging);

    // Sanity checks on values that would break streaming or smoothing
    if (c.gridSize <= 0.0f) {
        Logger("config").warn("city.grid_size must be positive, using 25");
        c.gridSize = 25.0f;
    }
    if (g.tileSize <= 0.0f) {
        Logger("config").warn("ground.tile_size must be positive, using 40");
        g.tileSize = 40.0f;
    }
    if (c.evictRadius < c.windowRadius) {
        Logger("config").warn("city.evict_radius below window radius, clamping");
        c.evictRadius = c.windowRadius;
    }
    if (g.evictRadius < g.windowRadius) {
        Logger("config").warn("ground.evict_radius below window radius, clamping");
        g.evictRadius = g.windowRadius;
    }
    if (p.maxJumpDuration <= 0) {
        Logger("config").warn("player.max_jump_ticks must be positive, using 90");
        p.maxJumpDuration = 90;
    }

    return cfg;
}

SimulationConfig SimulationConfig::load(const std::filesystem::path& path) {
    ConfigFile file;
    if (!file.load(path)) {
        Logger("config").warn("Config file " + path.string() + " not found, using defaults");
        return SimulationConfig{};
    }
    return fromFile(file);
}

void SimulationConfig::writeTo(ConfigFile& file) const {
    const auto& p = player;
    writeVec3(file, "player.spawn", p.spawnPosition);
    file.set("player.run_speed", static_cast<double>(p.runSpeed));
    file.set("player.walk_speed", static_cast<double>(p.walkSpeed));
    file.set("player.rotate_speed", static_cast<double>(p.rotateSpeed));
    file.set("player.radius", static_cast<double>(p.radius));
    file.set("player.jump_speed", static_cast<double>(p.jumpSpeed));
    file.set("player.gravity", static_cast<double>(p.gravity));
    file.set("player.jump_forward_speed", static_cast<double>(p.jumpForwardSpeed));
    file.set("player.jump_speed_decay", static_cast<double>(p.jumpSpeedDecay));
    file.set("player.landing_height", static_cast<double>(p.landingHeight));
    file.set("player.max_jump_ticks", static_cast<int64_t>(p.maxJumpDuration));
    file.set("player.model_scale", static_cast<double>(p.modelScale));

    const auto& c = city;
    file.set("city.grid_size", static_cast<double>(c.gridSize));
    file.set("city.spacing", static_cast<double>(c.spacing));
    file.set("city.spawn_chance", static_cast<double>(c.spawnChance));
    file.set("city.exclusion_radius", static_cast<double>(c.exclusionRadius));
    file.set("city.base_scale", static_cast<double>(c.baseScale));
    file.set("city.scale_jitter", static_cast<double>(c.scaleJitter));
    file.set("city.base_height", static_cast<double>(c.baseHeight));
    file.set("city.window_radius", static_cast<int64_t>(c.windowRadius));
    file.set("city.evict_radius", static_cast<int64_t>(c.evictRadius));
    file.set("city.seed", static_cast<int64_t>(c.seed));
    file.set("city.variant_count", static_cast<int64_t>(c.variants.size()));
    for (size_t i = 0; i < c.variants.size(); ++i) {
        const auto& v = c.variants[i];
        file.set(variantKey(i, "model"), std::string_view(v.modelPath));
        file.set(variantKey(i, "footprint"), static_cast<double>(v.footprint));
        file.set(variantKey(i, "height"), static_cast<double>(v.height));
        file.set(variantKey(i, "buffer"), static_cast<double>(v.buffer));
    }

    file.set("ground.tile_size", static_cast<double>(ground.tileSize));
    file.set("ground.window_radius", static_cast<int64_t>(ground.windowRadius));
    file.set("ground.evict_radius", static_cast<int64_t>(ground.evictRadius));
    file.set("ground.texture", std::string_view(ground.texturePath));

    file.set("snow.particle_count", static_cast<int64_t>(snow.particleCount));
    file.set("snow.spawn_radius", static_cast<double>(snow.spawnRadius));
    file.set("snow.ceiling", static_cast<double>(snow.ceilingHeight));
    file.set("snow.ground", static_cast<double>(snow.groundHeight));
    file.set("snow.fall_rate", static_cast<double>(snow.fallRate));
    file.set("snow.sway_amplitude", static_cast<double>(snow.swayAmplitude));
    file.set("snow.sway_frequency", static_cast<double>(snow.swayFrequency));
    file.set("snow.seed", static_cast<int64_t>(snow.seed));

    for (size_t i = 0; i < camera.candidateOffsets.size(); ++i) {
        writeVec3(file, offsetKey(i), camera.candidateOffsets[i]);
    }
    file.set("camera.smoothing", static_cast<double>(camera.smoothing));
    file.set("camera.baseline_height", static_cast<double>(camera.baselineHeight));
    file.set("camera.fov", static_cast<double>(camera.fovDegrees));
    file.set("camera.near", static_cast<double>(camera.nearPlane));
    file.set("camera.far", static_cast<double>(camera.farPlane));

    file.set("assets.character", std::string_view(assets.characterModel));
    file.set("debug.logging", debugLogging);
}

}  // namespace snowcity
