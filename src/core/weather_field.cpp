#include "snowcity/core/weather_field.hpp"
#include <cmath>

namespace snowcity {

namespace {

std::mt19937 makeRng(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        return std::mt19937(rd());
    }
    return std::mt19937(static_cast<std::mt19937::result_type>(seed));
}

}  // namespace

WeatherField::WeatherField(SceneGraph& scene, SnowConfig config, WallClock wallClock)
    : scene_(scene),
      config_(std::move(config)),
      wallClock_(std::move(wallClock)),
      rng_(makeRng(config_.seed)) {
    if (!wallClock_) {
        log_.warn("No wall clock supplied, using the system clock");
        wallClock_ = systemWallClock();
    }

    particles_.reserve(config_.particleCount);
    for (uint32_t i = 0; i < config_.particleCount; ++i) {
        particles_.emplace_back(
            uniform(-config_.spawnRadius, config_.spawnRadius),
            uniform(config_.groundHeight, config_.ceilingHeight),
            uniform(-config_.spawnRadius, config_.spawnRadius)
        );
    }

    RenderableDesc desc;
    desc.kind = RenderableKind::SnowField;
    desc.castShadow = false;
    desc.receiveShadow = false;
    renderable_ = scene_.add(desc);
    scene_.setParticles(renderable_, particles_);
}

WeatherField::~WeatherField() {
    scene_.remove(renderable_);
}

void WeatherField::update(float /*dt*/, const Vec3& playerPos) {
    double phase = wallClock_() * static_cast<double>(config_.swayFrequency);

    for (size_t i = 0; i < particles_.size(); ++i) {
        Vec3& p = particles_[i];
        p.y -= config_.fallRate;

        if (p.y < config_.groundHeight) {
            respawn(p, playerPos);
        }

        double slotPhase = phase + static_cast<double>(i);
        p.x += static_cast<float>(std::sin(slotPhase)) * config_.swayAmplitude;
        p.z += static_cast<float>(std::cos(slotPhase)) * config_.swayAmplitude;
    }

    scene_.setParticles(renderable_, particles_);
}

void WeatherField::respawn(Vec3& particle, const Vec3& playerPos) {
    particle.x = playerPos.x + uniform(-config_.spawnRadius, config_.spawnRadius);
    particle.y = config_.ceilingHeight;
    particle.z = playerPos.z + uniform(-config_.spawnRadius, config_.spawnRadius);
    ++respawns_;
}

float WeatherField::uniform(float lo, float hi) {
    return std::uniform_real_distribution<float>(lo, hi)(rng_);
}

}  // namespace snowcity
