#include <gtest/gtest.h>
#include "snowcity/core/weather_field.hpp"
#include "fakes.hpp"
#include <cmath>
#include <vector>

using namespace snowcity;
using namespace snowcity::fakes;

class WeatherFieldTest : public ::testing::Test {
protected:
    static SnowConfig seededConfig() {
        SnowConfig c;
        c.seed = 4242;
        return c;
    }

    WallClock frozenClock(double ms) {
        return [ms] { return ms; };
    }

    RecordingScene scene;
};

TEST_F(WeatherFieldTest, InitialDistribution) {
    WeatherField snow(scene, seededConfig(), frozenClock(0.0));

    ASSERT_EQ(snow.particleCount(), 2000u);
    for (const auto& p : snow.particles()) {
        EXPECT_GE(p.x, -50.0f);
        EXPECT_LE(p.x, 50.0f);
        EXPECT_GE(p.z, -50.0f);
        EXPECT_LE(p.z, 50.0f);
        EXPECT_GE(p.y, 0.0f);
        EXPECT_LT(p.y, 30.0f);
    }

    const auto* entry = scene.find(snow.renderable());
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->desc.kind, RenderableKind::SnowField);
    EXPECT_EQ(entry->particles.size(), 2000u);
}

TEST_F(WeatherFieldTest, FallsPerTickRegardlessOfDt) {
    SnowConfig config = seededConfig();
    config.swayAmplitude = 0.0f;
    WeatherField snow(scene, config, frozenClock(0.0));

    std::vector<Vec3> before(snow.particles().begin(), snow.particles().end());
    snow.update(0.5f, Vec3(0.0f));
    std::vector<Vec3> afterSlow(snow.particles().begin(), snow.particles().end());
    snow.update(0.001f, Vec3(0.0f));

    for (size_t i = 0; i < before.size(); ++i) {
        if (before[i].y < 0.03f) continue;  // may have respawned
        EXPECT_NEAR(afterSlow[i].y, before[i].y - 0.01f, 1e-5f);
        EXPECT_NEAR(snow.particles()[i].y, before[i].y - 0.02f, 1e-5f);
        EXPECT_FLOAT_EQ(snow.particles()[i].x, before[i].x);
    }
}

TEST_F(WeatherFieldTest, RespawnsAtCeilingAroundPlayer) {
    SnowConfig config = seededConfig();
    config.particleCount = 50;
    config.fallRate = 100.0f;       // everything drops below ground at once
    config.swayAmplitude = 0.0f;
    WeatherField snow(scene, config, frozenClock(0.0));

    Vec3 player(500.0f, 2.0f, -300.0f);
    snow.update(1.0f / 60.0f, player);

    EXPECT_EQ(snow.respawnCount(), 50u);
    EXPECT_EQ(snow.particleCount(), 50u);
    for (const auto& p : snow.particles()) {
        EXPECT_FLOAT_EQ(p.y, 30.0f);
        EXPECT_GE(p.x, 450.0f);
        EXPECT_LE(p.x, 550.0f);
        EXPECT_GE(p.z, -350.0f);
        EXPECT_LE(p.z, -250.0f);
    }
}

TEST_F(WeatherFieldTest, SwayFollowsWallClockAndSlot) {
    SnowConfig config = seededConfig();
    config.particleCount = 8;
    config.fallRate = 0.0f;
    config.groundHeight = -1.0f;
    config.swayAmplitude = 1.0f;
    WeatherField snow(scene, config, frozenClock(1000.0));

    std::vector<Vec3> before(snow.particles().begin(), snow.particles().end());
    snow.update(1.0f / 60.0f, Vec3(0.0f));

    // phase = 1000 ms * 0.0005 + slot index
    for (size_t i = 0; i < before.size(); ++i) {
        double phase = 0.5 + static_cast<double>(i);
        EXPECT_NEAR(snow.particles()[i].x - before[i].x, std::sin(phase), 1e-4);
        EXPECT_NEAR(snow.particles()[i].z - before[i].z, std::cos(phase), 1e-4);
        EXPECT_FLOAT_EQ(snow.particles()[i].y, before[i].y);
    }
}

TEST_F(WeatherFieldTest, BufferPushedEveryUpdate) {
    WeatherField snow(scene, seededConfig(), frozenClock(0.0));
    const auto* entry = scene.find(snow.renderable());
    ASSERT_NE(entry, nullptr);
    size_t pushes = entry->particleUpdates;

    snow.update(1.0f / 60.0f, Vec3(0.0f));
    snow.update(1.0f / 60.0f, Vec3(0.0f));
    EXPECT_EQ(entry->particleUpdates, pushes + 2);
    EXPECT_EQ(entry->particles[7], snow.particles()[7]);
}

TEST_F(WeatherFieldTest, CountNeverChanges) {
    SnowConfig config = seededConfig();
    config.particleCount = 300;
    config.fallRate = 1.0f;
    WeatherField snow(scene, config, frozenClock(0.0));

    Vec3 player(0.0f);
    for (int i = 0; i < 100; ++i) {
        player.x += 3.0f;
        snow.update(1.0f / 60.0f, player);
        ASSERT_EQ(snow.particleCount(), 300u);
    }
    EXPECT_GT(snow.respawnCount(), 0u);
}

TEST_F(WeatherFieldTest, SameSeedSameSnow) {
    WeatherField a(scene, seededConfig(), frozenClock(0.0));
    WeatherField b(scene, seededConfig(), frozenClock(0.0));
    ASSERT_EQ(a.particleCount(), b.particleCount());
    for (size_t i = 0; i < a.particleCount(); ++i) {
        EXPECT_EQ(a.particles()[i], b.particles()[i]);
    }
}

TEST_F(WeatherFieldTest, DestructorRemovesRenderable) {
    {
        WeatherField snow(scene, seededConfig(), frozenClock(0.0));
        EXPECT_EQ(scene.count(RenderableKind::SnowField), 1u);
    }
    EXPECT_EQ(scene.count(RenderableKind::SnowField), 0u);
}
