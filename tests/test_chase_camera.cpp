#include <gtest/gtest.h>
#include "snowcity/core/chase_camera.hpp"
#include "snowcity/core/city_streamer.hpp"
#include "snowcity/core/collision_index.hpp"
#include "fakes.hpp"
#include <memory>

using namespace snowcity;
using namespace snowcity::fakes;

class ChaseCameraTest : public ::testing::Test {
protected:
    void SetUp() override {
        CityConfig cityConfig;
        cityConfig.seed = 3;
        cityConfig.spawnChance = 0.0f;
        city = std::make_unique<CityStreamer>(scene, cityConfig);
        city->beginLoad(loader);
        city->pollLoad();
        collision = std::make_unique<CollisionIndex>(*city);
    }

    RecordingScene scene;
    FakeAssetLoader loader;
    std::unique_ptr<CityStreamer> city;
    std::unique_ptr<CollisionIndex> collision;
};

TEST_F(ChaseCameraTest, StartsAtNominalOffset) {
    ChaseCamera camera(*collision, CameraConfig{}, Vec3(0.0f, 2.0f, 0.0f));
    EXPECT_EQ(camera.target(), Vec3(0.0f, 2.0f, 0.0f));
    EXPECT_EQ(camera.position(), Vec3(0.0f, 5.0f, 8.0f));
    EXPECT_EQ(camera.smoothedOffset(), Vec3(0.0f, 3.0f, 8.0f));
}

TEST_F(ChaseCameraTest, TargetPinnedToBaselineHeight) {
    ChaseCamera camera(*collision, CameraConfig{});
    camera.update(Vec3(4.0f, 7.5f, -3.0f));
    EXPECT_EQ(camera.target(), Vec3(4.0f, 2.0f, -3.0f));
}

TEST_F(ChaseCameraTest, ClearViewUsesNearestOffset) {
    ChaseCamera camera(*collision, CameraConfig{}, Vec3(0.0f, 2.0f, 0.0f));
    camera.update(Vec3(0.0f, 2.0f, 0.0f));
    EXPECT_EQ(camera.rawOffset(), Vec3(0.0f, 3.0f, 8.0f));
    EXPECT_EQ(camera.position(), Vec3(0.0f, 5.0f, 8.0f));
}

TEST_F(ChaseCameraTest, LowObstacleSkipsToHigherOffset) {
    // Box x[-1,1] y[0.4,4.4] z[5,7]: blocks the (0,3,8) ray but not (0,5,10)
    ASSERT_TRUE(city->createBuilding(CellPos(0, 0), Vec3(0.0f, 2.4f, 6.0f), 0.0f, 0, 2.0f));

    ChaseCamera camera(*collision, CameraConfig{});
    EXPECT_EQ(camera.selectOffset(Vec3(0.0f, 2.0f, 0.0f)), Vec3(0.0f, 5.0f, 10.0f));
}

TEST_F(ChaseCameraTest, ObstacleBeyondOffsetIgnored) {
    // Behind where the nearest camera would sit
    ASSERT_TRUE(city->createBuilding(CellPos(0, 1), Vec3(0.0f, 6.47f, 30.0f), 0.0f, 0, 25.0f));
    ChaseCamera camera(*collision, CameraConfig{});
    EXPECT_EQ(camera.selectOffset(Vec3(0.0f, 2.0f, 0.0f)), Vec3(0.0f, 3.0f, 8.0f));
}

TEST_F(ChaseCameraTest, AllObstructedFallsBackToFarthest) {
    // Target sits inside this box, so every ray hits at distance 0
    ASSERT_TRUE(city->createBuilding(CellPos(0, 0), Vec3(0.0f, 6.47f, 10.0f), 0.0f, 0, 200.0f));

    ChaseCamera camera(*collision, CameraConfig{}, Vec3(0.0f, 2.0f, 0.0f));
    camera.update(Vec3(0.0f, 2.0f, 0.0f));
    EXPECT_EQ(camera.rawOffset(), Vec3(0.0f, 14.0f, 16.0f));

    // Smoothed offset moves a tenth of the way
    EXPECT_NEAR(camera.smoothedOffset().y, 3.0f + 11.0f * 0.1f, 1e-5f);
    EXPECT_NEAR(camera.smoothedOffset().z, 8.0f + 8.0f * 0.1f, 1e-5f);
}

TEST_F(ChaseCameraTest, PositionEasesTowardTarget) {
    ChaseCamera camera(*collision, CameraConfig{}, Vec3(0.0f, 2.0f, 0.0f));
    camera.update(Vec3(10.0f, 2.0f, 0.0f));
    EXPECT_NEAR(camera.position().x, 1.0f, 1e-5f);
    EXPECT_NEAR(camera.position().y, 5.0f, 1e-5f);
    EXPECT_NEAR(camera.position().z, 8.0f, 1e-5f);

    for (int i = 0; i < 300; ++i) {
        camera.update(Vec3(10.0f, 2.0f, 0.0f));
    }
    EXPECT_NEAR(camera.position().x, 10.0f, 1e-3f);
}

TEST_F(ChaseCameraTest, OffsetsDoNotTurnWithPlayer) {
    ChaseCamera camera(*collision, CameraConfig{}, Vec3(0.0f, 2.0f, 0.0f));
    // The camera only ever sees positions; heading has no input path
    camera.update(Vec3(0.0f, 2.0f, 0.0f));
    EXPECT_FLOAT_EQ(camera.position().x, 0.0f);
    EXPECT_GT(camera.position().z, camera.target().z);
}

TEST_F(ChaseCameraTest, PoseCarriesProjection) {
    ChaseCamera camera(*collision, CameraConfig{}, Vec3(0.0f, 2.0f, 0.0f));
    camera.setAspect(2.0f);

    CameraPose pose = camera.pose();
    EXPECT_EQ(pose.position, camera.position());
    EXPECT_EQ(pose.target, camera.target());
    EXPECT_FLOAT_EQ(pose.fovDegrees, 75.0f);
    EXPECT_FLOAT_EQ(pose.aspect, 2.0f);
    EXPECT_FLOAT_EQ(pose.nearPlane, 0.1f);
    EXPECT_FLOAT_EQ(pose.farPlane, 1000.0f);
}
