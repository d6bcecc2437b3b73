#include <gtest/gtest.h>
#include "snowcity/core/city_streamer.hpp"
#include "snowcity/core/collision_index.hpp"
#include "snowcity/core/player_controller.hpp"
#include "fakes.hpp"
#include <algorithm>
#include <memory>

using namespace snowcity;
using namespace snowcity::fakes;

namespace {

PlayerIntent moving(int moveAxis, int rotateAxis = 0) {
    PlayerIntent intent;
    intent.moveAxis = moveAxis;
    intent.rotateAxis = rotateAxis;
    if (moveAxis > 0) {
        intent.animation = AnimationState::Run;
    } else if (moveAxis < 0) {
        intent.animation = AnimationState::Walk;
    }
    return intent;
}

constexpr float DT = 1.0f / 60.0f;

}  // namespace

class PlayerControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        CityConfig cityConfig;
        cityConfig.seed = 1;
        cityConfig.spawnChance = 0.0f;
        city = std::make_unique<CityStreamer>(scene, cityConfig);
        city->beginLoad(loader);
        city->pollLoad();
        collision = std::make_unique<CollisionIndex>(*city);
    }

    std::unique_ptr<PlayerController> makeReadyPlayer(PlayerConfig config = {}) {
        auto player = std::make_unique<PlayerController>(scene, *collision, config);
        player->beginLoad(loader, "assets/eternauta.fbx");
        player->pollLoad();
        return player;
    }

    // Building of variant 0 at scale 12.5: reach 6.25 + 1.5 + 0.1 = 7.85
    void placeBuilding(const CellPos& cell, const Vec3& center) {
        ASSERT_TRUE(city->createBuilding(cell, center, 0.0f, 0, 12.5f));
    }

    RecordingScene scene;
    FakeAssetLoader loader;
    std::unique_ptr<CityStreamer> city;
    std::unique_ptr<CollisionIndex> collision;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(PlayerControllerTest, NotReadyIgnoresTicksAndJumps) {
    loader.deferred = true;
    PlayerController player(scene, *collision);
    player.beginLoad(loader, "assets/eternauta.fbx");

    EXPECT_FALSE(player.pollLoad());
    EXPECT_FALSE(player.isReady());

    player.tick(DT, moving(1, 1));
    EXPECT_EQ(player.position(), Vec3(0.0f, 2.0f, 0.0f));
    EXPECT_FLOAT_EQ(player.yaw(), 0.0f);
    EXPECT_FALSE(player.jump());
    EXPECT_FALSE(player.isAirborne());

    loader.resolveAll();
    EXPECT_TRUE(player.pollLoad());
    EXPECT_TRUE(player.isReady());
    EXPECT_FALSE(player.pollLoad());
}

TEST_F(PlayerControllerTest, LoadAddsCharacterRenderable) {
    auto player = makeReadyPlayer();
    ASSERT_TRUE(player->isReady());
    EXPECT_EQ(scene.count(RenderableKind::Character), 1u);

    const auto* entry = scene.find(player->renderable());
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->desc.mesh, 100u);
    EXPECT_FLOAT_EQ(entry->desc.scale, 4.0f);
    EXPECT_FLOAT_EQ(player->animation().clipDuration(AnimationState::Run), 0.8f);
}

TEST_F(PlayerControllerTest, MissingClipHoldsStaticPose) {
    loader.character.clips.erase(loader.character.clips.begin() + 1);  // walk
    auto player = makeReadyPlayer();
    ASSERT_TRUE(player->isReady());
    EXPECT_FLOAT_EQ(player->animation().clipDuration(AnimationState::Walk), 0.0f);
    EXPECT_FLOAT_EQ(player->animation().clipDuration(AnimationState::Idle), 2.0f);
}

TEST_F(PlayerControllerTest, LoadFailureIsRethrown) {
    loader.failing.insert("assets/missing.fbx");
    PlayerController player(scene, *collision);
    player.beginLoad(loader, "assets/missing.fbx");

    EXPECT_THROW(player.pollLoad(), AssetLoadError);
    EXPECT_FALSE(player.isReady());
    EXPECT_EQ(scene.count(RenderableKind::Character), 0u);
}

TEST_F(PlayerControllerTest, DestructorRemovesCharacter) {
    {
        auto player = makeReadyPlayer();
        EXPECT_EQ(scene.count(RenderableKind::Character), 1u);
    }
    EXPECT_EQ(scene.count(RenderableKind::Character), 0u);
}

// ============================================================================
// Ground movement
// ============================================================================

TEST_F(PlayerControllerTest, RunForwardTenTicks) {
    auto player = makeReadyPlayer();
    for (int i = 0; i < 10; ++i) {
        player->tick(DT, moving(1));
    }
    EXPECT_NEAR(player->position().x, 0.0f, 1e-5f);
    EXPECT_FLOAT_EQ(player->position().y, 2.0f);
    EXPECT_NEAR(player->position().z, -1.5f, 1e-4f);
    EXPECT_EQ(player->animationState(), AnimationState::Run);
}

TEST_F(PlayerControllerTest, EnteringRunMovesOnceThatTick) {
    auto player = makeReadyPlayer();
    player->tick(DT, moving(1));
    EXPECT_NEAR(player->position().z, -0.15f, 1e-6f);
    EXPECT_EQ(player->animationState(), AnimationState::Run);
}

TEST_F(PlayerControllerTest, WalkBackward) {
    auto player = makeReadyPlayer();
    for (int i = 0; i < 10; ++i) {
        player->tick(DT, moving(-1));
    }
    EXPECT_NEAR(player->position().z, 0.6f, 1e-4f);
    EXPECT_EQ(player->animationState(), AnimationState::Walk);
}

TEST_F(PlayerControllerTest, IdleWhenNoKeys) {
    auto player = makeReadyPlayer();
    player->tick(DT, moving(1));
    player->tick(DT, moving(0));
    EXPECT_EQ(player->animationState(), AnimationState::Idle);
    EXPECT_NEAR(player->position().z, -0.15f, 1e-6f);
}

TEST_F(PlayerControllerTest, RotationPerTick) {
    auto player = makeReadyPlayer();
    for (int i = 0; i < 10; ++i) {
        player->tick(DT, moving(0, 1));
    }
    EXPECT_NEAR(player->yaw(), 0.15f, 1e-5f);

    for (int i = 0; i < 20; ++i) {
        player->tick(DT, moving(0, -1));
    }
    EXPECT_NEAR(player->yaw(), -0.15f, 1e-5f);
}

TEST_F(PlayerControllerTest, CollisionStopsGroundMovement) {
    placeBuilding(CellPos(0, -1), Vec3(0.0f, 6.47f, -10.0f));
    auto player = makeReadyPlayer();

    for (int i = 0; i < 30; ++i) {
        player->tick(DT, moving(1));
    }
    // Fourteen steps fit before the 7.85 reach is crossed
    EXPECT_NEAR(player->position().z, -2.1f, 1e-4f);
    EXPECT_EQ(player->blockedMoves(), 16u);
    EXPECT_FALSE(player->isAirborne());
    EXPECT_FALSE(player->lastLandingImpulse().has_value());
}

TEST_F(PlayerControllerTest, RotationNotBlockedByCollision) {
    placeBuilding(CellPos(0, -1), Vec3(0.0f, 6.47f, -7.9f));
    auto player = makeReadyPlayer();

    player->tick(DT, moving(1, 1));
    EXPECT_EQ(player->blockedMoves(), 1u);
    EXPECT_NEAR(player->yaw(), 0.015f, 1e-6f);
    EXPECT_FLOAT_EQ(player->position().z, 0.0f);
}

// ============================================================================
// Jumping
// ============================================================================

TEST_F(PlayerControllerTest, JumpIsImmediateAndNotRepeatable) {
    auto player = makeReadyPlayer();
    EXPECT_TRUE(player->jump());
    EXPECT_TRUE(player->isAirborne());
    EXPECT_EQ(player->animationState(), AnimationState::Jump);
    EXPECT_FLOAT_EQ(player->verticalVelocity(), 0.19f);

    player->tick(DT, moving(0));
    float v = player->verticalVelocity();
    EXPECT_FALSE(player->jump());
    EXPECT_FLOAT_EQ(player->verticalVelocity(), v);
}

TEST_F(PlayerControllerTest, JumpFromIntent) {
    auto player = makeReadyPlayer();
    PlayerIntent intent;
    intent.jumpRequested = true;
    player->tick(DT, intent);

    EXPECT_TRUE(player->isAirborne());
    EXPECT_EQ(player->animationState(), AnimationState::Jump);
    EXPECT_NEAR(player->position().y, 2.185f, 1e-5f);
    ASSERT_TRUE(player->jumpState().has_value());
    EXPECT_EQ(player->jumpState()->elapsedTicks, 1);
}

TEST_F(PlayerControllerTest, JumpArcLandsAtLandingHeight) {
    auto player = makeReadyPlayer();
    ASSERT_TRUE(player->jump());

    int ticks = 0;
    float peak = 0.0f;
    while (player->isAirborne() && ticks < 200) {
        player->tick(DT, moving(0));
        ++ticks;
        peak = std::max(peak, player->position().y);
        if (player->isAirborne()) {
            EXPECT_GT(player->position().y, 2.0f);
        }
    }

    EXPECT_GE(ticks, 74);
    EXPECT_LE(ticks, 90);
    EXPECT_GT(peak, 5.0f);
    EXPECT_FLOAT_EQ(player->position().y, 2.0f);
    EXPECT_FLOAT_EQ(player->verticalVelocity(), 0.0f);

    player->tick(DT, moving(0));
    EXPECT_EQ(player->animationState(), AnimationState::Idle);
}

TEST_F(PlayerControllerTest, JumpCappedAtMaxDuration) {
    PlayerConfig config;
    config.maxJumpDuration = 10;
    auto player = makeReadyPlayer(config);
    ASSERT_TRUE(player->jump());

    for (int i = 0; i < 9; ++i) {
        player->tick(DT, moving(0));
        EXPECT_TRUE(player->isAirborne());
    }
    player->tick(DT, moving(0));
    EXPECT_FALSE(player->isAirborne());
    EXPECT_FLOAT_EQ(player->position().y, 2.0f);
}

TEST_F(PlayerControllerTest, AirborneSpeedDecaysWithProgress) {
    auto player = makeReadyPlayer();
    ASSERT_TRUE(player->jump());

    player->tick(DT, moving(1));
    EXPECT_NEAR(player->position().z, -0.2f, 1e-5f);

    player->tick(DT, moving(1));
    float second = 0.2f * (1.0f - 0.7f * (1.0f / 90.0f));
    EXPECT_NEAR(player->position().z, -(0.2f + second), 1e-5f);
    EXPECT_EQ(player->animationState(), AnimationState::Jump);
}

TEST_F(PlayerControllerTest, MidAirCollisionLandsEarly) {
    placeBuilding(CellPos(0, -1), Vec3(0.0f, 6.47f, -9.9f));
    auto player = makeReadyPlayer();
    ASSERT_TRUE(player->jump());

    int ticks = 0;
    while (player->isAirborne() && ticks < 200) {
        player->tick(DT, moving(1));
        ++ticks;
    }

    EXPECT_LT(ticks, 30);
    EXPECT_FLOAT_EQ(player->position().y, 2.0f);
    ASSERT_TRUE(player->lastLandingImpulse().has_value());
    EXPECT_LT(*player->lastLandingImpulse(), 0.0f);
    EXPECT_GE(player->blockedMoves(), 1u);
}

TEST_F(PlayerControllerTest, HeightInvariantsUnderMixedInput) {
    PlayerConfig config;
    auto player = makeReadyPlayer(config);

    for (int i = 0; i < 400; ++i) {
        PlayerIntent intent = moving((i / 37) % 3 - 1, (i / 53) % 3 - 1);
        intent.jumpRequested = (i % 45 == 0);
        player->tick(DT, intent);

        if (player->isAirborne()) {
            EXPECT_LE(player->jumpState()->elapsedTicks, config.maxJumpDuration);
        } else {
            EXPECT_FLOAT_EQ(player->position().y, config.landingHeight);
        }
    }
}

// ============================================================================
// Scene output
// ============================================================================

TEST_F(PlayerControllerTest, TransformAndBlendPushedEachTick) {
    auto player = makeReadyPlayer();
    player->tick(DT, moving(1, 1));

    const auto* entry = scene.find(player->renderable());
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->desc.transform, player->transform());
    EXPECT_EQ(entry->blend.current, AnimationState::Run);
    ASSERT_TRUE(entry->blend.previous.has_value());
    EXPECT_EQ(*entry->blend.previous, AnimationState::Idle);
    EXPECT_GT(entry->blend.weight, 0.0f);
    EXPECT_LT(entry->blend.weight, 1.0f);
}
