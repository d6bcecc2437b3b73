#include "snowcity/core/player_controller.hpp"

namespace snowcity {

PlayerController::PlayerController(SceneGraph& scene, const CollisionIndex& collision,
                                   PlayerConfig config)
    : scene_(scene), collision_(collision), config_(std::move(config)) {
    transform_.position = config_.spawnPosition;
}

PlayerController::~PlayerController() {
    if (renderable_ != INVALID_RENDERABLE) {
        scene_.remove(renderable_);
    }
}

// ============================================================================
// Asset loading
// ============================================================================

void PlayerController::beginLoad(AssetLoader& loader, const std::string& modelPath) {
    if (pendingModel_.status() != PendingAsset<SkinnedModel>::Status::Idle) {
        log_.warn("Character model already requested");
        return;
    }
    pendingModel_ = PendingAsset<SkinnedModel>(modelPath, loader.loadSkinnedModel(modelPath));
}

bool PlayerController::pollLoad() {
    if (ready_) return false;

    try {
        if (!pendingModel_.poll()) return false;
    } catch (const AssetLoadError& e) {
        log_.error(std::string("Error loading character model: ") + e.what());
        throw;
    }

    onModelLoaded(pendingModel_.value());
    return true;
}

void PlayerController::onModelLoaded(const SkinnedModel& model) {
    for (size_t i = 0; i < ANIMATION_STATE_COUNT; ++i) {
        auto state = static_cast<AnimationState>(i);
        const AnimationClip* clip = model.findClip(animationClipName(state));
        if (!clip) {
            log_.warn("Character model has no '" + std::string(animationClipName(state)) +
                      "' clip, holding a static pose");
            animation_.setClipDuration(state, 0.0f);
            continue;
        }
        animation_.setClipDuration(state, clip->duration);
    }

    RenderableDesc desc;
    desc.kind = RenderableKind::Character;
    desc.mesh = model.mesh;
    desc.transform = transform_;
    desc.scale = config_.modelScale;
    renderable_ = scene_.add(desc);

    ready_ = true;
    log_.info("Character model loaded");
    pushToScene();
}

// ============================================================================
// Simulation
// ============================================================================

void PlayerController::tick(float dt, const PlayerIntent& intent) {
    if (!ready_) {
        log_.debug("tick before model is ready, skipping");
        return;
    }

    // Rotation is never blocked
    transform_.yaw += static_cast<float>(intent.rotateAxis) * config_.rotateSpeed;

    if (intent.jumpRequested) {
        jump();
    }

    animation_.transitionTo(isAirborne() ? AnimationState::Jump : intent.animation);

    // One horizontal step per tick, whether or not the state just changed
    if (intent.moveAxis != 0) {
        moveHorizontal(intent.moveAxis);
    }

    if (jump_) {
        stepJump();
    }

    animation_.advance(dt);
    pushToScene();
}

bool PlayerController::jump() {
    if (!ready_ || jump_) return false;

    JumpState state;
    state.verticalVelocity = config_.jumpSpeed;
    state.elapsedTicks = 0;
    state.maxDuration = config_.maxJumpDuration;
    jump_ = state;

    animation_.transitionTo(AnimationState::Jump);
    return true;
}

float PlayerController::horizontalSpeed(int moveAxis) const {
    if (jump_) {
        return config_.jumpForwardSpeed * (1.0f - config_.jumpSpeedDecay * jump_->progress());
    }
    return moveAxis > 0 ? config_.runSpeed : config_.walkSpeed;
}

void PlayerController::moveHorizontal(int moveAxis) {
    float speed = horizontalSpeed(moveAxis);
    Vec3 candidate = transform_.position +
                     forwardFromYaw(transform_.yaw) * (static_cast<float>(moveAxis) * speed);
    candidate.y = transform_.position.y;

    if (!collision_.intersects(candidate, config_.radius)) {
        transform_.position = candidate;
        return;
    }

    ++blockedMoves_;
    if (jump_) {
        // Mid-air hit: bounce the vertical velocity and come down immediately
        jump_->verticalVelocity *= -0.5f;
        landingImpulse_ = jump_->verticalVelocity;
        endJump();
    }
}

void PlayerController::stepJump() {
    jump_->verticalVelocity -= config_.gravity;
    transform_.position.y += jump_->verticalVelocity;
    jump_->elapsedTicks += 1;

    if (transform_.position.y <= config_.landingHeight ||
        jump_->elapsedTicks >= jump_->maxDuration) {
        endJump();
    }
}

void PlayerController::endJump() {
    transform_.position.y = config_.landingHeight;
    jump_.reset();
}

void PlayerController::pushToScene() {
    if (renderable_ == INVALID_RENDERABLE) return;
    scene_.setTransform(renderable_, transform_);
    scene_.setAnimationBlend(renderable_, animation_.blend());
}

}  // namespace snowcity
