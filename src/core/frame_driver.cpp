#include "snowcity/core/frame_driver.hpp"

namespace snowcity {

namespace {

// Weight of the newest sample in the smoothed FPS
constexpr float FPS_SMOOTHING = 0.1f;

}  // namespace

FrameDriver::FrameDriver(SceneGraph& scene, FrameRenderer& renderer, AssetLoader& loader,
                         SimulationConfig config, WallClock wallClock)
    : config_(std::move(config)),
      scene_(scene),
      renderer_(renderer),
      loader_(loader) {
    Logger::setDebugEnabled(config_.debugLogging);

    city_ = std::make_unique<CityStreamer>(scene_, config_.city);
    collision_ = std::make_unique<CollisionIndex>(*city_);
    ground_ = std::make_unique<WorldStreamer>(scene_, loader_, config_.ground);
    snow_ = std::make_unique<WeatherField>(scene_, config_.snow, std::move(wallClock));
    player_ = std::make_unique<PlayerController>(scene_, *collision_, config_.player);
    camera_ = std::make_unique<ChaseCamera>(*collision_, config_.camera, player_->position());
}

FrameDriver::~FrameDriver() {
    // Components that hold references into the city go first
    camera_.reset();
    player_.reset();
    collision_.reset();
    city_.reset();
}

void FrameDriver::start() {
    if (started_) {
        log_.warn("start() called twice, ignoring");
        return;
    }
    started_ = true;

    log_.info("Loading character '" + config_.assets.characterModel + "' and " +
              std::to_string(config_.city.variants.size()) + " building variants");
    player_->beginLoad(loader_, config_.assets.characterModel);
    city_->beginLoad(loader_);
    clock_.reset();
}

void FrameDriver::tick() {
    tick(clock_.tick());
}

void FrameDriver::tick(float dt) {
    if (started_) {
        player_->pollLoad();
        city_->pollLoad();
    }

    // A press made while the character is still loading waits for it
    PlayerIntent intent = input_.poll(player_->isAirborne(), player_->isReady());
    player_->tick(dt, intent);

    const Vec3& pos = player_->position();
    ground_->update(pos);
    snow_->update(dt, pos);
    city_->update(pos);

    camera_->update(pos);
    renderer_.renderFrame(camera_->pose());

    updateStats(dt);
}

void FrameDriver::onKeyDown(int keyCode) {
    input_.onKeyDown(keyCode);
}

void FrameDriver::onKeyUp(int keyCode) {
    input_.onKeyUp(keyCode);
}

void FrameDriver::onResize(int width, int height) {
    if (height <= 0 || width <= 0) {
        log_.debug("Ignoring resize to " + std::to_string(width) + "x" + std::to_string(height));
        return;
    }
    camera_->setAspect(static_cast<float>(width) / static_cast<float>(height));
    renderer_.resize(width, height);
}

void FrameDriver::updateStats(float dt) {
    ++stats_.frameCount;
    stats_.lastDelta = dt;
    if (dt <= 0.0f) return;

    float fps = 1.0f / dt;
    if (stats_.smoothedFps <= 0.0f) {
        stats_.smoothedFps = fps;
    } else {
        stats_.smoothedFps += (fps - stats_.smoothedFps) * FPS_SMOOTHING;
    }
}

}  // namespace snowcity
