/**
 * @file city_walk_demo.cpp
 * @brief Headless walk through the streamed city
 *
 * Demonstrates:
 * - FrameDriver setup with host-provided scene, renderer and loader
 * - Asynchronous model loads resolving while the simulation ticks
 * - Building and ground streaming as the player moves
 * - Collision-aware chase camera
 *
 * No window is opened. The scene and renderer print a summary instead of
 * drawing, and a fixed input script plays the role of the keyboard.
 *
 * Command line:
 * - --config <path>: Load tuning from a config file
 * - --write-config <path>: Write the effective config and exit
 * - --ticks <n>: Number of ticks to run (default 1200)
 * - --seed <n>: City and snow seed (default 2024)
 * - --debug: Enable debug logging
 */

#include <snowcity/core/asset_loader.hpp>
#include <snowcity/core/config_file.hpp>
#include <snowcity/core/frame_driver.hpp>
#include <snowcity/core/key_bindings.hpp>
#include <snowcity/core/logger.hpp>
#include <snowcity/core/scene.hpp>
#include <snowcity/core/sim_config.hpp>

#include <chrono>
#include <cstdlib>
#include <future>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace snowcity;

namespace {

// ============================================================================
// ConsoleScene - counts renderables instead of drawing them
// ============================================================================

class ConsoleScene : public SceneGraph {
public:
    RenderableId add(const RenderableDesc& desc) override {
        RenderableId id = nextId_++;
        kinds_[id] = desc.kind;
        return id;
    }

    void remove(RenderableId id) override { kinds_.erase(id); }

    void setTransform(RenderableId, const Transform&) override {}

    void setParticles(RenderableId, std::span<const Vec3> positions) override {
        particleCount_ = positions.size();
    }

    [[nodiscard]] size_t count(RenderableKind kind) const {
        size_t n = 0;
        for (const auto& [id, k] : kinds_) {
            if (k == kind) ++n;
        }
        return n;
    }

    [[nodiscard]] size_t particleCount() const { return particleCount_; }

private:
    std::unordered_map<RenderableId, RenderableKind> kinds_;
    RenderableId nextId_ = 1;
    size_t particleCount_ = 0;
};

// ============================================================================
// ConsoleRenderer
// ============================================================================

class ConsoleRenderer : public FrameRenderer {
public:
    void renderFrame(const CameraPose& camera) override { last_ = camera; }

    void resize(int width, int height) override {
        std::cout << "Surface resized to " << width << "x" << height << "\n";
    }

    [[nodiscard]] const CameraPose& lastPose() const { return last_; }

private:
    CameraPose last_;
};

// ============================================================================
// SyntheticLoader - fabricates models on a worker after a short delay
// ============================================================================

class SyntheticLoader : public AssetLoader {
public:
    std::future<SkinnedModel> loadSkinnedModel(const std::string& /*path*/) override {
        MeshHandle mesh = nextMesh_++;
        return std::async(std::launch::async, [mesh] {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            SkinnedModel model;
            model.mesh = mesh;
            model.clips = {{"idle", 2.0f}, {"walk", 1.1f}, {"run", 0.7f}, {"jump", 1.4f}};
            return model;
        });
    }

    std::future<StaticModel> loadStaticModel(const std::string& /*path*/) override {
        MeshHandle mesh = nextMesh_++;
        return std::async(std::launch::async, [mesh] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            return StaticModel{mesh};
        });
    }

    TextureHandle loadTexture(const std::string&) override { return nextTexture_++; }

private:
    MeshHandle nextMesh_ = 1;
    TextureHandle nextTexture_ = 1;
};

// One scripted key edge
struct ScriptedKey {
    uint64_t tick;
    int keyCode;
    bool down;
};

std::vector<ScriptedKey> walkScript() {
    return {
        {0, KEY_W, true},
        {240, KEY_A, true},
        {330, KEY_A, false},
        {400, KEY_SPACE, true},
        {410, KEY_SPACE, false},
        {700, KEY_D, true},
        {880, KEY_D, false},
        {1000, KEY_W, false},
        {1010, KEY_S, true},
        {1100, KEY_S, false},
    };
}

void printStatus(const FrameDriver& driver, const ConsoleScene& scene, uint64_t tick) {
    const Vec3& p = driver.player().position();
    const Vec3& c = driver.camera().position();
    std::cout << std::fixed << std::setprecision(2)
              << "tick " << std::setw(5) << tick
              << "  player (" << p.x << ", " << p.y << ", " << p.z << ")"
              << "  camera (" << c.x << ", " << c.y << ", " << c.z << ")"
              << "  anim " << animationClipName(driver.player().animationState())
              << "  buildings " << scene.count(RenderableKind::Building)
              << "  tiles " << scene.count(RenderableKind::GroundTile)
              << "  blocked " << driver.player().blockedMoves()
              << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "SnowCity Walk Demo\n";
    std::cout << "==================\n\n";

    std::string configPath;
    std::string writeConfigPath;
    uint64_t tickCount = 1200;
    uint64_t seed = 2024;
    bool debug = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--write-config" && i + 1 < argc) {
            writeConfigPath = argv[++i];
        } else if (arg == "--ticks" && i + 1 < argc) {
            tickCount = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--debug") {
            debug = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    try {
        SimulationConfig config;
        if (!configPath.empty()) {
            config = SimulationConfig::load(configPath);
        } else {
            config.city.seed = seed;
            config.snow.seed = seed;
        }
        if (debug) {
            config.debugLogging = true;
        }

        if (!writeConfigPath.empty()) {
            ConfigFile file;
            file.loadFromString("# SnowCity simulation settings\n\n");
            config.writeTo(file);
            if (!file.saveAs(writeConfigPath)) {
                std::cerr << "Could not write " << writeConfigPath << "\n";
                return 1;
            }
            std::cout << "Wrote " << writeConfigPath << "\n";
            return 0;
        }

        ConsoleScene scene;
        ConsoleRenderer renderer;
        SyntheticLoader loader;

        FrameDriver driver(scene, renderer, loader, config);
        driver.onResize(1280, 720);
        driver.start();

        auto script = walkScript();
        size_t nextKey = 0;

        // Pace ticks at ~60 Hz so the async loads land mid-run
        const auto frame = std::chrono::microseconds(16667);
        for (uint64_t tick = 0; tick < tickCount; ++tick) {
            while (nextKey < script.size() && script[nextKey].tick == tick) {
                const auto& key = script[nextKey++];
                if (key.down) {
                    driver.onKeyDown(key.keyCode);
                } else {
                    driver.onKeyUp(key.keyCode);
                }
            }

            driver.tick();

            if (tick % 120 == 0) {
                printStatus(driver, scene, tick);
            }
            std::this_thread::sleep_for(frame);
        }

        printStatus(driver, scene, tickCount);
        const auto& stats = driver.stats();
        std::cout << "\nFrames: " << stats.frameCount
                  << "  avg FPS: " << std::setprecision(1) << stats.smoothedFps
                  << "  snow particles: " << scene.particleCount()
                  << "  cells decided: " << driver.city().processedCells().size() << "\n";
        std::cout << "Camera looking at (" << renderer.lastPose().target.x << ", "
                  << renderer.lastPose().target.y << ", "
                  << renderer.lastPose().target.z << ")\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
