#pragma once

/**
 * @file asset_loader.hpp
 * @brief Asset-loading collaborator and non-blocking load tracking
 *
 * Loads run concurrently with ticking. Components hold a PendingAsset and
 * poll it once per tick; until it resolves they report "not ready" and
 * their updates are no-ops. A failed load surfaces as an exception from the
 * future and is rethrown by PendingAsset::poll() as AssetLoadError.
 */

#include "snowcity/core/scene.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace snowcity {

// ============================================================================
// Loaded asset types
// ============================================================================

struct AnimationClip {
    std::string name;      // "idle", "walk", "run", "jump"
    float duration = 0.0f; // Seconds
};

struct SkinnedModel {
    MeshHandle mesh = INVALID_MESH;
    std::vector<AnimationClip> clips;

    [[nodiscard]] const AnimationClip* findClip(std::string_view name) const {
        for (const auto& clip : clips) {
            if (clip.name == name) return &clip;
        }
        return nullptr;
    }
};

struct StaticModel {
    MeshHandle mesh = INVALID_MESH;
};

// ============================================================================
// AssetLoadError
// ============================================================================

class AssetLoadError : public std::runtime_error {
public:
    AssetLoadError(const std::string& path, const std::string& reason)
        : std::runtime_error("Failed to load asset '" + path + "': " + reason),
          path_(path) {}

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ============================================================================
// AssetLoader - Interface implemented by the host's loader
// ============================================================================

class AssetLoader {
public:
    virtual ~AssetLoader() = default;

    virtual std::future<SkinnedModel> loadSkinnedModel(const std::string& path) = 0;
    virtual std::future<StaticModel> loadStaticModel(const std::string& path) = 0;

    /// Texture handle is returned immediately; pixel data fills in later
    virtual TextureHandle loadTexture(const std::string& path) = 0;
};

// ============================================================================
// PendingAsset - One in-flight load, polled without blocking
// ============================================================================

template<typename T>
class PendingAsset {
public:
    enum class Status : uint8_t {
        Idle,     // Never requested
        Loading,
        Ready,
        Failed
    };

    PendingAsset() = default;
    PendingAsset(std::string path, std::future<T> future)
        : path_(std::move(path)), future_(std::move(future)), status_(Status::Loading) {}

    /// Check the future without blocking. Returns true on the tick the
    /// asset becomes ready. Throws AssetLoadError on the tick it fails.
    bool poll() {
        if (status_ != Status::Loading) return false;
        if (!future_.valid()) {
            status_ = Status::Failed;
            throw AssetLoadError(path_, "no load in flight");
        }
        if (future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }
        try {
            value_ = future_.get();
        } catch (const std::exception& e) {
            status_ = Status::Failed;
            throw AssetLoadError(path_, e.what());
        }
        status_ = Status::Ready;
        return true;
    }

    [[nodiscard]] Status status() const { return status_; }
    [[nodiscard]] bool ready() const { return status_ == Status::Ready; }
    [[nodiscard]] bool failed() const { return status_ == Status::Failed; }
    [[nodiscard]] const std::string& path() const { return path_; }

    /// Loaded value (only valid when ready())
    [[nodiscard]] const T& value() const { return *value_; }

private:
    std::string path_;
    std::future<T> future_;
    std::optional<T> value_;
    Status status_ = Status::Idle;
};

}  // namespace snowcity
