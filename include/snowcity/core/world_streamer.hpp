#pragma once

/**
 * @file world_streamer.hpp
 * @brief Ring of flat ground tiles kept around the player
 *
 * Tiles carry no state beyond their renderable, so unlike building cells
 * they are forgotten on eviction and recreated identically when their
 * cell re-enters the window.
 */

#include "snowcity/core/asset_loader.hpp"
#include "snowcity/core/logger.hpp"
#include "snowcity/core/position.hpp"
#include "snowcity/core/scene.hpp"
#include "snowcity/core/sim_config.hpp"
#include <utility>
#include <unordered_map>

namespace snowcity {

class WorldStreamer {
public:
    /// Requests the ground texture from the loader immediately
    WorldStreamer(SceneGraph& scene, AssetLoader& loader, GroundConfig config);
    ~WorldStreamer();

    WorldStreamer(const WorldStreamer&) = delete;
    WorldStreamer& operator=(const WorldStreamer&) = delete;

    /// Fill the window around the player and evict distant tiles
    void update(const Vec3& playerPos);

    /// Add the tile for a cell. Returns false if it is already active.
    bool createTile(const CellPos& cell);

    /// Remove the tile for a cell. Returns false if it was not active.
    bool evictTile(const CellPos& cell);

    [[nodiscard]] const std::unordered_map<CellPos, RenderableId>& activeTiles() const {
        return tiles_;
    }
    [[nodiscard]] bool isActive(const CellPos& cell) const { return tiles_.count(cell) != 0; }
    [[nodiscard]] size_t tileCount() const { return tiles_.size(); }

    /// World position of a tile's center
    [[nodiscard]] Vec3 tileCenter(const CellPos& cell) const;

    [[nodiscard]] TextureHandle texture() const { return texture_; }
    [[nodiscard]] const GroundConfig& config() const { return config_; }

private:
    SceneGraph& scene_;
    GroundConfig config_;
    Logger log_{"ground"};
    TextureHandle texture_ = INVALID_TEXTURE;

    std::unordered_map<CellPos, RenderableId> tiles_;
};

}  // namespace snowcity
