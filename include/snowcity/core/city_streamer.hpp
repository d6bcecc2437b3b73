#pragma once

/**
 * @file city_streamer.hpp
 * @brief Procedural building placement streamed around the player
 *
 * The city lattice is divided into square cells (gridSize units). Each cell
 * is decided exactly once per session: the first time it enters the 5x5
 * window around the player it is marked processed and either receives a
 * building or stays empty. Buildings far from the player are evicted from
 * the scene but their cells stay processed, so a cell never respawns.
 *
 * Nothing happens until every building variant model has loaded. A failed
 * variant load leaves the streamer permanently unready.
 */

#include "snowcity/core/asset_loader.hpp"
#include "snowcity/core/logger.hpp"
#include "snowcity/core/physics.hpp"
#include "snowcity/core/position.hpp"
#include "snowcity/core/scene.hpp"
#include "snowcity/core/sim_config.hpp"
#include <cstdint>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace snowcity {

/// One placed building. Immutable once created.
struct BuildingInstance {
    CellPos cell;
    Transform transform;
    size_t variant = 0;
    float scale = 1.0f;
    BuildingCollider collider;
    RenderableId renderable = INVALID_RENDERABLE;
};

class CityStreamer {
public:
    CityStreamer(SceneGraph& scene, CityConfig config);
    ~CityStreamer();

    CityStreamer(const CityStreamer&) = delete;
    CityStreamer& operator=(const CityStreamer&) = delete;

    // ========================================================================
    // Asset loading
    // ========================================================================

    /// Request one static model per variant. Call once.
    void beginLoad(AssetLoader& loader);

    /// Resolve finished loads without blocking. Failures are logged, never thrown.
    void pollLoad();

    [[nodiscard]] bool isReady() const { return ready_; }
    [[nodiscard]] bool loadFailed() const { return failed_; }

    // ========================================================================
    // Streaming
    // ========================================================================

    /// Decide unprocessed cells in the window and evict far buildings.
    /// No-op until ready.
    void update(const Vec3& playerPos);

    /// Place a building in a cell and mark the cell processed.
    /// Returns false if the cell already holds an active building or the
    /// variant index is out of range.
    bool createBuilding(const CellPos& cell, const Vec3& position, float yaw,
                        size_t variant, float scale);

    /// Remove a building from the scene and the active set.
    /// The cell stays processed.
    bool evictBuilding(const CellPos& cell);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] const std::unordered_map<CellPos, BuildingInstance>& activeBuildings() const {
        return active_;
    }
    [[nodiscard]] const std::unordered_set<CellPos>& processedCells() const { return processed_; }

    [[nodiscard]] bool isProcessed(const CellPos& cell) const { return processed_.count(cell) != 0; }
    [[nodiscard]] bool isActive(const CellPos& cell) const { return active_.count(cell) != 0; }
    [[nodiscard]] const BuildingInstance* buildingAt(const CellPos& cell) const;

    [[nodiscard]] const CityConfig& config() const { return config_; }

    /// Collision volume for a building of the given variant and final scale
    [[nodiscard]] BuildingCollider makeCollider(const Vec3& position, size_t variant,
                                                float scale) const;

private:
    void decideCell(const CellPos& cell);
    void spawnInCell(const CellPos& cell);
    void evictFar(const CellPos& center);

    [[nodiscard]] float uniform01();

    SceneGraph& scene_;
    CityConfig config_;
    Logger log_{"city"};
    std::mt19937_64 rng_;

    std::vector<PendingAsset<StaticModel>> pendingModels_;
    std::vector<MeshHandle> variantMeshes_;
    bool ready_ = false;
    bool failed_ = false;

    std::unordered_map<CellPos, BuildingInstance> active_;
    std::unordered_set<CellPos> processed_;
};

}  // namespace snowcity
