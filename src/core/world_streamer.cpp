#include "snowcity/core/world_streamer.hpp"
#include <string>
#include <vector>

namespace snowcity {

WorldStreamer::WorldStreamer(SceneGraph& scene, AssetLoader& loader, GroundConfig config)
    : scene_(scene), config_(std::move(config)) {
    texture_ = loader.loadTexture(config_.texturePath);
    if (texture_ == INVALID_TEXTURE) {
        log_.warn("Ground texture '" + config_.texturePath + "' unavailable, tiles untextured");
    }
}

WorldStreamer::~WorldStreamer() {
    for (auto& [cell, id] : tiles_) {
        scene_.remove(id);
    }
}

void WorldStreamer::update(const Vec3& playerPos) {
    CellPos center = cellOf(playerPos, config_.tileSize);

    for (int32_t x = center.x - config_.windowRadius; x <= center.x + config_.windowRadius; ++x) {
        for (int32_t z = center.z - config_.windowRadius; z <= center.z + config_.windowRadius; ++z) {
            createTile(CellPos(x, z));
        }
    }

    std::vector<CellPos> far;
    for (const auto& [cell, id] : tiles_) {
        if (cell.chebyshevDistance(center) > config_.evictRadius) {
            far.push_back(cell);
        }
    }
    for (const auto& cell : far) {
        evictTile(cell);
    }
}

bool WorldStreamer::createTile(const CellPos& cell) {
    if (isActive(cell)) return false;

    RenderableDesc desc;
    desc.kind = RenderableKind::GroundTile;
    desc.texture = texture_;
    desc.transform = Transform(tileCenter(cell), 0.0f);
    desc.extent = config_.tileSize;
    desc.castShadow = false;
    desc.receiveShadow = true;

    tiles_.emplace(cell, scene_.add(desc));
    return true;
}

bool WorldStreamer::evictTile(const CellPos& cell) {
    auto it = tiles_.find(cell);
    if (it == tiles_.end()) return false;

    scene_.remove(it->second);
    tiles_.erase(it);
    return true;
}

Vec3 WorldStreamer::tileCenter(const CellPos& cell) const {
    return Vec3(static_cast<float>(cell.x) * config_.tileSize, 0.0f,
                static_cast<float>(cell.z) * config_.tileSize);
}

}  // namespace snowcity
