#include "snowcity/core/city_streamer.hpp"
#include <glm/gtc/constants.hpp>
#include <sstream>

namespace snowcity {

namespace {

std::mt19937_64 makeRng(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        return std::mt19937_64((static_cast<uint64_t>(rd()) << 32) | rd());
    }
    return std::mt19937_64(seed);
}

}  // namespace

CityStreamer::CityStreamer(SceneGraph& scene, CityConfig config)
    : scene_(scene), config_(std::move(config)), rng_(makeRng(config_.seed)) {}

CityStreamer::~CityStreamer() {
    for (auto& [cell, building] : active_) {
        scene_.remove(building.renderable);
    }
}

// ============================================================================
// Asset loading
// ============================================================================

void CityStreamer::beginLoad(AssetLoader& loader) {
    if (!pendingModels_.empty() || ready_ || failed_) {
        log_.warn("beginLoad called twice, ignoring");
        return;
    }
    if (config_.variants.empty()) {
        log_.error("No building variants configured, city stays empty");
        failed_ = true;
        return;
    }

    pendingModels_.reserve(config_.variants.size());
    for (const auto& variant : config_.variants) {
        pendingModels_.emplace_back(variant.modelPath, loader.loadStaticModel(variant.modelPath));
    }
}

void CityStreamer::pollLoad() {
    if (ready_ || failed_ || pendingModels_.empty()) return;

    bool allReady = true;
    for (auto& pending : pendingModels_) {
        try {
            pending.poll();
        } catch (const AssetLoadError& e) {
            log_.error(std::string("Error loading building model: ") + e.what());
            failed_ = true;
            pendingModels_.clear();
            return;
        }
        if (!pending.ready()) {
            allReady = false;
        }
    }

    if (!allReady) return;

    variantMeshes_.clear();
    for (const auto& pending : pendingModels_) {
        variantMeshes_.push_back(pending.value().mesh);
    }
    pendingModels_.clear();
    ready_ = true;
    log_.info("Building models loaded successfully (" +
              std::to_string(variantMeshes_.size()) + " variants)");
}

// ============================================================================
// Streaming
// ============================================================================

void CityStreamer::update(const Vec3& playerPos) {
    if (!ready_) return;

    CellPos center = cellOf(playerPos, config_.gridSize);

    for (int32_t x = center.x - config_.windowRadius; x <= center.x + config_.windowRadius; ++x) {
        for (int32_t z = center.z - config_.windowRadius; z <= center.z + config_.windowRadius; ++z) {
            CellPos cell(x, z);
            if (!isProcessed(cell)) {
                decideCell(cell);
            }
        }
    }

    evictFar(center);
}

void CityStreamer::decideCell(const CellPos& cell) {
    processed_.insert(cell);

    if (uniform01() >= config_.spawnChance) {
        return;
    }

    // Keep the spawn point clear
    if (cell.radialDistanceFromOrigin() <= config_.exclusionRadius) {
        return;
    }

    spawnInCell(cell);
}

void CityStreamer::spawnInCell(const CellPos& cell) {
    std::uniform_int_distribution<size_t> variantDist(0, variantMeshes_.size() - 1);
    std::uniform_int_distribution<int> quarterDist(0, 3);

    size_t variant = variantDist(rng_);
    float yaw = static_cast<float>(quarterDist(rng_)) * glm::half_pi<float>();

    float jitter = 1.0f - config_.scaleJitter + uniform01() * 2.0f * config_.scaleJitter;
    float scale = config_.baseScale * jitter;

    // Offset inside the cell, keeping clear of neighbouring cells
    float usable = config_.gridSize - config_.spacing;
    float offsetX = (uniform01() - 0.5f) * usable;
    float offsetZ = (uniform01() - 0.5f) * usable;

    Vec3 position(
        static_cast<float>(cell.x) * config_.gridSize + offsetX,
        config_.baseHeight,
        static_cast<float>(cell.z) * config_.gridSize + offsetZ
    );

    createBuilding(cell, position, yaw, variant, scale);
}

bool CityStreamer::createBuilding(const CellPos& cell, const Vec3& position, float yaw,
                                  size_t variant, float scale) {
    if (isActive(cell)) return false;
    if (variant >= config_.variants.size()) {
        log_.warn("Variant index " + std::to_string(variant) + " out of range");
        return false;
    }

    processed_.insert(cell);

    BuildingInstance building;
    building.cell = cell;
    building.transform = Transform(position, yaw);
    building.variant = variant;
    building.scale = scale;
    building.collider = makeCollider(position, variant, scale);

    RenderableDesc desc;
    desc.kind = RenderableKind::Building;
    desc.mesh = variant < variantMeshes_.size() ? variantMeshes_[variant] : INVALID_MESH;
    desc.transform = building.transform;
    desc.scale = scale;
    building.renderable = scene_.add(desc);

    if (Logger::debugEnabled()) {
        std::ostringstream oss;
        oss << "Created building at (" << position.x << ", " << position.y << ", "
            << position.z << ") cell " << cell.x << "," << cell.z;
        log_.debug(oss.str());
    }

    active_.emplace(cell, building);
    return true;
}

bool CityStreamer::evictBuilding(const CellPos& cell) {
    auto it = active_.find(cell);
    if (it == active_.end()) return false;

    scene_.remove(it->second.renderable);
    active_.erase(it);
    return true;
}

void CityStreamer::evictFar(const CellPos& center) {
    std::vector<CellPos> far;
    for (const auto& [cell, building] : active_) {
        if (cell.chebyshevDistance(center) > config_.evictRadius) {
            far.push_back(cell);
        }
    }
    for (const auto& cell : far) {
        evictBuilding(cell);
    }
}

// ============================================================================
// Queries
// ============================================================================

const BuildingInstance* CityStreamer::buildingAt(const CellPos& cell) const {
    auto it = active_.find(cell);
    return it != active_.end() ? &it->second : nullptr;
}

BuildingCollider CityStreamer::makeCollider(const Vec3& position, size_t variant,
                                            float scale) const {
    const auto& v = config_.variants.at(variant);
    BuildingCollider collider;
    collider.center = position;
    collider.halfWidth = scale * v.footprint * 0.5f;
    collider.halfHeight = scale * v.height * 0.5f;
    collider.buffer = v.buffer;
    return collider;
}

float CityStreamer::uniform01() {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(rng_);
}

}  // namespace snowcity
