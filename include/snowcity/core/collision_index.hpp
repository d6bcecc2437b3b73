#pragma once

/**
 * @file collision_index.hpp
 * @brief Read-only collision queries over the active buildings
 *
 * The index holds no colliders of its own. It borrows the CityStreamer's
 * active set, so eviction and creation are visible to the next query
 * without any registration step.
 */

#include "snowcity/core/city_streamer.hpp"
#include "snowcity/core/physics.hpp"
#include "snowcity/core/position.hpp"

namespace snowcity {

class CollisionIndex {
public:
    explicit CollisionIndex(const CityStreamer& city) : city_(city) {}

    /// True if a circle of the given radius at point overlaps any building.
    /// Height is ignored.
    [[nodiscard]] bool intersects(const Vec3& point, float radius) const;

    /// Nearest building box hit along a ray within maxDistance.
    /// direction must be normalized.
    [[nodiscard]] RaycastHit raycast(const Vec3& origin, const Vec3& direction,
                                     float maxDistance) const;

    [[nodiscard]] size_t colliderCount() const { return city_.activeBuildings().size(); }

private:
    const CityStreamer& city_;
};

}  // namespace snowcity
