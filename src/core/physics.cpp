#include "snowcity/core/physics.hpp"
#include <algorithm>
#include <limits>
#include <utility>

namespace snowcity {

// ============================================================================
// AABB implementation
// ============================================================================

bool AABB::rayIntersect(const Vec3& origin, const Vec3& direction,
                        float* tMin, float* tMax) const {
    float tEnter = -std::numeric_limits<float>::infinity();
    float tExit = std::numeric_limits<float>::infinity();

    for (int axis = 0; axis < 3; ++axis) {
        float o = origin[axis];
        float d = direction[axis];
        float lo = min[axis];
        float hi = max[axis];

        if (d == 0.0f) {
            // Parallel to this slab: must already be inside it
            if (o < lo || o > hi) {
                return false;
            }
            continue;
        }

        float invD = 1.0f / d;
        float t0 = (lo - o) * invD;
        float t1 = (hi - o) * invD;
        if (t0 > t1) std::swap(t0, t1);

        tEnter = std::max(tEnter, t0);
        tExit = std::min(tExit, t1);
        if (tEnter > tExit) {
            return false;
        }
    }

    // Box entirely behind the ray
    if (tExit < 0.0f) {
        return false;
    }

    if (tMin) *tMin = std::max(tEnter, 0.0f);
    if (tMax) *tMax = tExit;
    return true;
}

// ============================================================================
// Collider raycast
// ============================================================================

std::optional<float> raycastCollider(const BuildingCollider& collider,
                                     const Vec3& origin,
                                     const Vec3& direction,
                                     float maxDistance) {
    float tMin = 0.0f;
    if (!collider.bounds().rayIntersect(origin, direction, &tMin)) {
        return std::nullopt;
    }
    if (tMin > maxDistance) {
        return std::nullopt;
    }
    return tMin;
}

}  // namespace snowcity
