#pragma once

/**
 * @file physics.hpp
 * @brief Collision primitives: occlusion box, ray slab test, and building colliders
 *
 * Buildings collide with the player as vertical cylinders (planar distance
 * test) but occlude the camera as axis-aligned boxes. Both views are derived
 * from the same BuildingCollider.
 */

#include "snowcity/core/position.hpp"
#include <glm/glm.hpp>
#include <optional>

namespace snowcity {

// ============================================================================
// AABB - Axis-Aligned Bounding Box used for camera occlusion
// ============================================================================

struct AABB {
    Vec3 min{0.0f};
    Vec3 max{0.0f};

    AABB() = default;
    AABB(const Vec3& min_, const Vec3& max_) : min(min_), max(max_) {}
    AABB(float minX, float minY, float minZ, float maxX, float maxY, float maxZ)
        : min(minX, minY, minZ), max(maxX, maxY, maxZ) {}

    // Create AABB centered at a point with given half-extents
    [[nodiscard]] static AABB fromHalfExtents(const Vec3& center, const Vec3& halfExtents) {
        return AABB(center - halfExtents, center + halfExtents);
    }

    // Ray intersection using the slab method.
    // direction does not need to be normalized; distances are in units of
    // |direction|. Returns true if the ray hits at t >= 0. tMin/tMax receive
    // the entry/exit parameters (tMin is 0 when the origin is inside).
    [[nodiscard]] bool rayIntersect(const Vec3& origin, const Vec3& direction,
                                     float* tMin = nullptr, float* tMax = nullptr) const;
};

// ============================================================================
// BuildingCollider - Collision volume of one placed building
// ============================================================================

struct BuildingCollider {
    Vec3 center{0.0f};
    float halfWidth = 0.0f;   // Planar radius of the footprint
    float halfHeight = 0.0f;
    float buffer = 0.0f;      // Extra trigger distance, varies per building variant

    // Cylindrical test: rotation of the building is ignored
    [[nodiscard]] bool intersectsCircle(const Vec3& point, float radius) const {
        return planarDistance(point, center) < halfWidth + radius + buffer;
    }

    // Box approximation used for occlusion rays
    [[nodiscard]] AABB bounds() const {
        return AABB::fromHalfExtents(center, Vec3(halfWidth, halfHeight, halfWidth));
    }
};

// ============================================================================
// RaycastHit
// ============================================================================

struct RaycastHit {
    bool hit = false;
    float distance = 0.0f;  // Distance from origin to hit point
    Vec3 hitPoint{0.0f};

    explicit operator bool() const { return hit; }
};

// Raycast a normalized direction against a single collider box.
[[nodiscard]] std::optional<float> raycastCollider(const BuildingCollider& collider,
                                                   const Vec3& origin,
                                                   const Vec3& direction,
                                                   float maxDistance);

}  // namespace snowcity
