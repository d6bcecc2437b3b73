#include "snowcity/core/collision_index.hpp"

namespace snowcity {

bool CollisionIndex::intersects(const Vec3& point, float radius) const {
    for (const auto& [cell, building] : city_.activeBuildings()) {
        if (building.collider.intersectsCircle(point, radius)) {
            return true;
        }
    }
    return false;
}

RaycastHit CollisionIndex::raycast(const Vec3& origin, const Vec3& direction,
                                   float maxDistance) const {
    RaycastHit result;
    float nearest = maxDistance;

    for (const auto& [cell, building] : city_.activeBuildings()) {
        auto t = raycastCollider(building.collider, origin, direction, nearest);
        if (t && (!result.hit || *t < nearest)) {
            result.hit = true;
            nearest = *t;
        }
    }

    if (result.hit) {
        result.distance = nearest;
        result.hitPoint = origin + direction * nearest;
    }
    return result;
}

}  // namespace snowcity
