#pragma once

/**
 * @file position.hpp
 * @brief World-space vectors, transforms, and integer grid cells
 *
 * Every streamed lattice in the city (ground tiles, building cells) is keyed
 * by a CellPos. Cells are square, axis-aligned, and cover
 * [x*size, (x+1)*size) x [z*size, (z+1)*size) in world units.
 */

#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <compare>
#include <cstdint>
#include <cstdlib>
#include <functional>

namespace snowcity {

// ============================================================================
// GLM type alias
// ============================================================================

using Vec3 = glm::vec3;

// ============================================================================
// Transform - position plus yaw about +Y
// ============================================================================

struct Transform {
    Vec3 position{0.0f};
    float yaw = 0.0f;  // Radians, counter-clockwise seen from above

    Transform() = default;
    Transform(const Vec3& pos, float yaw_) : position(pos), yaw(yaw_) {}

    bool operator==(const Transform& other) const = default;
};

// ============================================================================
// CellPos - Integer (x, z) grid coordinate
// ============================================================================

struct CellPos {
    int32_t x = 0;
    int32_t z = 0;

    constexpr CellPos() = default;
    constexpr CellPos(int32_t x_, int32_t z_) : x(x_), z(z_) {}

    // Pack into 64-bit hash key (x in the high half)
    [[nodiscard]] uint64_t pack() const;

    // Chebyshev (chessboard) distance in cells
    [[nodiscard]] int32_t chebyshevDistance(const CellPos& other) const {
        return std::max(std::abs(x - other.x), std::abs(z - other.z));
    }

    // Radial distance of this cell's index from cell (0, 0)
    [[nodiscard]] float radialDistanceFromOrigin() const {
        return std::sqrt(static_cast<float>(x) * static_cast<float>(x) +
                         static_cast<float>(z) * static_cast<float>(z));
    }

    constexpr bool operator==(const CellPos& other) const = default;
    constexpr auto operator<=>(const CellPos& other) const = default;
};

// Cell containing a world position on a lattice of the given cell size.
// Uses floor so negative coordinates map to negative cells.
[[nodiscard]] inline CellPos cellOf(const Vec3& position, float cellSize) {
    return CellPos(
        static_cast<int32_t>(std::floor(position.x / cellSize)),
        static_cast<int32_t>(std::floor(position.z / cellSize))
    );
}

// Planar (x, z) distance, ignoring height
[[nodiscard]] inline float planarDistance(const Vec3& a, const Vec3& b) {
    float dx = a.x - b.x;
    float dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

// Forward unit vector for a yaw angle. yaw=0 faces -Z.
[[nodiscard]] inline Vec3 forwardFromYaw(float yaw) {
    return Vec3(-std::sin(yaw), 0.0f, -std::cos(yaw));
}

}  // namespace snowcity

template<>
struct std::hash<snowcity::CellPos> {
    size_t operator()(const snowcity::CellPos& pos) const noexcept {
        return std::hash<uint64_t>{}(pos.pack());
    }
};
