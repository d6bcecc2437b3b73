#pragma once

/**
 * @file scene.hpp
 * @brief Rendering collaborator interfaces
 *
 * The simulation never issues draw calls. It adds and removes renderable
 * handles, updates their transforms and animation blends, and hands a
 * camera pose to the renderer once per frame. Shadows, fog, lighting and
 * overlays belong to the implementation behind these interfaces.
 */

#include "snowcity/core/position.hpp"
#include "snowcity/core/animation_state.hpp"
#include <cstdint>
#include <span>

namespace snowcity {

/// Opaque handles issued by the asset loader
using MeshHandle = uint32_t;
using TextureHandle = uint32_t;

constexpr MeshHandle INVALID_MESH = 0;
constexpr TextureHandle INVALID_TEXTURE = 0;

/// Handle of a renderable added to the scene
using RenderableId = uint64_t;

constexpr RenderableId INVALID_RENDERABLE = 0;

enum class RenderableKind : uint8_t {
    Character,   ///< Skinned player model
    Building,    ///< Static building instance
    GroundTile,  ///< Flat textured ground quad, tileSize x tileSize
    SnowField    ///< Point cloud fed through setParticles()
};

struct RenderableDesc {
    RenderableKind kind = RenderableKind::Building;
    MeshHandle mesh = INVALID_MESH;
    TextureHandle texture = INVALID_TEXTURE;
    Transform transform;
    float scale = 1.0f;     // Uniform scale
    float extent = 0.0f;    // Edge length for GroundTile
    bool castShadow = true;
    bool receiveShadow = true;
};

/// Camera state handed to the renderer
struct CameraPose {
    Vec3 position{0.0f};
    Vec3 target{0.0f};          // Look-at point
    float fovDegrees = 75.0f;   // Vertical field of view
    float aspect = 16.0f / 9.0f;
    float nearPlane = 0.1f;
    float farPlane = 1000.0f;
};

// ============================================================================
// SceneGraph - Set of positioned renderables
// ============================================================================

class SceneGraph {
public:
    virtual ~SceneGraph() = default;

    /// Add a renderable. Returns a handle unique for the scene's lifetime.
    virtual RenderableId add(const RenderableDesc& desc) = 0;

    /// Remove a renderable. Unknown handles are ignored.
    virtual void remove(RenderableId id) = 0;

    virtual void setTransform(RenderableId id, const Transform& transform) = 0;

    /// Current animation mix for a skinned renderable
    virtual void setAnimationBlend(RenderableId id, const AnimationBlend& blend) {
        (void)id;
        (void)blend;
    }

    /// Replace the point positions of a SnowField renderable
    virtual void setParticles(RenderableId id, std::span<const Vec3> positions) = 0;
};

// ============================================================================
// FrameRenderer - Produces pixels for one frame
// ============================================================================

class FrameRenderer {
public:
    virtual ~FrameRenderer() = default;

    /// Render the scene from the given camera
    virtual void renderFrame(const CameraPose& camera) = 0;

    /// Resize the output surface
    virtual void resize(int width, int height) = 0;
};

}  // namespace snowcity
