#pragma once

/**
 * @file carve.hpp
 * @brief Cut a primitive's footprint out of the terrain
 *
 * 2.5D only: the shape is rasterized on X/Z and every covered cell above
 * the primitive's floor (position.y - scale.y / 2) is lowered to it,
 * bounded below by CARVE_FLOOR_LIMIT. Spheres and cylinders share the
 * same elliptical footprint; no true 3D solid subtraction is attempted.
 */

#include "terrasculpt/field/dirty_chunks.hpp"

#include <cstdint>
#include <glm/glm.hpp>

namespace terrasculpt {

class HeightField;

enum class PrimitiveShape : uint8_t {
    Cube,
    Sphere,
    Cylinder,
};

/// Carving never goes deeper than this
inline constexpr float CARVE_FLOOR_LIMIT = -50.0f;

/// Carve the primitive centered at world `position` with full extents
/// `scale`. A non-positive X or Z extent covers no cells.
DirtyChunkSet applyCarve(HeightField& field, const glm::vec3& position, const glm::vec3& scale,
                         PrimitiveShape shape);

}  // namespace terrasculpt
