#pragma once

/**
 * @file scatter.hpp
 * @brief Seeded rejection sampling of placement points inside a polygon
 *
 * Same seed, polygon, count and field heights give identical placements.
 * Up to count * 5 candidates are drawn from the polygon's bounding box;
 * returning fewer than `count` placements is normal for thin polygons.
 */

#include <cstdint>
#include <span>
#include <vector>
#include <glm/glm.hpp>

namespace terrasculpt {

class HeightField;

struct ScatterPlacement {
    glm::vec3 position{0.0f};  // World (x, field height, z)
    float yaw = 0.0f;          // Radians in [0, 2pi)
    float scale = 1.0f;        // Per-instance scale is applied by the consumer
};

/// Sample placements inside a closed world (x, z) polygon. Elevation is the
/// height of the cell containing the point (no interpolation); accepted
/// points outside the grid are dropped. Fewer than three vertices or a
/// non-positive count yields no placements.
[[nodiscard]] std::vector<ScatterPlacement> scatterInPolygon(const HeightField& field,
                                                             std::span<const glm::vec2> polygon,
                                                             int32_t count, uint32_t seed);

}  // namespace terrasculpt
