#pragma once

#include "terrasculpt/core/position.hpp"
#include "terrasculpt/field/field_geometry.hpp"

#include <span>
#include <vector>
#include <glm/glm.hpp>

namespace terrasculpt {

/// Squared distance from p to segment [a, b]; a degenerate segment is a point
[[nodiscard]] float distanceToSegmentSq(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b);

/// Even-odd ray-casting test against a closed polygon (last vertex joins the first)
[[nodiscard]] bool isPointInPolygon(const glm::vec2& p, std::span<const glm::vec2> polygon);

/// World (x, z) vertices to continuous grid (column, row)
[[nodiscard]] std::vector<glm::vec2> toGridPoints(const FieldGeometry& geometry,
                                                  std::span<const glm::vec2> worldPoints);

/// Bounding cell window of grid points grown by `margin` cells on each side,
/// clipped to the field. Empty when nothing overlaps.
[[nodiscard]] CellWindow expandedBounds(const FieldGeometry& geometry,
                                        std::span<const glm::vec2> gridPoints, float margin);

}  // namespace terrasculpt
