#pragma once

/**
 * @file ridge_line.hpp
 * @brief Mountain ridge raised along an open polyline
 *
 * Cross-section is (1 - d/halfWidth)^2, peaking at targetHeight on the
 * centerline, modulated along the ridge by 1 + noise * ridgeNoise.
 * Like the region fill it only ever raises cells.
 */

#include "terrasculpt/field/dirty_chunks.hpp"

#include <span>
#include <glm/glm.hpp>

namespace terrasculpt {

class HeightField;

struct RidgeConfig {
    float targetHeight = 35.0f;
    float halfWidth = 20.0f;   // World units from centerline to foot
    float ridgeNoise = 0.4f;   // Peak height variation amplitude
    float noiseOffset = 0.0f;
};

/// Raise a ridge along world (x, z) vertices (not closed). Fewer than two
/// vertices is a no-op returning an empty set.
DirtyChunkSet applyRidgeLine(HeightField& field, std::span<const glm::vec2> polyline,
                             const RidgeConfig& config);

}  // namespace terrasculpt
