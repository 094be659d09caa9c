#pragma once

/**
 * @file region_fill.hpp
 * @brief Polygon region fill: raise the inside of an outline to a plateau
 *
 * Height ramps from 0 at the outline to targetHeight at `falloff` world
 * units inside it with a smoothstep profile. The distance to the outline
 * is jittered by coherent noise so the rim reads as natural rather than
 * ruled. Fill only ever raises cells.
 */

#include "terrasculpt/field/dirty_chunks.hpp"

#include <span>
#include <glm/glm.hpp>

namespace terrasculpt {

class HeightField;

struct RegionFillConfig {
    float targetHeight = 15.0f;
    float falloff = 15.0f;         // World units; 0 gives a vertical wall
    float noiseAmplitude = 0.8f;   // Rim jitter, as a fraction of falloff / 4
    float noiseOffset = 0.0f;      // Shifts the jitter pattern; vary per call for new rims
};

/// Fill the closed polygon of world (x, z) vertices. Fewer than three
/// vertices is a no-op returning an empty set.
DirtyChunkSet applyRegionFill(HeightField& field, std::span<const glm::vec2> polygon,
                              const RegionFillConfig& config);

}  // namespace terrasculpt
