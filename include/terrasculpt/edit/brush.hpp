#pragma once

/**
 * @file brush.hpp
 * @brief Radial brush: sculpt, level and paint
 *
 * The brush covers grid cells strictly inside a circle of
 * ceil(radius in cells) around the cell containing the world point.
 * Weight falls off as (1 - d^2/r^2)^2: 1 at the center, 0 at the rim.
 */

#include "terrasculpt/field/dirty_chunks.hpp"

#include <cstdint>
#include <glm/glm.hpp>

namespace terrasculpt {

class HeightField;

enum class BrushMode : uint8_t {
    Sculpt,  // height += strength * falloff
    Level,   // height moves toward targetHeight by strength * 0.1 * falloff
    Paint,   // color moves toward color by clamp(strength * falloff * 5, 0, 1)
};

/// Editor tools layered over the modes
enum class BrushTool : uint8_t {
    Raise,
    Lower,
    Level,
    Paint,
};

struct BrushConfig {
    float radius = 6.0f;       // World units
    float strength = 0.4f;     // Signed
    BrushMode mode = BrushMode::Sculpt;
    glm::vec3 color{0.25f};    // Paint color, channels in [0, 1]
    float targetHeight = 8.0f; // Level target

    /// Raise and Lower sculpt with +|strength| and -|strength|
    [[nodiscard]] static BrushConfig forTool(BrushTool tool, float radius, float strength,
                                             float targetHeight, const glm::vec3& color);
};

/// Apply one brush stamp centered on the world hit point (x and z are used).
/// Returns the chunks whose cells changed; empty when nothing in the field
/// is under the brush.
DirtyChunkSet applyBrush(HeightField& field, const glm::vec3& worldPoint, const BrushConfig& config);

}  // namespace terrasculpt
