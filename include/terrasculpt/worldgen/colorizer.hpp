/**
 * @file colorizer.hpp
 * @brief Procedural terrain coloring from height, slope and noise
 *
 * A cell's color is a pure function of its height, its four axis
 * neighbors (for slope) and coherent noise, independent of how the height
 * was produced. Classification walks an ordered rule table top to bottom;
 * the first band whose predicate matches wins, then an optional
 * noise- or height-triggered variation is applied inside that band.
 */

#pragma once

#include "terrasculpt/worldgen/noise.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <glm/glm.hpp>

namespace terrasculpt::worldgen {

/// Parse "#rrggbb" (leading '#' optional) into channels in [0, 1]
[[nodiscard]] std::optional<glm::vec3> parseHexColor(std::string_view text);

// ============================================================================
// TerrainPalette
// ============================================================================

/// Named base colors the default rule table is built from
struct TerrainPalette {
    glm::vec3 waterDeep{0.0f};
    glm::vec3 sand{0.0f};
    glm::vec3 grassLow{0.0f};
    glm::vec3 grassHigh{0.0f};
    glm::vec3 rock{0.0f};
    glm::vec3 snow{0.0f};

    /// Weathered, overcast palette: murky water, dusty sand, dry grass,
    /// grey rock and a pale high-altitude fade
    [[nodiscard]] static TerrainPalette defaults();

    /// Look up a color by its settings name (water_deep, sand, grass_low,
    /// grass_high, rock, snow); nullptr if unknown
    [[nodiscard]] glm::vec3* find(std::string_view name);
};

// ============================================================================
// PaletteRule
// ============================================================================

/// Secondary variation applied within a matched band
struct BandVariation {
    enum class Trigger : uint8_t {
        None,
        NoiseAbove,   // noise(column * frequency, row * frequency) > threshold
        HeightBelow,  // shaded height < threshold
        HeightAbove,  // shaded height > threshold
    };

    enum class Effect : uint8_t {
        Scale,    // color *= amount
        Blend,    // color = mix(color, target, amount)
        Replace,  // color = target
    };

    Trigger trigger = Trigger::None;
    float noiseFrequency = 0.0f;
    float threshold = 0.0f;
    Effect effect = Effect::Scale;
    glm::vec3 target{0.0f};
    float amount = 1.0f;
};

/// One palette band. Matches when shadedHeight < maxHeight and slope > minSlope.
struct PaletteRule {
    std::string name;
    float maxHeight = std::numeric_limits<float>::infinity();
    float minSlope = -std::numeric_limits<float>::infinity();
    glm::vec3 color{0.0f};
    BandVariation variation;

    [[nodiscard]] bool matches(float shadedHeight, float slope) const {
        return shadedHeight < maxHeight && slope > minSlope;
    }
};

/// Ordered table: shore (darkening to water), cliff, lowland, upland, and a
/// catch-all peak band that fades toward snow at altitude.
[[nodiscard]] std::vector<PaletteRule> buildPaletteRules(const TerrainPalette& palette);

// ============================================================================
// TerrainColorizer
// ============================================================================
class TerrainColorizer {
public:
    /// Low-frequency height perturbation: h' = h + noise(c * 0.05, r * 0.05) * 2
    static constexpr float SHADING_FREQUENCY = 0.05f;
    static constexpr float SHADING_AMPLITUDE = 2.0f;

    /// Throws std::invalid_argument if rules is empty
    TerrainColorizer(PerlinNoise2D noise, std::vector<PaletteRule> rules);

    explicit TerrainColorizer(const PermutationTable& table,
                              const TerrainPalette& palette = TerrainPalette::defaults());

    /// Color for cell (column, row) whose current height is `height`.
    /// Neighbors come from `heights`; off-grid neighbors use `height`.
    [[nodiscard]] glm::vec3 colorize(int32_t column, int32_t row, float height,
                                     std::span<const float> heights, int32_t resolution) const;

    /// Finite-difference slope magnitude from the four axis neighbors
    [[nodiscard]] static float slopeAt(int32_t column, int32_t row, float height,
                                       std::span<const float> heights, int32_t resolution);

    [[nodiscard]] const std::vector<PaletteRule>& rules() const { return rules_; }
    [[nodiscard]] const PerlinNoise2D& noise() const { return noise_; }

private:
    [[nodiscard]] glm::vec3 applyVariation(const PaletteRule& rule, int32_t column, int32_t row,
                                           float shadedHeight) const;

    PerlinNoise2D noise_;
    std::vector<PaletteRule> rules_;
};

}  // namespace terrasculpt::worldgen
