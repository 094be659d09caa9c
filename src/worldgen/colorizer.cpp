#include "terrasculpt/worldgen/colorizer.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace terrasculpt::worldgen {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

glm::vec3 rgb(uint32_t hex) {
    return {static_cast<float>((hex >> 16) & 0xFF) / 255.0f,
            static_cast<float>((hex >> 8) & 0xFF) / 255.0f,
            static_cast<float>(hex & 0xFF) / 255.0f};
}

}  // namespace

std::optional<glm::vec3> parseHexColor(std::string_view text) {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6) {
        return std::nullopt;
    }

    uint32_t value = 0;
    for (char c : text) {
        int digit = hexDigit(c);
        if (digit < 0) return std::nullopt;
        value = (value << 4) | static_cast<uint32_t>(digit);
    }
    return rgb(value);
}

// ============================================================================
// TerrainPalette
// ============================================================================

TerrainPalette TerrainPalette::defaults() {
    TerrainPalette p;
    p.waterDeep = rgb(0x4a5054);
    p.sand = rgb(0x948e83);
    p.grassLow = rgb(0x7d8072);
    p.grassHigh = rgb(0x63695b);
    p.rock = rgb(0x8c8c8c);
    p.snow = rgb(0xe0e0e0);
    return p;
}

glm::vec3* TerrainPalette::find(std::string_view name) {
    if (name == "water_deep") return &waterDeep;
    if (name == "sand") return &sand;
    if (name == "grass_low") return &grassLow;
    if (name == "grass_high") return &grassHigh;
    if (name == "rock") return &rock;
    if (name == "snow") return &snow;
    return nullptr;
}

std::vector<PaletteRule> buildPaletteRules(const TerrainPalette& palette) {
    using Trigger = BandVariation::Trigger;
    using Effect = BandVariation::Effect;

    std::vector<PaletteRule> rules;

    // Waterline: sand, darkening toward murky water below 0.5
    PaletteRule shore;
    shore.name = "shore";
    shore.maxHeight = 1.0f;
    shore.color = palette.sand;
    shore.variation = {Trigger::HeightBelow, 0.0f, 0.5f, Effect::Blend, palette.waterDeep, 0.3f};
    rules.push_back(shore);

    // Steep faces are rock regardless of altitude, with darker stains
    PaletteRule cliff;
    cliff.name = "cliff";
    cliff.minSlope = 1.2f;
    cliff.color = palette.rock;
    cliff.variation = {Trigger::NoiseAbove, 0.15f, 0.4f, Effect::Scale, glm::vec3(0.0f), 0.85f};
    rules.push_back(cliff);

    // Dry grass with patches of bare ground
    PaletteRule lowland;
    lowland.name = "lowland";
    lowland.maxHeight = 10.0f;
    lowland.color = palette.grassLow;
    lowland.variation = {Trigger::NoiseAbove, 0.08f, 0.2f, Effect::Replace, palette.sand, 1.0f};
    rules.push_back(lowland);

    // Rock overgrown with moss
    PaletteRule upland;
    upland.name = "upland";
    upland.maxHeight = 35.0f;
    upland.color = palette.rock;
    upland.variation = {Trigger::NoiseAbove, 0.1f, 0.3f, Effect::Blend, palette.grassHigh, 0.5f};
    rules.push_back(upland);

    // Catch-all, fading toward snow at altitude
    PaletteRule peak;
    peak.name = "peak";
    peak.color = palette.rock;
    peak.variation = {Trigger::HeightAbove, 0.0f, 50.0f, Effect::Blend, palette.snow, 0.5f};
    rules.push_back(peak);

    return rules;
}

// ============================================================================
// TerrainColorizer
// ============================================================================

TerrainColorizer::TerrainColorizer(PerlinNoise2D noise, std::vector<PaletteRule> rules)
    : noise_(std::move(noise))
    , rules_(std::move(rules)) {
    if (rules_.empty()) {
        throw std::invalid_argument("TerrainColorizer: palette rule table is empty");
    }
}

TerrainColorizer::TerrainColorizer(const PermutationTable& table, const TerrainPalette& palette)
    : TerrainColorizer(PerlinNoise2D(table), buildPaletteRules(palette)) {}

float TerrainColorizer::slopeAt(int32_t column, int32_t row, float height,
                                std::span<const float> heights, int32_t resolution) {
    size_t idx = static_cast<size_t>(row) * static_cast<size_t>(resolution) + static_cast<size_t>(column);
    size_t stride = static_cast<size_t>(resolution);

    float left = column > 0 ? heights[idx - 1] : height;
    float right = column < resolution - 1 ? heights[idx + 1] : height;
    float up = row > 0 ? heights[idx - stride] : height;
    float down = row < resolution - 1 ? heights[idx + stride] : height;

    float slopeX = std::abs(right - left);
    float slopeZ = std::abs(down - up);
    return std::sqrt(slopeX * slopeX + slopeZ * slopeZ);
}

glm::vec3 TerrainColorizer::colorize(int32_t column, int32_t row, float height,
                                     std::span<const float> heights, int32_t resolution) const {
    float slope = slopeAt(column, row, height, heights, resolution);

    float c = static_cast<float>(column);
    float r = static_cast<float>(row);
    float shaded = height + noise_.evaluate(c * SHADING_FREQUENCY, r * SHADING_FREQUENCY) * SHADING_AMPLITUDE;

    const PaletteRule* band = &rules_.back();
    for (const auto& rule : rules_) {
        if (rule.matches(shaded, slope)) {
            band = &rule;
            break;
        }
    }

    return glm::clamp(applyVariation(*band, column, row, shaded), glm::vec3(0.0f), glm::vec3(1.0f));
}

glm::vec3 TerrainColorizer::applyVariation(const PaletteRule& rule, int32_t column, int32_t row,
                                           float shadedHeight) const {
    const BandVariation& v = rule.variation;

    bool triggered = false;
    switch (v.trigger) {
        case BandVariation::Trigger::None:
            break;
        case BandVariation::Trigger::NoiseAbove:
            triggered = noise_.evaluate(static_cast<float>(column) * v.noiseFrequency,
                                        static_cast<float>(row) * v.noiseFrequency) > v.threshold;
            break;
        case BandVariation::Trigger::HeightBelow:
            triggered = shadedHeight < v.threshold;
            break;
        case BandVariation::Trigger::HeightAbove:
            triggered = shadedHeight > v.threshold;
            break;
    }

    if (!triggered) {
        return rule.color;
    }

    switch (v.effect) {
        case BandVariation::Effect::Scale:
            return rule.color * v.amount;
        case BandVariation::Effect::Blend:
            return glm::mix(rule.color, v.target, v.amount);
        case BandVariation::Effect::Replace:
            return v.target;
    }
    return rule.color;
}

}  // namespace terrasculpt::worldgen
