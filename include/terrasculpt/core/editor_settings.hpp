#pragma once

/**
 * @file editor_settings.hpp
 * @brief Session settings built from a ConfigDocument
 *
 * Example file:
 * ```
 * world.size: 1024
 * world.resolution: 512
 * noise.seed: 7
 * brush.color: #5a4a3a
 * palette:snow: #f4f4f4
 * region:lake:
 *     -40 -40
 *      40 -40
 *      40  40
 * ```
 */

#include "terrasculpt/core/config_parser.hpp"
#include "terrasculpt/field/field_geometry.hpp"
#include "terrasculpt/worldgen/colorizer.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace terrasculpt {

struct EditorSettings {
    // World
    float worldSize = FieldGeometry::DEFAULT_WORLD_SIZE;
    int32_t resolution = 256;
    float chunkSize = FieldGeometry::DEFAULT_CHUNK_EDGE;
    uint64_t noiseSeed = 1337;

    // Brush
    float brushRadius = 6.0f;
    float brushStrength = 0.4f;
    float brushHeight = 8.0f;
    glm::vec3 brushColor{68.0f / 255.0f};

    // Polygon fill
    float fillHeight = 15.0f;
    float fillFalloff = 15.0f;
    float fillNoise = 0.8f;

    // Ridge line
    float ridgeHeight = 35.0f;
    float ridgeWidth = 20.0f;
    float ridgeNoise = 0.4f;

    // Scatter
    int32_t scatterCount = 30;
    uint32_t scatterSeed = 99;

    float imageHeightScale = 40.0f;
    size_t historyDepth = 16;

    worldgen::TerrainPalette palette = worldgen::TerrainPalette::defaults();

    /// Named world-space outlines, (x, z) per vertex
    std::map<std::string, std::vector<glm::vec2>> regions;

    /// Validated geometry; throws std::invalid_argument (see FieldGeometry)
    [[nodiscard]] FieldGeometry geometry() const {
        return FieldGeometry(resolution, worldSize, chunkSize);
    }
};

// ============================================================================
// EditorSettingsLoader
// ============================================================================
//
// Unknown keys are ignored. A present but invalid value is reported on
// std::cerr as "[EditorSettings] ..." and the default is kept.
//
class EditorSettingsLoader {
public:
    /// Load from file; nullopt if the file cannot be opened
    static std::optional<EditorSettings> loadFromFile(const std::string& path);

    static EditorSettings loadFromConfig(const ConfigDocument& doc);
};

}  // namespace terrasculpt
