#include "terrasculpt/edit/region_fill.hpp"
#include "terrasculpt/edit/polygon.hpp"
#include "terrasculpt/field/height_field.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace terrasculpt {

namespace {

constexpr float BOUNDARY_NOISE_FREQUENCY = 0.1f;

}  // namespace

DirtyChunkSet applyRegionFill(HeightField& field, std::span<const glm::vec2> polygon,
                              const RegionFillConfig& config) {
    if (polygon.size() < 3) {
        return {};
    }

    const FieldGeometry& geometry = field.geometry();
    std::vector<glm::vec2> grid = toGridPoints(geometry, polygon);
    float falloffCells = geometry.worldToGridDistance(config.falloff);

    CellWindow window = expandedBounds(geometry, grid, falloffCells);
    if (window.empty()) {
        return {};
    }

    float n = static_cast<float>(geometry.resolution());
    float cellToWorld = geometry.worldSize() / n;

    FieldEdit edit(field);

    for (int32_t row = window.minRow; row <= window.maxRow; ++row) {
        for (int32_t column = window.minColumn; column <= window.maxColumn; ++column) {
            glm::vec2 cell(static_cast<float>(column), static_cast<float>(row));

            if (!isPointInPolygon(cell, grid)) continue;

            float distSq = std::numeric_limits<float>::infinity();
            for (size_t i = 0; i < grid.size(); ++i) {
                distSq = std::min(distSq, distanceToSegmentSq(cell, grid[i], grid[(i + 1) % grid.size()]));
            }

            // Noise is sampled in corner-origin world units
            float nx = cell.x * cellToWorld * BOUNDARY_NOISE_FREQUENCY + config.noiseOffset;
            float ny = cell.y * cellToWorld * BOUNDARY_NOISE_FREQUENCY + config.noiseOffset;
            float jitter = edit.noise().evaluate(nx, ny) * config.noiseAmplitude * (falloffCells * 0.25f);
            float naturalDist = std::sqrt(distSq) + jitter;

            float factor = 1.0f;
            if (falloffCells > 0.0f) {
                float t = std::clamp(naturalDist / falloffCells, 0.0f, 1.0f);
                factor = t * t * (3.0f - 2.0f * t);
            }

            float candidate = config.targetHeight * factor;
            if (candidate > edit.height(column, row)) {
                edit.setHeight(column, row, candidate);
            }
        }
    }

    return edit.finish();
}

}  // namespace terrasculpt
