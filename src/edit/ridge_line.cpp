#include "terrasculpt/edit/ridge_line.hpp"
#include "terrasculpt/edit/polygon.hpp"
#include "terrasculpt/field/height_field.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace terrasculpt {

namespace {

constexpr float RIDGE_NOISE_FREQUENCY = 0.05f;

}  // namespace

DirtyChunkSet applyRidgeLine(HeightField& field, std::span<const glm::vec2> polyline,
                             const RidgeConfig& config) {
    if (polyline.size() < 2) {
        return {};
    }

    const FieldGeometry& geometry = field.geometry();
    std::vector<glm::vec2> grid = toGridPoints(geometry, polyline);
    float widthCells = geometry.worldToGridDistance(config.halfWidth);
    if (!(widthCells > 0.0f)) {
        return {};
    }

    CellWindow window = expandedBounds(geometry, grid, widthCells);
    if (window.empty()) {
        return {};
    }

    float cellToWorld = geometry.worldSize() / static_cast<float>(geometry.resolution());

    FieldEdit edit(field);

    for (int32_t row = window.minRow; row <= window.maxRow; ++row) {
        for (int32_t column = window.minColumn; column <= window.maxColumn; ++column) {
            glm::vec2 cell(static_cast<float>(column), static_cast<float>(row));

            float distSq = std::numeric_limits<float>::infinity();
            for (size_t i = 0; i + 1 < grid.size(); ++i) {
                distSq = std::min(distSq, distanceToSegmentSq(cell, grid[i], grid[i + 1]));
            }

            float dist = std::sqrt(distSq);
            if (dist >= widthCells) continue;

            float t = dist / widthCells;
            float profile = (1.0f - t) * (1.0f - t);

            float nx = cell.x * cellToWorld * RIDGE_NOISE_FREQUENCY + config.noiseOffset;
            float ny = cell.y * cellToWorld * RIDGE_NOISE_FREQUENCY + config.noiseOffset;
            float ridgeFactor = 1.0f + edit.noise().evaluate(nx, ny) * config.ridgeNoise;

            float candidate = std::max(0.0f, config.targetHeight * profile * ridgeFactor);
            if (candidate > edit.height(column, row)) {
                edit.setHeight(column, row, candidate);
            }
        }
    }

    return edit.finish();
}

}  // namespace terrasculpt
