#include "terrasculpt/edit/brush.hpp"
#include "terrasculpt/field/height_field.hpp"

#include <algorithm>
#include <cmath>

namespace terrasculpt {

BrushConfig BrushConfig::forTool(BrushTool tool, float radius, float strength,
                                 float targetHeight, const glm::vec3& color) {
    BrushConfig config;
    config.radius = radius;
    config.targetHeight = targetHeight;
    config.color = color;

    switch (tool) {
        case BrushTool::Raise:
            config.mode = BrushMode::Sculpt;
            config.strength = std::abs(strength);
            break;
        case BrushTool::Lower:
            config.mode = BrushMode::Sculpt;
            config.strength = -std::abs(strength);
            break;
        case BrushTool::Level:
            config.mode = BrushMode::Level;
            config.strength = strength;
            break;
        case BrushTool::Paint:
            config.mode = BrushMode::Paint;
            config.strength = strength;
            break;
    }
    return config;
}

DirtyChunkSet applyBrush(HeightField& field, const glm::vec3& worldPoint, const BrushConfig& config) {
    const FieldGeometry& geometry = field.geometry();

    float radiusCells = std::ceil(geometry.worldToGridDistance(config.radius));
    if (!(radiusCells > 0.0f)) {
        return {};
    }

    glm::vec2 grid = geometry.worldToGrid(worldPoint.x, worldPoint.z);
    float n = static_cast<float>(geometry.resolution());

    // Nothing of the field under the brush
    if (!(grid.x + radiusCells >= 0.0f && grid.x - radiusCells < n &&
          grid.y + radiusCells >= 0.0f && grid.y - radiusCells < n)) {
        return {};
    }

    // Window bounds are clamped in float space so huge radii or centers stay in range
    float centerColumn = std::floor(grid.x);
    float centerRow = std::floor(grid.y);
    float radiusSq = radiusCells * radiusCells;
    auto toCell = [n](float v) {
        return static_cast<int32_t>(std::clamp(v, -1.0f, n));
    };

    CellWindow window = geometry.clip({toCell(centerColumn - radiusCells), toCell(centerColumn + radiusCells),
                                       toCell(centerRow - radiusCells), toCell(centerRow + radiusCells)});

    FieldEdit edit(field);

    for (int32_t row = window.minRow; row <= window.maxRow; ++row) {
        for (int32_t column = window.minColumn; column <= window.maxColumn; ++column) {
            float dx = static_cast<float>(column) - centerColumn;
            float dy = static_cast<float>(row) - centerRow;
            float distSq = dx * dx + dy * dy;
            if (distSq >= radiusSq) continue;

            float w = 1.0f - distSq / radiusSq;
            float falloff = w * w;

            float current = edit.height(column, row);
            switch (config.mode) {
                case BrushMode::Sculpt: {
                    float next = current + config.strength * falloff;
                    if (next != current) edit.setHeight(column, row, next);
                    break;
                }
                case BrushMode::Level: {
                    float t = config.strength * 0.1f * falloff;
                    float next = current + t * (config.targetHeight - current);
                    if (next != current) edit.setHeight(column, row, next);
                    break;
                }
                case BrushMode::Paint: {
                    float mix = std::clamp(config.strength * falloff * 5.0f, 0.0f, 1.0f);
                    if (mix > 0.0f) edit.blendColor(column, row, config.color, mix);
                    break;
                }
            }
        }
    }

    return edit.finish();
}

}  // namespace terrasculpt
