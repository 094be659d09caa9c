#include "terrasculpt/edit/carve.hpp"
#include "terrasculpt/field/height_field.hpp"

#include <algorithm>
#include <cmath>

namespace terrasculpt {

namespace {

bool footprintContains(PrimitiveShape shape, float dx, float dz) {
    switch (shape) {
        case PrimitiveShape::Cube:
            return std::abs(dx) <= 1.0f && std::abs(dz) <= 1.0f;
        case PrimitiveShape::Sphere:
        case PrimitiveShape::Cylinder:
            return dx * dx + dz * dz <= 1.0f;
    }
    return false;
}

}  // namespace

DirtyChunkSet applyCarve(HeightField& field, const glm::vec3& position, const glm::vec3& scale,
                         PrimitiveShape shape) {
    const FieldGeometry& geometry = field.geometry();

    glm::vec2 center = geometry.worldToGrid(position.x, position.z);
    float halfX = geometry.worldToGridDistance(scale.x) * 0.5f;
    float halfZ = geometry.worldToGridDistance(scale.z) * 0.5f;
    if (!(halfX > 0.0f && halfZ > 0.0f)) {
        return {};
    }

    float n = static_cast<float>(geometry.resolution());
    if (!(center.x + halfX >= 0.0f && center.x - halfX < n &&
          center.y + halfZ >= 0.0f && center.y - halfZ < n)) {
        return {};
    }

    CellWindow window = geometry.clip({
        static_cast<int32_t>(std::max(-1.0f, std::floor(center.x - halfX))),
        static_cast<int32_t>(std::min(n, std::ceil(center.x + halfX))),
        static_cast<int32_t>(std::max(-1.0f, std::floor(center.y - halfZ))),
        static_cast<int32_t>(std::min(n, std::ceil(center.y + halfZ))),
    });

    float floorHeight = position.y - scale.y * 0.5f;
    float carvedHeight = std::max(CARVE_FLOOR_LIMIT, floorHeight);

    FieldEdit edit(field);

    for (int32_t row = window.minRow; row <= window.maxRow; ++row) {
        for (int32_t column = window.minColumn; column <= window.maxColumn; ++column) {
            float dx = (static_cast<float>(column) - center.x) / halfX;
            float dz = (static_cast<float>(row) - center.y) / halfZ;
            if (!footprintContains(shape, dx, dz)) continue;

            // Never raises, even where the depth limit sits above a deep cell
            float current = edit.height(column, row);
            if (current > floorHeight && carvedHeight < current) {
                edit.setHeight(column, row, carvedHeight);
            }
        }
    }

    return edit.finish();
}

}  // namespace terrasculpt
