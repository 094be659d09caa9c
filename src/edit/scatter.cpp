#include "terrasculpt/edit/scatter.hpp"
#include "terrasculpt/edit/polygon.hpp"
#include "terrasculpt/field/height_field.hpp"
#include "terrasculpt/worldgen/random.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace terrasculpt {

namespace {

constexpr int64_t ATTEMPTS_PER_PLACEMENT = 5;

}  // namespace

std::vector<ScatterPlacement> scatterInPolygon(const HeightField& field, std::span<const glm::vec2> polygon,
                                               int32_t count, uint32_t seed) {
    std::vector<ScatterPlacement> placements;
    if (polygon.size() < 3 || count <= 0) {
        return placements;
    }

    const FieldGeometry& geometry = field.geometry();
    worldgen::SeededRandom rng(seed);

    glm::vec2 lo = polygon[0];
    glm::vec2 hi = polygon[0];
    for (const auto& p : polygon) {
        lo = glm::min(lo, p);
        hi = glm::max(hi, p);
    }

    int64_t maxAttempts = static_cast<int64_t>(count) * ATTEMPTS_PER_PLACEMENT;
    for (int64_t attempt = 0; attempt < maxAttempts && placements.size() < static_cast<size_t>(count); ++attempt) {
        float x = static_cast<float>(rng.range(lo.x, hi.x));
        float z = static_cast<float>(rng.range(lo.y, hi.y));

        if (!isPointInPolygon({x, z}, polygon)) continue;

        glm::vec2 grid = geometry.worldToGrid(x, z);
        float n = static_cast<float>(geometry.resolution());
        if (!(grid.x >= 0.0f && grid.x < n && grid.y >= 0.0f && grid.y < n)) continue;

        int32_t column = static_cast<int32_t>(std::floor(grid.x));
        int32_t row = static_cast<int32_t>(std::floor(grid.y));

        ScatterPlacement placement;
        placement.position = {x, field.heightAt(column, row), z};
        placement.yaw = static_cast<float>(rng.next() * 2.0 * std::numbers::pi);
        placements.push_back(placement);
    }

    return placements;
}

}  // namespace terrasculpt
