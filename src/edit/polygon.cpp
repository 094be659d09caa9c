#include "terrasculpt/edit/polygon.hpp"

#include <algorithm>
#include <cmath>

namespace terrasculpt {

float distanceToSegmentSq(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b) {
    glm::vec2 ab = b - a;
    float lengthSq = glm::dot(ab, ab);
    if (lengthSq == 0.0f) {
        glm::vec2 d = p - a;
        return glm::dot(d, d);
    }

    float t = std::clamp(glm::dot(p - a, ab) / lengthSq, 0.0f, 1.0f);
    glm::vec2 d = p - (a + t * ab);
    return glm::dot(d, d);
}

bool isPointInPolygon(const glm::vec2& p, std::span<const glm::vec2> polygon) {
    bool inside = false;
    size_t n = polygon.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const glm::vec2& vi = polygon[i];
        const glm::vec2& vj = polygon[j];
        if ((vi.y > p.y) != (vj.y > p.y) &&
            p.x < (vj.x - vi.x) * (p.y - vi.y) / (vj.y - vi.y) + vi.x) {
            inside = !inside;
        }
    }
    return inside;
}

std::vector<glm::vec2> toGridPoints(const FieldGeometry& geometry, std::span<const glm::vec2> worldPoints) {
    std::vector<glm::vec2> grid;
    grid.reserve(worldPoints.size());
    for (const auto& p : worldPoints) {
        grid.push_back(geometry.worldToGrid(p.x, p.y));
    }
    return grid;
}

CellWindow expandedBounds(const FieldGeometry& geometry, std::span<const glm::vec2> gridPoints, float margin) {
    if (gridPoints.empty()) {
        return {};
    }

    float minX = gridPoints[0].x, maxX = gridPoints[0].x;
    float minY = gridPoints[0].y, maxY = gridPoints[0].y;
    for (const auto& p : gridPoints) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }

    // Clamp in float space first so far-off geometry cannot overflow int32
    float limit = static_cast<float>(geometry.resolution());
    auto toCell = [limit](float v) {
        return static_cast<int32_t>(std::clamp(v, -1.0f, limit));
    };

    CellWindow window;
    window.minColumn = toCell(std::floor(minX - margin));
    window.maxColumn = toCell(std::ceil(maxX + margin));
    window.minRow = toCell(std::floor(minY - margin));
    window.maxRow = toCell(std::ceil(maxY + margin));
    return geometry.clip(window);
}

}  // namespace terrasculpt
