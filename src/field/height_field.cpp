#include "terrasculpt/field/height_field.hpp"
#include "terrasculpt/field/snapshot.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace terrasculpt {

float sampleWorldHeight(std::span<const float> heights, int32_t resolution,
                        float worldSize, float worldX, float worldZ) {
    if (resolution < 2 ||
        heights.size() != static_cast<size_t>(resolution) * static_cast<size_t>(resolution)) {
        return VOID_ELEVATION;
    }

    float half = worldSize * 0.5f;
    float n = static_cast<float>(resolution);
    float gx = ((worldX + half) / worldSize) * n;
    float gz = ((worldZ + half) / worldSize) * n;

    float last = static_cast<float>(resolution - 1);
    if (!(gx >= 0.0f && gx < last && gz >= 0.0f && gz < last)) {
        return VOID_ELEVATION;
    }

    int32_t x0 = static_cast<int32_t>(std::floor(gx));
    int32_t z0 = static_cast<int32_t>(std::floor(gz));
    float fx = gx - static_cast<float>(x0);
    float fz = gz - static_cast<float>(z0);

    size_t stride = static_cast<size_t>(resolution);
    size_t i00 = static_cast<size_t>(z0) * stride + static_cast<size_t>(x0);
    float h00 = heights[i00];
    float h10 = heights[i00 + 1];
    float h01 = heights[i00 + stride];
    float h11 = heights[i00 + stride + 1];

    float top = h00 * (1.0f - fx) + h10 * fx;
    float bottom = h01 * (1.0f - fx) + h11 * fx;
    return top * (1.0f - fz) + bottom * fz;
}

// ============================================================================
// HeightField
// ============================================================================

HeightField::HeightField(const FieldGeometry& geometry, const worldgen::PermutationTable& table,
                         const worldgen::TerrainPalette& palette)
    : geometry_(geometry)
    , colorizer_(table, palette)
    , heights_(geometry.cellCount(), 0.0f)
    , colors_(geometry.cellCount() * 3, 0.0f) {
    recolorAll();
}

glm::vec3 HeightField::colorAt(int32_t column, int32_t row) const {
    size_t i = geometry_.index(column, row) * 3;
    return {colors_[i], colors_[i + 1], colors_[i + 2]};
}

glm::vec3 HeightField::computeColor(int32_t column, int32_t row) const {
    return colorizer_.colorize(column, row, heights_[geometry_.index(column, row)],
                               heights_, geometry_.resolution());
}

void HeightField::storeColor(size_t index, const glm::vec3& color) {
    glm::vec3 c = glm::clamp(color, glm::vec3(0.0f), glm::vec3(1.0f));
    colors_[index * 3] = c.r;
    colors_[index * 3 + 1] = c.g;
    colors_[index * 3 + 2] = c.b;
}

void HeightField::recolorAll() {
    int32_t n = geometry_.resolution();
    for (int32_t row = 0; row < n; ++row) {
        for (int32_t column = 0; column < n; ++column) {
            storeColor(geometry_.index(column, row), computeColor(column, row));
        }
    }
}

void HeightField::loadGrayscale(std::span<const float> samples, float heightScale) {
    if (samples.size() != heights_.size()) {
        throw std::invalid_argument("HeightField: grayscale buffer has " + std::to_string(samples.size()) +
                                    " samples, expected " + std::to_string(heights_.size()));
    }
    for (size_t i = 0; i < samples.size(); ++i) {
        heights_[i] = samples[i] * heightScale;
    }
    recolorAll();
}

FieldSnapshot HeightField::snapshot() const {
    return FieldSnapshot{geometry_, heights_, colors_};
}

DirtyChunkSet HeightField::restore(const FieldSnapshot& snapshot) {
    if (!(snapshot.geometry == geometry_)) {
        throw std::invalid_argument("HeightField: snapshot geometry does not match field");
    }
    if (snapshot.heights.size() != heights_.size() || snapshot.colors.size() != colors_.size()) {
        throw std::invalid_argument("HeightField: snapshot buffer sizes do not match field");
    }
    heights_ = snapshot.heights;
    colors_ = snapshot.colors;

    auto chunks = geometry_.allChunks();
    return DirtyChunkSet(chunks.begin(), chunks.end());
}

// ============================================================================
// FieldEdit
// ============================================================================

void FieldEdit::setHeight(int32_t column, int32_t row, float height) {
    size_t i = field_.geometry_.index(column, row);
    field_.heights_[i] = height;
    field_.storeColor(i, field_.computeColor(column, row));
    tracker_.markCell(column, row);
}

void FieldEdit::blendColor(int32_t column, int32_t row, const glm::vec3& target, float t) {
    glm::vec3 current = field_.colorAt(column, row);
    glm::vec3 next = glm::clamp(glm::mix(current, target, t), glm::vec3(0.0f), glm::vec3(1.0f));
    if (next == current) {
        return;
    }
    field_.storeColor(field_.geometry_.index(column, row), next);
    tracker_.markCell(column, row);
}

}  // namespace terrasculpt
