#pragma once

/**
 * @file height_field.hpp
 * @brief Owned height/color grid of one editing session
 *
 * Two parallel row-major buffers over an N x N grid: one height per cell
 * and one RGB triple per cell (channels in [0, 1]). Color is derived from
 * height by the procedural colorizer whenever a height changes.
 *
 * Cell writes happen only through a FieldEdit, which recolors and marks
 * dirty chunks as it goes. Edit operations (brush, fill, ridge, carve)
 * open one FieldEdit per call and return its dirty set.
 */

#include "terrasculpt/field/dirty_chunks.hpp"
#include "terrasculpt/field/field_geometry.hpp"
#include "terrasculpt/worldgen/colorizer.hpp"
#include "terrasculpt/worldgen/noise.hpp"

#include <cstdint>
#include <span>
#include <vector>
#include <glm/glm.hpp>

namespace terrasculpt {

struct FieldSnapshot;
class FieldEdit;

/// Elevation reported for positions outside the interpolable grid
inline constexpr float VOID_ELEVATION = -100.0f;

/// Bilinear height at world (x, z) over a row-major N x N buffer.
/// Returns VOID_ELEVATION when the grid coordinate is outside [0, N-1) or
/// heights does not hold N * N samples.
[[nodiscard]] float sampleWorldHeight(std::span<const float> heights, int32_t resolution,
                                      float worldSize, float worldX, float worldZ);

class HeightField {
public:
    /// Zero-height field with every cell colorized
    HeightField(const FieldGeometry& geometry, const worldgen::PermutationTable& table,
                const worldgen::TerrainPalette& palette = worldgen::TerrainPalette::defaults());

    HeightField(const HeightField&) = default;
    HeightField& operator=(const HeightField&) = default;
    HeightField(HeightField&&) noexcept = default;
    HeightField& operator=(HeightField&&) noexcept = default;

    [[nodiscard]] const FieldGeometry& geometry() const { return geometry_; }
    [[nodiscard]] int32_t resolution() const { return geometry_.resolution(); }
    [[nodiscard]] float worldSize() const { return geometry_.worldSize(); }

    [[nodiscard]] std::span<const float> heights() const { return heights_; }
    [[nodiscard]] std::span<const float> colors() const { return colors_; }

    [[nodiscard]] float heightAt(int32_t column, int32_t row) const {
        return heights_[geometry_.index(column, row)];
    }
    [[nodiscard]] glm::vec3 colorAt(int32_t column, int32_t row) const;

    /// Noise shared by the colorizer and the organic-boundary edits
    [[nodiscard]] const worldgen::PerlinNoise2D& noise() const { return colorizer_.noise(); }
    [[nodiscard]] const worldgen::TerrainColorizer& colorizer() const { return colorizer_; }

    /// Bilinear world height query (pure read)
    [[nodiscard]] float heightAtWorld(float worldX, float worldZ) const {
        return sampleWorldHeight(heights_, geometry_.resolution(), geometry_.worldSize(), worldX, worldZ);
    }

    // ========================================================================
    // Whole-field operations (O(N^2))
    // ========================================================================

    /// Set every height to sample * heightScale and recolor everything.
    /// Throws std::invalid_argument unless samples.size() == N * N.
    void loadGrayscale(std::span<const float> samples, float heightScale);

    /// Recompute every cell's color from its height
    void recolorAll();

    [[nodiscard]] FieldSnapshot snapshot() const;

    /// Replace both buffers. Throws std::invalid_argument on geometry or
    /// buffer size mismatch. Returns every chunk as dirty.
    DirtyChunkSet restore(const FieldSnapshot& snapshot);

private:
    friend class FieldEdit;

    [[nodiscard]] glm::vec3 computeColor(int32_t column, int32_t row) const;
    void storeColor(size_t index, const glm::vec3& color);

    FieldGeometry geometry_;
    worldgen::TerrainColorizer colorizer_;
    std::vector<float> heights_;
    std::vector<float> colors_;
};

// ============================================================================
// FieldEdit - Scoped writer for one edit operation
// ============================================================================
//
// Every write records the cell with a DirtyChunkTracker. setHeight()
// recolors the cell; blendColor() writes color directly (paint) and leaves
// height alone. Callers of setHeight() only write cells that actually
// change; blendColor() skips unchanged colors itself.
//
class FieldEdit {
public:
    explicit FieldEdit(HeightField& field)
        : field_(field)
        , tracker_(field.geometry()) {}

    FieldEdit(const FieldEdit&) = delete;
    FieldEdit& operator=(const FieldEdit&) = delete;

    [[nodiscard]] const FieldGeometry& geometry() const { return field_.geometry_; }
    [[nodiscard]] const worldgen::PerlinNoise2D& noise() const { return field_.noise(); }

    [[nodiscard]] float height(int32_t column, int32_t row) const { return field_.heightAt(column, row); }

    void setHeight(int32_t column, int32_t row, float height);

    /// color = mix(color, target, t); the cell is marked dirty only if its
    /// stored color changes
    void blendColor(int32_t column, int32_t row, const glm::vec3& target, float t);

    /// Dirty chunks accumulated so far; the edit may continue afterwards
    [[nodiscard]] DirtyChunkSet finish() { return tracker_.take(); }

private:
    HeightField& field_;
    DirtyChunkTracker tracker_;
};

}  // namespace terrasculpt
