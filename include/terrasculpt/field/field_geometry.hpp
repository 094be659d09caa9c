#pragma once

/**
 * @file field_geometry.hpp
 * @brief World size, grid resolution and chunk layout of a terrain field
 *
 * Grid coordinate 0 corresponds to world coordinate -worldSize/2 on both
 * horizontal axes:
 *   grid = ((world + worldSize/2) / worldSize) * resolution
 */

#include "terrasculpt/core/position.hpp"

#include <array>
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

namespace terrasculpt {

class FieldGeometry {
public:
    static constexpr std::array<int32_t, 3> SUPPORTED_RESOLUTIONS = {256, 512, 1024};
    static constexpr float DEFAULT_WORLD_SIZE = 256.0f;
    static constexpr float DEFAULT_CHUNK_EDGE = 128.0f;

    /// Throws std::invalid_argument for an unsupported resolution, a
    /// non-positive world size or chunk edge, a world size that is not a
    /// whole number of chunks, or a resolution the chunk count does not divide.
    FieldGeometry(int32_t resolution, float worldSize, float chunkEdge = DEFAULT_CHUNK_EDGE);

    [[nodiscard]] static bool isSupportedResolution(int32_t resolution);

    [[nodiscard]] int32_t resolution() const { return resolution_; }
    [[nodiscard]] float worldSize() const { return worldSize_; }
    [[nodiscard]] float chunkEdge() const { return chunkEdge_; }
    [[nodiscard]] int32_t chunksPerSide() const { return chunksPerSide_; }
    [[nodiscard]] int32_t cellsPerChunk() const { return cellsPerChunk_; }
    [[nodiscard]] size_t cellCount() const {
        return static_cast<size_t>(resolution_) * static_cast<size_t>(resolution_);
    }

    // ========================================================================
    // Coordinate mapping
    // ========================================================================

    /// Continuous grid coordinate (column, row) of a world (x, z) position
    [[nodiscard]] glm::vec2 worldToGrid(float worldX, float worldZ) const;

    /// Length in world units expressed in grid cells
    [[nodiscard]] float worldToGridDistance(float worldDistance) const;

    /// World (x, z) of a continuous grid coordinate
    [[nodiscard]] glm::vec2 gridToWorld(float column, float row) const;

    [[nodiscard]] bool inBounds(int32_t column, int32_t row) const {
        return column >= 0 && column < resolution_ && row >= 0 && row < resolution_;
    }

    [[nodiscard]] size_t index(int32_t column, int32_t row) const {
        return static_cast<size_t>(row) * static_cast<size_t>(resolution_) + static_cast<size_t>(column);
    }

    /// Intersect a window with the grid
    [[nodiscard]] CellWindow clip(CellWindow window) const;

    // ========================================================================
    // Chunk layout
    // ========================================================================

    [[nodiscard]] ChunkId chunkOf(CellPos cell) const {
        return {cell.column / cellsPerChunk_, cell.row / cellsPerChunk_};
    }

    [[nodiscard]] bool isValidChunk(ChunkId id) const {
        return id.column >= 0 && id.column < chunksPerSide_ && id.row >= 0 && id.row < chunksPerSide_;
    }

    /// Cells a chunk mesh samples, including the trailing boundary row and
    /// column it shares with the next chunk (clamped to the last cell).
    [[nodiscard]] CellWindow cellWindow(ChunkId id) const;

    [[nodiscard]] std::vector<ChunkId> allChunks() const;

    bool operator==(const FieldGeometry& other) const = default;

private:
    int32_t resolution_;
    float worldSize_;
    float chunkEdge_;
    int32_t chunksPerSide_ = 0;
    int32_t cellsPerChunk_ = 0;
};

}  // namespace terrasculpt
