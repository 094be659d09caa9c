#include "terrasculpt/field/field_geometry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace terrasculpt {

FieldGeometry::FieldGeometry(int32_t resolution, float worldSize, float chunkEdge)
    : resolution_(resolution)
    , worldSize_(worldSize)
    , chunkEdge_(chunkEdge) {

    if (!isSupportedResolution(resolution)) {
        throw std::invalid_argument("FieldGeometry: unsupported resolution " + std::to_string(resolution));
    }
    if (!(worldSize > 0.0f)) {
        throw std::invalid_argument("FieldGeometry: world size must be positive");
    }
    if (!(chunkEdge > 0.0f)) {
        throw std::invalid_argument("FieldGeometry: chunk edge must be positive");
    }

    float ratio = worldSize / chunkEdge;
    float whole = std::round(ratio);
    if (whole < 1.0f || std::abs(ratio - whole) > 1e-4f) {
        throw std::invalid_argument("FieldGeometry: world size " + std::to_string(worldSize) +
                                    " is not a whole number of " + std::to_string(chunkEdge) +
                                    "-unit chunks");
    }
    chunksPerSide_ = static_cast<int32_t>(whole);

    if (resolution % chunksPerSide_ != 0) {
        throw std::invalid_argument("FieldGeometry: resolution " + std::to_string(resolution) +
                                    " does not divide into " + std::to_string(chunksPerSide_) +
                                    " chunks per side");
    }
    cellsPerChunk_ = resolution / chunksPerSide_;
}

bool FieldGeometry::isSupportedResolution(int32_t resolution) {
    return std::find(SUPPORTED_RESOLUTIONS.begin(), SUPPORTED_RESOLUTIONS.end(), resolution) !=
           SUPPORTED_RESOLUTIONS.end();
}

glm::vec2 FieldGeometry::worldToGrid(float worldX, float worldZ) const {
    float half = worldSize_ * 0.5f;
    float n = static_cast<float>(resolution_);
    return {((worldX + half) / worldSize_) * n, ((worldZ + half) / worldSize_) * n};
}

float FieldGeometry::worldToGridDistance(float worldDistance) const {
    return (worldDistance / worldSize_) * static_cast<float>(resolution_);
}

glm::vec2 FieldGeometry::gridToWorld(float column, float row) const {
    float half = worldSize_ * 0.5f;
    float n = static_cast<float>(resolution_);
    return {(column / n) * worldSize_ - half, (row / n) * worldSize_ - half};
}

CellWindow FieldGeometry::clip(CellWindow window) const {
    window.minColumn = std::max(0, window.minColumn);
    window.minRow = std::max(0, window.minRow);
    window.maxColumn = std::min(resolution_ - 1, window.maxColumn);
    window.maxRow = std::min(resolution_ - 1, window.maxRow);
    return window;
}

CellWindow FieldGeometry::cellWindow(ChunkId id) const {
    if (!isValidChunk(id)) {
        return {};
    }
    CellWindow window;
    window.minColumn = id.column * cellsPerChunk_;
    window.minRow = id.row * cellsPerChunk_;
    window.maxColumn = std::min(resolution_ - 1, (id.column + 1) * cellsPerChunk_);
    window.maxRow = std::min(resolution_ - 1, (id.row + 1) * cellsPerChunk_);
    return window;
}

std::vector<ChunkId> FieldGeometry::allChunks() const {
    std::vector<ChunkId> chunks;
    chunks.reserve(static_cast<size_t>(chunksPerSide_) * static_cast<size_t>(chunksPerSide_));
    for (int32_t row = 0; row < chunksPerSide_; ++row) {
        for (int32_t column = 0; column < chunksPerSide_; ++column) {
            chunks.emplace_back(column, row);
        }
    }
    return chunks;
}

}  // namespace terrasculpt
