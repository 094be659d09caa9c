#include "terrasculpt/field/dirty_chunks.hpp"

#include <utility>

namespace terrasculpt {

void DirtyChunkTracker::markCell(int32_t column, int32_t row) {
    int32_t chunkColumn = column / cellsPerChunk_;
    int32_t chunkRow = row / cellsPerChunk_;
    chunks_.emplace(chunkColumn, chunkRow);

    // Shared leading edge: the previous chunk's mesh owns this vertex too
    if (column % cellsPerChunk_ == 0 && chunkColumn > 0) {
        chunks_.emplace(chunkColumn - 1, chunkRow);
    }
    if (row % cellsPerChunk_ == 0 && chunkRow > 0) {
        chunks_.emplace(chunkColumn, chunkRow - 1);
    }
}

DirtyChunkSet DirtyChunkTracker::take() {
    DirtyChunkSet result = std::move(chunks_);
    chunks_.clear();
    return result;
}

void ChunkVersionTable::bump(const DirtyChunkSet& dirty) {
    for (const auto& id : dirty) {
        ++versions_[id];
    }
}

uint64_t ChunkVersionTable::version(ChunkId id) const {
    auto it = versions_.find(id);
    return it != versions_.end() ? it->second : 0;
}

}  // namespace terrasculpt
