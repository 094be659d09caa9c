#pragma once

/**
 * @file dirty_chunks.hpp
 * @brief Stale-mesh bookkeeping for edited cells
 *
 * Adjacent chunk meshes share one boundary row/column of vertices. A cell
 * on column (or row) 0 of its chunk is also a vertex of the chunk to the
 * left (or above), so that chunk goes stale too. The rule is applied per
 * modified cell, never inferred from an edit's bounding window.
 */

#include "terrasculpt/core/position.hpp"
#include "terrasculpt/field/field_geometry.hpp"

#include <cstdint>
#include <unordered_map>
#include <unordered_set>

namespace terrasculpt {

/// Chunks whose mesh must be rebuilt after an edit. Order is irrelevant.
using DirtyChunkSet = std::unordered_set<ChunkId>;

// ============================================================================
// DirtyChunkTracker - Accumulates dirty chunks for one edit call
// ============================================================================
class DirtyChunkTracker {
public:
    explicit DirtyChunkTracker(const FieldGeometry& geometry)
        : cellsPerChunk_(geometry.cellsPerChunk()) {}

    /// Record a modified cell (column, row)
    void markCell(int32_t column, int32_t row);

    [[nodiscard]] bool empty() const { return chunks_.empty(); }
    [[nodiscard]] const DirtyChunkSet& chunks() const { return chunks_; }

    /// Hand the accumulated set to the caller and start over
    [[nodiscard]] DirtyChunkSet take();

private:
    int32_t cellsPerChunk_;
    DirtyChunkSet chunks_;
};

// ============================================================================
// ChunkVersionTable - Per-chunk mesh versions
// ============================================================================
//
// A renderer keeps the version it last built for each chunk; when bump()
// advances a chunk past that, the mesh is stale. Unknown chunks are at 0.
//
class ChunkVersionTable {
public:
    void bump(const DirtyChunkSet& dirty);
    void bump(ChunkId id) { ++versions_[id]; }

    [[nodiscard]] uint64_t version(ChunkId id) const;

    /// Forget all versions (field replaced)
    void reset() { versions_.clear(); }

    [[nodiscard]] size_t trackedCount() const { return versions_.size(); }

private:
    std::unordered_map<ChunkId, uint64_t> versions_;
};

}  // namespace terrasculpt
