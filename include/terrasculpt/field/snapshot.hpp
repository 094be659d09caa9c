/**
 * @file snapshot.hpp
 * @brief Whole-field snapshots, their compressed encoding, and undo history
 *
 * Encoded form: 12-byte header (magic "TSFS", uncompressed size,
 * compressed size, both 32-bit little-endian) followed by an
 * LZ4-compressed CBOR map:
 *   { "version", "resolution", "world_size", "chunk_size",
 *     "heights": float32 LE bytes, "colors": float32 LE bytes }
 */

#pragma once

#include "terrasculpt/field/dirty_chunks.hpp"
#include "terrasculpt/field/field_geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace terrasculpt {

class HeightField;

/// Copy of both field buffers plus the geometry they belong to
struct FieldSnapshot {
    FieldGeometry geometry;
    std::vector<float> heights;
    std::vector<float> colors;
};

/// Compress a snapshot. Throws std::runtime_error if LZ4 fails.
[[nodiscard]] std::vector<uint8_t> encodeSnapshot(const FieldSnapshot& snapshot);

/// Throws std::runtime_error on bad magic, truncation, LZ4 failure or a
/// malformed payload; std::invalid_argument if the stored geometry is invalid.
[[nodiscard]] FieldSnapshot decodeSnapshot(std::span<const uint8_t> data);

void saveSnapshot(const FieldSnapshot& snapshot, const std::filesystem::path& path);
[[nodiscard]] FieldSnapshot loadSnapshot(const std::filesystem::path& path);

// ============================================================================
// SnapshotHistory - Bounded whole-field undo stack
// ============================================================================
class SnapshotHistory {
public:
    /// Throws std::invalid_argument if depth is 0
    explicit SnapshotHistory(size_t depth);

    /// Push the field's current state, evicting the oldest beyond depth
    void record(const HeightField& field);

    /// Restore the most recent state into field and drop it from the stack.
    /// nullopt when empty. Throws std::invalid_argument if the recorded
    /// geometry differs from the field's (the entry is kept).
    std::optional<DirtyChunkSet> undo(HeightField& field);

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] size_t depth() const { return depth_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

private:
    size_t depth_;
    std::deque<std::vector<uint8_t>> entries_;
};

}  // namespace terrasculpt
