#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace terrasculpt {

// ============================================================================
// CellPos - Integer cell of the height/color grid
// ============================================================================
//
// column runs along world X, row along world Z. Row-major flat index is
// row * resolution + column.
//
struct CellPos {
    int32_t column = 0;
    int32_t row = 0;

    constexpr CellPos() = default;
    constexpr CellPos(int32_t column_, int32_t row_) : column(column_), row(row_) {}

    [[nodiscard]] constexpr size_t index(int32_t resolution) const {
        return static_cast<size_t>(row) * static_cast<size_t>(resolution) + static_cast<size_t>(column);
    }

    constexpr bool operator==(const CellPos& other) const = default;
    constexpr auto operator<=>(const CellPos& other) const = default;
};

// ============================================================================
// ChunkId - Fixed-size square mesh region, (chunkColumn, chunkRow)
// ============================================================================
struct ChunkId {
    int32_t column = 0;
    int32_t row = 0;

    constexpr ChunkId() = default;
    constexpr ChunkId(int32_t column_, int32_t row_) : column(column_), row(row_) {}

    // Pack into 64-bit value for use as map key
    [[nodiscard]] constexpr uint64_t pack() const {
        return (static_cast<uint64_t>(static_cast<uint32_t>(column)) << 32) |
               static_cast<uint64_t>(static_cast<uint32_t>(row));
    }

    [[nodiscard]] static constexpr ChunkId unpack(uint64_t packed) {
        return {static_cast<int32_t>(static_cast<uint32_t>(packed >> 32)),
                static_cast<int32_t>(static_cast<uint32_t>(packed & 0xFFFFFFFFULL))};
    }

    constexpr bool operator==(const ChunkId& other) const = default;
    constexpr auto operator<=>(const ChunkId& other) const = default;
};

// Inclusive cell range [minColumn, maxColumn] x [minRow, maxRow]
struct CellWindow {
    int32_t minColumn = 0;
    int32_t maxColumn = -1;
    int32_t minRow = 0;
    int32_t maxRow = -1;

    [[nodiscard]] constexpr bool empty() const { return maxColumn < minColumn || maxRow < minRow; }

    [[nodiscard]] constexpr bool contains(CellPos cell) const {
        return cell.column >= minColumn && cell.column <= maxColumn &&
               cell.row >= minRow && cell.row <= maxRow;
    }

    [[nodiscard]] constexpr size_t cellCount() const {
        if (empty()) return 0;
        return static_cast<size_t>(maxColumn - minColumn + 1) * static_cast<size_t>(maxRow - minRow + 1);
    }
};

}  // namespace terrasculpt

template<>
struct std::hash<terrasculpt::CellPos> {
    size_t operator()(const terrasculpt::CellPos& pos) const noexcept {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(static_cast<uint32_t>(pos.column)) << 32) |
                                     static_cast<uint32_t>(pos.row));
    }
};

template<>
struct std::hash<terrasculpt::ChunkId> {
    size_t operator()(const terrasculpt::ChunkId& id) const noexcept {
        return std::hash<uint64_t>{}(id.pack());
    }
};
