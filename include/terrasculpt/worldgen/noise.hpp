/**
 * @file noise.hpp
 * @brief Coherent 2D gradient noise over an explicit permutation table
 *
 * The permutation table is an immutable value built once (normally at
 * startup from the configured seed) and handed to every noise evaluator.
 * Nothing here keeps ambient global state.
 * Output range is approximately [-1, 1].
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace terrasculpt::worldgen {

// ============================================================================
// PermutationTable
// ============================================================================

/// 256-entry shuffled lattice hash, duplicated to 512 entries so corner
/// lookups never need wrapping.
class PermutationTable {
public:
    static constexpr size_t SIZE = 256;

    explicit PermutationTable(uint64_t seed);

    [[nodiscard]] uint8_t operator[](size_t index) const { return perm_[index]; }
    [[nodiscard]] uint64_t seed() const { return seed_; }

    bool operator==(const PermutationTable& other) const { return perm_ == other.perm_; }

private:
    std::array<uint8_t, SIZE * 2> perm_{};
    uint64_t seed_;
};

// ============================================================================
// Noise2D
// ============================================================================

/// Abstract 2D noise evaluator
class Noise2D {
public:
    virtual ~Noise2D() = default;

    /// Evaluate noise at (x, z). Returns approximately [-1, 1].
    [[nodiscard]] virtual float evaluate(float x, float z) const = 0;
};

/// Perlin gradient noise with a quintic fade and bilinear blend of the
/// four lattice-corner gradients.
class PerlinNoise2D : public Noise2D {
public:
    explicit PerlinNoise2D(const PermutationTable& table) : table_(table) {}

    [[nodiscard]] float evaluate(float x, float z) const override;

    [[nodiscard]] const PermutationTable& table() const { return table_; }

private:
    PermutationTable table_;
};

}  // namespace terrasculpt::worldgen
