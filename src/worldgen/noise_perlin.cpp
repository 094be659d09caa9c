/**
 * @file noise_perlin.cpp
 * @brief Permutation table construction and 2D Perlin evaluation
 */

#include "terrasculpt/worldgen/noise.hpp"

#include <cmath>
#include <utility>

namespace terrasculpt::worldgen {

namespace {

/// Improved Perlin fade curve: 6t^5 - 15t^4 + 10t^3
inline float fade(float t) {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

inline float lerp(float t, float a, float b) {
    return a + t * (b - a);
}

/// One of the 12 edge gradients of the 3D set, projected onto the plane.
/// Hashes 12..15 repeat directions, so some corners contribute a single axis.
inline float grad(int hash, float x, float z) {
    int h = hash & 15;
    float u = h < 8 ? x : z;
    float v = h < 4 ? z : (h == 12 || h == 14 ? x : 0.0f);
    return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

}  // namespace

// ============================================================================
// PermutationTable
// ============================================================================

PermutationTable::PermutationTable(uint64_t seed) : seed_(seed) {
    for (size_t i = 0; i < SIZE; ++i) {
        perm_[i] = static_cast<uint8_t>(i);
    }

    // Fisher-Yates with an xorshift stream; zero is a fixed point of xorshift
    uint64_t state = seed != 0 ? seed : 0x9e3779b97f4a7c15ULL;
    for (size_t i = SIZE - 1; i > 0; --i) {
        state ^= state << 13;
        state ^= state >> 7;
        state ^= state << 17;
        size_t j = static_cast<size_t>(state % (i + 1));
        std::swap(perm_[i], perm_[j]);
    }

    for (size_t i = 0; i < SIZE; ++i) {
        perm_[i + SIZE] = perm_[i];
    }
}

// ============================================================================
// PerlinNoise2D
// ============================================================================

float PerlinNoise2D::evaluate(float x, float z) const {
    float fx = std::floor(x);
    float fz = std::floor(z);

    // Wrap to the table period in float space; large coordinates do not fit an int
    int xi = static_cast<int>(fx - 256.0f * std::floor(fx / 256.0f)) & 255;
    int zi = static_cast<int>(fz - 256.0f * std::floor(fz / 256.0f)) & 255;

    float xf = x - fx;
    float zf = z - fz;

    float u = fade(xf);
    float v = fade(zf);

    const auto& p = table_;
    int aa = p[static_cast<size_t>(p[static_cast<size_t>(xi)] + zi)];
    int ab = p[static_cast<size_t>(p[static_cast<size_t>(xi)] + zi + 1)];
    int ba = p[static_cast<size_t>(p[static_cast<size_t>(xi + 1)] + zi)];
    int bb = p[static_cast<size_t>(p[static_cast<size_t>(xi + 1)] + zi + 1)];

    float x1 = lerp(u, grad(aa, xf, zf), grad(ba, xf - 1.0f, zf));
    float x2 = lerp(u, grad(ab, xf, zf - 1.0f), grad(bb, xf - 1.0f, zf - 1.0f));

    return lerp(v, x1, x2);
}

}  // namespace terrasculpt::worldgen
