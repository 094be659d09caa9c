/**
 * @file random.hpp
 * @brief Seeded linear congruential generator
 *
 * Reproducibility of scatter placement depends on this sequence, so the
 * constants must never change: state = (state * 9301 + 49297) mod 233280.
 */

#pragma once

#include <cstdint>

namespace terrasculpt::worldgen {

/// Deterministic uniform generator. Same seed => same sequence, always.
class SeededRandom {
public:
    static constexpr uint64_t MULTIPLIER = 9301;
    static constexpr uint64_t INCREMENT = 49297;
    static constexpr uint64_t MODULUS = 233280;

    explicit SeededRandom(uint32_t seed) : state_(seed) {}

    /// Advance and return a value in [0, 1)
    double next();

    /// Uniform value in [min, max)
    double range(double min, double max);

    [[nodiscard]] uint64_t state() const { return state_; }

private:
    uint64_t state_;
};

}  // namespace terrasculpt::worldgen
