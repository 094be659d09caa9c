#include "terrasculpt/worldgen/random.hpp"

namespace terrasculpt::worldgen {

double SeededRandom::next() {
    state_ = (state_ * MULTIPLIER + INCREMENT) % MODULUS;
    return static_cast<double>(state_) / static_cast<double>(MODULUS);
}

double SeededRandom::range(double min, double max) {
    return min + next() * (max - min);
}

}  // namespace terrasculpt::worldgen
