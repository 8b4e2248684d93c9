/**
 * @file RandomSource.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "RandomSource.h"

uint32_t RandomSource::entropySeed() {
    std::random_device rd;
    return static_cast<uint32_t>(rd());
}

RandomSource::RandomSource() : RandomSource(entropySeed()) {}

RandomSource::RandomSource(uint32_t seed) : seedValue(seed), prng(seed) {}

void RandomSource::reseed(uint32_t seed) {
    seedValue = seed;
    prng.seed(seed);
}

double RandomSource::uniform01() {
    std::uniform_real_distribution<double> d(0.0, 1.0);
    return d(prng);
}

double RandomSource::uniform(double lo, double hi) {
    return lo + (hi - lo) * uniform01();
}
