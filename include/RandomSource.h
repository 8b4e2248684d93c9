/**
 * @file RandomSource.h
 * @brief Owned, seedable PRNG passed by reference through construction and per-tick updates.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <random>

/**
 * @class RandomSource
 * @brief Wraps an mt19937 together with the seed it was started from so a run can be replayed.
 */
class RandomSource {
public:
    /** @brief Seed from std::random_device. */
    RandomSource();
    /** @brief Seed explicitly. */
    explicit RandomSource(uint32_t seed);

    /** @brief Restart the sequence from @p seed. */
    void reseed(uint32_t seed);
    /** @brief Seed the current sequence started from. */
    uint32_t seed() const { return seedValue; }

    /** @brief Uniform real in [0,1). */
    double uniform01();
    /** @brief Uniform real in [lo,hi). */
    double uniform(double lo, double hi);
    /** @brief Uniform real in [-halfWidth, halfWidth). */
    double symmetric(double halfWidth) { return uniform(-halfWidth, halfWidth); }

    /** @brief Access the engine (for std distributions). */
    std::mt19937& engine() { return prng; }

    /** @brief Draw a fresh seed from std::random_device. */
    static uint32_t entropySeed();

private:
    uint32_t seedValue{0};
    std::mt19937 prng;
};
