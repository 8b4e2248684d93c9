/**
 * @file ToneChamber.h
 * @brief Display-less variant: three lobes of velocity-only particles sonified every step.
 *
 * Unlike SpinnerNode's positional demon, the chamber's demon nudges velocity: particles above their lobe's
 * average energy get vx += nudge, the rest vx -= nudge.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Particle.h"

#include <array>
#include <cstddef>

class RandomSource;
class ToneSink;

class ToneChamber {
public:
    static constexpr int Lobes = 3;
    static constexpr double InitialSpread = 0.25; /**< initial vx, vy uniform in [-spread, spread) */
    static constexpr double Jitter = 0.01;        /**< per-step velocity noise half-width */
    static constexpr double Nudge = 0.01;         /**< demon push along x */
    static constexpr double ParticleRadius = 1.0; /**< nominal; chamber particles never meet a wall */

    struct Lobe {
        double baseFrequency{220.0};
        double pan{0.5};
        ParticleGroup particles;
    };

    /** @brief Populate three lobes (pans 0.1, 0.5, 0.9) with @p particlesPerLobe particles each. */
    ToneChamber(int particlesPerLobe, const std::array<double, 3>& baseFrequencies, RandomSource& rng);

    /** @brief Jitter every velocity, then apply the average-energy demon per lobe. */
    void step(RandomSource& rng);

    /** @brief Issue one tone request per particle, lobe by lobe. */
    void emit(ToneSink& sink) const;

    /** @brief Mean kinetic energy of lobe @p idx (0 for an empty lobe). */
    double averageEnergy(int idx) const;

    const Lobe& lobe(int idx) const { return lobes[static_cast<size_t>(idx)]; }
    Lobe& lobe(int idx) { return lobes[static_cast<size_t>(idx)]; }

private:
    std::array<Lobe, Lobes> lobes;
};
