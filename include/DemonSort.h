/**
 * @file DemonSort.h
 * @brief The "Maxwell's demon" heuristic: partition a lobe's particles left/right by energy class.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Particle.h"

/** @brief Energy above which a particle counts as hot. */
constexpr double DemonThreshold = 0.05;

/** @brief Whether @p p is on the hot side of @p threshold (strictly greater). */
inline bool isHot(const Particle& p, double threshold = DemonThreshold) {
    return p.kineticEnergy() > threshold;
}

/**
 * @brief Mirror every particle of @p group onto the side of @p lobeCenter matching its energy class.
 *
 * Hot particles end with x >= lobeCenter.x, cold ones with x <= lobeCenter.x. Only x is rewritten, and
 * only by reflecting it about the lobe center, so the distance to the center (and therefore lobe
 * containment) is unchanged. Velocity is untouched.
 *
 * @return number of particles classified hot.
 */
int demonSortLobe(ParticleGroup& group, const Vec2& lobeCenter, double threshold = DemonThreshold);
