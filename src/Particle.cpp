/**
 * @file Particle.cpp
 * @brief Particle integration and circular-boundary reflection.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Particle.h"
#include "RandomSource.h"

/** @copydoc Particle::update */
bool Particle::update(const Vec2& center, double lobeRadius, double dt, RandomSource& rng, double jitter) {
    pos += vel * dt;

    bool reflected = false;
    Vec2 d = pos - center;
    double dist = d.length();
    if (dist + rad > lobeRadius && dist > DegenerateDistance) {
        Vec2 n = d * (1.0 / dist);
        double vn = vel.dot(n);
        vel = vel - n * (2.0 * vn);
        pos = center + n * (lobeRadius - rad);
        reflected = true;
    }

    // Order matters for replay: x noise is drawn before y noise.
    vel.x += rng.symmetric(jitter);
    vel.y += rng.symmetric(jitter);
    return reflected;
}
