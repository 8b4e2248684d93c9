/**
 * @file Particle.h
 * @brief A point mass bouncing inside a circular lobe.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vec2.h"

#include <vector>

class RandomSource;

/**
 * @class Particle
 * @brief Position, velocity and radius of one particle, plus its integration and boundary physics.
 *
 * Energy is never stored; it is derived from velocity on demand. There is no speed cap:
 * the per-tick velocity jitter lets energy drift upward without bound over long runs.
 */
class Particle {
public:
    /** @brief Jitter half-width applied to each velocity component after every update. */
    static constexpr double DefaultJitter = 0.005;
    /** @brief Below this distance from the lobe center the outward normal is undefined. */
    static constexpr double DegenerateDistance = 1e-9;

    Particle() = default;
    Particle(const Vec2& position, const Vec2& velocity, double radius)
        : pos(position), vel(velocity), rad(radius) {}

    /** @brief Kinetic energy 0.5*(vx^2 + vy^2) (unit mass). */
    double kineticEnergy() const { return 0.5 * vel.dot(vel); }

    /**
     * @brief Integrate one tick and reflect off the lobe wall.
     *
     * Moves by velocity*dt; if the particle now pokes through the circle of @p lobeRadius around
     * @p center, reflects velocity about the outward normal and clamps position to
     * lobeRadius - radius along it. Then adds independent uniform noise in [-jitter, jitter) to vx and vy.
     * Reflection is skipped when the particle sits on the center itself.
     *
     * @return true if a wall reflection happened this tick.
     */
    bool update(const Vec2& center, double lobeRadius, double dt, RandomSource& rng,
                double jitter = DefaultJitter);

    const Vec2& position() const { return pos; }
    const Vec2& velocity() const { return vel; }
    double radius() const { return rad; }

    void setPosition(const Vec2& p) { pos = p; }
    void setVelocity(const Vec2& v) { vel = v; }
    /** @brief Overwrite only the x coordinate (used by the demon sort). */
    void setX(double x) { pos.x = x; }

private:
    Vec2 pos;
    Vec2 vel;
    double rad{1.0};
};

/** @brief Fixed-size set of particles confined to one lobe. */
using ParticleGroup = std::vector<Particle>;
