/**
 * @file test_particle.cpp
 * @brief Particle integration, wall reflection, jitter and degenerate-geometry handling.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include <cmath>

#include "Particle.h"
#include "RandomSource.h"

TEST_CASE("Particle kinetic energy is half the squared speed", "[particle]") {
    Particle p({0.0, 0.0}, {3.0, 4.0}, 1.0);
    REQUIRE(p.kineticEnergy() == Approx(12.5));
    Particle still({5.0, 5.0}, {0.0, 0.0}, 1.0);
    REQUIRE(still.kineticEnergy() == 0.0);
}

TEST_CASE("Particle integrates position while inside its lobe", "[particle]") {
    RandomSource rng(1);
    Particle p({10.0, 0.0}, {1.0, 2.0}, 1.0);
    REQUIRE_FALSE(p.update({0.0, 0.0}, 100.0, 2.0, rng));
    REQUIRE(p.position().x == Approx(12.0));
    REQUIRE(p.position().y == Approx(4.0));
    REQUIRE(p.velocity().x == Approx(1.0).margin(Particle::DefaultJitter));
    REQUIRE(p.velocity().y == Approx(2.0).margin(Particle::DefaultJitter));
}

TEST_CASE("Particle reflects outward motion and clamps to the wall", "[particle]") {
    RandomSource rng(2);
    const Vec2 center{5.0, 5.0};
    Particle p({13.5, 5.0}, {1.0, 0.0}, 1.0);
    REQUIRE(p.update(center, 10.0, 1.0, rng));
    REQUIRE(p.position().x == Approx(14.0).margin(1e-12));
    REQUIRE(p.position().y == Approx(5.0).margin(1e-12));
    REQUIRE(p.velocity().x == Approx(-1.0).margin(Particle::DefaultJitter + 1e-12));
    REQUIRE(p.velocity().y == Approx(0.0).margin(Particle::DefaultJitter + 1e-12));
}

TEST_CASE("Particle diagonal reflection negates the normal component", "[particle]") {
    RandomSource rng(3);
    const Vec2 center{0.0, 0.0};
    const double lobeRadius = 10.0;
    Particle p({6.0, 6.0}, {1.0, 1.0}, 1.0);
    const Vec2 n{1.0 / std::sqrt(2.0), 1.0 / std::sqrt(2.0)};
    double before = p.velocity().dot(n);
    REQUIRE(p.update(center, lobeRadius, 1.0, rng));
    double after = p.velocity().dot(n);
    // Jitter touches both components, so the normal component moves by at most jitter*sqrt(2).
    REQUIRE(after == Approx(-before).margin(Particle::DefaultJitter * std::sqrt(2.0) + 1e-12));
    REQUIRE((p.position() - center).length() == Approx(lobeRadius - p.radius()).margin(1e-9));
    REQUIRE(p.position().x == Approx(p.position().y).margin(1e-9));
}

TEST_CASE("Particle jitter stays inside its symmetric interval", "[particle]") {
    RandomSource rng(4);
    Particle p({0.0, 0.0}, {0.0, 0.0}, 1.0);

    SECTION("default width") {
        for (int i = 0; i < 500; ++i) {
            Vec2 before = p.velocity();
            p.update({0.0, 0.0}, 100.0, 0.0, rng);
            REQUIRE(std::fabs(p.velocity().x - before.x) <= Particle::DefaultJitter);
            REQUIRE(std::fabs(p.velocity().y - before.y) <= Particle::DefaultJitter);
        }
    }

    SECTION("zero width leaves velocity alone") {
        p.update({0.0, 0.0}, 100.0, 1.0, rng, 0.0);
        REQUIRE(p.velocity().x == 0.0);
        REQUIRE(p.velocity().y == 0.0);
    }
}

TEST_CASE("Particle sitting on the lobe center skips reflection", "[particle]") {
    RandomSource rng(6);
    // Bigger than its lobe and sitting on the center: the normal is undefined.
    Particle p({3.0, 3.0}, {0.0, 0.0}, 1.0);
    REQUIRE_FALSE(p.update({3.0, 3.0}, 0.5, 1.0, rng, 0.0));
    REQUIRE(p.position().x == 3.0);
    REQUIRE(p.position().y == 3.0);
    REQUIRE_FALSE(std::isnan(p.velocity().x));
    REQUIRE_FALSE(std::isnan(p.velocity().y));
}

TEST_CASE("Particle stays contained over many fast ticks", "[particle]") {
    RandomSource rng(7);
    const Vec2 center{100.0, -50.0};
    const double lobeRadius = 40.0;
    for (int k = 0; k < 20; ++k) {
        double a = rng.uniform01() * 6.283185307179586;
        Vec2 dir = Vec2::polar(a);
        Particle p(center + dir * rng.uniform(0.0, 30.0), dir * rng.uniform(1.0, 25.0), rng.uniform(2.0, 4.0));
        for (int t = 0; t < 300; ++t) {
            p.update(center, lobeRadius, 16.0, rng);
            REQUIRE((p.position() - center).length() + p.radius() <= lobeRadius + 1e-9);
        }
    }
}

TEST_CASE("Particle trajectories replay from the same seed", "[particle][seed]") {
    RandomSource a(99), b(99);
    Particle p({1.0, 2.0}, {0.2, -0.1}, 3.0);
    Particle q = p;
    for (int t = 0; t < 100; ++t) {
        p.update({0.0, 0.0}, 20.0, 16.0, a);
        q.update({0.0, 0.0}, 20.0, 16.0, b);
    }
    REQUIRE(p.position().x == q.position().x);
    REQUIRE(p.position().y == q.position().y);
    REQUIRE(p.velocity().x == q.velocity().x);
    REQUIRE(p.velocity().y == q.velocity().y);
}
