/**
 * @file Simulation.h
 * @brief Root of a run: owns the independent spinner trees and the random source, drives update/render.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "RandomSource.h"
#include "SimConfig.h"
#include "SpinnerNode.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class RenderSurface;
class ToneSink;

/**
 * @class Simulation
 * @brief Owns config.systems top-level SpinnerNode trees centered in the world.
 *
 * Single-threaded: step() updates every tree in order, render() draws every tree then the totals overlay.
 */
class Simulation {
public:
    /** @brief Build all trees, seeding from config.seed when set, otherwise from std::random_device. */
    explicit Simulation(const SimConfig& config);

    /** @brief Tear down and rebuild every tree from @p seed. */
    void rebuild(uint32_t seed);

    /** @brief Advance every tree by @p dt; tone requests go to @p sink when non-null. */
    void step(double dt, ToneSink* sink);

    /** @brief Draw every tree, then the particle/energy overlay. */
    void render(RenderSurface& surface) const;

    size_t totalParticles() const;
    double totalEnergy() const;
    size_t nodeCount() const;

    size_t systemCount() const { return systems.size(); }
    const SpinnerNode& system(size_t i) const { return *systems.at(i); }
    const SimConfig& config() const { return cfg; }
    uint32_t seed() const { return rng.seed(); }
    uint64_t frames() const { return frameCount; }

    /** @brief World position of the tree roots (center of the world). */
    Vec2 worldCenter() const;

    /** @brief Overlay lines, e.g. "Total Particles: 2187" and "Total Energy: 12.34". */
    static std::string particlesLabel(size_t n);
    static std::string energyLabel(double e);

private:
    void build();

    SimConfig cfg;
    SpinnerParams params;
    RandomSource rng;
    std::vector<std::unique_ptr<SpinnerNode>> systems;
    uint64_t frameCount{0};
};
