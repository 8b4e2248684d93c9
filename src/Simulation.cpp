/**
 * @file Simulation.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Simulation.h"
#include "Logger.h"
#include "RenderSurface.h"
#include "ToneSink.h"

#include <cstdio>

Simulation::Simulation(const SimConfig& config)
    : cfg(config),
      params(config.spinnerParams()),
      rng(config.hasSeed ? config.seed : RandomSource::entropySeed()) {
    build();
}

void Simulation::rebuild(uint32_t seed) {
    rng.reseed(seed);
    build();
}

void Simulation::build() {
    systems.clear();
    systems.reserve(static_cast<size_t>(cfg.systems));
    for (int i = 0; i < cfg.systems; ++i) {
        systems.push_back(std::make_unique<SpinnerNode>(0, worldCenter(), cfg.armLength, cfg.lobeRadius,
                                                        cfg.maxLevel, params, rng));
    }
    frameCount = 0;
    Logger::info("Simulation: built systems=" + std::to_string(systems.size()) +
                 " nodes=" + std::to_string(nodeCount()) +
                 " particles=" + std::to_string(totalParticles()) +
                 " seed=" + std::to_string(rng.seed()));
}

Vec2 Simulation::worldCenter() const {
    return {static_cast<double>(cfg.width / 2), static_cast<double>(cfg.height / 2)};
}

void Simulation::step(double dt, ToneSink* sink) {
    for (auto& s : systems) s->update(dt, rng, sink);
    ++frameCount;
}

void Simulation::render(RenderSurface& surface) const {
    for (const auto& s : systems) s->render(surface);
    surface.drawText({20.0, 15.0}, particlesLabel(totalParticles()), Palette::Text);
    surface.drawText({20.0, 40.0}, energyLabel(totalEnergy()), Palette::Text);
}

size_t Simulation::totalParticles() const {
    size_t n = 0;
    for (const auto& s : systems) n += s->totalParticles();
    return n;
}

double Simulation::totalEnergy() const {
    double e = 0.0;
    for (const auto& s : systems) e += s->totalEnergy();
    return e;
}

size_t Simulation::nodeCount() const {
    size_t n = 0;
    for (const auto& s : systems) n += s->nodeCount();
    return n;
}

std::string Simulation::particlesLabel(size_t n) {
    return "Total Particles: " + std::to_string(n);
}

std::string Simulation::energyLabel(double e) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Total Energy: %.2f", e);
    return buf;
}
