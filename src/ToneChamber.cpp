/**
 * @file ToneChamber.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ToneChamber.h"
#include "RandomSource.h"
#include "ToneMapper.h"
#include "ToneSink.h"

#include <algorithm>

namespace {
constexpr std::array<double, 3> kChamberPans{{0.1, 0.5, 0.9}};
}

ToneChamber::ToneChamber(int particlesPerLobe, const std::array<double, 3>& baseFrequencies, RandomSource& rng) {
    int count = std::max(0, particlesPerLobe);
    for (size_t i = 0; i < lobes.size(); ++i) {
        Lobe& l = lobes[i];
        l.baseFrequency = baseFrequencies[i];
        l.pan = kChamberPans[i];
        l.particles.reserve(static_cast<size_t>(count));
        for (int k = 0; k < count; ++k) {
            double vx = rng.symmetric(InitialSpread);
            double vy = rng.symmetric(InitialSpread);
            l.particles.emplace_back(Vec2{}, Vec2{vx, vy}, ParticleRadius);
        }
    }
}

void ToneChamber::step(RandomSource& rng) {
    for (size_t i = 0; i < lobes.size(); ++i) {
        for (auto& p : lobes[i].particles) {
            Vec2 v = p.velocity();
            v.x += rng.symmetric(Jitter);
            v.y += rng.symmetric(Jitter);
            p.setVelocity(v);
        }
        double avg = averageEnergy(static_cast<int>(i));
        for (auto& p : lobes[i].particles) {
            Vec2 v = p.velocity();
            v.x += (p.kineticEnergy() > avg) ? Nudge : -Nudge;
            p.setVelocity(v);
        }
    }
}

void ToneChamber::emit(ToneSink& sink) const {
    for (const auto& l : lobes) {
        for (const auto& p : l.particles) {
            sink.play(mapEnergyToTone(p.kineticEnergy(), l.baseFrequency, l.pan));
        }
    }
}

double ToneChamber::averageEnergy(int idx) const {
    const auto& ps = lobes[static_cast<size_t>(idx)].particles;
    if (ps.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& p : ps) sum += p.kineticEnergy();
    return sum / static_cast<double>(ps.size());
}
