/**
 * @file SpinnerNode.cpp
 * @brief Spinner tree construction, recursive update/render, and energy/count reductions.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SpinnerNode.h"
#include "Logger.h"
#include "RandomSource.h"
#include "RenderSurface.h"
#include "ToneMapper.h"
#include "ToneSink.h"

#include <algorithm>
#include <string>

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
}

/** @copydoc SpinnerNode::SpinnerNode */
SpinnerNode::SpinnerNode(int level, const Vec2& center, double armLength, double lobeRadius, int maxLevel,
                         const SpinnerParams& params, RandomSource& rng)
    : lvl(level), maxLvl(maxLevel), ctr(center), arm(armLength), lobeR(lobeRadius), cfg(params) {
    if (hasChildren()) {
        for (int i = 0; i < Lobes; ++i) {
            Vec2 lc = lobeCenter(i);
            auto& list = kids[static_cast<size_t>(i)];
            list.reserve(ChildrenPerLobe);
            for (int j = 0; j < ChildrenPerLobe; ++j) {
                list.push_back(std::make_unique<SpinnerNode>(level + 1, lc, armLength * cfg.shrink,
                                                             lobeRadius * cfg.shrink, maxLevel, cfg, rng));
            }
        }
    }
    initParticles(rng);
    if (level == 0 && Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("SpinnerNode: built tree nodes=" + std::to_string(nodeCount()) +
                      " particles=" + std::to_string(totalParticles()) +
                      " maxLevel=" + std::to_string(maxLevel));
    }
}

void SpinnerNode::initParticles(RandomSource& rng) {
    // Keep particles smaller than the lobe even at deep levels.
    double rMax = std::min(cfg.maxParticleRadius, lobeR * 0.5);
    double rMin = std::min(cfg.minParticleRadius, rMax);
    int count = std::max(0, cfg.particlesPerLobe);
    for (int i = 0; i < Lobes; ++i) {
        Vec2 lc = lobeCenter(i);
        auto& group = groups[static_cast<size_t>(i)];
        group.clear();
        group.reserve(static_cast<size_t>(count));
        for (int k = 0; k < count; ++k) {
            double a = rng.uniform01() * kTwoPi;
            double speed = rng.uniform01() * cfg.maxInitialSpeed;
            double r = rMin + rng.uniform01() * (rMax - rMin);
            double reach = rng.uniform01() * (lobeR - r);
            Vec2 dir = Vec2::polar(a);
            group.emplace_back(lc + dir * reach, dir * speed, r);
        }
    }
}

Vec2 SpinnerNode::lobeCenter(int idx) const {
    double a = idx * kTwoPi / Lobes + angle;
    return ctr + Vec2::polar(a) * arm;
}

/** @copydoc SpinnerNode::update */
void SpinnerNode::update(double dt, RandomSource& rng, ToneSink* sink) {
    angle += dt * (1.0 + lvl * cfg.spinPerLevel);

    for (int i = 0; i < Lobes; ++i) {
        Vec2 lc = lobeCenter(i);
        auto& group = groups[static_cast<size_t>(i)];
        for (auto& p : group) {
            p.update(lc, lobeR, dt, rng, cfg.jitter);
            if (sink) {
                sink->play(mapEnergyToTone(p.kineticEnergy(), cfg.baseFrequencies[static_cast<size_t>(i)],
                                           cfg.lobePans[static_cast<size_t>(i)]));
            }
        }
    }

    if (hasChildren()) {
        for (int i = 0; i < Lobes; ++i) {
            Vec2 lc = lobeCenter(i);
            for (auto& child : kids[static_cast<size_t>(i)]) {
                child->setCenter(lc);
                child->update(dt, rng, sink);
            }
        }
    }

    applyDemon();
}

void SpinnerNode::applyDemon() {
    for (int i = 0; i < Lobes; ++i) {
        demonSortLobe(groups[static_cast<size_t>(i)], lobeCenter(i), cfg.demonThreshold);
    }
}

void SpinnerNode::render(RenderSurface& surface) const {
    for (int i = 0; i < Lobes; ++i) {
        Vec2 lc = lobeCenter(i);
        const Rgb& color = Palette::Lobes[static_cast<size_t>(i)];
        surface.drawLine(ctr, lc, Palette::Arm, 2);
        surface.drawCircleOutline(lc, lobeR, color);
        for (const auto& p : groups[static_cast<size_t>(i)]) {
            surface.drawFilledCircle(p.position(), p.radius(), color);
        }
    }
    for (const auto& list : kids) {
        for (const auto& child : list) child->render(surface);
    }
}

double SpinnerNode::totalEnergy() const {
    double e = 0.0;
    for (const auto& group : groups) {
        for (const auto& p : group) e += p.kineticEnergy();
    }
    for (const auto& list : kids) {
        for (const auto& child : list) e += child->totalEnergy();
    }
    return e;
}

size_t SpinnerNode::totalParticles() const {
    size_t n = 0;
    for (const auto& group : groups) n += group.size();
    for (const auto& list : kids) {
        for (const auto& child : list) n += child->totalParticles();
    }
    return n;
}

size_t SpinnerNode::nodeCount() const {
    size_t n = 1;
    for (const auto& list : kids) {
        for (const auto& child : list) n += child->nodeCount();
    }
    return n;
}
