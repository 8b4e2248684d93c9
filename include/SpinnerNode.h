/**
 * @file SpinnerNode.h
 * @brief Recursive three-lobed spinner: owns its lobes' particles and, above the leaf level, nine child spinners.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "DemonSort.h"
#include "Particle.h"
#include "Vec2.h"

#include <array>
#include <cstddef>
#include <memory>
#include <vector>

class RandomSource;
class RenderSurface;
class ToneSink;

/**
 * @struct SpinnerParams
 * @brief Tunables shared by every node of a tree (copied into each node at construction).
 */
struct SpinnerParams {
    int particlesPerLobe{6};          /**< particles per lobe, fixed for the node's lifetime */
    double shrink{0.4};               /**< arm length and lobe radius scale per level */
    double spinPerLevel{0.3};         /**< extra angular speed per depth level */
    double demonThreshold{DemonThreshold};
    double jitter{Particle::DefaultJitter};
    double maxInitialSpeed{0.3};
    double minParticleRadius{2.0};
    double maxParticleRadius{4.0};
    std::array<double, 3> baseFrequencies{{220.0, 330.0, 440.0}};
    std::array<double, 3> lobePans{{0.0, 0.5, 1.0}};
};

/**
 * @class SpinnerNode
 * @brief One spinner in a self-similar tree.
 *
 * Level 0 is a root. A node has 3x3 children iff level < maxLevel. A child's center is not owned by the
 * child: the parent pushes its current lobe center down on every update before recursing.
 */
class SpinnerNode {
public:
    static constexpr int Lobes = 3;
    static constexpr int ChildrenPerLobe = 3;

    /**
     * @brief Build this node and its whole subtree.
     *
     * Children are built first (at the theta = 0 lobe geometry, arm/lobe scaled by params.shrink), then
     * this node's particles. All randomness is drawn from @p rng in that order.
     */
    SpinnerNode(int level, const Vec2& center, double armLength, double lobeRadius, int maxLevel,
                const SpinnerParams& params, RandomSource& rng);

    SpinnerNode(const SpinnerNode&) = delete;
    SpinnerNode& operator=(const SpinnerNode&) = delete;

    /**
     * @brief Advance one tick.
     *
     * theta advances by dt*(1 + level*spinPerLevel); each lobe's particles are integrated against the new
     * lobe centers (each one emitting a tone to @p sink when non-null); children are re-centered and
     * updated recursively; finally this node's own demon sort runs.
     */
    void update(double dt, RandomSource& rng, ToneSink* sink = nullptr);

    /** @brief Demon-sort this node's three lobes (children are not touched). */
    void applyDemon();

    /** @brief Draw arms, lobe outlines and particles for this node, then its children. */
    void render(RenderSurface& surface) const;

    /** @brief Kinetic energy summed over this node and all descendants. */
    double totalEnergy() const;
    /** @brief Particle count over this node and all descendants. */
    size_t totalParticles() const;
    /** @brief Number of nodes in this subtree, including this one. */
    size_t nodeCount() const;

    /** @brief Center of lobe @p idx at the current theta. */
    Vec2 lobeCenter(int idx) const;

    int level() const { return lvl; }
    int maxLevel() const { return maxLvl; }
    const Vec2& center() const { return ctr; }
    void setCenter(const Vec2& c) { ctr = c; }
    double armLength() const { return arm; }
    double lobeRadius() const { return lobeR; }
    double theta() const { return angle; }
    bool hasChildren() const { return lvl < maxLvl; }
    const SpinnerParams& params() const { return cfg; }

    const ParticleGroup& particles(int lobe) const { return groups[static_cast<size_t>(lobe)]; }
    ParticleGroup& particles(int lobe) { return groups[static_cast<size_t>(lobe)]; }
    /** @brief Children hanging off lobe @p lobe (empty for leaves). */
    const std::vector<std::unique_ptr<SpinnerNode>>& children(int lobe) const { return kids[static_cast<size_t>(lobe)]; }

private:
    void initParticles(RandomSource& rng);

    int lvl;
    int maxLvl;
    Vec2 ctr;
    double arm;
    double lobeR;
    double angle{0.0};
    SpinnerParams cfg;
    std::array<ParticleGroup, Lobes> groups;
    std::array<std::vector<std::unique_ptr<SpinnerNode>>, Lobes> kids;
};
