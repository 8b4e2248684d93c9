/**
 * @file DemonSort.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "DemonSort.h"

#include <cmath>

int demonSortLobe(ParticleGroup& group, const Vec2& lobeCenter, double threshold) {
    int hot = 0;
    for (auto& p : group) {
        double dx = std::fabs(p.position().x - lobeCenter.x);
        if (isHot(p, threshold)) {
            p.setX(lobeCenter.x + dx);
            ++hot;
        } else {
            p.setX(lobeCenter.x - dx);
        }
    }
    return hot;
}
