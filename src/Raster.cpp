/**
 * @file Raster.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Raster.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;

void sortUnique(std::vector<Cell>& cells) {
    std::sort(cells.begin(), cells.end());
    cells.erase(std::unique(cells.begin(), cells.end()), cells.end());
}
}

Cell CellMapper::toCell(const Vec2& p) const {
    Vec2 c = toCellSpace(p);
    return {static_cast<int>(std::floor(c.x)), static_cast<int>(std::floor(c.y))};
}

std::vector<Cell> rasterLine(const Cell& a, const Cell& b) {
    std::vector<Cell> out;
    int x0 = a.x, y0 = a.y;
    int dx = std::abs(b.x - a.x), sx = a.x < b.x ? 1 : -1;
    int dy = -std::abs(b.y - a.y), sy = a.y < b.y ? 1 : -1;
    int err = dx + dy;
    out.reserve(static_cast<size_t>(std::max(dx, -dy)) + 1);
    for (;;) {
        out.push_back({x0, y0});
        if (x0 == b.x && y0 == b.y) break;
        int e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }
    return out;
}

std::vector<Cell> rasterEllipse(const Vec2& center, double rx, double ry) {
    std::vector<Cell> out;
    rx = std::fabs(rx);
    ry = std::fabs(ry);
    // Two samples per cell of circumference is enough to leave no gaps after rounding.
    int steps = std::max(8, static_cast<int>(std::ceil(kTwoPi * std::max(rx, ry) * 2.0)));
    out.reserve(static_cast<size_t>(steps));
    for (int i = 0; i < steps; ++i) {
        double a = kTwoPi * i / steps;
        out.push_back({static_cast<int>(std::floor(center.x + std::cos(a) * rx)),
                       static_cast<int>(std::floor(center.y + std::sin(a) * ry))});
    }
    sortUnique(out);
    return out;
}

std::vector<Cell> rasterDisc(const Vec2& center, double rx, double ry) {
    std::vector<Cell> out;
    rx = std::fabs(rx);
    ry = std::fabs(ry);
    if (rx > 0.0 && ry > 0.0) {
        int x0 = static_cast<int>(std::floor(center.x - rx));
        int x1 = static_cast<int>(std::ceil(center.x + rx));
        int y0 = static_cast<int>(std::floor(center.y - ry));
        int y1 = static_cast<int>(std::ceil(center.y + ry));
        for (int y = y0; y <= y1; ++y) {
            for (int x = x0; x <= x1; ++x) {
                double nx = (x + 0.5 - center.x) / rx;
                double ny = (y + 0.5 - center.y) / ry;
                if (nx * nx + ny * ny <= 1.0) out.push_back({x, y});
            }
        }
    }
    if (out.empty()) {
        out.push_back({static_cast<int>(std::floor(center.x)), static_cast<int>(std::floor(center.y))});
    }
    return out;
}

int nearestBasicColor(const Rgb& c) {
    static const Rgb basic[8] = {
        {0, 0, 0}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
        {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255},
    };
    int best = 0;
    long bestD = -1;
    for (int i = 0; i < 8; ++i) {
        long dr = static_cast<long>(c.r) - basic[i].r;
        long dg = static_cast<long>(c.g) - basic[i].g;
        long db = static_cast<long>(c.b) - basic[i].b;
        long d = dr * dr + dg * dg + db * db;
        if (bestD < 0 || d < bestD) { bestD = d; best = i; }
    }
    return best;
}
