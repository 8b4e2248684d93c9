/**
 * @file Vec2.h
 * @brief Plain 2D vector used for world-space positions and velocities.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cmath>

struct Vec2 {
    double x{0.0};
    double y{0.0};

    Vec2() = default;
    Vec2(double x_, double y_) : x(x_), y(y_) {}

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(double s) const { return {x * s, y * s}; }
    Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }

    double dot(const Vec2& o) const { return x * o.x + y * o.y; }
    double length() const { return std::hypot(x, y); }

    /** @brief Unit vector at @p angle radians. */
    static Vec2 polar(double angle) { return {std::cos(angle), std::sin(angle)}; }
};
