/**
 * @file RenderSurface.h
 * @brief Abstract drawing backend the simulation renders into, plus the shared palette.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vec2.h"

#include <array>
#include <cstdint>
#include <string>

struct Rgb {
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};
    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

namespace Palette {
/** @brief One color per lobe index, shared by every node of every tree. */
constexpr std::array<Rgb, 3> Lobes{{{255, 107, 107}, {255, 217, 61}, {107, 227, 107}}};
constexpr Rgb Arm{200, 200, 200};
constexpr Rgb Background{11, 16, 32};
constexpr Rgb Text{230, 238, 248};
}

/**
 * @class RenderSurface
 * @brief World-space drawing primitives; the backend owns the display and its present cycle.
 */
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    /** @brief Start a frame (erase to background). */
    virtual void clear() = 0;
    virtual void drawLine(const Vec2& a, const Vec2& b, const Rgb& color, int width) = 0;
    virtual void drawCircleOutline(const Vec2& center, double radius, const Rgb& color) = 0;
    virtual void drawFilledCircle(const Vec2& center, double radius, const Rgb& color) = 0;
    /** @brief Draw @p text with its first character at world position @p at. */
    virtual void drawText(const Vec2& at, const std::string& text, const Rgb& color) = 0;
    /** @brief Finish the frame and make it visible. */
    virtual void present() = 0;
};
