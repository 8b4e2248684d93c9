/**
 * @file CursesSurface.h
 * @brief RenderSurface drawing into an ncurses window, world coordinates scaled onto character cells.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Raster.h"
#include "RenderSurface.h"

#include <ncurses.h>
#include <string>

/**
 * @class CursesSurface
 * @brief Terminal render backend. The caller owns curses initialisation (initscr/endwin) and color pairs
 *        1..8 (black, red, green, yellow, blue, magenta, cyan, white); the last row is kept for a status line.
 */
class CursesSurface : public RenderSurface {
public:
    /** @brief Minimum usable terminal size (cells, including the status row). */
    static constexpr int MinCols = 10;
    static constexpr int MinRows = 5;

    /** @brief Bind to @p win; throws std::runtime_error if the window is null or smaller than MinCols x MinRows. */
    CursesSurface(WINDOW* win, double worldWidth, double worldHeight);

    void clear() override;
    void drawLine(const Vec2& a, const Vec2& b, const Rgb& color, int width) override;
    void drawCircleOutline(const Vec2& center, double radius, const Rgb& color) override;
    void drawFilledCircle(const Vec2& center, double radius, const Rgb& color) override;
    void drawText(const Vec2& at, const std::string& text, const Rgb& color) override;
    void present() override;

    /** @brief Replace the bottom row with @p text (padded/clipped to the window width). */
    void drawStatusLine(const std::string& text);
    /** @brief Re-read the window size after a terminal resize. */
    void resize();

    const CellMapper& mapper() const { return map; }

private:
    void plot(const Cell& c, chtype ch, const Rgb& color, bool bold);

    WINDOW* win;
    CellMapper map;
};
