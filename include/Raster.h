/**
 * @file Raster.h
 * @brief Character-cell rasterizers used by the terminal surface (pure; no curses dependency).
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "RenderSurface.h"
#include "Vec2.h"

#include <vector>

struct Cell {
    int x{0};
    int y{0};
    bool operator==(const Cell& o) const { return x == o.x && y == o.y; }
    bool operator<(const Cell& o) const { return y < o.y || (y == o.y && x < o.x); }
};

/**
 * @struct CellMapper
 * @brief Scales world coordinates (worldW x worldH) onto a cols x rows grid, independently per axis.
 */
struct CellMapper {
    double worldW{1.0};
    double worldH{1.0};
    int cols{1};
    int rows{1};

    double sx() const { return cols / worldW; }
    double sy() const { return rows / worldH; }
    /** @brief Continuous cell-space position of @p p. */
    Vec2 toCellSpace(const Vec2& p) const { return {p.x * sx(), p.y * sy()}; }
    /** @brief Nearest cell (may lie outside the grid). */
    Cell toCell(const Vec2& p) const;
    bool inBounds(const Cell& c) const { return c.x >= 0 && c.y >= 0 && c.x < cols && c.y < rows; }
};

/** @brief Bresenham line from @p a to @p b, both ends included. */
std::vector<Cell> rasterLine(const Cell& a, const Cell& b);

/** @brief Sorted, unique cells on the outline of an axis-aligned ellipse given in cell space. */
std::vector<Cell> rasterEllipse(const Vec2& center, double rx, double ry);

/**
 * @brief Sorted cells whose centers fall inside the ellipse; never empty (falls back to the nearest cell).
 */
std::vector<Cell> rasterDisc(const Vec2& center, double rx, double ry);

/**
 * @brief Index (0..7, curses order: black, red, green, yellow, blue, magenta, cyan, white) of the basic
 *        terminal color closest to @p c in RGB space.
 */
int nearestBasicColor(const Rgb& c);
