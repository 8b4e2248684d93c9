/**
 * @file CursesSurface.cpp
 * @brief ncurses rendering of spinner arms, lobes, particles and overlay text.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "CursesSurface.h"

#include <stdexcept>

CursesSurface::CursesSurface(WINDOW* w, double worldWidth, double worldHeight) : win(w) {
    if (!win) throw std::runtime_error("CursesSurface: no curses window");
    map.worldW = worldWidth > 0.0 ? worldWidth : 1.0;
    map.worldH = worldHeight > 0.0 ? worldHeight : 1.0;
    resize();
}

void CursesSurface::resize() {
    int rows, cols;
    getmaxyx(win, rows, cols);
    if (cols < MinCols || rows < MinRows) {
        throw std::runtime_error("terminal too small: " + std::to_string(cols) + "x" + std::to_string(rows) +
                                 " (need " + std::to_string(MinCols) + "x" + std::to_string(MinRows) + ")");
    }
    map.cols = cols;
    map.rows = rows - 1;
}

void CursesSurface::plot(const Cell& c, chtype ch, const Rgb& color, bool bold) {
    if (!map.inBounds(c)) return;
    int pair = 1 + nearestBasicColor(color);
    if (has_colors()) wattron(win, COLOR_PAIR(pair));
    if (bold) wattron(win, A_BOLD);
    mvwaddch(win, c.y, c.x, ch);
    if (bold) wattroff(win, A_BOLD);
    if (has_colors()) wattroff(win, COLOR_PAIR(pair));
}

void CursesSurface::clear() {
    werase(win);
}

void CursesSurface::drawLine(const Vec2& a, const Vec2& b, const Rgb& color, int width) {
    chtype ch = width >= 2 ? ':' : '.';
    for (const auto& c : rasterLine(map.toCell(a), map.toCell(b))) plot(c, ch, color, false);
}

void CursesSurface::drawCircleOutline(const Vec2& center, double radius, const Rgb& color) {
    for (const auto& c : rasterEllipse(map.toCellSpace(center), radius * map.sx(), radius * map.sy())) {
        plot(c, 'o', color, false);
    }
}

void CursesSurface::drawFilledCircle(const Vec2& center, double radius, const Rgb& color) {
    for (const auto& c : rasterDisc(map.toCellSpace(center), radius * map.sx(), radius * map.sy())) {
        plot(c, '@', color, true);
    }
}

void CursesSurface::drawText(const Vec2& at, const std::string& text, const Rgb& color) {
    Cell c = map.toCell(at);
    if (!map.inBounds(c)) return;
    int room = map.cols - c.x;
    int pair = 1 + nearestBasicColor(color);
    if (has_colors()) wattron(win, COLOR_PAIR(pair));
    wattron(win, A_BOLD);
    mvwaddnstr(win, c.y, c.x, text.c_str(), room);
    wattroff(win, A_BOLD);
    if (has_colors()) wattroff(win, COLOR_PAIR(pair));
}

void CursesSurface::drawStatusLine(const std::string& text) {
    int y = map.rows;
    wmove(win, y, 0);
    wclrtoeol(win);
    mvwaddnstr(win, y, 0, text.c_str(), map.cols);
}

void CursesSurface::present() {
    wnoutrefresh(win);
    doupdate();
}
