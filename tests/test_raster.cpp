/**
 * @file test_raster.cpp
 * @brief Character-cell rasterizers and world-to-cell mapping used by the terminal surface.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

#include "Raster.h"

TEST_CASE("rasterLine walks horizontal and diagonal lines end to end", "[raster]") {
    std::vector<Cell> h = rasterLine({0, 0}, {3, 0});
    REQUIRE(h.size() == 4u);
    for (int i = 0; i < 4; ++i) CHECK(h[static_cast<size_t>(i)] == (Cell{i, 0}));

    std::vector<Cell> d = rasterLine({2, 2}, {-1, -1});
    REQUIRE(d.size() == 4u);
    CHECK(d.front() == (Cell{2, 2}));
    CHECK(d.back() == (Cell{-1, -1}));
}

TEST_CASE("rasterLine puts one cell per row on steep lines", "[raster]") {
    std::vector<Cell> l = rasterLine({0, 0}, {2, 9});
    REQUIRE(l.size() == 10u);
    for (size_t i = 0; i < l.size(); ++i) CHECK(l[i].y == static_cast<int>(i));
}

TEST_CASE("rasterLine of a single point is one cell", "[raster]") {
    std::vector<Cell> l = rasterLine({5, 7}, {5, 7});
    REQUIRE(l.size() == 1u);
    CHECK(l[0] == (Cell{5, 7}));
}

TEST_CASE("rasterEllipse hugs its radius", "[raster]") {
    const Vec2 c{20.0, 10.0};
    std::vector<Cell> cells = rasterEllipse(c, 8.0, 4.0);
    REQUIRE_FALSE(cells.empty());
    CHECK(std::is_sorted(cells.begin(), cells.end()));
    CHECK(std::adjacent_find(cells.begin(), cells.end()) == cells.end());
    for (const auto& cell : cells) {
        double nx = (cell.x + 0.5 - c.x) / 8.0;
        double ny = (cell.y + 0.5 - c.y) / 4.0;
        double r = std::sqrt(nx * nx + ny * ny);
        CHECK(r > 0.7);
        CHECK(r < 1.3);
    }
}

TEST_CASE("rasterDisc covers at least one cell", "[raster]") {
    std::vector<Cell> d = rasterDisc({4.3, 2.8}, 0.2, 0.1);
    REQUIRE(d.size() == 1u);
    CHECK(d[0] == (Cell{4, 2}));
}

TEST_CASE("rasterDisc contains its center and excludes far cells", "[raster]") {
    std::vector<Cell> d = rasterDisc({5.5, 5.5}, 2.0, 2.0);
    auto has = [&](int x, int y) { return std::find(d.begin(), d.end(), Cell{x, y}) != d.end(); };
    CHECK(has(5, 5));
    CHECK(has(7, 5));
    CHECK_FALSE(has(8, 5));
    CHECK_FALSE(has(7, 7));
    CHECK(std::is_sorted(d.begin(), d.end()));
}

TEST_CASE("CellMapper scales the world onto the grid per axis", "[raster]") {
    CellMapper m;
    m.worldW = 1200.0;
    m.worldH = 800.0;
    m.cols = 120;
    m.rows = 40;
    CHECK(m.sx() == Approx(0.1));
    CHECK(m.sy() == Approx(0.05));
    CHECK(m.toCell({600.0, 400.0}) == (Cell{60, 20}));
    CHECK(m.toCell({-1.0, 0.0}) == (Cell{-1, 0}));
    CHECK_FALSE(m.inBounds(m.toCell({-1.0, 0.0})));
    CHECK_FALSE(m.inBounds(m.toCell({1200.0, 10.0})));
    CHECK(m.inBounds(m.toCell({1199.0, 799.0})));
}

TEST_CASE("nearestBasicColor maps the palette onto terminal colors", "[raster]") {
    CHECK(nearestBasicColor(Palette::Lobes[0]) == 1); // red
    CHECK(nearestBasicColor(Palette::Lobes[1]) == 3); // yellow
    CHECK(nearestBasicColor(Palette::Lobes[2]) == 2); // green
    CHECK(nearestBasicColor(Palette::Arm) == 7);      // white
    CHECK(nearestBasicColor(Palette::Text) == 7);
    CHECK(nearestBasicColor(Palette::Background) == 0);
}
