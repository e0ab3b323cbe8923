#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include "hex_layout.hpp"

namespace {
const double SQRT3 = std::sqrt(3.0);
}

TEST_CASE("Hex centres follow the flat-top layout", "[layout]") {
    HexLayout layout(40.0);

    PointF origin = layout.hex_to_pixel(HexCoord(0, 0));
    CHECK(origin.x == Approx(0.0));
    CHECK(origin.y == Approx(0.0));

    PointF east = layout.hex_to_pixel(HexCoord(2, 0));
    CHECK(east.x == Approx(120.0));
    CHECK(east.y == Approx(0.0));

    PointF south = layout.hex_to_pixel(HexCoord(0, 2));
    CHECK(south.x == Approx(0.0));
    CHECK(south.y == Approx(SQRT3 * 40.0));

    PointF se = layout.hex_to_pixel(HexCoord(1, 1));
    CHECK(se.x == Approx(60.0));
    CHECK(se.y == Approx(SQRT3 / 2.0 * 40.0));
}

TEST_CASE("Centres map back to their own hex", "[layout]") {
    HexLayout layout(40.0);
    for (int x = -6; x <= 6; ++x) {
        for (int y = -8; y <= 8; ++y) {
            HexCoord c(x, y);
            if (!c.is_cell()) continue;
            CHECK(layout.pixel_to_hex(layout.hex_to_pixel(c)) == c);
        }
    }
}

TEST_CASE("Points inside a hex hit that hex", "[layout]") {
    HexLayout layout(40.0);
    HexCoord c(3, -1);
    PointF centre = layout.hex_to_pixel(c);

    // Вписанная окружность радиуса sqrt(3)/2 R целиком внутри гекса
    double r = SQRT3 / 2.0 * 40.0 * 0.95;
    for (int i = 0; i < 12; ++i) {
        double a = i * 30.0 * 3.14159265358979 / 180.0;
        PointF p{centre.x + r * std::cos(a), centre.y + r * std::sin(a)};
        CHECK(layout.pixel_to_hex(p) == c);
    }
}

TEST_CASE("Ties go to the lowest coordinate", "[layout]") {
    HexLayout layout(40.0);
    // Середина между (0, 0) и (0, 2)
    PointF mid{0.0, SQRT3 / 2.0 * 40.0};
    CHECK(layout.pixel_to_hex(mid) == HexCoord(0, 0));

    // Середина между (0, 0) и (1, 1)
    PointF diag{30.0, SQRT3 / 4.0 * 40.0};
    CHECK(layout.pixel_to_hex(diag) == HexCoord(0, 0));
}

TEST_CASE("Hit test keeps the requested level", "[layout]") {
    HexLayout layout(40.0);
    CHECK(layout.pixel_to_hex({120.0, 0.0}, 2) == HexCoord(2, 0, 2));
}

TEST_CASE("Corners lie on the circumscribed circle", "[layout]") {
    HexLayout layout(25.0);
    HexCoord c(1, 1);
    PointF centre = layout.hex_to_pixel(c);
    auto pts = layout.corners(c);
    for (const auto& p : pts) {
        CHECK(std::hypot(p.x - centre.x, p.y - centre.y) == Approx(25.0));
    }
    // Плоская верхняя грань: первая вершина справа от центра
    CHECK(pts[0].x == Approx(centre.x + 25.0));
    CHECK(pts[0].y == Approx(centre.y));
}

TEST_CASE("Cells in a rectangle are valid and cover it", "[layout]") {
    HexLayout layout(40.0);
    RectF rect{-100.0, -100.0, 300.0, 200.0};
    auto cells = layout.cells_in_rect(rect, 1);
    REQUIRE_FALSE(cells.empty());
    for (const auto& c : cells) {
        CHECK(c.is_cell());
        CHECK(layout.bounds(c).intersects(rect));
    }
    CHECK(layout.count_cells_in_rect(rect) >= cells.size());

    // Гекс под центром прямоугольника обязан попасть в выборку
    HexCoord centre = layout.pixel_to_hex(rect.center());
    CHECK(std::find(cells.begin(), cells.end(), centre) != cells.end());
}

TEST_CASE("Zooming keeps the point under the cursor fixed", "[camera]") {
    Camera cam;
    cam.set_viewport({0.0, 0.0, 800.0, 600.0});
    cam.set_center({100.0, 50.0});

    PointF cursor{620.0, 130.0};
    PointF before = cam.screen_to_world(cursor);
    cam.zoom_at(0.5, cursor);
    PointF after = cam.screen_to_world(cursor);
    CHECK(cam.get_zoom() == Approx(0.5));
    CHECK(after.x == Approx(before.x));
    CHECK(after.y == Approx(before.y));

    cam.zoom_at(3.0, cursor);
    after = cam.screen_to_world(cursor);
    CHECK(after.x == Approx(before.x));
    CHECK(after.y == Approx(before.y));
}

TEST_CASE("Zoom is clamped to the configured range", "[camera]") {
    Camera cam;
    cam.set_zoom_limits(0.5, 4.0);
    cam.set_zoom(100.0);
    CHECK(cam.get_zoom() == Approx(4.0));
    cam.zoom_at(0.001, {10.0, 10.0});
    CHECK(cam.get_zoom() == Approx(0.5));
}

TEST_CASE("Screen and world transforms are inverse", "[camera]") {
    Camera cam;
    cam.set_viewport({0.0, 0.0, 1000.0, 700.0});
    cam.set_center({-40.0, 75.0});
    cam.set_zoom(2.5);

    PointF p{321.0, 456.0};
    PointF back = cam.world_to_screen(cam.screen_to_world(p));
    CHECK(back.x == Approx(p.x));
    CHECK(back.y == Approx(p.y));

    cam.pan(10.0, -20.0);
    CHECK(cam.get_center().x == Approx(-40.0 - 25.0));
    CHECK(cam.get_center().y == Approx(75.0 + 50.0));
}

TEST_CASE("Fit puts the whole rectangle on screen", "[camera]") {
    Camera cam;
    cam.set_viewport({0.0, 0.0, 800.0, 600.0});
    RectF world{1000.0, 2000.0, 3000.0, 1000.0};
    cam.fit(world, 50.0);

    RectF visible = cam.visible_world_rect();
    CHECK(visible.left <= world.left);
    CHECK(visible.top <= world.top);
    CHECK(visible.right() >= world.right());
    CHECK(visible.bottom() >= world.bottom());
}
