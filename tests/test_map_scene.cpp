#include <catch2/catch.hpp>
#include <cmath>
#include <vector>
#include "map_scene.hpp"
#include "utils/ColorUtils.hpp"

namespace {

WorldModel small_world() {
    WorldModel world;
    world.merge(ReportParser::parse(R"({"number": 3, "turn": 1,
        "regions": [
            {"coordinates": {"x": 0, "y": 0}, "terrain": "plain",
             "settlement": {"name": "Basia", "size": "town"},
             "structures": [{"number": 1, "name": "Keep", "type": "Fort"}],
             "units": [{"number": 1, "name": "U1", "own_unit": true},
                       {"number": 2, "name": "Spy", "faction": {"number": 9, "name": "Others"}}]},
            {"coordinates": {"x": 0, "y": 0, "z": 2}, "terrain": "tunnels"}
        ]})"));
    return world;
}

const HexVisual* find_visual(const std::vector<HexVisual>& visuals, const HexCoord& c) {
    for (const auto& v : visuals) {
        if (v.coord == c) return &v;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Empty world renders unknown hexes", "[scene]") {
    WorldModel world;
    HexLayout layout(40.0);
    MapScene scene(world, layout);
    scene.get_camera().set_viewport({0.0, 0.0, 400.0, 300.0});

    auto visuals = scene.render({0.0, 0.0, 400.0, 300.0});
    REQUIRE_FALSE(visuals.empty());
    for (const auto& v : visuals) {
        CHECK_FALSE(v.known);
        CHECK(v.fill == ColorUtils::unknown_color());
        CHECK_FALSE(v.own_units);
    }
    CHECK(find_visual(visuals, HexCoord(0, 0)) != nullptr);
}

TEST_CASE("Known hexes carry terrain colour and markers", "[scene]") {
    WorldModel world = small_world();
    HexLayout layout(40.0);
    MapScene scene(world, layout);
    scene.get_camera().set_viewport({0.0, 0.0, 400.0, 300.0});

    auto visuals = scene.render({0.0, 0.0, 400.0, 300.0});
    const HexVisual* home = find_visual(visuals, HexCoord(0, 0));
    REQUIRE(home != nullptr);
    CHECK(home->known);
    CHECK(home->fill == ColorUtils::terrain_color("plain"));
    CHECK(home->own_units);
    CHECK(home->foreign_units);
    CHECK(home->foreign_color == ColorUtils::faction_color(9));
    CHECK(home->settlement);
    CHECK(home->structures);
    CHECK(home->label == "(0,0)");

    // Уровень 2 на поверхности не виден
    for (const auto& v : visuals) CHECK(v.coord.z == SURFACE_LEVEL);

    scene.set_show_coords(false);
    CHECK(scene.visual_for(HexCoord(0, 0)).label.empty());
}

TEST_CASE("Unknown terrain gets the placeholder colour", "[scene]") {
    CHECK(ColorUtils::terrain_color("Plain") == ColorUtils::terrain_color("plain"));
    CHECK(ColorUtils::terrain_color("glass desert") == ColorUtils::placeholder_color());
    CHECK(ColorUtils::label_color("ocean") != ColorUtils::label_color("plain"));
}

TEST_CASE("Zoomed-out view renders known hexes only", "[scene]") {
    WorldModel world = small_world();
    HexLayout layout(40.0);
    MapScene scene(world, layout);
    scene.get_camera().set_viewport({0.0, 0.0, 400.0, 300.0});
    scene.set_max_cells(1);

    auto visuals = scene.render({0.0, 0.0, 400.0, 300.0});
    REQUIRE(visuals.size() == 1);
    CHECK(visuals[0].coord == HexCoord(0, 0));
}

TEST_CASE("Hit test maps screen points to hexes", "[scene]") {
    WorldModel world;
    HexLayout layout(40.0);
    MapScene scene(world, layout);
    scene.get_camera().set_viewport({0.0, 0.0, 400.0, 300.0});
    scene.get_camera().set_center({0.0, 0.0});

    // Центр viewport смотрит в центр (0, 0)
    CHECK(scene.hit_test({200.0, 150.0}) == HexCoord(0, 0));
    CHECK(scene.hit_test({320.0, 150.0}) == HexCoord(2, 0));
    CHECK_FALSE(scene.hit_test({500.0, 150.0}).has_value());
    CHECK_FALSE(scene.hit_test({-1.0, 10.0}).has_value());
}

TEST_CASE("Every viewport point hits a hex within one radius", "[scene]") {
    WorldModel world;
    HexLayout layout(30.0);
    MapScene scene(world, layout);
    Camera& cam = scene.get_camera();
    cam.set_viewport({50.0, 20.0, 640.0, 480.0});

    struct View { PointF center; double zoom; };
    const View views[] = {{{0.0, 0.0}, 1.0}, {{-317.5, 902.25}, 0.37}, {{1234.0, -56.0}, 3.3}};

    for (const auto& v : views) {
        cam.set_center(v.center);
        cam.set_zoom(v.zoom);

        int misses = 0;
        int too_far = 0;
        for (double sx = 50.0; sx < 690.0; sx += 3.7) {
            for (double sy = 20.0; sy < 500.0; sy += 3.1) {
                auto hit = scene.hit_test({sx, sy});
                if (!hit) { ++misses; continue; }
                PointF w = cam.screen_to_world({sx, sy});
                PointF c = layout.hex_to_pixel(*hit);
                if (std::hypot(w.x - c.x, w.y - c.y) > layout.get_radius() + 1e-9) ++too_far;
            }
        }
        CHECK(misses == 0);
        CHECK(too_far == 0);
    }
}

TEST_CASE("Selection changes notify subscribers", "[scene]") {
    WorldModel world;
    HexLayout layout(40.0);
    MapScene scene(world, layout);

    std::vector<std::optional<HexCoord>> seen;
    int id = scene.subscribe([&](const std::optional<HexCoord>& c) { seen.push_back(c); });

    scene.select_hex(HexCoord(2, 0));
    scene.select_hex(HexCoord(2, 0));
    scene.select_hex(HexCoord(1, 1));
    scene.clear_selection();
    scene.clear_selection();

    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == HexCoord(2, 0));
    CHECK(seen[1] == HexCoord(1, 1));
    CHECK_FALSE(seen[2].has_value());

    scene.unsubscribe(id);
    scene.select_hex(HexCoord(0, 0));
    CHECK(seen.size() == 3);
}

TEST_CASE("Listener may unsubscribe while being notified", "[scene]") {
    WorldModel world;
    HexLayout layout(40.0);
    MapScene scene(world, layout);

    int calls = 0;
    int id = 0;
    id = scene.subscribe([&](const std::optional<HexCoord>&) {
        ++calls;
        scene.unsubscribe(id);
    });
    scene.select_hex(HexCoord(0, 0));
    scene.select_hex(HexCoord(2, 0));
    CHECK(calls == 1);
}

TEST_CASE("Switching level follows known levels", "[scene]") {
    WorldModel world = small_world();
    HexLayout layout(40.0);
    MapScene scene(world, layout);

    scene.select_hex(HexCoord(0, 0));
    CHECK(scene.step_level(1));
    CHECK(scene.get_level() == 2);
    // Выделение на другом уровне снимается
    CHECK_FALSE(scene.get_selection().has_value());
    CHECK_FALSE(scene.step_level(1));
    CHECK(scene.step_level(-1));
    CHECK(scene.get_level() == 1);
    CHECK_FALSE(scene.step_level(-1));
}

TEST_CASE("Known bounds cover every known hex on the level", "[scene]") {
    WorldModel world = small_world();
    HexLayout layout(40.0);
    MapScene scene(world, layout);

    auto bounds = scene.known_bounds();
    REQUIRE(bounds.has_value());
    CHECK(bounds->width == Approx(80.0));

    WorldModel empty;
    MapScene blank(empty, layout);
    CHECK_FALSE(blank.known_bounds().has_value());
}
