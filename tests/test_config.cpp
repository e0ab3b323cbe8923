#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include "utils/ConfigLoader.hpp"
#include "utils/Timer.hpp"

TEST_CASE("Missing config file gives defaults", "[config]") {
    AppConfig cfg = ConfigLoader::load("/nonexistent/hexatlas.json");
    AppConfig defaults;
    CHECK(cfg.world_file == "persistent_map_data.json");
    CHECK(cfg.hex_radius == Approx(defaults.hex_radius));
    CHECK(cfg.departed_units == DepartedUnitPolicy::RETAIN);
    CHECK(cfg.autosave_on_exit);
    CHECK(cfg.level == SURFACE_LEVEL);
}

TEST_CASE("Config values override defaults", "[config]") {
    json j = json::parse(R"({
        "window_width": 1600, "window_height": 900, "hex_radius": 30.0,
        "world_file": "my_world.json", "departed_units": "remove",
        "show_coords": false, "autosave_on_exit": false, "level": 2,
        "min_zoom": 0.1, "max_zoom": 8.0, "max_cells": 5000,
        "font_paths": ["fonts/mono.ttf"]
    })");
    AppConfig cfg = ConfigLoader::from_json(j);

    CHECK(cfg.window_width == 1600);
    CHECK(cfg.window_height == 900);
    CHECK(cfg.hex_radius == Approx(30.0));
    CHECK(cfg.world_file == "my_world.json");
    CHECK(cfg.departed_units == DepartedUnitPolicy::REMOVE);
    CHECK_FALSE(cfg.show_coords);
    CHECK_FALSE(cfg.autosave_on_exit);
    CHECK(cfg.level == 2);
    CHECK(cfg.min_zoom == Approx(0.1));
    CHECK(cfg.max_zoom == Approx(8.0));
    CHECK(cfg.max_cells == 5000);
    CHECK(cfg.font_paths == std::vector<std::string>{"fonts/mono.ttf"});
}

TEST_CASE("Bad config values fall back per field", "[config]") {
    json j = json::parse(R"({
        "window_width": "wide", "hex_radius": -5, "departed_units": "forget",
        "min_zoom": 3.0, "max_zoom": 1.0, "world_file": "kept.json"
    })");
    AppConfig defaults;
    AppConfig cfg = ConfigLoader::from_json(j, defaults);

    CHECK(cfg.window_width == defaults.window_width);
    CHECK(cfg.hex_radius == Approx(defaults.hex_radius));
    CHECK(cfg.departed_units == DepartedUnitPolicy::RETAIN);
    CHECK(cfg.min_zoom == Approx(defaults.min_zoom));
    CHECK(cfg.max_zoom == Approx(defaults.max_zoom));
    CHECK(cfg.world_file == "kept.json");
}

TEST_CASE("Malformed config file gives defaults", "[config]") {
    auto path = (std::filesystem::temp_directory_path() / "hexatlas_test_config.json").string();
    {
        std::ofstream out(path);
        out << "{ \"hex_radius\": ";
    }
    AppConfig cfg = ConfigLoader::load(path);
    CHECK(cfg.hex_radius == Approx(AppConfig().hex_radius));
    std::filesystem::remove(path);
}

TEST_CASE("Timer formats short and long durations", "[timer]") {
    Timer timer;
    CHECK(timer.get_elapsed_sec() >= 0.0);
    CHECK(timer.get_elapsed_ms() >= 0.0);
    std::string text = timer.format_elapsed();
    CHECK(text.find("ms") != std::string::npos);
}
