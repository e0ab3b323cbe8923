#pragma once
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core.hpp"
#include "../world.hpp"
#include <iostream>

using json = nlohmann::json;

struct AppConfig {
    unsigned int window_width = 1280;
    unsigned int window_height = 800;
    float hex_radius = 40.0f;
    std::string world_file = "persistent_map_data.json";
    DepartedUnitPolicy departed_units = DepartedUnitPolicy::RETAIN;
    bool show_coords = true;
    bool autosave_on_exit = true;
    int level = SURFACE_LEVEL;
    double min_zoom = 0.05;
    double max_zoom = 20.0;
    size_t max_cells = 20000;
    std::vector<std::string> font_paths = {
        "arial.ttf",
        "C:/Windows/Fonts/arial.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/System/Library/Fonts/Helvetica.ttc"
    };
};

class ConfigLoader {
public:
    static AppConfig load(const std::string& filename) {
        AppConfig cfg;

        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Config file not found: " << filename << ". Using defaults." << std::endl;
            return cfg;
        }

        json j;
        try {
            file >> j;
        } catch (const std::exception& e) {
            std::cerr << "Error parsing config: " << e.what() << ". Using defaults." << std::endl;
            return cfg;
        }
        return from_json(j, cfg);
    }

    // Поля, которые не удалось прочитать, остаются из defaults
    static AppConfig from_json(const json& j, const AppConfig& defaults = AppConfig()) {
        AppConfig cfg = defaults;
        if (!j.is_object()) {
            std::cerr << "Config root is not an object. Using defaults." << std::endl;
            return cfg;
        }

        read(j, "window_width", cfg.window_width);
        read(j, "window_height", cfg.window_height);
        read(j, "hex_radius", cfg.hex_radius);
        read(j, "world_file", cfg.world_file);
        read(j, "show_coords", cfg.show_coords);
        read(j, "autosave_on_exit", cfg.autosave_on_exit);
        read(j, "level", cfg.level);
        read(j, "min_zoom", cfg.min_zoom);
        read(j, "max_zoom", cfg.max_zoom);
        read(j, "max_cells", cfg.max_cells);
        read(j, "font_paths", cfg.font_paths);

        std::string policy;
        if (read(j, "departed_units", policy)) {
            if (auto p = departed_policy_from_string(policy)) {
                cfg.departed_units = *p;
            } else {
                std::cerr << "Unknown departed_units value '" << policy << "', keeping "
                          << departed_policy_to_string(cfg.departed_units) << std::endl;
            }
        }

        if (cfg.hex_radius <= 0.0f) {
            std::cerr << "hex_radius must be positive, using " << defaults.hex_radius << std::endl;
            cfg.hex_radius = defaults.hex_radius;
        }
        if (cfg.min_zoom <= 0.0 || cfg.max_zoom < cfg.min_zoom) {
            std::cerr << "Invalid zoom range, using defaults" << std::endl;
            cfg.min_zoom = defaults.min_zoom;
            cfg.max_zoom = defaults.max_zoom;
        }
        return cfg;
    }

private:
    template <typename T>
    static bool read(const json& j, const char* key, T& target) {
        if (!j.contains(key)) return false;
        try {
            target = j.at(key).get<T>();
            return true;
        } catch (const json::exception& e) {
            std::cerr << "Error parsing config field '" << key << "': " << e.what()
                      << ". Using default." << std::endl;
            return false;
        }
    }
};
