#pragma once
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <string>
#include "../core.hpp" // For struct Color

class ColorUtils {
public:
    // Цвет гекса, который ещё ни разу не попадал в отчёт
    static Color unknown_color() { return {40, 40, 45}; }
    // Заглушка для местности, которой нет в палитре
    static Color placeholder_color() { return {255, 255, 255}; }

    // Fill color for a terrain name; unknown names fall back to the placeholder
    static Color terrain_color(const std::string& terrain) {
        static const std::map<std::string, Color> palette = {
            {"plain", {34, 139, 34}},        // forestgreen
            {"plains", {34, 139, 34}},
            {"forest", {0, 100, 0}},         // darkgreen
            {"mountain", {128, 128, 128}},   // gray
            {"hill", {160, 140, 90}},
            {"swamp", {85, 107, 47}},        // darkolivegreen
            {"jungle", {107, 142, 35}},      // olivedrab
            {"desert", {244, 164, 96}},      // sandybrown
            {"tundra", {173, 216, 230}},     // lightblue
            {"nexus", {128, 0, 128}},        // purple
            {"ocean", {0, 0, 255}},          // blue
            {"lake", {65, 105, 225}},
            {"cavern", {90, 80, 70}},
            {"underforest", {47, 79, 47}},
            {"tunnels", {70, 60, 60}},
            {"chasm", {25, 25, 30}},
            {"deepforest", {20, 60, 20}},
            {"grotto", {110, 100, 120}}
        };
        auto it = palette.find(to_lower(terrain));
        if (it == palette.end()) return placeholder_color();
        return it->second;
    }

    // Coordinate label color: light grey on ocean, black elsewhere
    static Color label_color(const std::string& terrain) {
        if (to_lower(terrain) == "ocean") return {176, 176, 176};
        return {0, 0, 0};
    }

    // Стабильный различимый цвет для маркеров чужой фракции
    static Color faction_color(int faction_number) {
        const float golden = 0.61803398875f;
        float h = std::fmod(static_cast<float>(faction_number) * golden, 1.0f);
        if (h < 0.0f) h += 1.0f;
        return hsv_to_rgb(h, 0.65f, 0.95f);
    }

    // Convert HSV (Hue [0..1], Saturation [0..1], Value [0..1]) to RGB Color
    static Color hsv_to_rgb(float h, float s, float v) {
        int i = int(h * 6);
        float f = h * 6 - i;
        float p = v * (1 - s);
        float q = v * (1 - f * s);
        float t = v * (1 - (1 - f) * s);

        float rf, gf, bf;
        switch (i % 6) {
            case 0: rf = v; gf = t; bf = p; break;
            case 1: rf = q; gf = v; bf = p; break;
            case 2: rf = p; gf = v; bf = t; break;
            case 3: rf = p; gf = q; bf = v; break;
            case 4: rf = t; gf = p; bf = v; break;
            case 5: rf = v; gf = p; bf = q; break;
            default: rf = 0; gf = 0; bf = 0; break;
        }

        return {
            static_cast<int>(rf * 255),
            static_cast<int>(gf * 255),
            static_cast<int>(bf * 255)
        };
    }

private:
    static std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
};
