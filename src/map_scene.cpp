#include "map_scene.hpp"
#include "utils/ColorUtils.hpp"
#include <algorithm>

MapScene::MapScene(const WorldModel& world, const HexLayout& layout)
    : world(world), layout(layout) {}

HexVisual MapScene::visual_for(const HexCoord& coord) const {
    HexVisual v;
    v.coord = coord;
    v.center = layout.hex_to_pixel(coord);
    v.selected = selection && *selection == coord;
    v.fill = ColorUtils::unknown_color();
    v.label_color = {150, 150, 150};

    const Region* region = world.get_region(coord);
    if (region) {
        v.known = true;
        v.exit_only = region->detail == RegionDetail::EXIT;
        v.fill = ColorUtils::terrain_color(region->terrain);
        v.label_color = ColorUtils::label_color(region->terrain);
        v.settlement = region->settlement.has_value();
        v.structures = !region->structures.empty();
        v.own_units = region->has_own_units();
        v.foreign_units = region->has_foreign_units();

        for (const auto& u : region->units) {
            if (!u.own_unit && u.faction) {
                v.foreign_color = ColorUtils::faction_color(u.faction->number);
                break;
            }
        }
    }

    if (show_coords) {
        v.label = "(" + std::to_string(coord.x) + "," + std::to_string(coord.y) + ")";
    }
    return v;
}

std::vector<HexVisual> MapScene::render(const RectF& viewport) const {
    PointF tl = camera.screen_to_world({viewport.left, viewport.top});
    PointF br = camera.screen_to_world({viewport.right(), viewport.bottom()});
    RectF area{tl.x, tl.y, br.x - tl.x, br.y - tl.y};

    std::vector<HexVisual> visuals;
    if (area.width <= 0.0 || area.height <= 0.0) return visuals;

    if (layout.count_cells_in_rect(area) <= max_cells) {
        for (const auto& c : layout.cells_in_rect(area, level)) {
            visuals.push_back(visual_for(c));
        }
        return visuals;
    }

    // Слишком мелкий масштаб: фон из неизвестных клеток не строим, только известные гексы
    for (const auto& [coord, region] : world.get_regions()) {
        if (coord.z != level) continue;
        if (layout.bounds(coord).intersects(area)) visuals.push_back(visual_for(coord));
    }
    return visuals;
}

std::optional<HexCoord> MapScene::hit_test(const PointF& screen_point) const {
    if (!camera.get_viewport().contains(screen_point)) return std::nullopt;
    PointF world_pos = camera.screen_to_world(screen_point);
    return layout.pixel_to_hex(world_pos, level);
}

void MapScene::select_hex(const HexCoord& coord) {
    if (selection && *selection == coord) return;
    selection = coord;
    notify_selection();
}

void MapScene::clear_selection() {
    if (!selection) return;
    selection.reset();
    notify_selection();
}

int MapScene::subscribe(SelectionListener listener) {
    int id = next_listener_id++;
    listeners.emplace_back(id, std::move(listener));
    return id;
}

void MapScene::unsubscribe(int id) {
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                   [id](const auto& l) { return l.first == id; }),
                    listeners.end());
}

void MapScene::notify_selection() {
    // Копия на случай, если обработчик отпишется во время вызова
    auto current = listeners;
    for (auto& [id, listener] : current) {
        if (listener) listener(selection);
    }
}

void MapScene::set_level(int z) {
    if (z == level) return;
    level = z;
    if (selection && selection->z != level) clear_selection();
}

bool MapScene::step_level(int direction) {
    std::vector<int> levels = world.get_levels();
    if (std::find(levels.begin(), levels.end(), level) == levels.end()) {
        levels.push_back(level);
        std::sort(levels.begin(), levels.end());
    }
    auto it = std::find(levels.begin(), levels.end(), level);
    long idx = static_cast<long>(it - levels.begin()) + (direction > 0 ? 1 : -1);
    if (idx < 0 || idx >= static_cast<long>(levels.size())) return false;
    set_level(levels[static_cast<size_t>(idx)]);
    return true;
}

std::optional<RectF> MapScene::known_bounds() const {
    std::optional<RectF> result;
    for (const auto& [coord, region] : world.get_regions()) {
        if (coord.z != level) continue;
        RectF b = layout.bounds(coord);
        if (!result) {
            result = b;
            continue;
        }
        double left = std::min(result->left, b.left);
        double top = std::min(result->top, b.top);
        double right = std::max(result->right(), b.right());
        double bottom = std::max(result->bottom(), b.bottom());
        result = RectF{left, top, right - left, bottom - top};
    }
    return result;
}

void MapScene::fit_to_world() {
    if (auto b = known_bounds()) {
        camera.fit(*b);
    } else {
        camera.set_center(layout.hex_to_pixel(HexCoord(0, 0, level)));
    }
}
