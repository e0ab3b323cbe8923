#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core.hpp"
#include "hex_layout.hpp"
#include "world.hpp"

// Всё, что нужно нарисовать для одного гекса. Неизвестные гексы тоже
// попадают в сцену - с цветом "неизвестно", а не пропускаются.
struct HexVisual {
    HexCoord coord;
    PointF center;                  // Центр в пикселях мира
    bool known = false;
    bool exit_only = false;         // Известен только по выходам соседа
    bool selected = false;
    Color fill = {40, 40, 45};
    Color label_color = {0, 0, 0};
    std::string label;              // Пусто, если подписи координат выключены
    bool own_units = false;
    bool foreign_units = false;
    Color foreign_color = {255, 255, 255};
    bool settlement = false;
    bool structures = false;
};

// Модель карты без привязки к SFML: камера, видимые гексы, попадание курсором, выделение.
// Мир доступен только для чтения.
class MapScene {
public:
    using SelectionListener = std::function<void(const std::optional<HexCoord>&)>;

    MapScene(const WorldModel& world, const HexLayout& layout);

    // Гексы, пересекающие viewport (прямоугольник экрана) при текущей камере
    std::vector<HexVisual> render(const RectF& viewport) const;
    HexVisual visual_for(const HexCoord& coord) const;

    // Гекс под точкой экрана; пусто, если точка вне области карты
    std::optional<HexCoord> hit_test(const PointF& screen_point) const;

    void select_hex(const HexCoord& coord);
    void clear_selection();
    const std::optional<HexCoord>& get_selection() const { return selection; }

    // Подписка на смену выделения; возвращает id для unsubscribe()
    int subscribe(SelectionListener listener);
    void unsubscribe(int id);

    Camera& get_camera() { return camera; }
    const Camera& get_camera() const { return camera; }
    const HexLayout& get_layout() const { return layout; }
    const WorldModel& get_world() const { return world; }

    int get_level() const { return level; }
    void set_level(int z);
    // Переключиться на соседний уровень среди известных; false, если дальше некуда
    bool step_level(int direction);

    bool get_show_coords() const { return show_coords; }
    void set_show_coords(bool show) { show_coords = show; }
    void toggle_show_coords() { show_coords = !show_coords; }

    void set_max_cells(size_t n) { max_cells = n; }

    // Описанный прямоугольник всех известных гексов текущего уровня
    std::optional<RectF> known_bounds() const;
    void fit_to_world();

private:
    const WorldModel& world;
    HexLayout layout;
    Camera camera;
    int level = SURFACE_LEVEL;
    bool show_coords = true;
    size_t max_cells = 20000;

    std::optional<HexCoord> selection;
    std::vector<std::pair<int, SelectionListener>> listeners;
    int next_listener_id = 1;

    void notify_selection();
};
