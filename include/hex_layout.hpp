#pragma once
#include <array>
#include <cstddef>
#include <vector>
#include "core.hpp"

struct PointF {
    double x = 0.0;
    double y = 0.0;
};

struct RectF {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return left + width; }
    double bottom() const { return top + height; }
    PointF center() const { return {left + width / 2.0, top + height / 2.0}; }
    bool contains(const PointF& p) const {
        return p.x >= left && p.x < right() && p.y >= top && p.y < bottom();
    }
    bool intersects(const RectF& o) const {
        return left < o.right() && o.left < right() && top < o.bottom() && o.top < bottom();
    }
};

// Геометрия гексов с плоской верхней гранью ("flat-top").
// Центр гекса (x, y) в пикселях мира: (1.5 R x, sqrt(3)/2 R y).
class HexLayout {
public:
    explicit HexLayout(double radius = 40.0);

    double get_radius() const { return radius; }

    PointF hex_to_pixel(const HexCoord& coord) const;

    // Ближайший центр клетки по евклидову расстоянию.
    // При равенстве расстояний выбирается наименьшая координата (x, затем y).
    HexCoord pixel_to_hex(const PointF& p, int level = SURFACE_LEVEL) const;

    std::array<PointF, 6> corners(const HexCoord& coord) const;
    RectF bounds(const HexCoord& coord) const;

    // Все клетки уровня, чей описанный прямоугольник пересекает rect (в пикселях мира)
    std::vector<HexCoord> cells_in_rect(const RectF& rect, int level) const;
    // Оценка количества клеток в rect без их построения
    size_t count_cells_in_rect(const RectF& rect) const;

private:
    double radius;

    struct Range { int x0, x1, y0, y1; };
    Range cell_range(const RectF& rect) const;
};

// Камера карты: центр в координатах мира и масштаб (единиц мира на пиксель экрана).
// viewport - прямоугольник окна, в котором рисуется карта.
class Camera {
public:
    Camera();

    void set_viewport(const RectF& area);
    const RectF& get_viewport() const { return viewport; }

    void set_center(const PointF& c) { center = c; }
    const PointF& get_center() const { return center; }

    double get_zoom() const { return zoom; }
    void set_zoom(double z);
    void set_zoom_limits(double min_zoom, double max_zoom);

    // Сдвиг на dx, dy пикселей экрана (перетаскивание мышью)
    void pan(double dx, double dy);
    // Масштабирование с сохранением точки мира под курсором
    void zoom_at(double factor, const PointF& screen_point);
    // Подогнать камеру так, чтобы world_rect целиком поместился в viewport
    void fit(const RectF& world_rect, double padding = 50.0);

    PointF screen_to_world(const PointF& p) const;
    PointF world_to_screen(const PointF& p) const;
    RectF visible_world_rect() const;

private:
    RectF viewport;
    PointF center;
    double zoom = 1.0;
    double min_zoom = 0.05;
    double max_zoom = 20.0;
};
