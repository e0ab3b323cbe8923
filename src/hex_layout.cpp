#include "hex_layout.hpp"
#include <algorithm>
#include <cmath>

namespace {

const double SQRT3 = std::sqrt(3.0);
const double PI = 3.14159265358979323846;

} // namespace

HexLayout::HexLayout(double radius) : radius(radius > 0.0 ? radius : 40.0) {}

PointF HexLayout::hex_to_pixel(const HexCoord& coord) const {
    return {1.5 * radius * coord.x, SQRT3 / 2.0 * radius * coord.y};
}

HexCoord HexLayout::pixel_to_hex(const PointF& p, int level) const {
    // Дробные осевые координаты (q, r) и кубическое округление
    double q = (2.0 / 3.0 * p.x) / radius;
    double r = (-1.0 / 3.0 * p.x + SQRT3 / 3.0 * p.y) / radius;
    double s = -q - r;

    double rq = std::round(q);
    double rr = std::round(r);
    double rs = std::round(s);
    double dq = std::abs(rq - q);
    double dr = std::abs(rr - r);
    double ds = std::abs(rs - s);
    if (dq > dr && dq > ds) {
        rq = -rr - rs;
    } else if (dr > ds) {
        rr = -rq - rs;
    }

    // Осевые -> координаты отчёта: x = q, y = 2r + q
    int cx = static_cast<int>(rq);
    int cy = 2 * static_cast<int>(rr) + cx;

    // Округление даёт верный гекс, кроме точек на границе. Проверяем его и
    // шесть соседей, чтобы равенство расстояний разрешалось одинаково.
    const int offsets[7][2] = {{0, 0}, {0, -2}, {0, 2}, {-1, -1}, {-1, 1}, {1, -1}, {1, 1}};
    const double eps = 1e-9 * radius * radius;

    HexCoord best(cx, cy, level);
    double best_d2 = -1.0;
    for (const auto& o : offsets) {
        HexCoord cand(cx + o[0], cy + o[1], level);
        PointF c = hex_to_pixel(cand);
        double dx = c.x - p.x;
        double dy = c.y - p.y;
        double d2 = dx * dx + dy * dy;
        if (best_d2 < 0.0 || d2 < best_d2 - eps ||
            (std::abs(d2 - best_d2) <= eps && cand < best)) {
            best = cand;
            best_d2 = d2;
        }
    }
    return best;
}

std::array<PointF, 6> HexLayout::corners(const HexCoord& coord) const {
    PointF c = hex_to_pixel(coord);
    std::array<PointF, 6> pts;
    for (int i = 0; i < 6; ++i) {
        double angle_rad = PI / 180.0 * (60.0 * i);
        pts[i] = {c.x + radius * std::cos(angle_rad), c.y + radius * std::sin(angle_rad)};
    }
    return pts;
}

RectF HexLayout::bounds(const HexCoord& coord) const {
    PointF c = hex_to_pixel(coord);
    double h = SQRT3 / 2.0 * radius;
    return {c.x - radius, c.y - h, 2.0 * radius, 2.0 * h};
}

HexLayout::Range HexLayout::cell_range(const RectF& rect) const {
    double w = 1.5 * radius;
    double h = SQRT3 / 2.0 * radius;
    Range range;
    range.x0 = static_cast<int>(std::floor((rect.left - radius) / w));
    range.x1 = static_cast<int>(std::ceil((rect.right() + radius) / w));
    range.y0 = static_cast<int>(std::floor((rect.top - h) / h));
    range.y1 = static_cast<int>(std::ceil((rect.bottom() + h) / h));
    return range;
}

size_t HexLayout::count_cells_in_rect(const RectF& rect) const {
    if (rect.width <= 0.0 || rect.height <= 0.0) return 0;
    Range range = cell_range(rect);
    double cols = static_cast<double>(range.x1) - range.x0 + 1.0;
    double rows = static_cast<double>(range.y1) - range.y0 + 1.0;
    return static_cast<size_t>(cols * rows / 2.0 + 1.0);
}

std::vector<HexCoord> HexLayout::cells_in_rect(const RectF& rect, int level) const {
    std::vector<HexCoord> cells;
    if (rect.width <= 0.0 || rect.height <= 0.0) return cells;

    Range range = cell_range(rect);
    for (int x = range.x0; x <= range.x1; ++x) {
        for (int y = range.y0; y <= range.y1; ++y) {
            HexCoord c(x, y, level);
            if (!c.is_cell()) continue;
            if (bounds(c).intersects(rect)) cells.push_back(c);
        }
    }
    return cells;
}

Camera::Camera() : viewport{0.0, 0.0, 800.0, 600.0} {}

void Camera::set_viewport(const RectF& area) {
    viewport = area;
}

void Camera::set_zoom(double z) {
    zoom = std::clamp(z, min_zoom, max_zoom);
}

void Camera::set_zoom_limits(double lo, double hi) {
    if (lo <= 0.0 || hi < lo) return;
    min_zoom = lo;
    max_zoom = hi;
    set_zoom(zoom);
}

void Camera::pan(double dx, double dy) {
    center.x -= dx * zoom;
    center.y -= dy * zoom;
}

void Camera::zoom_at(double factor, const PointF& screen_point) {
    if (factor <= 0.0) return;
    PointF before = screen_to_world(screen_point);
    set_zoom(zoom * factor);
    PointF after = screen_to_world(screen_point);
    center.x += before.x - after.x;
    center.y += before.y - after.y;
}

void Camera::fit(const RectF& world_rect, double padding) {
    center = world_rect.center();
    double availW = viewport.width - 2.0 * padding;
    double availH = viewport.height - 2.0 * padding;
    if (availW <= 0.0) availW = viewport.width;
    if (availH <= 0.0) availH = viewport.height;
    if (availW <= 0.0 || availH <= 0.0) return;

    double z = std::max(world_rect.width / availW, world_rect.height / availH);
    if (z <= 0.0) z = 1.0;
    set_zoom(z);
}

PointF Camera::screen_to_world(const PointF& p) const {
    PointF vc = viewport.center();
    return {center.x + (p.x - vc.x) * zoom, center.y + (p.y - vc.y) * zoom};
}

PointF Camera::world_to_screen(const PointF& p) const {
    PointF vc = viewport.center();
    return {vc.x + (p.x - center.x) / zoom, vc.y + (p.y - center.y) / zoom};
}

RectF Camera::visible_world_rect() const {
    PointF tl = screen_to_world({viewport.left, viewport.top});
    return {tl.x, tl.y, viewport.width * zoom, viewport.height * zoom};
}
