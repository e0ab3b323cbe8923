#include "MapView.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace {
// Сдвиг мыши (в пикселях), после которого нажатие считается перетаскиванием, а не кликом
constexpr int DRAG_THRESHOLD = 4;
// Меньше этого радиуса на экране подписи координат не рисуем
constexpr float MIN_LABEL_RADIUS_PX = 18.0f;
}

HexMapView::HexMapView(MapScene& scene, const sf::Font& font, bool fontLoaded)
    : scene(scene), font(font), fontLoaded(fontLoaded) {}

sf::Color HexMapView::toSf(const Color& c, std::uint8_t alpha) {
    return sf::Color(static_cast<std::uint8_t>(c.r), static_cast<std::uint8_t>(c.g),
                     static_cast<std::uint8_t>(c.b), alpha);
}

void HexMapView::setArea(const sf::FloatRect& a) {
    area = a;
    scene.get_camera().set_viewport({a.position.x, a.position.y, a.size.x, a.size.y});
}

bool HexMapView::handleEvent(const sf::Event& event) {
    if (const auto* pressed = event.getIf<sf::Event::MouseButtonPressed>()) {
        sf::Vector2f p(static_cast<float>(pressed->position.x), static_cast<float>(pressed->position.y));
        if (!area.contains(p)) return false;

        if (pressed->button == sf::Mouse::Button::Right || pressed->button == sf::Mouse::Button::Middle) {
            isDragging = true;
            lastMousePos = pressed->position;
            return true;
        }
        if (pressed->button == sf::Mouse::Button::Left) {
            // Левой кнопкой тоже можно тянуть карту; выделение - только если мышь почти не двигалась
            leftPressed = true;
            dragMoved = false;
            pressPos = pressed->position;
            lastMousePos = pressed->position;
            return true;
        }
        return false;
    }

    if (const auto* released = event.getIf<sf::Event::MouseButtonReleased>()) {
        if (released->button == sf::Mouse::Button::Right || released->button == sf::Mouse::Button::Middle) {
            bool was = isDragging;
            isDragging = false;
            return was;
        }
        if (released->button == sf::Mouse::Button::Left && leftPressed) {
            leftPressed = false;
            if (!dragMoved) {
                PointF sp{static_cast<double>(released->position.x), static_cast<double>(released->position.y)};
                if (auto hit = scene.hit_test(sp)) scene.select_hex(*hit);
            }
            dragMoved = false;
            return true;
        }
        return false;
    }

    if (const auto* moved = event.getIf<sf::Event::MouseMoved>()) {
        if (leftPressed && !dragMoved) {
            sf::Vector2i d = moved->position - pressPos;
            if (std::abs(d.x) > DRAG_THRESHOLD || std::abs(d.y) > DRAG_THRESHOLD) dragMoved = true;
        }
        if (isDragging || (leftPressed && dragMoved)) {
            sf::Vector2i d = moved->position - lastMousePos;
            scene.get_camera().pan(d.x, d.y);
        }
        lastMousePos = moved->position;

        PointF sp{static_cast<double>(moved->position.x), static_cast<double>(moved->position.y)};
        hovered = scene.hit_test(sp);
        return hovered.has_value();
    }

    if (const auto* wheel = event.getIf<sf::Event::MouseWheelScrolled>()) {
        sf::Vector2f p(static_cast<float>(wheel->position.x), static_cast<float>(wheel->position.y));
        if (!area.contains(p)) return false;
        // Колесо вверх - приближение (меньше единиц мира на пиксель)
        double factor = wheel->delta > 0 ? 1.0 / 1.15 : 1.15;
        scene.get_camera().zoom_at(factor, {p.x, p.y});
        return true;
    }

    return false;
}

sf::View HexMapView::makeWorldView(const sf::RenderWindow& window) const {
    const Camera& cam = scene.get_camera();
    sf::Vector2u winSize = window.getSize();
    float zoom = static_cast<float>(cam.get_zoom());

    sf::View view;
    view.setCenter({static_cast<float>(cam.get_center().x), static_cast<float>(cam.get_center().y)});
    view.setSize({area.size.x * zoom, area.size.y * zoom});
    view.setViewport(sf::FloatRect(
        {area.position.x / static_cast<float>(winSize.x), area.position.y / static_cast<float>(winSize.y)},
        {area.size.x / static_cast<float>(winSize.x), area.size.y / static_cast<float>(winSize.y)}));
    return view;
}

void HexMapView::draw(sf::RenderWindow& window) {
    sf::RectangleShape bg(area.size);
    bg.setPosition(area.position);
    bg.setFillColor(colorBg);
    window.draw(bg);

    RectF viewport{area.position.x, area.position.y, area.size.x, area.size.y};
    std::vector<HexVisual> visuals = scene.render(viewport);

    sf::View defaultView = window.getView();
    window.setView(makeWorldView(window));
    for (const auto& v : visuals) drawHex(window, v);
    // Выделение поверх соседей, иначе их обводка перекрывает рамку
    for (const auto& v : visuals) {
        if (v.selected) {
            sf::ConvexShape hex(6);
            auto pts = scene.get_layout().corners(v.coord);
            for (size_t i = 0; i < 6; ++i) hex.setPoint(i, {static_cast<float>(pts[i].x), static_cast<float>(pts[i].y)});
            hex.setFillColor(sf::Color::Transparent);
            hex.setOutlineColor(colorSelected);
            hex.setOutlineThickness(static_cast<float>(3.0 * scene.get_camera().get_zoom()));
            window.draw(hex);
        }
    }
    window.setView(defaultView);

    // Подписи рисуются в экранных координатах, чтобы текст оставался чётким
    float radiusPx = static_cast<float>(scene.get_layout().get_radius() / scene.get_camera().get_zoom());
    if (fontLoaded && scene.get_show_coords() && radiusPx >= MIN_LABEL_RADIUS_PX) {
        for (const auto& v : visuals) drawLabel(window, v);
    }

    if (scene.get_world().empty()) drawEmptyHint(window);
}

void HexMapView::drawHex(sf::RenderWindow& window, const HexVisual& v) {
    const HexLayout& layout = scene.get_layout();
    auto pts = layout.corners(v.coord);

    sf::ConvexShape hex(6);
    for (size_t i = 0; i < 6; ++i) {
        hex.setPoint(i, {static_cast<float>(pts[i].x), static_cast<float>(pts[i].y)});
    }
    // Гекс, известный только по выходам, рисуем приглушённым
    hex.setFillColor(toSf(v.fill, v.exit_only ? 140 : 255));
    hex.setOutlineColor(colorOutline);
    hex.setOutlineThickness(static_cast<float>(-1.0 * scene.get_camera().get_zoom()));
    window.draw(hex);

    if (hovered && *hovered == v.coord) {
        hex.setFillColor(colorHover);
        window.draw(hex);
    }

    if (v.known) drawMarkers(window, v);
}

void HexMapView::drawMarkers(sf::RenderWindow& window, const HexVisual& v) {
    float R = static_cast<float>(scene.get_layout().get_radius());
    sf::Vector2f c(static_cast<float>(v.center.x), static_cast<float>(v.center.y));
    float dot = R * 0.12f;

    // Свои отряды: треугольник с точкой, слева от центра
    if (v.own_units) {
        sf::Vector2f p = c + sf::Vector2f(-R * 0.4f, R * 0.1f);
        sf::ConvexShape tri(3);
        tri.setPoint(0, {p.x, p.y - R * 0.25f});
        tri.setPoint(1, {p.x + R * 0.22f, p.y + R * 0.15f});
        tri.setPoint(2, {p.x - R * 0.22f, p.y + R * 0.15f});
        tri.setFillColor(sf::Color::Transparent);
        tri.setOutlineColor(colorOwn);
        tri.setOutlineThickness(R * 0.04f);
        window.draw(tri);

        sf::CircleShape d(dot * 0.7f);
        d.setOrigin({dot * 0.7f, dot * 0.7f});
        d.setPosition(p);
        d.setFillColor(colorOwn);
        window.draw(d);
    }

    // Чужие отряды: точка цвета фракции, справа от центра
    if (v.foreign_units) {
        sf::CircleShape d(dot);
        d.setOrigin({dot, dot});
        d.setPosition(c + sf::Vector2f(R * 0.4f, R * 0.1f));
        d.setFillColor(toSf(v.foreign_color));
        d.setOutlineColor(sf::Color::Black);
        d.setOutlineThickness(R * 0.02f);
        window.draw(d);
    }

    // Поселение: кольцо с точкой в центре
    if (v.settlement) {
        float rr = R * 0.22f;
        sf::CircleShape ring(rr);
        ring.setOrigin({rr, rr});
        ring.setPosition(c + sf::Vector2f(0.0f, -R * 0.35f));
        ring.setFillColor(sf::Color::Transparent);
        ring.setOutlineColor(sf::Color::Black);
        ring.setOutlineThickness(R * 0.05f);
        window.draw(ring);

        sf::CircleShape d(dot * 0.6f);
        d.setOrigin({dot * 0.6f, dot * 0.6f});
        d.setPosition(ring.getPosition());
        d.setFillColor(sf::Color::Black);
        window.draw(d);
    }

    // Здания и корабли: пустой квадрат снизу
    if (v.structures) {
        float s = R * 0.3f;
        sf::RectangleShape box({s, s});
        box.setOrigin({s / 2.0f, s / 2.0f});
        box.setPosition(c + sf::Vector2f(0.0f, R * 0.5f));
        box.setFillColor(sf::Color::Transparent);
        box.setOutlineColor(sf::Color::Black);
        box.setOutlineThickness(R * 0.04f);
        window.draw(box);
    }
}

void HexMapView::drawLabel(sf::RenderWindow& window, const HexVisual& v) {
    if (v.label.empty()) return;
    PointF sp = scene.get_camera().world_to_screen(v.center);
    float radiusPx = static_cast<float>(scene.get_layout().get_radius() / scene.get_camera().get_zoom());

    unsigned int size = static_cast<unsigned int>(std::max(9.0f, std::min(16.0f, radiusPx * 0.28f)));
    sf::Text text(font, v.label, size);
    text.setFillColor(toSf(v.label_color));
    sf::FloatRect b = text.getLocalBounds();
    text.setOrigin({b.position.x + b.size.x / 2.0f, b.position.y + b.size.y / 2.0f});
    text.setPosition({static_cast<float>(sp.x), static_cast<float>(sp.y) - radiusPx * 0.62f});

    if (!area.contains(text.getPosition())) return;
    window.draw(text);
}

void HexMapView::drawEmptyHint(sf::RenderWindow& window) {
    if (!fontLoaded) return;
    sf::Text text(font, "No reports imported yet. Press 'O' and enter a report path.", 18);
    text.setFillColor(sf::Color(150, 150, 150));
    sf::FloatRect b = text.getLocalBounds();
    text.setOrigin({b.position.x + b.size.x / 2.0f, b.position.y + b.size.y / 2.0f});
    text.setPosition({area.position.x + area.size.x / 2.0f, area.position.y + 40.0f});
    window.draw(text);
}
