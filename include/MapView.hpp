#pragma once
#include <SFML/Graphics.hpp>
#include <cstdint>
#include <optional>
#include "core.hpp"
#include "map_scene.hpp"

// SFML-отрисовка MapScene и перевод мыши в pan / zoom / select.
// Вся геометрия и состояние камеры живут в MapScene.
class HexMapView {
public:
    HexMapView(MapScene& scene, const sf::Font& font, bool fontLoaded);

    // Прямоугольник окна (в пикселях), отданный под карту
    void setArea(const sf::FloatRect& area);

    // true, если событие относилось к карте
    bool handleEvent(const sf::Event& event);
    void draw(sf::RenderWindow& window);

private:
    MapScene& scene;
    const sf::Font& font;
    bool fontLoaded;
    sf::FloatRect area;

    // Состояние мыши
    bool isDragging = false;
    bool dragMoved = false;
    bool leftPressed = false;
    sf::Vector2i pressPos;
    sf::Vector2i lastMousePos;
    std::optional<HexCoord> hovered;

    sf::Color colorBg = sf::Color(30, 30, 35);
    sf::Color colorOutline = sf::Color(20, 20, 20);
    sf::Color colorSelected = sf::Color(255, 215, 0);
    sf::Color colorHover = sf::Color(255, 255, 255, 60);
    sf::Color colorOwn = sf::Color(255, 255, 255);

    sf::View makeWorldView(const sf::RenderWindow& window) const;
    void drawHex(sf::RenderWindow& window, const HexVisual& v);
    void drawMarkers(sf::RenderWindow& window, const HexVisual& v);
    void drawLabel(sf::RenderWindow& window, const HexVisual& v);
    void drawEmptyHint(sf::RenderWindow& window);

    static sf::Color toSf(const Color& c, std::uint8_t alpha = 255);
};
