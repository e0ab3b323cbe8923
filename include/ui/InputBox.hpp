#pragma once
#include <SFML/Graphics.hpp>
#include <string>

// Однострочное поле ввода (путь к файлу отчёта)
class InputBox {
public:
    sf::RectangleShape rect;
    sf::Text textObj;
    std::string value;
    bool isFocused = false;
    std::string label;
    size_t maxLength = 512;

    InputBox(float x, float y, float w, float h, const std::string& lbl, const sf::Font& font);

    // true, если в фокусе нажат Enter (значение готово к применению)
    bool handleEvent(const sf::Event& event);
    void setPosition(float x, float y);
    void draw(sf::RenderWindow& window, const sf::Font& font, bool fontLoaded);
    bool contains(float x, float y) const;

private:
    void updateText();
};
