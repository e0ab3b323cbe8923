#include "ui/InputBox.hpp"

InputBox::InputBox(float x, float y, float w, float h, const std::string& lbl, const sf::Font& font)
    : textObj(font)
{
    rect.setPosition({x, y});
    rect.setSize({w, h});
    rect.setFillColor(sf::Color(50, 50, 55));
    rect.setOutlineColor(sf::Color(100, 100, 100));
    rect.setOutlineThickness(1.0f);

    label = lbl;

    textObj.setCharacterSize(14);
    textObj.setFillColor(sf::Color::White);
    textObj.setPosition({x + 5, y + 5});
}

bool InputBox::handleEvent(const sf::Event& event) {
    if (!isFocused) return false;

    if (const auto* keyPressed = event.getIf<sf::Event::KeyPressed>()) {
        if (keyPressed->scancode == sf::Keyboard::Scancode::Enter) return true;
        return false;
    }

    if (const auto* textEvent = event.getIf<sf::Event::TextEntered>()) {
        if (textEvent->unicode == 8) { // Backspace
            if (!value.empty()) value.pop_back();
        }
        // Только печатаемые ASCII; Enter и управляющие символы приходят отдельно
        else if (textEvent->unicode >= 32 && textEvent->unicode < 127) {
            if (value.length() < maxLength) {
                value += static_cast<char>(textEvent->unicode);
            }
        }
        updateText();
    }
    return false;
}

void InputBox::setPosition(float x, float y) {
    rect.setPosition({x, y});
    textObj.setPosition({x + 5, y + 5});
    updateText();
}

void InputBox::updateText() {
    // Длинный путь не влезает: показываем хвост, он информативнее
    std::string shown = value;
    textObj.setString(shown);
    while (shown.size() > 1 && textObj.getLocalBounds().size.x > rect.getSize().x - 10) {
        shown.erase(0, 1);
        textObj.setString("..." + shown);
    }
}

void InputBox::draw(sf::RenderWindow& window, const sf::Font& font, bool fontLoaded) {
    rect.setOutlineColor(isFocused ? sf::Color(70, 130, 180) : sf::Color(100, 100, 100));
    window.draw(rect);
    if (!fontLoaded) return;
    window.draw(textObj);

    sf::Text lblText(font, label, 12);
    lblText.setFillColor(sf::Color(180, 180, 180));
    lblText.setPosition({rect.getPosition().x, rect.getPosition().y - 18});
    window.draw(lblText);
}

bool InputBox::contains(float x, float y) const {
    return rect.getGlobalBounds().contains({x, y});
}
