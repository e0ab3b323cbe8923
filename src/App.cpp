#include "App.hpp"
#include "utils/Serializer.hpp"
#include "utils/Timer.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>

App::App(const AppConfig& cfg)
    : config(cfg), layout(cfg.hex_radius), scene(world, layout), presenter(world)
{
    window.create(sf::VideoMode({config.window_width, config.window_height}), "HexAtlas");
    window.setFramerateLimit(60);

    loadFont();

    scene.set_show_coords(config.show_coords);
    scene.set_max_cells(config.max_cells);
    scene.set_level(config.level);
    scene.get_camera().set_zoom_limits(config.min_zoom, config.max_zoom);
    presenter.attach(scene);

    mapView = std::make_unique<HexMapView>(scene, font, fontLoaded);
    pathInput = std::make_unique<InputBox>(0, 0, sidebarWidth - 60, 25, "Report file", font);
    recalcLayout();
}

void App::loadFont() {
    for (const auto& path : config.font_paths) {
        if (std::filesystem::exists(path) && font.openFromFile(path)) {
            fontLoaded = true;
            std::cout << "Loaded font: " << path << std::endl;
            break;
        }
    }

    if (!fontLoaded) {
        std::cerr << "Warning: No font found. Text will not display." << std::endl;
    }
}

void App::run() {
    scene.fit_to_world();
    while (window.isOpen()) {
        handleEvents();
        render();
    }
}

void App::loadWorld() {
    Timer timer;
    if (!std::filesystem::exists(config.world_file)) {
        // Файла нет - на диске пустой мир, текущая карта сбрасывается
        std::cout << "No world file at " << config.world_file << ", starting with an empty map" << std::endl;
        world.clear();
        world.mark_clean();
        statusText = "New world";
    } else {
        try {
            world = Serializer::load_json(config.world_file);
            statusText = "Loaded " + std::to_string(world.size()) + " hexes";
            lastOperation = "Load: " + timer.format_elapsed();
        } catch (const PersistenceError& e) {
            std::cerr << "Error loading world: " << e.what() << std::endl;
            world = WorldModel();
            statusText = "World file unreadable, empty map";
            lastOperation = e.what();
        }
    }
    presenter.refresh();
    scene.fit_to_world();
}

bool App::saveWorld() {
    try {
        Serializer::save_json(config.world_file, world);
        world.mark_clean();
        statusText = "Saved " + std::to_string(world.size()) + " hexes";
        return true;
    } catch (const PersistenceError& e) {
        std::cerr << "Error saving world: " << e.what() << std::endl;
        statusText = "Save failed";
        lastOperation = e.what();
        return false;
    }
}

bool App::importReport(const std::string& path) {
    if (path.empty()) {
        statusText = "No report file given";
        return false;
    }

    Timer timer;
    TurnReport report;
    try {
        report = ReportParser::parse_file(path);
    } catch (const ParseError& e) {
        std::cerr << "Error importing " << path << ": " << e.what() << std::endl;
        statusText = "Import failed";
        lastOperation = e.what();
        return false;
    }

    bool wasEmpty = world.empty();
    MergeOptions options;
    options.departed_units = config.departed_units;
    MergeResult result = world.merge(report, options);

    lastWarnings.clear();
    for (const auto& w : result.warnings) {
        std::string msg = w.coord ? w.coord->to_string() + ": " + w.message : w.message;
        std::cerr << "Warning: " << msg << std::endl;
        lastWarnings.push_back(msg);
    }

    std::stringstream ss;
    ss << "+" << result.inserted << " new, " << result.updated << " updated, "
       << result.unchanged << " unchanged, " << result.skipped << " skipped";
    lastOperation = ss.str() + " (" + timer.format_elapsed() + ")";
    statusText = "Imported turn " + std::to_string(report.turn);
    std::cout << "Imported " << path << ": " << lastOperation << std::endl;

    lastReport = report;
    presenter.refresh();
    if (wasEmpty) scene.fit_to_world();
    return true;
}

void App::shutdown() {
    if (world.is_dirty() && config.autosave_on_exit) {
        saveWorld();
    }
    window.close();
}

void App::handleEvents() {
    while (const auto event = window.pollEvent()) {
        if (event->is<sf::Event::Closed>()) {
            shutdown();
            return;
        }

        if (const auto* resized = event->getIf<sf::Event::Resized>()) {
            sf::FloatRect visibleArea({0, 0}, {(float)resized->size.x, (float)resized->size.y});
            window.setView(sf::View(visibleArea));
            recalcLayout();
            continue;
        }

        if (event->is<sf::Event::TextEntered>() && swallowNextText) {
            // Символ клавиши, которой поле только что получило фокус
            swallowNextText = false;
            continue;
        }

        if (pathInput->handleEvent(*event)) {
            pathInput->isFocused = false;
            importReport(pathInput->value);
            continue;
        }

        if (const auto* mousePressed = event->getIf<sf::Event::MouseButtonPressed>()) {
            float mx = (float)mousePressed->position.x;
            float my = (float)mousePressed->position.y;
            if (mousePressed->button == sf::Mouse::Button::Left) {
                pathInput->isFocused = pathInput->contains(mx, my);
            }
        }

        if (const auto* keyPressed = event->getIf<sf::Event::KeyPressed>()) {
            if (pathInput->isFocused) {
                if (keyPressed->scancode == sf::Keyboard::Scancode::Escape) pathInput->isFocused = false;
                continue;
            }
            handleKey(*keyPressed);
            if (!window.isOpen()) return;
            continue;
        }

        if (!pathInput->isFocused || !event->is<sf::Event::TextEntered>()) {
            mapView->handleEvent(*event);
        }
    }
}

void App::handleKey(const sf::Event::KeyPressed& key) {
    using Sc = sf::Keyboard::Scancode;

    if (key.control) {
        if (key.scancode == Sc::S) saveWorld();
        if (key.scancode == Sc::L) loadWorld();
        return;
    }

    switch (key.scancode) {
        case Sc::O:
            pathInput->isFocused = true;
            swallowNextText = true;
            break;
        case Sc::C:
            scene.toggle_show_coords();
            break;
        case Sc::PageUp:
            if (!scene.step_level(-1)) statusText = "No level above";
            else scene.fit_to_world();
            break;
        case Sc::PageDown:
            if (!scene.step_level(1)) statusText = "No level below";
            else scene.fit_to_world();
            break;
        case Sc::F:
            scene.fit_to_world();
            break;
        case Sc::Escape:
            if (scene.get_selection()) scene.clear_selection();
            else shutdown();
            break;
        default:
            break;
    }
}

void App::recalcLayout() {
    sf::Vector2u size = window.getSize();
    float w = static_cast<float>(size.x);
    float h = static_cast<float>(size.y);

    sidebarRect = sf::FloatRect({w - sidebarWidth, 0}, {sidebarWidth, h});
    mapRect = sf::FloatRect({0, 0}, {std::max(0.0f, w - sidebarWidth), h});
    mapView->setArea(mapRect);
}

void App::render() {
    window.clear(colorBg);
    mapView->draw(window);
    drawSidebar();
    window.display();
}

void App::drawSidebar() {
    sf::RectangleShape bg(sidebarRect.size);
    bg.setPosition(sidebarRect.position);
    bg.setFillColor(colorSidebarBg);
    window.draw(bg);

    float x = sidebarRect.position.x + 20.0f;
    float y = sidebarRect.position.y + 20.0f;
    float w = sidebarWidth - 40.0f;

    drawText("HexAtlas", x, y, 24, false, sf::Color::White);
    y += 40;

    y = drawStatusPanel(x, y, w);
    y = drawReportPanel(x, y, w);
    y = drawImportPanel(x, y, w);

    float controlsTop = drawControlsPanel(x, sidebarRect.size.y - 10.0f, w);
    drawDetailPanel(x, y, w, controlsTop - 10.0f - y);
}

float App::drawStatusPanel(float x, float y, float w) {
    drawPanel(x, y, w, 130);
    float py = y + 10;
    drawText("STATUS", x + 10, py, 16, false, colorAccent); py += 22;

    drawText(statusText + (world.is_dirty() ? "  [unsaved]" : ""), x + 10, py, 14, false,
             world.is_dirty() ? colorWarning : colorTextMain);
    py += 20;

    std::stringstream ss;
    ss << "Hexes: " << world.size() << "   Factions: " << world.get_factions().size();
    drawText(ss.str(), x + 10, py, 14); py += 20;

    ss.str(""); ss << "Level: " << scene.get_level() << "   Zoom: " << std::fixed;
    ss.precision(2);
    ss << scene.get_camera().get_zoom();
    drawText(ss.str(), x + 10, py, 14); py += 20;

    ss.str(""); ss << "Units policy: " << departed_policy_to_string(config.departed_units);
    drawText(ss.str(), x + 10, py, 14, false, colorTextDim);

    return y + 140;
}

float App::drawReportPanel(float x, float y, float w) {
    if (!lastReport) {
        drawPanel(x, y, w, 60);
        drawText("REPORT", x + 10, y + 10, 16, false, colorAccent);
        drawText("No report imported this session", x + 10, y + 32, 14, false, colorTextDim);
        return y + 70;
    }

    DetailSection header = DetailPresenter::describe_report(*lastReport);
    float h = 40.0f + 18.0f * static_cast<float>(header.lines.size());
    drawPanel(x, y, w, h);
    float py = y + 10;
    drawText("REPORT", x + 10, py, 16, false, colorAccent); py += 22;

    size_t width = static_cast<size_t>((w - 20) / 7.0f);
    for (size_t i = 0; i < header.lines.size(); ++i) {
        // Первые две строки (фракция и ход) - основным цветом
        std::string line = header.lines[i].size() > width ? header.lines[i].substr(0, width) : header.lines[i];
        drawText(line, x + 10, py, 13, false, i < 2 ? colorTextMain : colorTextDim);
        py += 18;
    }
    return y + h + 10;
}

float App::drawImportPanel(float x, float y, float w) {
    float h = 80.0f + (lastWarnings.empty() ? 0.0f : 20.0f);
    drawPanel(x, y, w, h);
    float py = y + 10;
    drawText("IMPORT", x + 10, py, 16, false, colorAccent);

    pathInput->setPosition(x + 10, py + 40);
    pathInput->draw(window, font, fontLoaded);
    py += 70;

    auto lines = wrapLine(lastOperation, static_cast<size_t>((w - 20) / 7.5f));
    if (!lines.empty()) drawText(lines.front(), x + 10, py, 12, false, colorTextDim);
    if (!lastWarnings.empty()) {
        py += 18;
        drawText(std::to_string(lastWarnings.size()) + " warning(s), see console", x + 10, py, 12, false, colorWarning);
    }
    return y + h + 20.0f;
}

void App::drawDetailPanel(float x, float y, float w, float h) {
    if (h < 60.0f) return;
    drawPanel(x, y, w, h);
    float py = y + 10;
    drawText("HEX", x + 10, py, 16, false, colorAccent); py += 22;

    const auto& detail = presenter.current();
    if (!detail) {
        drawText("Click a hex to see details", x + 10, py, 14, false, colorTextDim);
        return;
    }

    size_t width = static_cast<size_t>((w - 20) / 7.0f);
    float bottom = y + h - 16;

    for (const auto& l : wrapLine(detail->title, width)) {
        if (py > bottom) return;
        drawText(l, x + 10, py, 14, false, sf::Color::White); py += 18;
    }

    for (const auto& section : detail->sections) {
        if (py > bottom) return;
        py += 4;
        drawText(section.title, x + 10, py, 13, false, colorAccent); py += 17;
        for (const auto& line : section.lines) {
            for (const auto& l : wrapLine(line, width - 2)) {
                if (py > bottom) {
                    drawText("...", x + 10, py, 12, false, colorTextDim);
                    return;
                }
                drawText(l, x + 20, py, 12, false, colorTextMain); py += 15;
            }
        }
    }
}

float App::drawControlsPanel(float x, float bottom, float w) {
    std::vector<std::string> controls = {
        "[O] Report path   [Enter] Import",
        "[Ctrl+S] Save     [Ctrl+L] Reload",
        "[C] Coordinates   [F] Fit map",
        "[PgUp/PgDn] Level [Esc] Deselect/Quit",
        "Drag: pan   Wheel: zoom   Click: select"
    };
    float h = 35.0f + 18.0f * controls.size();
    float y = bottom - h;

    drawPanel(x, y, w, h);
    float py = y + 10;
    drawText("CONTROLS", x + 10, py, 16, false, colorAccent); py += 22;
    for (const auto& c : controls) {
        drawText(c, x + 10, py, 13, false, colorTextDim);
        py += 18;
    }
    return y;
}

void App::drawPanel(float x, float y, float w, float h) {
    sf::RectangleShape rect(sf::Vector2f(w, h));
    rect.setPosition({x, y});
    rect.setFillColor(sf::Color(45, 45, 50));
    rect.setOutlineColor(sf::Color(60, 60, 60));
    rect.setOutlineThickness(1.0f);
    window.draw(rect);
}

void App::drawText(const std::string& str, float x, float y, unsigned int size, bool centered, sf::Color color) {
    if (!fontLoaded) return;
    sf::Text text(font, str, size);
    text.setFillColor(color);
    if (centered) {
        sf::FloatRect bounds = text.getLocalBounds();
        text.setOrigin({bounds.position.x + bounds.size.x / 2.0f, bounds.position.y + bounds.size.y / 2.0f});
    }
    text.setPosition({x, y});
    window.draw(text);
}

std::vector<std::string> App::wrapLine(const std::string& line, size_t width) {
    std::vector<std::string> out;
    if (width < 8) width = 8;
    std::string rest = line;
    while (rest.size() > width) {
        size_t cut = rest.rfind(' ', width);
        if (cut == std::string::npos || cut == 0) cut = width;
        out.push_back(rest.substr(0, cut));
        rest = rest.substr(cut);
        if (!rest.empty() && rest[0] == ' ') rest.erase(0, 1);
    }
    if (!rest.empty()) out.push_back(rest);
    return out;
}
