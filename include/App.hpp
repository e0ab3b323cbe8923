#pragma once
#include <SFML/Graphics.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core.hpp"
#include "detail.hpp"
#include "hex_layout.hpp"
#include "map_scene.hpp"
#include "MapView.hpp"
#include "report.hpp"
#include "world.hpp"
#include "ui/InputBox.hpp"
#include "utils/ConfigLoader.hpp"

class App {
public:
    explicit App(const AppConfig& config);
    void run();

    // Импорт отчёта в мир; false при ошибке разбора (мир не меняется)
    bool importReport(const std::string& path);
    // Загрузка мира из config.world_file; при ошибке остаётся пустой мир
    void loadWorld();
    bool saveWorld();

private:
    AppConfig config;

    // Window & Resources
    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded = false;

    // Data
    WorldModel world;
    HexLayout layout;
    MapScene scene;
    DetailPresenter presenter;
    std::unique_ptr<HexMapView> mapView;

    // Application State
    std::string statusText = "Ready";
    std::string lastOperation;
    std::optional<TurnReport> lastReport;
    std::vector<std::string> lastWarnings;
    bool swallowNextText = false;

    // UI & Layout
    float sidebarWidth = 380.0f;
    sf::FloatRect mapRect;
    sf::FloatRect sidebarRect;
    std::unique_ptr<InputBox> pathInput;

    // Colors
    sf::Color colorBg = sf::Color(20, 20, 20);
    sf::Color colorSidebarBg = sf::Color(35, 35, 40);
    sf::Color colorTextMain = sf::Color(220, 220, 220);
    sf::Color colorTextDim = sf::Color(150, 150, 150);
    sf::Color colorAccent = sf::Color(70, 130, 180);
    sf::Color colorWarning = sf::Color(230, 180, 60);
    sf::Color colorError = sf::Color(220, 80, 80);

    // Methods
    void loadFont();
    void handleEvents();
    void handleKey(const sf::Event::KeyPressed& key);
    void render();
    void recalcLayout();
    void shutdown();

    void drawSidebar();
    float drawStatusPanel(float x, float y, float w);
    float drawReportPanel(float x, float y, float w);
    float drawImportPanel(float x, float y, float w);
    void drawDetailPanel(float x, float y, float w, float h);
    float drawControlsPanel(float x, float bottom, float w);
    void drawPanel(float x, float y, float w, float h);
    void drawText(const std::string& str, float x, float y, unsigned int size = 16, bool centered = false, sf::Color color = sf::Color(220, 220, 220));

    // Перенос длинной строки по ширине панели (по символам)
    static std::vector<std::string> wrapLine(const std::string& line, size_t width);
};
