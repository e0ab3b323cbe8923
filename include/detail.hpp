#pragma once
#include <optional>
#include <string>
#include <vector>
#include "core.hpp"
#include "world.hpp"

class MapScene;

struct DetailSection {
    std::string title;
    std::vector<std::string> lines;
};

// Человекочитаемая сводка по гексу
struct HexDetail {
    HexCoord coord;
    bool discovered = false;
    std::string title;
    std::vector<DetailSection> sections;

    const DetailSection* find_section(const std::string& title) const;
};

// Read-only view of the world for the selected hex. No caching: every call
// reflects the current WorldModel.
class DetailPresenter {
public:
    explicit DetailPresenter(const WorldModel& world);
    ~DetailPresenter();

    DetailPresenter(const DetailPresenter&) = delete;
    DetailPresenter& operator=(const DetailPresenter&) = delete;

    HexDetail describe(const HexCoord& coord) const;

    // Follow the scene's selection; current() is refreshed on every change
    void attach(MapScene& scene);
    void detach();
    // Re-read the current selection (after an import changed the world)
    void refresh();
    const std::optional<HexDetail>& current() const { return current_detail; }

    static std::string to_text(const HexDetail& detail);
    // Заголовок отчёта: фракция, дата, движок и настройки из administrative
    static DetailSection describe_report(const TurnReport& report);

private:
    const WorldModel& world;
    MapScene* scene = nullptr;
    int subscription = 0;
    std::optional<HexCoord> current_coord;
    std::optional<HexDetail> current_detail;

    static std::string format_unit(const Unit& unit, const Region& region);
};
