#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core.hpp"
#include "errors.hpp"

using json = nlohmann::json;

struct ReportDate {
    std::string month;
    int year = 0;
};

struct EngineInfo {
    std::string ruleset = "Unknown";
    std::string ruleset_version = "Unknown";
    std::string version = "Unknown";
};

struct AdminSettings {
    std::string email;
    bool password_unset = false;
    bool show_unit_attitudes = false;
    bool times_sent = false;
};

// Снимок одного региона из отчёта. coord пуст, если координаты в отчёте
// отсутствуют или повреждены - такой снимок пропускается при слиянии.
struct RegionSnapshot {
    std::optional<HexCoord> coord;
    Region region;
    int units_without_number = 0;
};

// Разобранный отчёт за один ход одной фракции
struct TurnReport {
    int faction_number = 0;
    std::string faction_name = "Unknown";
    int turn = 0;
    std::optional<ReportDate> date;
    EngineInfo engine;
    std::string default_attitude = "Neutral";
    AdminSettings administrative;
    std::vector<RegionSnapshot> regions;
    std::vector<TurnEvent> events;
};

class ReportParser {
public:
    // Throws ParseError on malformed JSON or missing faction/turn.
    static TurnReport parse(const std::string& text);
    static TurnReport parse_file(const std::string& filename);
    static TurnReport from_json(const json& j);

    // Month index 0..11 for an English month name, -1 if unknown
    static int month_index(const std::string& month);
    // Absolute turn number for a game date; -1 if the month is unknown or the year is out of range
    static int turn_from_date(const std::string& month, int year);

private:
    static RegionSnapshot read_region(const json& j);
    static std::optional<HexCoord> read_coord(const json& j);
    static std::optional<Unit> read_unit(const json& j, std::optional<int> structure);
    static std::optional<Exit> read_exit(const json& j);
    static std::optional<TurnEvent> read_event(const json& j);
    static std::vector<ItemStack> read_items(const json& j);
    static std::vector<MarketEntry> read_market(const json& j);
    static std::vector<SkillEntry> read_skills(const json& j);
    static std::optional<Settlement> read_settlement(const json& j);
};
