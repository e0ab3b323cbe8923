#include "report.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace {

const char* const MONTHS[] = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
};

// Поле отсутствует или имеет не тот тип -> значение по умолчанию.
// Неизвестные поля отчёта просто не читаются.
std::string get_string(const json& j, const char* key, const std::string& def = "") {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return def;
    return it->get<std::string>();
}

// Число вне диапазона int считается отсутствующим, а не обрезается
std::optional<int> get_int(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    const long long lo = std::numeric_limits<int>::min();
    const long long hi = std::numeric_limits<int>::max();
    if (it->is_number_unsigned()) {
        auto v = it->get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(hi)) return std::nullopt;
        return static_cast<int>(v);
    }
    if (it->is_number_integer()) {
        auto v = it->get<std::int64_t>();
        if (v < lo || v > hi) return std::nullopt;
        return static_cast<int>(v);
    }
    if (it->is_number_float()) {
        double v = it->get<double>();
        if (!(v >= static_cast<double>(lo) && v < static_cast<double>(hi) + 1.0)) return std::nullopt;
        return static_cast<int>(v);
    }
    return std::nullopt;
}

std::optional<double> get_double(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

bool get_bool(const json& j, const char* key, bool def) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return def;
    return it->get<bool>();
}

const json* get_object(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return nullptr;
    return &(*it);
}

const json* get_array(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return nullptr;
    return &(*it);
}

} // namespace

TurnReport ReportParser::parse(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("Report is not valid JSON: ") + e.what());
    }
    return from_json(j);
}

TurnReport ReportParser::parse_file(const std::string& filename) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw ParseError("Cannot open report file: " + filename);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

int ReportParser::month_index(const std::string& month) {
    std::string lower = month;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (int i = 0; i < 12; ++i) {
        if (lower == MONTHS[i]) return i;
    }
    return -1;
}

int ReportParser::turn_from_date(const std::string& month, int year) {
    int m = month_index(month);
    if (m < 0 || year < 1) return -1;
    if (year > (std::numeric_limits<int>::max() - 12) / 12 + 1) return -1;
    return (year - 1) * 12 + m + 1;
}

TurnReport ReportParser::from_json(const json& j) {
    if (!j.is_object()) {
        throw ParseError("Report root must be a JSON object");
    }

    TurnReport report;

    // Фракция: в отчёте Atlantis это поля верхнего уровня name/number
    std::optional<int> faction = get_int(j, "number");
    report.faction_name = get_string(j, "name", "Unknown");
    if (!faction) {
        if (const json* f = get_object(j, "faction")) {
            faction = get_int(*f, "number");
            report.faction_name = get_string(*f, "name", report.faction_name);
        }
    }
    if (!faction) {
        throw ParseError("Report has no faction number");
    }
    report.faction_number = *faction;

    if (const json* d = get_object(j, "date")) {
        std::optional<int> year = get_int(*d, "year");
        std::string month = get_string(*d, "month");
        if (year && !month.empty()) {
            report.date = ReportDate{month, *year};
        }
    }

    if (std::optional<int> turn = get_int(j, "turn")) {
        report.turn = *turn;
    } else if (report.date) {
        report.turn = turn_from_date(report.date->month, report.date->year);
        if (report.turn < 0) {
            throw ParseError("Report date is not recognised: " + report.date->month + " of year " +
                             std::to_string(report.date->year));
        }
    } else {
        throw ParseError("Report has no turn number or date");
    }

    if (const json* e = get_object(j, "engine")) {
        report.engine.ruleset = get_string(*e, "ruleset", "Unknown");
        report.engine.ruleset_version = get_string(*e, "ruleset_version", "Unknown");
        report.engine.version = get_string(*e, "version", "Unknown");
    }

    if (const json* a = get_object(j, "attitudes")) {
        std::string def = get_string(*a, "default", "neutral");
        if (!def.empty()) def[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(def[0])));
        report.default_attitude = def;
    }

    if (const json* adm = get_object(j, "administrative")) {
        report.administrative.email = get_string(*adm, "email");
        report.administrative.password_unset = get_bool(*adm, "password_unset", false);
        report.administrative.show_unit_attitudes = get_bool(*adm, "show_unit_attitudes", false);
        report.administrative.times_sent = get_bool(*adm, "times_sent", false);
    }

    if (const json* regions = get_array(j, "regions")) {
        for (const auto& r : *regions) {
            if (r.is_object()) {
                report.regions.push_back(read_region(r));
            } else {
                report.regions.push_back(RegionSnapshot{});
            }
        }
    }

    if (const json* events = get_array(j, "events")) {
        for (const auto& e : *events) {
            if (auto ev = read_event(e)) report.events.push_back(*ev);
        }
    }

    return report;
}

std::optional<HexCoord> ReportParser::read_coord(const json& j) {
    const json* c = get_object(j, "coordinates");
    if (!c) return std::nullopt;
    std::optional<int> x = get_int(*c, "x");
    std::optional<int> y = get_int(*c, "y");
    if (!x || !y) return std::nullopt;
    return HexCoord(*x, *y, get_int(*c, "z").value_or(SURFACE_LEVEL));
}

std::optional<Settlement> ReportParser::read_settlement(const json& j) {
    const json* s = get_object(j, "settlement");
    if (!s) return std::nullopt;
    Settlement settlement;
    settlement.name = get_string(*s, "name", "Unknown");
    settlement.size = get_string(*s, "size", "Unknown");
    return settlement;
}

std::vector<ItemStack> ReportParser::read_items(const json& j) {
    std::vector<ItemStack> items;
    if (!j.is_array()) return items;
    for (const auto& it : j) {
        if (!it.is_object()) continue;
        ItemStack item;
        item.name = get_string(it, "name", "Unknown");
        item.tag = get_string(it, "tag");
        item.amount = get_int(it, "amount").value_or(1);
        items.push_back(item);
    }
    return items;
}

std::vector<MarketEntry> ReportParser::read_market(const json& j) {
    std::vector<MarketEntry> entries;
    if (!j.is_array()) return entries;
    for (const auto& it : j) {
        if (!it.is_object()) continue;
        MarketEntry entry;
        entry.name = get_string(it, "name", "Unknown");
        entry.tag = get_string(it, "tag");
        entry.amount = get_int(it, "amount").value_or(0);
        entry.price = get_int(it, "price").value_or(0);
        entries.push_back(entry);
    }
    return entries;
}

std::vector<SkillEntry> ReportParser::read_skills(const json& j) {
    // Навыки приходят либо объектом {"known": [...]}, либо сразу массивом
    const json* list = &j;
    if (j.is_object()) {
        list = get_array(j, "known");
        if (!list) return {};
    }
    std::vector<SkillEntry> skills;
    if (!list->is_array()) return skills;
    for (const auto& s : *list) {
        if (!s.is_object()) continue;
        SkillEntry skill;
        skill.name = get_string(s, "name", "Unknown");
        skill.tag = get_string(s, "tag");
        skill.level = get_int(s, "level").value_or(0);
        skill.days = get_int(s, "skill_days").value_or(0);
        skills.push_back(skill);
    }
    return skills;
}

std::optional<Unit> ReportParser::read_unit(const json& j, std::optional<int> structure) {
    if (!j.is_object()) return std::nullopt;
    std::optional<int> number = get_int(j, "number");
    if (!number) return std::nullopt;

    Unit unit;
    unit.number = *number;
    unit.name = get_string(j, "name", "Unit");
    unit.own_unit = get_bool(j, "own_unit", false);
    unit.structure = structure;
    unit.description = get_string(j, "description");

    if (const json* f = get_object(j, "faction")) {
        if (std::optional<int> fnum = get_int(*f, "number")) {
            unit.faction = FactionRef{*fnum, get_string(*f, "name")};
        }
    }

    if (const json* items = get_array(j, "items")) unit.items = read_items(*items);

    auto skills = j.find("skills");
    if (skills != j.end()) unit.skills = read_skills(*skills);

    if (const json* flags = get_object(j, "flags")) {
        for (auto it = flags->begin(); it != flags->end(); ++it) {
            if (it.value().is_boolean()) unit.flags[it.key()] = it.value().get<bool>();
        }
    }

    if (const json* orders = get_array(j, "orders")) {
        for (const auto& o : *orders) {
            if (o.is_string()) {
                unit.orders.push_back(o.get<std::string>());
            } else if (o.is_object()) {
                std::string text = get_string(o, "order");
                if (!text.empty()) unit.orders.push_back(text);
            }
        }
    }

    return unit;
}

std::optional<Exit> ReportParser::read_exit(const json& j) {
    if (!j.is_object()) return std::nullopt;
    const json* region = get_object(j, "region");
    if (!region) return std::nullopt;
    std::optional<HexCoord> coord = read_coord(*region);
    if (!coord) return std::nullopt;

    Exit exit;
    exit.direction = get_string(j, "direction");
    exit.coord = *coord;
    exit.terrain = get_string(*region, "terrain");
    exit.province = get_string(*region, "province");
    exit.settlement = read_settlement(*region);
    return exit;
}

std::optional<TurnEvent> ReportParser::read_event(const json& j) {
    if (!j.is_object()) return std::nullopt;
    TurnEvent event;
    event.message = get_string(j, "message");
    if (event.message.empty()) return std::nullopt;
    event.category = get_string(j, "category");
    if (const json* u = get_object(j, "unit")) {
        event.unit_number = get_int(*u, "number");
    }
    if (const json* r = get_object(j, "region")) {
        event.coord = read_coord(*r);
    }
    return event;
}

RegionSnapshot ReportParser::read_region(const json& j) {
    RegionSnapshot snapshot;
    snapshot.coord = read_coord(j);

    Region& r = snapshot.region;
    if (snapshot.coord) r.coord = *snapshot.coord;
    r.terrain = get_string(j, "terrain");
    r.province = get_string(j, "province");
    r.settlement = read_settlement(j);
    r.tax = get_int(j, "tax");
    r.entertainment = get_int(j, "entertainment");

    if (const json* w = get_object(j, "weather")) {
        r.weather = Weather{get_string(*w, "current"), get_string(*w, "next")};
    }

    if (const json* p = get_object(j, "population")) {
        Population pop;
        pop.amount = get_int(*p, "amount").value_or(0);
        pop.race = get_string(*p, "race");
        r.population = pop;
    }

    if (const json* w = get_object(j, "wages")) {
        Wages wages;
        wages.amount = get_double(*w, "amount").value_or(0.0);
        wages.max = get_int(*w, "max").value_or(0);
        r.wages = wages;
    }

    if (const json* products = get_array(j, "products")) r.products = read_items(*products);

    if (const json* m = get_object(j, "markets")) {
        if (const json* fs = get_array(*m, "for_sale")) r.markets.for_sale = read_market(*fs);
        if (const json* w = get_array(*m, "wanted")) r.markets.wanted = read_market(*w);
    }

    if (const json* exits = get_array(j, "exits")) {
        for (const auto& e : *exits) {
            if (auto exit = read_exit(e)) r.exits.push_back(*exit);
        }
    }

    // Отряды внутри зданий разворачиваются в общий список с пометкой structure
    if (const json* structures = get_array(j, "structures")) {
        for (const auto& s : *structures) {
            if (!s.is_object()) continue;
            Structure st;
            st.number = get_int(s, "number").value_or(0);
            st.name = get_string(s, "name", "Structure");
            st.type = get_string(s, "type");
            r.structures.push_back(st);

            if (const json* units = get_array(s, "units")) {
                for (const auto& u : *units) {
                    if (auto unit = read_unit(u, st.number)) {
                        r.units.push_back(*unit);
                    } else {
                        snapshot.units_without_number++;
                    }
                }
            }
        }
    }

    if (const json* units = get_array(j, "units")) {
        for (const auto& u : *units) {
            if (auto unit = read_unit(u, std::nullopt)) {
                r.units.push_back(*unit);
            } else {
                snapshot.units_without_number++;
            }
        }
    }

    return snapshot;
}
