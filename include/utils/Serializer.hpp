#pragma once
#include "../core.hpp"
#include "../errors.hpp"
#include "../world.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Файл мира: все известные гексы и фракции между сессиями.
// Формат: {"format": "hexatlas-world", "version": 1, "factions": [...], "regions": [...]}
class Serializer {
public:
    static constexpr const char* FORMAT_NAME = "hexatlas-world";
    static constexpr int FORMAT_VERSION = 1;

    // Сохранение мира в JSON файл. Гексы идут в порядке координат, так что
    // повторное сохранение того же мира даёт тот же файл.
    static void save_json(const std::string& filename, const WorldModel& world) {
        std::ofstream out(filename);
        if (!out.is_open()) {
            throw PersistenceError("Failed to open output file: " + filename);
        }
        out << dump(world);
        out.flush();
        if (!out.good()) {
            throw PersistenceError("Failed to write world file: " + filename);
        }
        std::cout << "World saved to " << filename << " (" << world.size() << " hexes)" << std::endl;
    }

    // Загрузка мира из JSON файла. Повреждённый файл -> PersistenceError,
    // частично прочитанный мир наружу не отдаётся.
    static WorldModel load_json(const std::string& filename) {
        std::ifstream in(filename);
        if (!in.is_open()) {
            throw PersistenceError("Failed to open world file: " + filename);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        json j;
        try {
            j = json::parse(buffer.str());
        } catch (const json::parse_error& e) {
            throw PersistenceError("World file is not valid JSON: " + filename + ": " + e.what());
        }
        WorldModel world = from_json(j);
        std::cout << "World loaded from " << filename << " (" << world.size() << " hexes)" << std::endl;
        return world;
    }

    static std::string dump(const WorldModel& world) {
        return to_json(world).dump(4) + "\n";
    }

    static json to_json(const WorldModel& world) {
        json j;
        j["format"] = FORMAT_NAME;
        j["version"] = FORMAT_VERSION;

        json j_factions = json::array();
        for (const auto& [number, f] : world.get_factions()) {
            j_factions.push_back({
                {"number", f.number},
                {"name", f.name},
                {"last_turn", f.last_turn}
            });
        }
        j["factions"] = j_factions;

        json j_regions = json::array();
        for (const auto& [coord, region] : world.get_regions()) {
            j_regions.push_back(region_to_json(region));
        }
        j["regions"] = j_regions;
        return j;
    }

    static WorldModel from_json(const json& j) {
        WorldModel world;
        try {
            if (!j.is_object()) throw PersistenceError("World file root is not an object");
            if (j.value("format", std::string()) != FORMAT_NAME) {
                throw PersistenceError("Unknown world file format");
            }
            int version = j.at("version").get<int>();
            if (version > FORMAT_VERSION) {
                throw PersistenceError("Unsupported world file version " + std::to_string(version));
            }

            if (j.contains("factions")) {
                for (const auto& f : j.at("factions")) {
                    FactionRecord rec;
                    rec.number = f.at("number").get<int>();
                    rec.name = f.value("name", std::string());
                    rec.last_turn = f.value("last_turn", 0);
                    world.put_faction(rec);
                }
            }

            for (const auto& r : j.at("regions")) {
                Region region = region_from_json(r);
                if (world.contains(region.coord)) {
                    throw PersistenceError("Duplicate hex in world file: " + region.coord.to_string());
                }
                world.put_region(region);
            }
        } catch (const json::exception& e) {
            throw PersistenceError(std::string("Corrupt world file: ") + e.what());
        }
        world.mark_clean();
        return world;
    }

private:
    static json coord_to_json(const HexCoord& c) {
        return {{"x", c.x}, {"y", c.y}, {"z", c.z}};
    }

    static HexCoord coord_from_json(const json& j) {
        return HexCoord(j.at("x").get<int>(), j.at("y").get<int>(), j.value("z", SURFACE_LEVEL));
    }

    static json items_to_json(const std::vector<ItemStack>& items) {
        json arr = json::array();
        for (const auto& it : items) {
            arr.push_back({{"name", it.name}, {"tag", it.tag}, {"amount", it.amount}});
        }
        return arr;
    }

    static std::vector<ItemStack> items_from_json(const json& arr) {
        std::vector<ItemStack> items;
        for (const auto& it : arr) {
            items.push_back({it.value("name", std::string()), it.value("tag", std::string()),
                             it.value("amount", 0)});
        }
        return items;
    }

    static json market_to_json(const std::vector<MarketEntry>& entries) {
        json arr = json::array();
        for (const auto& e : entries) {
            arr.push_back({{"name", e.name}, {"tag", e.tag}, {"amount", e.amount}, {"price", e.price}});
        }
        return arr;
    }

    static std::vector<MarketEntry> market_from_json(const json& arr) {
        std::vector<MarketEntry> entries;
        for (const auto& e : arr) {
            entries.push_back({e.value("name", std::string()), e.value("tag", std::string()),
                               e.value("amount", 0), e.value("price", 0)});
        }
        return entries;
    }

    static json settlement_to_json(const Settlement& s) {
        return {{"name", s.name}, {"size", s.size}};
    }

    static Settlement settlement_from_json(const json& j) {
        return {j.value("name", std::string()), j.value("size", std::string())};
    }

    static json unit_to_json(const Unit& u) {
        json j;
        j["number"] = u.number;
        j["name"] = u.name;
        if (u.faction) j["faction"] = {{"number", u.faction->number}, {"name", u.faction->name}};
        j["own_unit"] = u.own_unit;
        if (u.structure) j["structure"] = *u.structure;
        if (!u.description.empty()) j["description"] = u.description;
        j["items"] = items_to_json(u.items);

        json skills = json::array();
        for (const auto& s : u.skills) {
            skills.push_back({{"name", s.name}, {"tag", s.tag}, {"level", s.level}, {"days", s.days}});
        }
        j["skills"] = skills;

        json flags = json::object();
        for (const auto& [name, on] : u.flags) flags[name] = on;
        j["flags"] = flags;
        j["orders"] = u.orders;
        return j;
    }

    static Unit unit_from_json(const json& j) {
        Unit u;
        u.number = j.at("number").get<int>();
        u.name = j.value("name", std::string());
        if (j.contains("faction")) {
            const auto& f = j.at("faction");
            u.faction = FactionRef{f.at("number").get<int>(), f.value("name", std::string())};
        }
        u.own_unit = j.value("own_unit", false);
        if (j.contains("structure")) u.structure = j.at("structure").get<int>();
        u.description = j.value("description", std::string());
        if (j.contains("items")) u.items = items_from_json(j.at("items"));
        if (j.contains("skills")) {
            for (const auto& s : j.at("skills")) {
                u.skills.push_back({s.value("name", std::string()), s.value("tag", std::string()),
                                    s.value("level", 0), s.value("days", 0)});
            }
        }
        if (j.contains("flags")) {
            for (auto it = j.at("flags").begin(); it != j.at("flags").end(); ++it) {
                u.flags[it.key()] = it.value().get<bool>();
            }
        }
        if (j.contains("orders")) u.orders = j.at("orders").get<std::vector<std::string>>();
        return u;
    }

    static json event_to_json(const TurnEvent& e) {
        json j;
        j["message"] = e.message;
        j["category"] = e.category;
        if (e.unit_number) j["unit"] = *e.unit_number;
        if (e.coord) j["coord"] = coord_to_json(*e.coord);
        return j;
    }

    static TurnEvent event_from_json(const json& j) {
        TurnEvent e;
        e.message = j.at("message").get<std::string>();
        e.category = j.value("category", std::string());
        if (j.contains("unit")) e.unit_number = j.at("unit").get<int>();
        if (j.contains("coord")) e.coord = coord_from_json(j.at("coord"));
        return e;
    }

    static json region_to_json(const Region& r) {
        json j;
        j["coord"] = coord_to_json(r.coord);
        j["detail"] = region_detail_to_string(r.detail);
        j["turn_seen"] = r.turn_seen;
        j["terrain"] = r.terrain;
        j["province"] = r.province;
        if (r.settlement) j["settlement"] = settlement_to_json(*r.settlement);
        if (r.weather) j["weather"] = {{"current", r.weather->current}, {"next", r.weather->next}};
        if (r.population) j["population"] = {{"amount", r.population->amount}, {"race", r.population->race}};
        if (r.tax) j["tax"] = *r.tax;
        if (r.wages) j["wages"] = {{"amount", r.wages->amount}, {"max", r.wages->max}};
        if (r.entertainment) j["entertainment"] = *r.entertainment;
        j["products"] = items_to_json(r.products);
        j["markets"] = {
            {"for_sale", market_to_json(r.markets.for_sale)},
            {"wanted", market_to_json(r.markets.wanted)}
        };

        json exits = json::array();
        for (const auto& e : r.exits) {
            json je;
            je["direction"] = e.direction;
            je["coord"] = coord_to_json(e.coord);
            je["terrain"] = e.terrain;
            je["province"] = e.province;
            if (e.settlement) je["settlement"] = settlement_to_json(*e.settlement);
            exits.push_back(je);
        }
        j["exits"] = exits;

        json structures = json::array();
        for (const auto& s : r.structures) {
            structures.push_back({{"number", s.number}, {"name", s.name}, {"type", s.type}});
        }
        j["structures"] = structures;

        json units = json::array();
        for (const auto& u : r.units) units.push_back(unit_to_json(u));
        j["units"] = units;

        json events = json::array();
        for (const auto& e : r.events) events.push_back(event_to_json(e));
        j["events"] = events;
        return j;
    }

    static Region region_from_json(const json& j) {
        Region r;
        r.coord = coord_from_json(j.at("coord"));
        auto detail = region_detail_from_string(j.value("detail", std::string("full")));
        if (!detail) throw PersistenceError("Unknown region detail at " + r.coord.to_string());
        r.detail = *detail;
        r.turn_seen = j.value("turn_seen", 0);
        r.terrain = j.value("terrain", std::string());
        r.province = j.value("province", std::string());
        if (j.contains("settlement")) r.settlement = settlement_from_json(j.at("settlement"));
        if (j.contains("weather")) {
            const auto& w = j.at("weather");
            r.weather = Weather{w.value("current", std::string()), w.value("next", std::string())};
        }
        if (j.contains("population")) {
            const auto& p = j.at("population");
            r.population = Population{p.value("amount", 0), p.value("race", std::string())};
        }
        if (j.contains("tax")) r.tax = j.at("tax").get<int>();
        if (j.contains("wages")) {
            const auto& w = j.at("wages");
            r.wages = Wages{w.value("amount", 0.0), w.value("max", 0)};
        }
        if (j.contains("entertainment")) r.entertainment = j.at("entertainment").get<int>();
        if (j.contains("products")) r.products = items_from_json(j.at("products"));
        if (j.contains("markets")) {
            const auto& m = j.at("markets");
            if (m.contains("for_sale")) r.markets.for_sale = market_from_json(m.at("for_sale"));
            if (m.contains("wanted")) r.markets.wanted = market_from_json(m.at("wanted"));
        }
        if (j.contains("exits")) {
            for (const auto& je : j.at("exits")) {
                Exit e;
                e.direction = je.value("direction", std::string());
                e.coord = coord_from_json(je.at("coord"));
                e.terrain = je.value("terrain", std::string());
                e.province = je.value("province", std::string());
                if (je.contains("settlement")) e.settlement = settlement_from_json(je.at("settlement"));
                r.exits.push_back(e);
            }
        }
        if (j.contains("structures")) {
            for (const auto& s : j.at("structures")) {
                r.structures.push_back({s.at("number").get<int>(), s.value("name", std::string()),
                                        s.value("type", std::string())});
            }
        }
        if (j.contains("units")) {
            for (const auto& u : j.at("units")) r.units.push_back(unit_from_json(u));
        }
        if (j.contains("events")) {
            for (const auto& e : j.at("events")) r.events.push_back(event_from_json(e));
        }
        return r;
    }
};
