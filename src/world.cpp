#include "world.hpp"
#include <algorithm>
#include <set>

std::string departed_policy_to_string(DepartedUnitPolicy policy) {
    switch (policy) {
        case DepartedUnitPolicy::REMOVE: return "remove";
        case DepartedUnitPolicy::RETAIN: default: return "retain";
    }
}

std::optional<DepartedUnitPolicy> departed_policy_from_string(const std::string& s) {
    if (s == "retain") return DepartedUnitPolicy::RETAIN;
    if (s == "remove") return DepartedUnitPolicy::REMOVE;
    return std::nullopt;
}

bool operator==(const FactionRecord& a, const FactionRecord& b) {
    return a.number == b.number && a.name == b.name && a.last_turn == b.last_turn;
}

bool operator==(const WorldModel& a, const WorldModel& b) {
    return a.get_regions() == b.get_regions() && a.get_factions() == b.get_factions();
}

bool operator!=(const WorldModel& a, const WorldModel& b) {
    return !(a == b);
}

void WorldModel::touch() {
    dirty = true;
    ++revision;
}

const Region* WorldModel::get_region(const HexCoord& coord) const {
    auto it = regions.find(coord);
    if (it == regions.end()) return nullptr;
    return &it->second;
}

std::vector<int> WorldModel::get_levels() const {
    std::set<int> levels;
    for (const auto& [coord, region] : regions) levels.insert(coord.z);
    return std::vector<int>(levels.begin(), levels.end());
}

std::optional<HexCoord> WorldModel::locate_unit(int number) const {
    for (const auto& [coord, region] : regions) {
        if (region.find_unit(number)) return coord;
    }
    return std::nullopt;
}

void WorldModel::put_region(const Region& region) {
    regions[region.coord] = region;
    touch();
}

void WorldModel::put_faction(const FactionRecord& faction) {
    factions[faction.number] = faction;
    touch();
}

void WorldModel::clear() {
    if (regions.empty() && factions.empty()) return;
    regions.clear();
    factions.clear();
    touch();
}

MergeResult WorldModel::merge(const TurnReport& report, const MergeOptions& options) {
    MergeResult result;
    const int turn = report.turn;

    // Снимки одного отчёта могут менять гекс несколько раз (повтор координаты,
    // переезд отряда), поэтому итог считается по разнице с состоянием до отчёта
    const std::map<HexCoord, Region> before = regions;

    // Где каждый отряд стоял до этого отчёта
    std::map<int, HexCoord> known_units;
    for (const auto& [coord, region] : regions) {
        for (const auto& u : region.units) known_units[u.number] = coord;
    }

    // События хода раскладываются по гексам: по региону события,
    // либо по гексу, где в этом отчёте стоит упомянутый отряд
    std::map<int, HexCoord> units_in_report;
    for (const auto& s : report.regions) {
        if (!s.coord) continue;
        for (const auto& u : s.region.units) units_in_report[u.number] = *s.coord;
    }

    std::map<HexCoord, std::vector<TurnEvent>> events;
    for (const auto& e : report.events) {
        std::optional<HexCoord> where = e.coord;
        if (!where && e.unit_number) {
            auto it = units_in_report.find(*e.unit_number);
            if (it != units_in_report.end()) where = it->second;
        }
        if (!where) continue;

        auto& list = events[*where];
        bool duplicate = std::any_of(list.begin(), list.end(),
                                     [&](const TurnEvent& other) { return other.message == e.message; });
        if (!duplicate) list.push_back(e);
    }

    // Полные снимки - в порядке файла, так что при повторе координаты побеждает последний
    std::vector<const RegionSnapshot*> applied;
    for (const auto& s : report.regions) {
        if (merge_region(s, turn, options, events, known_units, result)) {
            applied.push_back(&s);
        }
    }

    // Соседи из списков выходов - после всех полных снимков
    for (const auto* s : applied) {
        for (const auto& exit : s->region.exits) {
            merge_exit(exit, turn);
        }
    }

    // Отряд может быть только в одном месте
    std::map<int, HexCoord> moved;
    for (const auto* s : applied) {
        const Region* r = get_region(*s->coord);
        if (!r) continue;
        for (const auto& u : r->units) {
            if (s->region.find_unit(u.number)) moved[u.number] = *s->coord;
        }
    }
    for (const auto& [number, coord] : moved) {
        relocate_unit(number, coord, turn);
    }

    std::set<HexCoord> applied_coords;
    for (const auto* s : applied) applied_coords.insert(*s->coord);

    bool changed = false;
    for (const auto& [coord, region] : regions) {
        auto b = before.find(coord);
        if (b == before.end()) {
            result.inserted++;
            changed = true;
        } else if (!(b->second == region)) {
            result.updated++;
            changed = true;
        } else if (applied_coords.count(coord)) {
            result.unchanged++;
        }
    }

    auto fit = factions.find(report.faction_number);
    FactionRecord faction;
    faction.number = report.faction_number;
    faction.name = report.faction_name;
    faction.last_turn = turn;
    if (fit != factions.end()) {
        if (faction.name.empty() || faction.name == "Unknown") faction.name = fit->second.name;
        faction.last_turn = std::max(fit->second.last_turn, turn);
    }
    if (fit == factions.end() || !(fit->second == faction)) {
        factions[faction.number] = faction;
        changed = true;
    }
    if (changed) touch();

    return result;
}

bool WorldModel::merge_region(const RegionSnapshot& snapshot, int turn, const MergeOptions& options,
                              const std::map<HexCoord, std::vector<TurnEvent>>& events,
                              const std::map<int, HexCoord>& known_units, MergeResult& result) {
    if (!snapshot.coord) {
        result.skipped++;
        result.warnings.push_back({std::nullopt, "Region entry without coordinates skipped"});
        return false;
    }
    const HexCoord coord = *snapshot.coord;

    if (snapshot.units_without_number > 0) {
        result.warnings.push_back({coord, std::to_string(snapshot.units_without_number) +
                                              " unit entries without a valid number ignored"});
    }

    auto it = regions.find(coord);
    if (it != regions.end() && it->second.detail == RegionDetail::FULL && it->second.turn_seen > turn) {
        result.skipped++;
        result.warnings.push_back({coord, "Snapshot from turn " + std::to_string(turn) +
                                              " is older than known state (turn " +
                                              std::to_string(it->second.turn_seen) + "), ignored"});
        return false;
    }

    Region incoming = snapshot.region;
    incoming.coord = coord;
    incoming.turn_seen = turn;
    incoming.detail = RegionDetail::FULL;
    auto ev = events.find(coord);
    if (ev != events.end()) {
        incoming.events = ev->second;
    } else {
        incoming.events.clear();
    }

    // Если отряд уже видели в другом гексе на более позднем ходу, этот снимок устарел для него
    incoming.units.erase(
        std::remove_if(incoming.units.begin(), incoming.units.end(), [&](const Unit& u) {
            auto k = known_units.find(u.number);
            if (k == known_units.end() || k->second == coord) return false;
            const Region* other = get_region(k->second);
            return other && other->turn_seen > turn;
        }),
        incoming.units.end());

    if (it == regions.end()) {
        regions.emplace(coord, incoming);
        return true;
    }

    Region& existing = it->second;
    if (options.departed_units == DepartedUnitPolicy::RETAIN) {
        for (const auto& u : existing.units) {
            if (!incoming.find_unit(u.number)) incoming.units.push_back(u);
        }
    }

    existing = incoming;
    return true;
}

void WorldModel::merge_exit(const Exit& exit, int turn) {
    auto it = regions.find(exit.coord);
    if (it == regions.end()) {
        Region r;
        r.coord = exit.coord;
        r.terrain = exit.terrain;
        r.province = exit.province;
        r.settlement = exit.settlement;
        r.turn_seen = turn;
        r.detail = RegionDetail::EXIT;
        regions.emplace(exit.coord, r);
        return;
    }

    // Данные выхода никогда не перекрывают полностью увиденный гекс
    Region& existing = it->second;
    if (existing.detail == RegionDetail::FULL || existing.turn_seen > turn) return;

    existing.terrain = exit.terrain;
    existing.province = exit.province;
    existing.settlement = exit.settlement;
    existing.turn_seen = turn;
}

void WorldModel::relocate_unit(int number, const HexCoord& coord, int turn) {
    for (auto& [other_coord, region] : regions) {
        if (other_coord == coord || region.turn_seen > turn) continue;
        region.units.erase(std::remove_if(region.units.begin(), region.units.end(),
                                          [&](const Unit& u) { return u.number == number; }),
                           region.units.end());
    }
}
