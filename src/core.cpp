#include "core.hpp"
#include <sstream>
#include <tuple>

bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

bool operator!=(const Color& a, const Color& b) {
    return !(a == b);
}

std::string HexCoord::to_string() const {
    std::stringstream ss;
    ss << "(" << x << ", " << y;
    if (z != SURFACE_LEVEL) ss << ", " << z;
    ss << ")";
    return ss.str();
}

bool operator==(const HexCoord& a, const HexCoord& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

bool operator!=(const HexCoord& a, const HexCoord& b) {
    return !(a == b);
}

bool operator<(const HexCoord& a, const HexCoord& b) {
    return std::tie(a.x, a.y, a.z) < std::tie(b.x, b.y, b.z);
}

const Unit* Region::find_unit(int number) const {
    for (const auto& u : units) {
        if (u.number == number) return &u;
    }
    return nullptr;
}

const Structure* Region::find_structure(int number) const {
    for (const auto& s : structures) {
        if (s.number == number) return &s;
    }
    return nullptr;
}

bool Region::has_own_units() const {
    for (const auto& u : units) {
        if (u.own_unit) return true;
    }
    return false;
}

bool Region::has_foreign_units() const {
    for (const auto& u : units) {
        if (!u.own_unit) return true;
    }
    return false;
}

bool operator==(const ItemStack& a, const ItemStack& b) {
    return a.name == b.name && a.tag == b.tag && a.amount == b.amount;
}

bool operator==(const MarketEntry& a, const MarketEntry& b) {
    return a.name == b.name && a.tag == b.tag && a.amount == b.amount && a.price == b.price;
}

bool operator==(const SkillEntry& a, const SkillEntry& b) {
    return a.name == b.name && a.tag == b.tag && a.level == b.level && a.days == b.days;
}

bool operator==(const FactionRef& a, const FactionRef& b) {
    return a.number == b.number && a.name == b.name;
}

bool operator==(const Unit& a, const Unit& b) {
    return a.number == b.number
        && a.name == b.name
        && a.faction == b.faction
        && a.own_unit == b.own_unit
        && a.structure == b.structure
        && a.description == b.description
        && a.items == b.items
        && a.skills == b.skills
        && a.flags == b.flags
        && a.orders == b.orders;
}

bool operator==(const Settlement& a, const Settlement& b) {
    return a.name == b.name && a.size == b.size;
}

bool operator==(const Structure& a, const Structure& b) {
    return a.number == b.number && a.name == b.name && a.type == b.type;
}

bool operator==(const Weather& a, const Weather& b) {
    return a.current == b.current && a.next == b.next;
}

bool operator==(const Population& a, const Population& b) {
    return a.amount == b.amount && a.race == b.race;
}

bool operator==(const Wages& a, const Wages& b) {
    return a.amount == b.amount && a.max == b.max;
}

bool operator==(const MarketInfo& a, const MarketInfo& b) {
    return a.for_sale == b.for_sale && a.wanted == b.wanted;
}

bool operator==(const Exit& a, const Exit& b) {
    return a.direction == b.direction
        && a.coord == b.coord
        && a.terrain == b.terrain
        && a.province == b.province
        && a.settlement == b.settlement;
}

bool operator==(const TurnEvent& a, const TurnEvent& b) {
    return a.message == b.message
        && a.category == b.category
        && a.unit_number == b.unit_number
        && a.coord == b.coord;
}

bool operator==(const Region& a, const Region& b) {
    return a.coord == b.coord
        && a.terrain == b.terrain
        && a.province == b.province
        && a.settlement == b.settlement
        && a.weather == b.weather
        && a.population == b.population
        && a.tax == b.tax
        && a.wages == b.wages
        && a.entertainment == b.entertainment
        && a.products == b.products
        && a.markets == b.markets
        && a.exits == b.exits
        && a.structures == b.structures
        && a.units == b.units
        && a.events == b.events
        && a.turn_seen == b.turn_seen
        && a.detail == b.detail;
}

bool operator!=(const Region& a, const Region& b) {
    return !(a == b);
}

std::string region_detail_to_string(RegionDetail detail) {
    switch (detail) {
        case RegionDetail::EXIT: return "exit";
        case RegionDetail::FULL: default: return "full";
    }
}

std::optional<RegionDetail> region_detail_from_string(const std::string& s) {
    if (s == "full") return RegionDetail::FULL;
    if (s == "exit") return RegionDetail::EXIT;
    return std::nullopt;
}
