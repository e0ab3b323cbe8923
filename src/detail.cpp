#include "detail.hpp"
#include "map_scene.hpp"
#include <cctype>
#include <sstream>

namespace {

std::string capitalize(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

std::string format_number(double v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

const char* yes_no(bool v) {
    return v ? "yes" : "no";
}

std::string format_market_entry(const MarketEntry& e) {
    std::ostringstream ss;
    ss << e.name;
    if (!e.tag.empty()) ss << " [" << e.tag << "]";
    ss << ": " << e.amount << " at " << e.price << " silver";
    return ss.str();
}

} // namespace

const DetailSection* HexDetail::find_section(const std::string& name) const {
    for (const auto& s : sections) {
        if (s.title == name) return &s;
    }
    return nullptr;
}

DetailPresenter::DetailPresenter(const WorldModel& world) : world(world) {}

DetailPresenter::~DetailPresenter() {
    detach();
}

void DetailPresenter::attach(MapScene& s) {
    detach();
    scene = &s;
    subscription = s.subscribe([this](const std::optional<HexCoord>& coord) {
        current_coord = coord;
        refresh();
    });
    current_coord = s.get_selection();
    refresh();
}

void DetailPresenter::detach() {
    if (scene) scene->unsubscribe(subscription);
    scene = nullptr;
    subscription = 0;
}

void DetailPresenter::refresh() {
    if (current_coord) {
        current_detail = describe(*current_coord);
    } else {
        current_detail.reset();
    }
}

std::string DetailPresenter::format_unit(const Unit& unit, const Region& region) {
    std::ostringstream ss;
    ss << unit.name << " (" << unit.number << ")";
    if (unit.faction) {
        ss << ", " << (unit.faction->name.empty() ? "Faction" : unit.faction->name)
           << " (" << unit.faction->number << ")";
    }
    if (unit.own_unit) ss << " [own]";
    if (unit.structure) {
        const Structure* st = region.find_structure(*unit.structure);
        ss << " in " << (st ? st->name : "structure") << " [" << *unit.structure << "]";
    }

    std::vector<std::string> flags;
    for (const auto& [flag, on] : unit.flags) {
        if (on) flags.push_back(flag);
    }
    if (!flags.empty()) {
        ss << " {";
        for (size_t i = 0; i < flags.size(); ++i) ss << (i ? ", " : "") << flags[i];
        ss << "}";
    }

    if (!unit.items.empty()) {
        ss << "; ";
        for (size_t i = 0; i < unit.items.size(); ++i) {
            ss << (i ? ", " : "") << unit.items[i].amount << "x " << unit.items[i].name;
        }
    }

    if (!unit.skills.empty()) {
        ss << "; skills: ";
        for (size_t i = 0; i < unit.skills.size(); ++i) {
            const auto& sk = unit.skills[i];
            ss << (i ? ", " : "") << sk.name << " " << sk.level << " (" << sk.days << ")";
        }
    }
    return ss.str();
}

HexDetail DetailPresenter::describe(const HexCoord& coord) const {
    HexDetail detail;
    detail.coord = coord;

    const Region* region = world.get_region(coord);
    if (!region) {
        detail.discovered = false;
        detail.title = "Hex " + coord.to_string();
        detail.sections.push_back({"Overview", {"undiscovered"}});
        return detail;
    }

    detail.discovered = true;
    std::string terrain = region->terrain.empty() ? "unknown" : region->terrain;
    detail.title = terrain + " " + coord.to_string();
    if (!region->province.empty()) detail.title += " in " + capitalize(region->province);

    DetailSection overview{"Overview", {}};
    overview.lines.push_back("Terrain: " + terrain);
    if (!region->province.empty()) overview.lines.push_back("Province: " + capitalize(region->province));
    if (region->weather) {
        std::string w = "Weather: " + region->weather->current;
        if (!region->weather->next.empty()) w += " (next: " + region->weather->next + ")";
        overview.lines.push_back(w);
    }
    overview.lines.push_back("Last seen: turn " + std::to_string(region->turn_seen));
    if (region->detail == RegionDetail::EXIT) {
        overview.lines.push_back("Known only from a neighbour's exits");
    }
    detail.sections.push_back(overview);

    if (region->settlement) {
        detail.sections.push_back({"Settlement", {"Contains: " + region->settlement->name + " (" +
                                                  region->settlement->size + ")"}});
    }

    if (region->detail == RegionDetail::EXIT) return detail;

    DetailSection economy{"Economy", {}};
    economy.lines.push_back("Tax Rate: " + (region->tax ? std::to_string(*region->tax) : std::string("Not available")));
    if (region->wages) {
        economy.lines.push_back("Max Wages: " + format_number(region->wages->amount) +
                                " (Max: " + std::to_string(region->wages->max) + ")");
    }
    if (region->population) {
        economy.lines.push_back("Population: " + std::to_string(region->population->amount) +
                                " (" + region->population->race + ")");
    }
    if (region->entertainment) {
        economy.lines.push_back("Entertainment available: " + std::to_string(*region->entertainment));
    }
    detail.sections.push_back(economy);

    DetailSection products{"Products", {}};
    for (const auto& p : region->products) {
        products.lines.push_back(p.name + ": " + std::to_string(p.amount));
    }
    if (products.lines.empty()) products.lines.push_back("None");
    detail.sections.push_back(products);

    if (region->markets.empty()) {
        detail.sections.push_back({"Market", {"No market information available."}});
    } else {
        DetailSection sale{"For Sale", {}};
        for (const auto& e : region->markets.for_sale) sale.lines.push_back(format_market_entry(e));
        if (sale.lines.empty()) sale.lines.push_back("None");
        detail.sections.push_back(sale);

        DetailSection wanted{"Wanted", {}};
        for (const auto& e : region->markets.wanted) wanted.lines.push_back(format_market_entry(e));
        if (wanted.lines.empty()) wanted.lines.push_back("None");
        detail.sections.push_back(wanted);
    }

    if (!region->structures.empty()) {
        DetailSection structures{"Structures", {}};
        for (const auto& s : region->structures) {
            structures.lines.push_back(s.name + " [" + std::to_string(s.number) + "]" +
                                       (s.type.empty() ? "" : " : " + s.type));
        }
        detail.sections.push_back(structures);
    }

    DetailSection units{"Units", {}};
    DetailSection orders{"Orders", {}};
    for (const auto& u : region->units) {
        units.lines.push_back(format_unit(u, *region));
        if (u.own_unit) {
            for (const auto& o : u.orders) {
                orders.lines.push_back(u.name + " (" + std::to_string(u.number) + "): " + o);
            }
        }
    }
    if (units.lines.empty()) units.lines.push_back("None");
    detail.sections.push_back(units);
    if (!orders.lines.empty()) detail.sections.push_back(orders);

    if (!region->events.empty()) {
        DetailSection events{"Events", {}};
        for (const auto& e : region->events) {
            events.lines.push_back(e.category.empty() ? e.message : "[" + e.category + "] " + e.message);
        }
        detail.sections.push_back(events);
    }

    if (!region->exits.empty()) {
        DetailSection exits{"Exits", {}};
        for (const auto& e : region->exits) {
            exits.lines.push_back(e.direction + ": " + (e.terrain.empty() ? "unknown" : e.terrain) + " " +
                                  e.coord.to_string());
        }
        detail.sections.push_back(exits);
    }

    return detail;
}

DetailSection DetailPresenter::describe_report(const TurnReport& report) {
    DetailSection section{"Report", {}};
    section.lines.push_back(report.faction_name + " (" + std::to_string(report.faction_number) + ")");

    std::string turn = "Turn " + std::to_string(report.turn);
    if (report.date) turn += ", " + report.date->month + " year " + std::to_string(report.date->year);
    section.lines.push_back(turn);

    section.lines.push_back(report.engine.ruleset + " " + report.engine.ruleset_version +
                            " (engine " + report.engine.version + ")");
    section.lines.push_back("Default attitude: " + report.default_attitude);
    if (!report.administrative.email.empty()) {
        section.lines.push_back("Email: " + report.administrative.email);
    }
    section.lines.push_back(std::string("Password unset: ") + yes_no(report.administrative.password_unset) +
                            ", times sent: " + yes_no(report.administrative.times_sent));
    section.lines.push_back(std::string("Show unit attitudes: ") +
                            yes_no(report.administrative.show_unit_attitudes));
    return section;
}

std::string DetailPresenter::to_text(const HexDetail& detail) {
    std::ostringstream ss;
    ss << detail.title << "\n";
    for (const auto& section : detail.sections) {
        ss << "\n" << section.title << "\n";
        for (const auto& line : section.lines) ss << "  " << line << "\n";
    }
    return ss.str();
}
