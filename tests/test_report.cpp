#include <catch2/catch.hpp>
#include "report.hpp"

namespace {
const std::string SAMPLE = std::string(HEXATLAS_TEST_DATA_DIR) + "/sample_report.json";
}

TEST_CASE("Sample report header is read", "[report]") {
    TurnReport r = ReportParser::parse_file(SAMPLE);

    CHECK(r.faction_number == 3);
    CHECK(r.faction_name == "Wanderers");
    REQUIRE(r.date.has_value());
    CHECK(r.date->month == "January");
    CHECK(r.date->year == 1);
    CHECK(r.turn == 1);
    CHECK(r.engine.ruleset == "Standard Atlantis");
    CHECK(r.default_attitude == "Neutral");
    CHECK(r.administrative.email == "wanderers@example.org");
    CHECK(r.administrative.password_unset);
}

TEST_CASE("Sample report regions and units are read", "[report]") {
    TurnReport r = ReportParser::parse_file(SAMPLE);

    REQUIRE(r.regions.size() == 3);
    const RegionSnapshot& s = r.regions[0];
    REQUIRE(s.coord.has_value());
    CHECK(*s.coord == HexCoord(0, 0));
    CHECK(s.region.terrain == "plain");
    REQUIRE(s.region.settlement.has_value());
    CHECK(s.region.settlement->name == "Basia");
    CHECK(s.region.tax == 250);
    REQUIRE(s.region.wages.has_value());
    CHECK(s.region.wages->amount == Approx(12.5));
    CHECK(s.region.exits.size() == 2);
    CHECK(s.region.markets.for_sale.size() == 1);
    CHECK(s.units_without_number == 1);

    // Отряд из здания попадает в общий список с номером здания
    const Unit* guards = s.region.find_unit(7);
    REQUIRE(guards != nullptr);
    REQUIRE(guards->structure.has_value());
    CHECK(*guards->structure == 1);

    const Unit* u1 = s.region.find_unit(1);
    REQUIRE(u1 != nullptr);
    CHECK(u1->own_unit);
    CHECK_FALSE(u1->structure.has_value());
    CHECK(u1->items.size() == 2);
    REQUIRE(u1->skills.size() == 1);
    CHECK(u1->skills[0].days == 30);
    CHECK(u1->flags.at("guard"));
    CHECK(u1->orders == std::vector<std::string>{"work", "study COMB"});

    // Записи без координат остаются, но без coord
    CHECK_FALSE(r.regions[1].coord.has_value());
    CHECK_FALSE(r.regions[2].coord.has_value());

    CHECK(r.events.size() == 3);
    REQUIRE(r.events[0].unit_number.has_value());
    CHECK(*r.events[0].unit_number == 1);
}

TEST_CASE("Turn is derived from the game date", "[report]") {
    CHECK(ReportParser::turn_from_date("January", 1) == 1);
    CHECK(ReportParser::turn_from_date("december", 1) == 12);
    CHECK(ReportParser::turn_from_date("March", 2) == 15);
    CHECK(ReportParser::turn_from_date("Smarch", 2) == -1);
    CHECK(ReportParser::turn_from_date("March", 0) == -1);

    TurnReport r = ReportParser::parse(R"({"number": 5, "date": {"month": "March", "year": 2}})");
    CHECK(r.turn == 15);
    CHECK(r.faction_name == "Unknown");

    TurnReport explicit_turn = ReportParser::parse(R"({"number": 5, "turn": 40, "date": {"month": "March", "year": 2}})");
    CHECK(explicit_turn.turn == 40);
}

TEST_CASE("Faction can come from a nested object", "[report]") {
    TurnReport r = ReportParser::parse(R"({"faction": {"number": 12, "name": "Nested"}, "turn": 3})");
    CHECK(r.faction_number == 12);
    CHECK(r.faction_name == "Nested");
}

TEST_CASE("Malformed reports raise ParseError", "[report]") {
    CHECK_THROWS_AS(ReportParser::parse("{not json"), ParseError);
    CHECK_THROWS_AS(ReportParser::parse("[1, 2, 3]"), ParseError);
    CHECK_THROWS_AS(ReportParser::parse(R"({"turn": 1})"), ParseError);
    CHECK_THROWS_AS(ReportParser::parse(R"({"number": 1})"), ParseError);
    CHECK_THROWS_AS(ReportParser::parse(R"({"number": 1, "date": {"month": "Smarch", "year": 1}})"), ParseError);
    CHECK_THROWS_AS(ReportParser::parse_file("/nonexistent/report.json"), ParseError);
}

TEST_CASE("Wrongly typed fields read as absent", "[report]") {
    TurnReport r = ReportParser::parse(R"({
        "number": 1, "turn": 2,
        "regions": [{"coordinates": {"x": 2, "y": 0}, "terrain": 5, "tax": "lots",
                     "units": [{"number": 4, "items": "none", "orders": [1, "move N"]}]}]
    })");
    REQUIRE(r.regions.size() == 1);
    const Region& region = r.regions[0].region;
    CHECK(region.terrain.empty());
    CHECK_FALSE(region.tax.has_value());
    REQUIRE(region.units.size() == 1);
    CHECK(region.units[0].items.empty());
    CHECK(region.units[0].orders == std::vector<std::string>{"move N"});
}

TEST_CASE("Coordinates carry the level", "[report]") {
    TurnReport r = ReportParser::parse(R"({"number": 1, "turn": 2,
        "regions": [{"coordinates": {"x": 1, "y": 1, "z": 2}, "terrain": "tunnels"}]})");
    REQUIRE(r.regions[0].coord.has_value());
    CHECK(*r.regions[0].coord == HexCoord(1, 1, 2));
}

TEST_CASE("Out-of-range numbers read as absent", "[report]") {
    TurnReport r = ReportParser::parse(R"({"number": 1, "turn": 2,
        "regions": [{"coordinates": {"x": 0, "y": 0}, "terrain": "plain", "tax": 1e12,
                     "units": [{"number": 1, "name": "U1"},
                               {"number": 4294967297, "name": "Wrapped"},
                               {"number": -9999999999, "name": "Negative"}]}]})");
    const RegionSnapshot& s = r.regions[0];
    CHECK_FALSE(s.region.tax.has_value());
    REQUIRE(s.region.units.size() == 1);
    CHECK(s.region.units[0].name == "U1");
    CHECK(s.units_without_number == 2);

    // Координата вне диапазона - снимок без координат
    TurnReport far = ReportParser::parse(R"({"number": 1, "turn": 2,
        "regions": [{"coordinates": {"x": 3000000000, "y": 0}, "terrain": "plain"}]})");
    CHECK_FALSE(far.regions[0].coord.has_value());
}

TEST_CASE("Out-of-range turn or faction is rejected", "[report]") {
    CHECK_THROWS_AS(ReportParser::parse(R"({"number": 1, "turn": 1e20})"), ParseError);
    CHECK_THROWS_AS(ReportParser::parse(R"({"number": 1, "turn": 18446744073709551615})"), ParseError);
    CHECK_THROWS_AS(ReportParser::parse(R"({"number": 4294967297, "turn": 1})"), ParseError);

    TurnReport r = ReportParser::parse(R"({"number": 1, "turn": 7.0})");
    CHECK(r.turn == 7);
}

TEST_CASE("Huge years do not overflow the turn number", "[report]") {
    CHECK(ReportParser::turn_from_date("March", 2147483646) == -1);
    CHECK(ReportParser::turn_from_date("December", 178956970) == 2147483640);
    CHECK(ReportParser::turn_from_date("January", 178956971) == -1);
    CHECK_THROWS_AS(ReportParser::parse(R"({"number": 1, "date": {"month": "March", "year": 2147483646}})"),
                    ParseError);
}
