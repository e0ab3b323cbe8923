#include <catch2/catch.hpp>
#include "detail.hpp"
#include "map_scene.hpp"

namespace {
const std::string SAMPLE = std::string(HEXATLAS_TEST_DATA_DIR) + "/sample_report.json";
}

TEST_CASE("Undiscovered hex is described as such", "[detail]") {
    WorldModel world;
    DetailPresenter presenter(world);

    HexDetail d = presenter.describe(HexCoord(4, 2));
    CHECK_FALSE(d.discovered);
    REQUIRE(d.sections.size() == 1);
    CHECK(d.sections[0].lines == std::vector<std::string>{"undiscovered"});
}

TEST_CASE("Seen hex lists its sections in order", "[detail]") {
    WorldModel world;
    world.merge(ReportParser::parse_file(SAMPLE));
    DetailPresenter presenter(world);

    HexDetail d = presenter.describe(HexCoord(0, 0));
    CHECK(d.discovered);
    CHECK(d.title == "plain (0, 0) in Gelea");

    std::vector<std::string> titles;
    for (const auto& s : d.sections) titles.push_back(s.title);
    CHECK(titles == std::vector<std::string>{"Overview", "Settlement", "Economy", "Products", "For Sale",
                                             "Wanted", "Structures", "Units", "Orders", "Events", "Exits"});

    CHECK(d.find_section("Settlement")->lines[0] == "Contains: Basia (town)");

    const DetailSection* economy = d.find_section("Economy");
    REQUIRE(economy != nullptr);
    CHECK(economy->lines[0] == "Tax Rate: 250");
    CHECK(economy->lines[1] == "Max Wages: 12.5 (Max: 300)");
    CHECK(economy->lines[2] == "Population: 5000 (Plainsmen)");
    CHECK(economy->lines[3] == "Entertainment available: 80");

    const DetailSection* units = d.find_section("Units");
    REQUIRE(units != nullptr);
    REQUIRE(units->lines.size() == 3);
    CHECK(units->lines[0].find("Guards (7)") == 0);
    CHECK(units->lines[0].find("in Keep [1]") != std::string::npos);
    CHECK(units->lines[1].find("U1 (1), Wanderers (3) [own]") == 0);
    CHECK(units->lines[1].find("100x silver") != std::string::npos);

    const DetailSection* orders = d.find_section("Orders");
    REQUIRE(orders != nullptr);
    CHECK(orders->lines == std::vector<std::string>{"U1 (1): work", "U1 (1): study COMB"});

    const DetailSection* events = d.find_section("Events");
    REQUIRE(events != nullptr);
    CHECK(events->lines[0] == "[economy] U1 earns 30 silver.");
}

TEST_CASE("Hex without market data says so", "[detail]") {
    WorldModel world;
    world.merge(ReportParser::parse(R"({"number": 1, "turn": 1,
        "regions": [{"coordinates": {"x": 2, "y": 0}, "terrain": "forest"}]})"));
    DetailPresenter presenter(world);

    HexDetail d = presenter.describe(HexCoord(2, 0));
    REQUIRE(d.find_section("Market") != nullptr);
    CHECK(d.find_section("Market")->lines[0] == "No market information available.");
    CHECK(d.find_section("Products")->lines[0] == "None");
    CHECK(d.find_section("Economy")->lines[0] == "Tax Rate: Not available");
    CHECK(d.find_section("Orders") == nullptr);
}

TEST_CASE("Exit-only hex shows what the neighbour saw", "[detail]") {
    WorldModel world;
    world.merge(ReportParser::parse_file(SAMPLE));
    DetailPresenter presenter(world);

    HexDetail d = presenter.describe(HexCoord(0, -2));
    CHECK(d.discovered);
    CHECK(d.find_section("Economy") == nullptr);
    const auto& overview = d.find_section("Overview")->lines;
    CHECK(overview.back() == "Known only from a neighbour's exits");
}

TEST_CASE("Presenter follows the scene selection", "[detail]") {
    WorldModel world;
    HexLayout layout;
    MapScene scene(world, layout);
    DetailPresenter presenter(world);
    presenter.attach(scene);

    CHECK_FALSE(presenter.current().has_value());

    scene.select_hex(HexCoord(0, 0));
    REQUIRE(presenter.current().has_value());
    CHECK_FALSE(presenter.current()->discovered);

    // После импорта описание перечитывается
    world.merge(ReportParser::parse_file(SAMPLE));
    presenter.refresh();
    CHECK(presenter.current()->discovered);

    scene.clear_selection();
    CHECK_FALSE(presenter.current().has_value());

    presenter.detach();
    scene.select_hex(HexCoord(2, 0));
    CHECK_FALSE(presenter.current().has_value());
}

TEST_CASE("Text rendering includes the title and section lines", "[detail]") {
    WorldModel world;
    DetailPresenter presenter(world);
    std::string text = DetailPresenter::to_text(presenter.describe(HexCoord(1, 1)));
    CHECK(text.find("Hex (1, 1)") == 0);
    CHECK(text.find("  undiscovered") != std::string::npos);
}

TEST_CASE("Report header lists engine and administrative settings", "[detail]") {
    TurnReport report = ReportParser::parse_file(SAMPLE);
    DetailSection header = DetailPresenter::describe_report(report);

    CHECK(header.title == "Report");
    CHECK(header.lines == std::vector<std::string>{
        "Wanderers (3)",
        "Turn 1, January year 1",
        "Standard Atlantis 5.2.0 (engine 5.2.0)",
        "Default attitude: Neutral",
        "Email: wanderers@example.org",
        "Password unset: yes, times sent: no",
        "Show unit attitudes: no"});

    // Без заголовка в отчёте остаются значения по умолчанию
    TurnReport bare = ReportParser::parse(R"({"number": 2, "turn": 5})");
    DetailSection minimal = DetailPresenter::describe_report(bare);
    CHECK(minimal.lines[0] == "Unknown (2)");
    CHECK(minimal.lines[1] == "Turn 5");
    CHECK(minimal.lines[2] == "Unknown Unknown (engine Unknown)");
    CHECK(minimal.lines.size() == 6);
}
