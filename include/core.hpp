#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

struct Color {
    int r, g, b;
};

bool operator==(const Color& a, const Color& b);
bool operator!=(const Color& a, const Color& b);

// Уровень карты по умолчанию (поверхность). 0 - Nexus, 2+ - подземелья.
constexpr int SURFACE_LEVEL = 1;

// Координата гекса в системе отчёта: x - столбец, y - "удвоенная" строка,
// у соседей по вертикали y отличается на 2, у настоящих клеток (x + y) чётно.
struct HexCoord {
    int x = 0;
    int y = 0;
    int z = SURFACE_LEVEL;

    HexCoord() = default;
    HexCoord(int x, int y, int z = SURFACE_LEVEL) : x(x), y(y), z(z) {}

    // true, если (x, y) попадает в центр клетки гексагональной решётки
    bool is_cell() const { return (x + y) % 2 == 0; }

    std::string to_string() const;
};

bool operator==(const HexCoord& a, const HexCoord& b);
bool operator!=(const HexCoord& a, const HexCoord& b);
bool operator<(const HexCoord& a, const HexCoord& b);

// Предмет/товар в отряде или в списке продукции региона
struct ItemStack {
    std::string name;
    std::string tag;
    int amount = 0;
};

struct MarketEntry {
    std::string name;
    std::string tag;
    int amount = 0;
    int price = 0;
};

struct SkillEntry {
    std::string name;
    std::string tag;
    int level = 0;
    int days = 0;
};

struct FactionRef {
    int number = 0;
    std::string name;
};

struct Unit {
    int number = 0;                       // Идентификатор отряда (уникален в игре)
    std::string name;
    std::optional<FactionRef> faction;    // У чужих отрядов фракция может быть скрыта
    bool own_unit = false;
    std::optional<int> structure;         // Номер здания/корабля, внутри которого стоит отряд
    std::string description;
    std::vector<ItemStack> items;
    std::vector<SkillEntry> skills;
    std::map<std::string, bool> flags;    // guard, avoid, behind, ...
    std::vector<std::string> orders;      // Только для своих отрядов
};

struct Settlement {
    std::string name;
    std::string size;   // village, town, city
};

struct Structure {
    int number = 0;
    std::string name;
    std::string type;
};

struct Weather {
    std::string current;
    std::string next;
};

struct Population {
    int amount = 0;
    std::string race;
};

struct Wages {
    double amount = 0.0;
    int max = 0;
};

struct MarketInfo {
    std::vector<MarketEntry> for_sale;
    std::vector<MarketEntry> wanted;

    bool empty() const { return for_sale.empty() && wanted.empty(); }
};

// Выход из региона в соседний гекс (и то немногое, что о нём видно)
struct Exit {
    std::string direction;
    HexCoord coord;
    std::string terrain;
    std::string province;
    std::optional<Settlement> settlement;
};

struct TurnEvent {
    std::string message;
    std::string category;
    std::optional<int> unit_number;
    std::optional<HexCoord> coord;
};

enum class RegionDetail {
    EXIT,   // Известен только как сосед из списка выходов
    FULL    // Фракция видела гекс целиком
};

// Последнее известное состояние одного гекса
struct Region {
    HexCoord coord;
    std::string terrain;
    std::string province;
    std::optional<Settlement> settlement;
    std::optional<Weather> weather;
    std::optional<Population> population;
    std::optional<int> tax;
    std::optional<Wages> wages;
    std::optional<int> entertainment;
    std::vector<ItemStack> products;
    MarketInfo markets;
    std::vector<Exit> exits;
    std::vector<Structure> structures;
    std::vector<Unit> units;
    std::vector<TurnEvent> events;
    int turn_seen = 0;
    RegionDetail detail = RegionDetail::FULL;

    const Unit* find_unit(int number) const;
    const Structure* find_structure(int number) const;
    bool has_own_units() const;
    bool has_foreign_units() const;
};

bool operator==(const ItemStack& a, const ItemStack& b);
bool operator==(const MarketEntry& a, const MarketEntry& b);
bool operator==(const SkillEntry& a, const SkillEntry& b);
bool operator==(const FactionRef& a, const FactionRef& b);
bool operator==(const Unit& a, const Unit& b);
bool operator==(const Settlement& a, const Settlement& b);
bool operator==(const Structure& a, const Structure& b);
bool operator==(const Weather& a, const Weather& b);
bool operator==(const Population& a, const Population& b);
bool operator==(const Wages& a, const Wages& b);
bool operator==(const MarketInfo& a, const MarketInfo& b);
bool operator==(const Exit& a, const Exit& b);
bool operator==(const TurnEvent& a, const TurnEvent& b);
bool operator==(const Region& a, const Region& b);
bool operator!=(const Region& a, const Region& b);

std::string region_detail_to_string(RegionDetail detail);
std::optional<RegionDetail> region_detail_from_string(const std::string& s);
