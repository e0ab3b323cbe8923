#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core.hpp"
#include "report.hpp"

// Что делать с отрядами, которые раньше стояли в гексе, а в новом
// отчёте по этому гексу не упомянуты
enum class DepartedUnitPolicy {
    RETAIN,   // оставить последнее известное состояние
    REMOVE    // считать, что отряд ушёл
};

std::string departed_policy_to_string(DepartedUnitPolicy policy);
std::optional<DepartedUnitPolicy> departed_policy_from_string(const std::string& s);

struct MergeOptions {
    DepartedUnitPolicy departed_units = DepartedUnitPolicy::RETAIN;
};

// Некритичная проблема в отдельной записи отчёта; остальная часть отчёта применяется
struct MergeWarning {
    std::optional<HexCoord> coord;
    std::string message;
};

struct MergeResult {
    int inserted = 0;    // новые гексы (включая известные только по выходам)
    int updated = 0;     // гексы, состояние которых изменилось
    int unchanged = 0;   // гексы, где новый снимок ничего не поменял
    int skipped = 0;     // записи без координат или старее известного состояния
    std::vector<MergeWarning> warnings;

    bool changed() const { return inserted > 0 || updated > 0; }
};

struct FactionRecord {
    int number = 0;
    std::string name;
    int last_turn = 0;
};

bool operator==(const FactionRecord& a, const FactionRecord& b);

// Накопленная карта мира: для каждого гекса - последнее известное состояние.
// Единственный сохраняемый агрегат; меняется только через merge() и загрузку.
class WorldModel {
public:
    WorldModel() = default;

    MergeResult merge(const TurnReport& report, const MergeOptions& options = MergeOptions());

    const Region* get_region(const HexCoord& coord) const;
    bool contains(const HexCoord& coord) const { return regions.count(coord) > 0; }
    const std::map<HexCoord, Region>& get_regions() const { return regions; }
    const std::map<int, FactionRecord>& get_factions() const { return factions; }
    size_t size() const { return regions.size(); }
    bool empty() const { return regions.empty(); }

    // Уровни карты, на которых есть хотя бы один известный гекс (по возрастанию)
    std::vector<int> get_levels() const;
    // Гекс, где отряд был замечен последним, на любом уровне
    std::optional<HexCoord> locate_unit(int number) const;

    // Используются загрузчиком файла мира
    void put_region(const Region& region);
    void put_faction(const FactionRecord& faction);
    // Сбросить карту (новый мир); пустую модель не помечает изменённой
    void clear();

    bool is_dirty() const { return dirty; }
    void mark_clean() { dirty = false; }
    uint64_t get_revision() const { return revision; }

private:
    std::map<HexCoord, Region> regions;
    std::map<int, FactionRecord> factions;
    bool dirty = false;
    uint64_t revision = 0;

    void touch();

    // Возвращает false, если снимок пропущен
    bool merge_region(const RegionSnapshot& snapshot, int turn, const MergeOptions& options,
                      const std::map<HexCoord, std::vector<TurnEvent>>& events,
                      const std::map<int, HexCoord>& known_units, MergeResult& result);
    void merge_exit(const Exit& exit, int turn);
    void relocate_unit(int number, const HexCoord& coord, int turn);
};

// Сравнивает содержимое (гексы и фракции), без учёта dirty/revision
bool operator==(const WorldModel& a, const WorldModel& b);
bool operator!=(const WorldModel& a, const WorldModel& b);
