#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "detail.hpp"
#include "report.hpp"
#include "world.hpp"
#include "utils/Serializer.hpp"
#include "utils/Timer.hpp"

struct Args {
    std::string mode = "";
    std::string world = "persistent_map_data.json";
    std::vector<std::string> inputs;
    std::string policy = "retain";
    std::optional<int> x;
    std::optional<int> y;
    int z = SURFACE_LEVEL;
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    for(int i=1; i<argc; ++i) {
        std::string arg = argv[i];
        if(arg == "--mode" && i+1 < argc) args.mode = argv[++i];
        else if(arg == "--world" && i+1 < argc) args.world = argv[++i];
        else if(arg == "--input" && i+1 < argc) args.inputs.push_back(argv[++i]);
        else if(arg == "--policy" && i+1 < argc) args.policy = argv[++i];
        else if(arg == "--x" && i+1 < argc) args.x = std::stoi(argv[++i]);
        else if(arg == "--y" && i+1 < argc) args.y = std::stoi(argv[++i]);
        else if(arg == "--z" && i+1 < argc) args.z = std::stoi(argv[++i]);
    }
    return args;
}

// Отсутствующий файл мира - это просто пустой мир
WorldModel load_world(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "No world file at " << path << ", starting empty" << std::endl;
        return WorldModel();
    }
    return Serializer::load_json(path);
}

int run_import(const Args& args) {
    if (args.inputs.empty()) {
        std::cerr << "Error: Missing --input for import mode." << std::endl;
        return 1;
    }
    auto policy = departed_policy_from_string(args.policy);
    if (!policy) {
        std::cerr << "Error: Unknown policy '" << args.policy << "' (expected retain or remove)." << std::endl;
        return 1;
    }
    MergeOptions options;
    options.departed_units = *policy;

    WorldModel world = load_world(args.world);
    int failed = 0;
    for (const auto& input : args.inputs) {
        Timer timer;
        try {
            TurnReport report = ReportParser::parse_file(input);
            MergeResult r = world.merge(report, options);
            for (const auto& w : r.warnings) {
                std::cerr << "Warning: " << (w.coord ? w.coord->to_string() + ": " : "") << w.message << std::endl;
            }
            std::cout << input << ": faction " << report.faction_number << ", turn " << report.turn
                      << " | +" << r.inserted << " new, " << r.updated << " updated, "
                      << r.unchanged << " unchanged, " << r.skipped << " skipped"
                      << " | " << timer.format_elapsed() << std::endl;
            for (const auto& line : DetailPresenter::describe_report(report).lines) {
                std::cout << "  " << line << std::endl;
            }
        } catch (const ParseError& e) {
            std::cerr << "Error importing " << input << ": " << e.what() << std::endl;
            ++failed;
        }
    }

    if (world.is_dirty()) Serializer::save_json(args.world, world);
    else std::cout << "World unchanged, nothing to save" << std::endl;
    return failed == 0 ? 0 : 2;
}

int run_show(const Args& args) {
    if (!args.x || !args.y) {
        std::cerr << "Error: Missing --x or --y for show mode." << std::endl;
        return 1;
    }
    WorldModel world = load_world(args.world);
    DetailPresenter presenter(world);
    std::cout << DetailPresenter::to_text(presenter.describe(HexCoord(*args.x, *args.y, args.z)));
    return 0;
}

int run_summary(const Args& args) {
    WorldModel world = load_world(args.world);
    std::cout << "Hexes: " << world.size() << std::endl;
    for (int level : world.get_levels()) {
        int full = 0, exits = 0;
        for (const auto& [coord, region] : world.get_regions()) {
            if (coord.z != level) continue;
            if (region.detail == RegionDetail::FULL) ++full;
            else ++exits;
        }
        std::cout << "  Level " << level << ": " << full << " seen, " << exits << " from exits" << std::endl;
    }
    std::cout << "Factions: " << world.get_factions().size() << std::endl;
    for (const auto& [number, f] : world.get_factions()) {
        std::cout << "  " << f.name << " (" << number << "), last turn " << f.last_turn << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    }

    if (args.mode.empty()) {
        std::cout << "Usage:\n"
                  << "  Import:  ./hexatlas_cli --mode import --world <file> --input <report> [--input ...] [--policy retain|remove]\n"
                  << "  Show:    ./hexatlas_cli --mode show --world <file> --x N --y N [--z N]\n"
                  << "  Summary: ./hexatlas_cli --mode summary --world <file>\n";
        return 1;
    }

    try {
        if (args.mode == "import") return run_import(args);
        if (args.mode == "show") return run_show(args);
        if (args.mode == "summary") return run_summary(args);
    } catch (const PersistenceError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Unknown mode: " << args.mode << std::endl;
    return 1;
}
