#include "App.hpp"
#include "utils/ConfigLoader.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::string configPath = "hexatlas.json";
    std::string worldPath;
    std::vector<std::string> reports;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
        else if (arg == "--world" && i + 1 < argc) worldPath = argv[++i];
        else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [--config <file>] [--world <file>] [report.json ...]" << std::endl;
            return 0;
        }
        else reports.push_back(arg);
    }

    AppConfig config = ConfigLoader::load(configPath);
    if (!worldPath.empty()) config.world_file = worldPath;

    App app(config);
    app.loadWorld();
    for (const auto& r : reports) app.importReport(r);
    app.run();
    return 0;
}
