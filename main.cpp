#include <iostream>
#include <stdexcept>
#include <string>

#include "app/ArchMendApp.hpp"

namespace {

void PrintUsage() {
    std::cerr << "Usage: archmend <sourceDir> [outputDir] [--config <file>] [--no-cache] [--evaluate <file>]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    archmend::app::LaunchOptions options;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                PrintUsage();
                return 1;
            }
            options.configPath = argv[++i];
            options.configRequired = true;
        } else if (arg == "--evaluate") {
            if (i + 1 >= argc) {
                PrintUsage();
                return 1;
            }
            options.evaluationPath = argv[++i];
        } else if (arg == "--no-cache") {
            options.noCache = true;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[ArchMend] Unknown option: " << arg << std::endl;
            PrintUsage();
            return 1;
        } else if (positional == 0) {
            options.sourceDirectory = arg;
            ++positional;
        } else if (positional == 1) {
            options.outputDirectory = arg;
            ++positional;
        } else {
            PrintUsage();
            return 1;
        }
    }

    if (options.sourceDirectory.empty()) {
        PrintUsage();
        return 1;
    }

    try {
        archmend::app::ArchMendApp app(options);
        return app.Run();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ArchMend] Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ArchMend] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
