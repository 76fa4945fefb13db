#include "Simulator.hpp"
#include "Errors.hpp"
#include <iostream>

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [options]\n"
              << "\nOptions:\n"
              << "  -f, --floors <n>      Number of floors (2-100, default: 10)\n"
              << "  -e, --cars <n>        Number of cars (1-16, default: 2)\n"
              << "  -c, --capacity <n>    Car capacity (1-40, default: 8)\n"
              << "  -l, --look <variant>  Stop selection: nearest|farthest (default: nearest)\n"
              << "  -z, --zones <mode>    Zone layout: contiguous|overlap (default: contiguous)\n"
              << "  -d, --drift <n>       Floors displaced before drifting home, -1 disables (default: 2)\n"
              << "  -t, --tick <ms>       Tick duration in ms (20-2000, default: 200)\n"
              << "  -h, --help            Show this help\n"
              << "\nExample:\n"
              << "  " << progName << " -f 20 -e 4 -l farthest -z overlap\n";
}

bool parseArgs(int argc, char* argv[], Config& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return false;
        }
        else if ((arg == "-f" || arg == "--floors") && i + 1 < argc) {
            config.numFloors = std::stoi(argv[++i]);
            if (config.numFloors < 2 || config.numFloors > 100) {
                std::cerr << "Error: floors must be 2-100\n";
                return false;
            }
        }
        else if ((arg == "-e" || arg == "--cars") && i + 1 < argc) {
            config.numCars = std::stoi(argv[++i]);
            if (config.numCars < 1 || config.numCars > 16) {
                std::cerr << "Error: cars must be 1-16\n";
                return false;
            }
        }
        else if ((arg == "-c" || arg == "--capacity") && i + 1 < argc) {
            config.carCapacity = std::stoi(argv[++i]);
            if (config.carCapacity < 1 || config.carCapacity > 40) {
                std::cerr << "Error: capacity must be 1-40\n";
                return false;
            }
        }
        else if ((arg == "-l" || arg == "--look") && i + 1 < argc) {
            std::string variant = argv[++i];
            if (variant == "nearest") {
                config.lookVariant = LookVariant::NearestFirst;
            } else if (variant == "farthest") {
                config.lookVariant = LookVariant::FarthestFirst;
            } else {
                std::cerr << "Error: look must be 'nearest' or 'farthest'\n";
                return false;
            }
        }
        else if ((arg == "-z" || arg == "--zones") && i + 1 < argc) {
            std::string mode = argv[++i];
            if (mode == "contiguous") {
                config.zoneMode = ZoneMode::Contiguous;
            } else if (mode == "overlap") {
                config.zoneMode = ZoneMode::Overlapping;
            } else {
                std::cerr << "Error: zones must be 'contiguous' or 'overlap'\n";
                return false;
            }
        }
        else if ((arg == "-d" || arg == "--drift") && i + 1 < argc) {
            config.driftThreshold = std::stoi(argv[++i]);
            if (config.driftThreshold < -1) {
                std::cerr << "Error: drift must be -1 or more\n";
                return false;
            }
        }
        else if ((arg == "-t" || arg == "--tick") && i + 1 < argc) {
            config.tickDurationMs = std::stoi(argv[++i]);
            if (config.tickDurationMs < 20 || config.tickDurationMs > 2000) {
                std::cerr << "Error: tick must be 20-2000 ms\n";
                return false;
            }
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    Config config;

    try {
        if (!parseArgs(argc, argv, config)) {
            return 1;
        }
    } catch (const std::logic_error& e) {
        // std::stoi on a non-number
        std::cerr << "Error: bad numeric option (" << e.what() << ")\n";
        return 1;
    }

    std::cout << "========================================\n"
              << "        Elevator Dispatch System        \n"
              << "========================================\n"
              << "Configuration:\n"
              << "  Floors:     " << config.numFloors << "\n"
              << "  Cars:       " << config.numCars << "\n"
              << "  Capacity:   " << config.carCapacity << "\n"
              << "  LOOK:       " << (config.lookVariant == LookVariant::NearestFirst
                                      ? "nearest-first" : "farthest-first") << "\n"
              << "  Zones:      " << (config.zoneMode == ZoneMode::Contiguous
                                      ? "contiguous" : "overlapping") << "\n"
              << "  Tick:       " << config.tickDurationMs << " ms\n"
              << "========================================\n";

    try {
        BuildingSimulator simulator(config);
        DispatchService service(config, simulator);
        simulator.setEventHandler([&service](const Event& event) {
            service.submit(event);
        });

        service.start();

        CLI cli(simulator, service, config.tickDurationMs);
        cli.run();

        service.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Dispatch ended.\n";
    return 0;
}
