// Colonnade Relay - Main Entry Point
// [NETWORK_AGENT] Command-line configuration and relay startup

#include "relay/SessionHost.hpp"
#include "Constants.hpp"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace Colonnade;

namespace {

void printUsage(const char* programName) {
    std::cout << "Colonnade Relay v" << Constants::VERSION << "\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  --port <num>          Relay port (default: " << Constants::DEFAULT_SERVER_PORT << ")\n"
              << "  --status-port <num>   /health and /metrics port, 0 to disable (default: "
              << Constants::DEFAULT_STATUS_PORT << ")\n"
              << "  --enemies <num>       Enemy count (default: " << Constants::ENEMY_COUNT << ")\n"
              << "  --attack-range <m>    Server-side attack reach (default: "
              << Constants::ATTACK_VALIDATION_RANGE << ")\n"
              << "  --help, -h            Show this help\n";
}

std::optional<long> parseInteger(const char* text, long minValue, long maxValue) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < minValue || value > maxValue) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parsePositive(const char* text) {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !(value > 0.0)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        RelayConfig config;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            }

            if (i + 1 >= argc) {
                std::cerr << "Missing value for option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
            const char* value = argv[++i];

            if (arg == "--port") {
                auto port = parseInteger(value, 1, 65535);
                if (!port) {
                    std::cerr << "Invalid port: " << value << "\n";
                    return 1;
                }
                config.port = static_cast<uint16_t>(*port);
            } else if (arg == "--status-port") {
                auto port = parseInteger(value, 0, 65535);
                if (!port) {
                    std::cerr << "Invalid status port: " << value << "\n";
                    return 1;
                }
                config.statusPort = static_cast<uint16_t>(*port);
            } else if (arg == "--enemies") {
                auto count = parseInteger(value, 0, 1000);
                if (!count) {
                    std::cerr << "Invalid enemy count: " << value << "\n";
                    return 1;
                }
                config.enemies.enemyCount = static_cast<uint32_t>(*count);
            } else if (arg == "--attack-range") {
                auto range = parsePositive(value);
                if (!range) {
                    std::cerr << "Invalid attack range: " << value << "\n";
                    return 1;
                }
                config.combat.validationRange = *range;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        std::cout << "Colonnade Relay v" << Constants::VERSION << "\n";
        std::cout << "Port: " << config.port << "\n";
        std::cout << "Status port: " << config.statusPort << "\n";
        std::cout << "Enemies: " << config.enemies.enemyCount << "\n\n";

        SessionHost host;
        if (!host.initialize(config)) {
            std::cerr << "\nFailed to initialize relay. Check logs for details.\n";
            return 1;
        }

        std::cout << "Relay is running. Press Ctrl+C to stop\n\n";

        // Blocks until SIGINT/SIGTERM
        host.run();

        std::cout << "\nRelay shutdown complete.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
