#include "CommandLine.hpp"

#include <cstring>
#include <cstdlib>
#include <iostream>

namespace {

bool ParsePort(const char* text, uint16_t& port) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

} // namespace

bool ParseArguments(int argc, char* argv[], CommandLineOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            options.host = argv[++i];
        } else if (strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            if (!ParsePort(argv[++i], options.port)) {
                error = std::string("invalid port: ") + argv[i];
                return false;
            }
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            options.config_file = argv[++i];
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            options.show_help = true;
        } else {
            error = std::string("unexpected argument: ") + argv[i];
            return false;
        }
    }
    return true;
}

void ApplyOverrides(const CommandLineOptions& options, EndpointConfig& conf) {
    if (!options.host.empty()) {
        conf.host = options.host;
    }
    if (options.port != 0) {
        conf.port = options.port;
    }
}

void PrintUsage(const char* prog, const std::string& default_config) {
    std::cerr << "Usage: " << prog << " [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --host <name>     Host to use (default " << DEFAULT_HOST << ")\n";
    std::cerr << "  --port <number>   Port to use (default " << DEFAULT_PORT << ")\n";
    std::cerr << "  --config <file>   JSON config file (default " << default_config << ")\n";
    std::cerr << "  -h, --help        Show this help\n";
}
