#include <iostream>
#include <string>
#include <chrono>
#include <thread>

#include "Server.hpp"
#include "CommandLine.hpp"
#include "Signals.hpp"

constexpr const char* DEFAULT_CONFIG = "serverconf.json";

int main(int argc, char* argv[]) {
    CommandLineOptions options;
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        std::cerr << error << "\n";
        PrintUsage(argv[0], DEFAULT_CONFIG);
        return 1;
    }
    if (options.show_help) {
        PrintUsage(argv[0], DEFAULT_CONFIG);
        return 0;
    }

    EndpointConfig conf;
    try {
        ConfReader reader("");
        conf = reader.ReadEndpointConfig(options.config_file.empty() ? DEFAULT_CONFIG : options.config_file);
    } catch (const std::exception& e) {
        std::cerr << "Cannot read config: " << e.what() << "\n";
        return 1;
    }
    ApplyOverrides(options, conf);

    InstallInterruptHandler();

    Logger logger(conf.log_file);
    ConsoleInteraction ui;
    Server server(conf, ui, logger);
    if (!server.Initialize()) {
        return 1;
    }

    SessionEnd end = server.Run();
    if (end == SessionEnd::INTERRUPTED || InterruptRequested()) {
        std::cout << "Exiting..." << std::endl;
        std::this_thread::sleep_for(std::chrono::seconds(1));
        return 0;
    }
    return end == SessionEnd::TRANSPORT_ERROR ? 1 : 0;
}
