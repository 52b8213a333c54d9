#include <iostream>
#include <string>
#include <chrono>
#include <thread>

#include "Client.hpp"
#include "CommandLine.hpp"
#include "Signals.hpp"

constexpr const char* DEFAULT_CONFIG = "clientconf.json";

static int Exiting() {
    std::cout << "Exiting..." << std::endl;
    std::this_thread::sleep_for(std::chrono::seconds(1));
    return 0;
}

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
    Client client(conf, ui, logger);
    if (!client.Initialize()) {
        return InterruptRequested() ? Exiting() : 1;
    }

    SessionEnd end = SessionEnd::CLOSED;
    switch (client.Connect()) {
        case ConnectResult::INTERRUPTED:
            return Exiting();
        case ConnectResult::DECLINED:
            return 0;
        case ConnectResult::FAILED:
            return InterruptRequested() ? Exiting() : 1;
        case ConnectResult::CONNECTED:
            end = client.Run();
            break;
    }

    if (end == SessionEnd::INTERRUPTED || InterruptRequested()) {
        return Exiting();
    }
    return end == SessionEnd::TRANSPORT_ERROR ? 1 : 0;
}
