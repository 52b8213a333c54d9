#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <string>
#include <cstdint>

#include "ConfReader.hpp"

struct CommandLineOptions {
    CommandLineOptions() : port(0), show_help(false) {}

    std::string host;   // empty when not given
    uint16_t port;      // 0 when not given
    std::string config_file;
    bool show_help;
};

// Accepts --host <name>, --port <number>, --config <file>, -h/--help.
bool ParseArguments(int argc, char* argv[], CommandLineOptions& options, std::string& error);

// Applies --host/--port on top of the values read from the config file.
void ApplyOverrides(const CommandLineOptions& options, EndpointConfig& conf);

void PrintUsage(const char* prog, const std::string& default_config);

#endif // COMMAND_LINE_HPP
