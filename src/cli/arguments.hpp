#pragma once

#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>

enum class CliMode {
    RUN,              // positional host/user/commands_file
    CONFIG,           // settings from a config file
    CREATE_EXAMPLE,   // write a sample command file
    HELP,
    VERSION,
};

struct CliOptions {
    CliMode mode = CliMode::HELP;
    bool verbose = false;

    // RUN
    std::string host;
    std::string username;
    std::string commands_file;
    std::string password;
    std::string key_path;
    int port = DEFAULT_SSH_PORT;

    // CONFIG
    std::string config_path = DEFAULT_CONFIG_FILE;

    // CREATE_EXAMPLE
    std::string example_path = DEFAULT_EXAMPLE_FILE;
};

// Parse argv (without the program name).
//
//   <host> <username> <commands_file> [password] [key_file] [port]
//   --config [config_file]
//   --create-example [path]
//   --help | --version
//
// -v / --verbose may appear anywhere. An empty password argument ('') means
// "no password", which selects key auth when a key file is given.
Result<CliOptions> parse_arguments(const std::vector<std::string>& args);
