#pragma once

#include <string>
#include <filesystem>
#include "constants.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// Connection and run settings read from a config file. The file is YAML;
// JSON documents are valid YAML, so config.json files load as-is.
class Config {
public:
    Config() = default;

    // Load from a file. A missing file is replaced with a template and
    // reported as an error so the user can fill it in.
    static Result<Config> load(const fs::path& path);

    // Parse config text directly (no file I/O).
    static Result<Config> parse(const std::string& text);

    // Accessors
    const std::string& hostname() const { return hostname_; }
    const std::string& username() const { return username_; }
    const std::string& password() const { return password_; }
    const std::string& key_filename() const { return key_filename_; }
    int port() const { return port_; }
    const std::string& commands_file() const { return commands_file_; }
    int command_delay_ms() const { return command_delay_ms_; }
    const std::string& log_file() const { return log_file_; }
    const std::string& log_level() const { return log_level_; }

private:
    std::string hostname_;
    std::string username_;
    std::string password_;
    std::string key_filename_;
    int port_ = DEFAULT_SSH_PORT;
    std::string commands_file_ = DEFAULT_COMMANDS_FILE;
    int command_delay_ms_ = DEFAULT_COMMAND_DELAY_MS;
    std::string log_file_;
    std::string log_level_ = "info";
};

// Write an empty config template. Never overwrites an existing file.
Result<void> create_default_config(const fs::path& path);
