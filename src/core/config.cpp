#include "config.hpp"
#include "log.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
    }

    // JSON so the template reads the same as the files users already have
    const char* default_config = R"({
    "hostname": "",
    "username": "",
    "password": "",
    "key_filename": "",
    "port": 22,
    "commands_file": "commands.txt"
}
)";

    try {
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static bool has_value(const YAML::Node& node) {
    return node && !node.IsNull();
}

// Null and missing keys both take the fallback
static std::string string_or(const YAML::Node& node, const std::string& fallback) {
    return has_value(node) ? node.as<std::string>() : fallback;
}

static Result<Config> config_error(const std::string& msg) {
    return Result<Config>::Err(msg);
}

Result<Config> Config::parse(const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            return config_error("Config must be a mapping of keys to values");
        }

        Config config;
        config.hostname_ = string_or(root["hostname"], "");
        config.username_ = string_or(root["username"], "");
        if (config.hostname_.empty() || config.username_.empty()) {
            return config_error("hostname and username are required in config file");
        }

        config.password_ = string_or(root["password"], "");
        config.key_filename_ = string_or(root["key_filename"], "");
        config.commands_file_ = string_or(root["commands_file"], DEFAULT_COMMANDS_FILE);
        if (config.commands_file_.empty()) {
            config.commands_file_ = DEFAULT_COMMANDS_FILE;
        }

        // Present-but-malformed numbers throw instead of falling back
        if (has_value(root["port"])) {
            config.port_ = root["port"].as<int>();
        }
        if (config.port_ < 1 || config.port_ > 65535) {
            return config_error("port must be between 1 and 65535, got " + std::to_string(config.port_));
        }

        if (has_value(root["command_delay_ms"])) {
            config.command_delay_ms_ = root["command_delay_ms"].as<int>();
        }
        if (config.command_delay_ms_ < 0) {
            return config_error("command_delay_ms must not be negative");
        }

        config.log_file_ = string_or(root["log_file"], "");
        config.log_level_ = string_or(root["log_level"], "info");
        auto level = logging::parse_level(config.log_level_);
        if (level.is_err()) {
            return config_error(level.error);
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return config_error(std::string("Error parsing configuration file: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        auto created = create_default_config(path);
        if (created.is_err()) {
            return config_error(created.error);
        }
        return config_error("Configuration file " + path.string() + " not found. Created a template; "
                            "please edit it with your SSH connection details");
    }

    std::ifstream in(path);
    if (!in) {
        return config_error("Cannot read configuration file: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());

    return parse(text);
}
