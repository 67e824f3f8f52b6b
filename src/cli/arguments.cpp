#include "arguments.hpp"
#include <core/utils.hpp>

static Result<CliOptions> usage_error(const std::string& msg) {
    return Result<CliOptions>::Err(msg);
}

Result<CliOptions> parse_arguments(const std::vector<std::string>& args) {
    CliOptions opts;
    std::vector<std::string> positional;
    bool have_mode_flag = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.mode = CliMode::HELP;
            return Result<CliOptions>::Ok(opts);
        } else if (arg == "--version") {
            opts.mode = CliMode::VERSION;
            return Result<CliOptions>::Ok(opts);
        } else if (arg == "--config") {
            if (have_mode_flag) return usage_error("Only one of --config / --create-example may be given");
            have_mode_flag = true;
            opts.mode = CliMode::CONFIG;
        } else if (arg == "--create-example") {
            if (have_mode_flag) return usage_error("Only one of --config / --create-example may be given");
            have_mode_flag = true;
            opts.mode = CliMode::CREATE_EXAMPLE;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            return usage_error("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (opts.mode == CliMode::CONFIG) {
        if (positional.size() > 1) return usage_error("--config takes at most one file");
        if (!positional.empty()) opts.config_path = positional[0];
        return Result<CliOptions>::Ok(opts);
    }

    if (opts.mode == CliMode::CREATE_EXAMPLE) {
        if (positional.size() > 1) return usage_error("--create-example takes at most one path");
        if (!positional.empty()) opts.example_path = positional[0];
        return Result<CliOptions>::Ok(opts);
    }

    if (positional.size() < 3) {
        return usage_error("Expected <host> <username> <commands_file>");
    }
    if (positional.size() > 6) {
        return usage_error("Too many arguments");
    }

    opts.mode = CliMode::RUN;
    opts.host = positional[0];
    opts.username = positional[1];
    opts.commands_file = positional[2];
    if (positional.size() > 3) opts.password = positional[3];
    if (positional.size() > 4) opts.key_path = positional[4];
    if (positional.size() > 5) {
        opts.port = safe_stoi(positional[5], -1);
        if (opts.port < 1 || opts.port > 65535) {
            return usage_error("Invalid port: " + positional[5]);
        }
    }

    if (opts.host.empty() || opts.username.empty() || opts.commands_file.empty()) {
        return usage_error("host, username and commands_file must not be empty");
    }

    return Result<CliOptions>::Ok(opts);
}
