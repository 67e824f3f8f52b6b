#include "sshbatch_cli.hpp"
#include "theme.hpp"
#include <core/command_file.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <managers/command_runner.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>

// ── Password prompt ─────────────────────────────────────

std::string collect_password(const CharSource& next) {
    std::string password;
    while (true) {
        char c = 0;
        int got = next(c);
        if (got < 0) return "";   // timed out: never send a half-typed password
        if (got == 0) break;
        if (c == '\n' || c == '\r') break;
        if (c == 127 || c == 8) {  // backspace
            if (!password.empty()) password.pop_back();
            continue;
        }
        if (static_cast<unsigned char>(c) >= 32) password += c;
    }
    return password;
}

std::string read_password(const std::string& prompt) {
    std::cerr << prompt;
    std::cerr.flush();

    std::string password;
    if (!platform::stdin_is_terminal()) {
        std::getline(std::cin, password);
        return password;
    }

    platform::NoEchoGuard guard;

    // Read character by character (no echo, no canonical)
    password = collect_password([](char& c) {
        if (!platform::poll_stdin(PASSWORD_PROMPT_TIMEOUT_MS)) return -1;
        return platform::read_stdin_char(c) ? 1 : 0;
    });

    std::cerr << "\n";
    return password;
}

// ── SshBatchCLI ─────────────────────────────────────────

SshBatchCLI::SshBatchCLI(Transport& transport, std::ostream& out)
    : transport_(transport), out_(out), prompt_(read_password) {
}

void SshBatchCLI::print_usage() const {
    out_ << theme::section("Usage");
    out_ << theme::usage_row("sshbatch <host> <username> <commands_file> [password] [key_file] [port]",
                             "Run commands");
    out_ << theme::usage_row("sshbatch --config [config_file]",
                             std::string("Read settings from a config file (default ") + DEFAULT_CONFIG_FILE + ")");
    out_ << theme::usage_row("sshbatch --create-example [path]",
                             std::string("Write a sample command file (default ") + DEFAULT_EXAMPLE_FILE + ")");
    out_ << "\n";
    out_ << theme::dim("    Examples:") << "\n";
    out_ << theme::dim("      sshbatch 192.168.1.100 user commands.txt mypassword") << "\n";
    out_ << theme::dim("      sshbatch 192.168.1.100 user commands.txt '' ~/.ssh/id_rsa") << "\n";
    out_ << "\n";
    out_ << theme::dim("    -v, --verbose         Debug logging\n"
                       "    --version             Show version\n"
                       "    --help                Show this help") << "\n\n";
}

void SshBatchCLI::print_version() const {
    out_ << theme::bold("sshbatch") << theme::dim(std::string(" version ") + SSHBATCH_VERSION) << "\n";
}

int SshBatchCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return 1;
    }

    auto parsed = parse_arguments(args);
    if (parsed.is_err()) {
        out_ << theme::fail(parsed.error);
        print_usage();
        return 1;
    }

    const CliOptions& opts = parsed.value;
    if (opts.verbose) {
        logging::set_level(LogLevel::DEBUG);
    }

    switch (opts.mode) {
    case CliMode::HELP:
        print_usage();
        return 0;
    case CliMode::VERSION:
        print_version();
        return 0;
    case CliMode::CREATE_EXAMPLE:
        return run_create_example(opts);
    case CliMode::CONFIG:
        return run_from_config(opts);
    case CliMode::RUN:
        return run_commands(opts);
    }
    return 1;
}

int SshBatchCLI::run_commands(const CliOptions& opts) {
    CredentialInput input{opts.host, opts.username, opts.port, opts.password, opts.key_path};
    return execute(input, opts.commands_file, DEFAULT_COMMAND_DELAY_MS);
}

int SshBatchCLI::run_from_config(const CliOptions& opts) {
    auto loaded = Config::load(opts.config_path);
    if (loaded.is_err()) {
        out_ << theme::fail(loaded.error);
        return 1;
    }
    const Config& config = loaded.value;

    if (!opts.verbose) {
        auto level = logging::parse_level(config.log_level());
        if (level.is_ok()) logging::set_level(level.value);
    }
    if (!config.log_file().empty()) {
        auto sink = logging::set_log_file(config.log_file());
        if (sink.is_err()) {
            out_ << theme::warn(sink.error);
        }
    }

    CredentialInput input{config.hostname(), config.username(), config.port(),
                          config.password(), config.key_filename()};
    return execute(input, config.commands_file(), config.command_delay_ms());
}

int SshBatchCLI::run_create_example(const CliOptions& opts) {
    auto written = write_example_commands(opts.example_path);
    if (written.is_err()) {
        out_ << theme::fail(written.error);
        return 1;
    }
    out_ << theme::ok("Created " + opts.example_path + " with sample commands");
    return 0;
}

int SshBatchCLI::execute(const CredentialInput& input, const std::string& commands_file, int delay_ms) {
    // Commands first: a missing file must fail before any connection attempt
    auto loaded = load_commands(commands_file);
    if (loaded.is_err()) {
        logging::error(loaded.error);
        out_ << theme::fail(loaded.error);
        return 1;
    }
    const CommandList& commands = loaded.value;
    if (commands.empty()) {
        logging::error("No commands to execute");
        out_ << theme::fail("No commands to execute in " + commands_file);
        return 1;
    }

    auto params = resolve_credentials(input, prompt_);
    if (params.is_err()) {
        logging::error(params.error);
        out_ << theme::fail(params.error);
        return 1;
    }

    RunnerOptions options;
    options.command_delay_ms = delay_ms;
    options.echo = &out_;

    CommandRunner runner(transport_, options);
    RunReport report = runner.run(params.value, commands);

    if (!report.connected) {
        out_ << theme::fail("Failed to establish SSH connection: " + report.error);
        return 1;
    }

    out_ << report.summary() << "\n";

    if (report.aborted) {
        out_ << theme::fail(fmt::format("Connection lost after {} of {} commands: {}",
                                        report.results.size(), report.total_commands, report.error));
    }

    if (report.all_succeeded) {
        out_ << theme::ok("All commands executed successfully");
        return 0;
    }

    out_ << theme::fail("Some commands failed to execute");
    return 1;
}
