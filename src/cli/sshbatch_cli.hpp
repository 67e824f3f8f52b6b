#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include <core/credentials.hpp>
#include <ssh/transport.hpp>
#include "arguments.hpp"

// Command-line front end. Returns process exit codes: 0 when every command
// succeeded, 1 for any failure (usage, missing file, connection, or a
// failed command).
class SshBatchCLI {
public:
    explicit SshBatchCLI(Transport& transport, std::ostream& out = std::cout);

    int run(const std::vector<std::string>& args);

    int run_commands(const CliOptions& opts);
    int run_from_config(const CliOptions& opts);
    int run_create_example(const CliOptions& opts);

    void print_usage() const;
    void print_version() const;

    // Defaults to an interactive no-echo terminal prompt.
    void set_password_prompt(PasswordPrompt prompt) { prompt_ = std::move(prompt); }

private:
    Transport& transport_;
    std::ostream& out_;
    PasswordPrompt prompt_;

    int execute(const CredentialInput& input, const std::string& commands_file, int delay_ms);
};

// Yields the next typed character: 1 with c set, 0 at end of input, -1 on timeout.
using CharSource = std::function<int(char& c)>;

// Line-edit characters from next() into a password (backspace erases, Enter
// ends). A timeout yields "" so a half-typed password is never used.
std::string collect_password(const CharSource& next);

// Read a password from the terminal without echoing it. Falls back to a
// plain line read when stdin is not a terminal.
std::string read_password(const std::string& prompt);
