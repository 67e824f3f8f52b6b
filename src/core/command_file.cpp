#include "command_file.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <fstream>
#include <string>

CommandList parse_commands(std::istream& in) {
    CommandList commands;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        logging::debug(fmt::format("Loaded command {}: {}", line_num, line));
        commands.push_back(line);
    }

    return commands;
}

Result<CommandList> load_commands(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec) || fs::is_directory(path, ec)) {
        return Result<CommandList>::Err("Commands file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file) {
        return Result<CommandList>::Err("Cannot read commands file: " + path.string());
    }

    CommandList commands = parse_commands(file);
    if (file.bad()) {
        return Result<CommandList>::Err("Error reading commands file: " + path.string());
    }

    logging::info(fmt::format("Loaded {} commands from {}", commands.size(), path.string()));
    return Result<CommandList>::Ok(std::move(commands));
}

Result<void> write_example_commands(const fs::path& path) {
    const char* example = R"(# Test commands for demonstration
echo 'Hello from SSH!'
date
whoami
pwd
echo 'Test completed'
)";

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err("Failed to create " + path.string());
    }
    out << example;
    out.close();
    if (!out) {
        return Result<void>::Err("Failed to write " + path.string());
    }
    return Result<void>::Ok();
}
