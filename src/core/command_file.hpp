#pragma once

#include <filesystem>
#include <istream>
#include "types.hpp"

namespace fs = std::filesystem;

// Command files hold one shell command per line. Blank lines and lines whose
// first non-whitespace character is '#' are skipped; everything else is kept
// trimmed and in file order. A '#' after a command is part of the command.

CommandList parse_commands(std::istream& in);

// Fails when the file does not exist or cannot be read.
Result<CommandList> load_commands(const fs::path& path);

// Write the sample command file used by `sshbatch --create-example`.
Result<void> write_example_commands(const fs::path& path);
