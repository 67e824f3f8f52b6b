#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[94m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "+ " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "! " + color::RESET + msg + "\n";
}

// Usage row: command on the left, description dimmed on the right
inline std::string usage_row(const std::string& command, const std::string& description) {
    return "    " + color::BLUE + fmt::format("{:<58}", command) + color::RESET
           + color::DIM + description + color::RESET + "\n";
}

} // namespace theme
