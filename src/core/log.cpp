#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>

namespace logging {

static LogLevel g_level = LogLevel::INFO;
static std::ostream* g_console = nullptr;
static std::unique_ptr<std::ofstream> g_file;

void set_level(LogLevel level) {
    g_level = level;
}

LogLevel level() {
    return g_level;
}

Result<LogLevel> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Result<LogLevel>::Ok(LogLevel::DEBUG);
    if (lower == "info") return Result<LogLevel>::Ok(LogLevel::INFO);
    if (lower == "warning" || lower == "warn") return Result<LogLevel>::Ok(LogLevel::WARNING);
    if (lower == "error") return Result<LogLevel>::Ok(LogLevel::ERROR);
    return Result<LogLevel>::Err("Unknown log level: " + name);
}

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:   return "DEBUG";
    case LogLevel::INFO:    return "INFO";
    case LogLevel::WARNING: return "WARNING";
    case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

Result<void> set_log_file(const std::string& path) {
    if (path.empty()) {
        g_file.reset();
        return Result<void>::Ok();
    }

    auto out = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!*out) {
        return Result<void>::Err("Cannot open log file: " + path);
    }
    g_file = std::move(out);
    return Result<void>::Ok();
}

void set_console(std::ostream* out) {
    g_console = out;
}

void write(LogLevel level, const std::string& msg) {
    if (level < g_level) return;

    std::string line = fmt::format("{} - {} - {}\n", now_log_timestamp(), level_name(level), msg);

    std::ostream& console = g_console ? *g_console : std::cerr;
    console << line;
    console.flush();

    if (g_file) {
        *g_file << line;
        g_file->flush();
    }
}

} // namespace logging
