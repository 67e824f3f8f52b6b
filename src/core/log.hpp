#pragma once

#include <string>
#include <ostream>
#include "types.hpp"

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

// Process-wide leveled logger. Lines look like
//   2025-01-15 10:00:00,123 - INFO - message
// and go to the console stream (stderr unless redirected) plus an optional
// append-only log file.
namespace logging {

void set_level(LogLevel level);
LogLevel level();

// Parse "debug" / "info" / "warning" / "error" (case-insensitive).
Result<LogLevel> parse_level(const std::string& name);
const char* level_name(LogLevel level);

// Also append every line to the given file. Empty path disables the file sink.
Result<void> set_log_file(const std::string& path);

// Redirect console output (tests capture into a stringstream).
// Passing nullptr restores stderr.
void set_console(std::ostream* out);

void write(LogLevel level, const std::string& msg);

inline void debug(const std::string& msg)   { write(LogLevel::DEBUG, msg); }
inline void info(const std::string& msg)    { write(LogLevel::INFO, msg); }
inline void warning(const std::string& msg) { write(LogLevel::WARNING, msg); }
inline void error(const std::string& msg)   { write(LogLevel::ERROR, msg); }

} // namespace logging
