#pragma once

#include <string>

// Generate a log timestamp (YYYY-MM-DD HH:MM:SS,mmm) for the current local time.
std::string now_log_timestamp();

// Safe integer parse: returns fallback on failure (no exceptions).
// Trailing garbage ("22abc") counts as failure.
int safe_stoi(const std::string& s, int fallback = 0);

// First max_chars characters of s, with a marker noting how much was cut.
std::string truncate_for_log(const std::string& s, size_t max_chars);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n\f\v") + 1);
}
