#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Expand a leading "~" or "~/" to the home directory. Other paths are
// returned unchanged ("~user" forms are not supported).
std::string expand_user(const std::string& path);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
