#pragma once

#include <string>

namespace platform {

// True when stdin is an interactive terminal (not a pipe or file).
bool stdin_is_terminal();

// RAII guard that turns off terminal echo and line buffering on stdin.
// Destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Read one character from stdin. Returns false on EOF or error.
bool read_stdin_char(char& c);

} // namespace platform
