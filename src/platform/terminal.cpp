#include "terminal.hpp"
#include <cstdio>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOGDI
#    define NOGDI
#  endif
#  include <windows.h>
#  include <io.h>
#  include <conio.h>
#else
#  include <termios.h>
#  include <unistd.h>
#  include <poll.h>
#endif

namespace platform {

bool stdin_is_terminal() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
}

// ── NoEchoGuard ──────────────────────────────────────────────

#ifdef _WIN32

NoEchoGuard::NoEchoGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(h, &old_mode_);
    DWORD new_mode = old_mode_ & ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT);
    SetConsoleMode(h, new_mode);
}

NoEchoGuard::~NoEchoGuard() {
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

#else // Unix

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    impl_->saved = (tcgetattr(STDIN_FILENO, &impl_->old_term) == 0);
    if (!impl_->saved) return;

    // Canonical off, echo off; Ctrl-C still interrupts
    struct termios raw = impl_->old_term;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->saved) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        }
        delete impl_;
    }
}

#endif

// ── stdin helpers ────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
#ifdef _WIN32
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    return WaitForSingleObject(h, timeout_ms) == WAIT_OBJECT_0;
#else
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
#endif
}

bool read_stdin_char(char& c) {
#ifdef _WIN32
    int ch = _getch();
    if (ch == EOF) return false;
    c = static_cast<char>(ch);
    return true;
#else
    return read(STDIN_FILENO, &c, 1) == 1;
#endif
}

} // namespace platform
