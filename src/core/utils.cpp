#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <stdexcept>

std::string now_log_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return fmt::format("{},{:03d}", buf, static_cast<int>(ms.count()));
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int value = std::stoi(s, &pos);
        if (pos != s.size()) return fallback;
        return value;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::string truncate_for_log(const std::string& s, size_t max_chars) {
    if (s.size() <= max_chars) return s;
    return fmt::format("{}... [{} more bytes]", s.substr(0, max_chars), s.size() - max_chars);
}
