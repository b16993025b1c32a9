#pragma once
// Diagnostics: component-tagged lines on stderr
//
// log_debug is silent unless verbose mode is on (CLI --verbose).
// log_warn always prints; it is for data the store had to skip.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace nyaya {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_verbose(bool on) { verbose_flag() = on; }
inline bool verbose() { return verbose_flag().load(); }

namespace detail {

inline void vlog(const char* level, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << component << "]" << level << " ";
    std::cerr.flush();
    vfprintf(stderr, fmt, args);
    std::cerr << "\n";
}

} // namespace detail

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;
    va_list args;
    va_start(args, fmt);
    detail::vlog("", component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::vlog(" warning:", component, fmt, args);
    va_end(args);
}

} // namespace nyaya
