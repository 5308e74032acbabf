#pragma once
// Logging: stderr, component-tagged, verbose-gated debug

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace pramana {

// Global verbose flag for debug logging
inline std::atomic<bool>& verbose_mode() {
    static std::atomic<bool> flag{[] {
        const char* env = std::getenv("PRAMANA_VERBOSE");
        return env != nullptr && std::strcmp(env, "0") != 0 && env[0] != '\0';
    }()};
    return flag;
}

inline void set_verbose(bool on) { verbose_mode() = on; }

inline bool verbose() { return verbose_mode().load(); }

inline void log_debug(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << component << "] ";

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

// Warnings always print: disclosed non-convergence, recovery stops, I/O trouble
inline void log_warn(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

inline void log_warn(const char* component, const char* fmt, ...) {
    std::cerr << "[" << component << "] ";
    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

} // namespace pramana
