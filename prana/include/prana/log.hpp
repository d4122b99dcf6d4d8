#pragma once
// Log: timestamped component lines on stderr
//
// [HH:MM:SS.mmm][component] message

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace prana {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

namespace log_detail {

inline std::atomic<int>& threshold() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

inline const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "?";
}

inline void vwrite(LogLevel level, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::fprintf(stderr, "[%s.%03d][%s] ", time_buf,
                 static_cast<int>(now_ms.count()), component);
    if (level >= LogLevel::Warn) {
        std::fprintf(stderr, "%s: ", level_tag(level));
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace log_detail

inline void set_log_level(LogLevel level) {
    log_detail::threshold() = static_cast<int>(level);
}

inline LogLevel log_level() {
    return static_cast<LogLevel>(log_detail::threshold().load());
}

inline bool log_enabled(LogLevel level) {
    return level != LogLevel::Off &&
           static_cast<int>(level) >= log_detail::threshold().load();
}

#if defined(__GNUC__)
#define PRANA_PRINTF_FMT __attribute__((format(printf, 2, 3)))
#else
#define PRANA_PRINTF_FMT
#endif

inline void log_debug(const char* component, const char* fmt, ...) PRANA_PRINTF_FMT;
inline void log_info(const char* component, const char* fmt, ...) PRANA_PRINTF_FMT;
inline void log_warn(const char* component, const char* fmt, ...) PRANA_PRINTF_FMT;
inline void log_error(const char* component, const char* fmt, ...) PRANA_PRINTF_FMT;

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!log_enabled(LogLevel::Debug)) return;
    va_list args;
    va_start(args, fmt);
    log_detail::vwrite(LogLevel::Debug, component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    if (!log_enabled(LogLevel::Info)) return;
    va_list args;
    va_start(args, fmt);
    log_detail::vwrite(LogLevel::Info, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    if (!log_enabled(LogLevel::Warn)) return;
    va_list args;
    va_start(args, fmt);
    log_detail::vwrite(LogLevel::Warn, component, fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    if (!log_enabled(LogLevel::Error)) return;
    va_list args;
    va_start(args, fmt);
    log_detail::vwrite(LogLevel::Error, component, fmt, args);
    va_end(args);
}

} // namespace prana
