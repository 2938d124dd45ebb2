#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

namespace detail {
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Info};
    return lvl;
}

inline std::atomic<std::FILE*>& log_sink() {
    static std::atomic<std::FILE*> sink{stderr};
    return sink;
}

inline void log_impl(LogLevel lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::FILE* out = log_sink().load(std::memory_order_relaxed);
    std::fprintf(out, "%s: ", level_name(lvl));
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}
} // namespace detail

// Messages below the minimum level are dropped before formatting.
inline void set_log_level(LogLevel lvl) noexcept { detail::min_level().store(lvl, std::memory_order_relaxed); }
inline LogLevel log_level() noexcept { return detail::min_level().load(std::memory_order_relaxed); }
inline bool log_enabled(LogLevel lvl) noexcept { return lvl >= log_level(); }

// Diagnostics go to stderr by default so stdout stays reserved for the
// account snapshot. The caller keeps ownership of `sink`.
inline void set_log_sink(std::FILE* sink) noexcept {
    detail::log_sink().store(sink ? sink : stderr, std::memory_order_relaxed);
}

inline void log(LogLevel lvl, const char* fmt, ...) {
    if (!log_enabled(lvl)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    detail::log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define LOG_DEBUG(FMT, ...) ::util::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_INFO(FMT, ...)  ::util::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_ERROR(FMT, ...) ::util::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_FATAL(FMT, ...) ::util::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
