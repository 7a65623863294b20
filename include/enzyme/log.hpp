#ifndef ENZYME_LOG_HPP
#define ENZYME_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace enzyme::log {

// =============================================================================
// Minimal leveled logger (stderr)
// =============================================================================

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

inline std::atomic<LogLevel>& threshold() {
    static std::atomic<LogLevel> level{LogLevel::Warn};
    return level;
}

inline void set_level(LogLevel level) { threshold().store(level, std::memory_order_relaxed); }

inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "LOG";
}

// "debug" | "info" | "warn" | "error" | "off"; unknown names map to INFO
inline LogLevel level_from_string(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

inline bool enabled(LogLevel level) {
    return level >= threshold().load(std::memory_order_relaxed);
}

inline void write(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;
    using clock = std::chrono::system_clock;
    const auto now = clock::to_time_t(clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::ostringstream ss;
    ss << "[" << std::put_time(&tm_buf, "%F %T") << "][" << level_to_string(level) << "] "
       << message << '\n';
    std::cerr << ss.str();
}

inline void debug(const std::string& msg) { write(LogLevel::Debug, msg); }
inline void info(const std::string& msg) { write(LogLevel::Info, msg); }
inline void warn(const std::string& msg) { write(LogLevel::Warn, msg); }
inline void error(const std::string& msg) { write(LogLevel::Error, msg); }

} // namespace enzyme::log

#endif // ENZYME_LOG_HPP
