#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace parley {

enum class LogLevel : int { off = 0, warn = 1, info = 2, debug = 3, trace = 4 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    /// Parse "off" / "warn" / "info" / "debug" / "trace". Returns false for anything else.
    static bool parseLevel(const char* name, LogLevel& level);

    // Formats and emits one line. Safe from render worker threads;
    // emission (stderr or callback) is serialised.
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Optional callback for host language log capture
    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();

    static std::atomic<int> level_;
    static std::mutex emitMutex_;

    static std::chrono::steady_clock::time_point startTime_;
    static LogCallback callback_;
    static void* callbackUserData_;
};

} // namespace parley

// --- Macros ---

#define PL_WARN(fmt, ...) \
    do { if (parley::Logger::getLevel() >= parley::LogLevel::warn) \
        parley::Logger::log(parley::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define PL_INFO(fmt, ...) \
    do { if (parley::Logger::getLevel() >= parley::LogLevel::info) \
        parley::Logger::log(parley::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define PL_DEBUG(fmt, ...) \
    do { if (parley::Logger::getLevel() >= parley::LogLevel::debug) \
        parley::Logger::log(parley::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define PL_TRACE(fmt, ...) \
    do { if (parley::Logger::getLevel() >= parley::LogLevel::trace) \
        parley::Logger::log(parley::LogLevel::trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)
