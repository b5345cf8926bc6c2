#pragma once

/**
 * @file logger.hpp
 * @brief Leveled diagnostic logging for the sync engine.
 *
 * Messages are formatted with dmsync::compat::format and written to stderr
 * as "[DMSYNC] LEVEL component: message".
 *
 * DEBUG output is compiled in only when DMSYNC_DEBUG_LOG is defined
 * (CMake: -DDMSYNC_DEBUG_LOG=ON). Other levels are always compiled and
 * filtered at runtime through SetLogLevel().
 *
 * Never pass decrypted message content or key material to these macros.
 */

#include "dmsync/core/format.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>

namespace dmsync::debug {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

inline std::atomic<LogLevel>& MinimumLogLevel() {
    static std::atomic<LogLevel> level{LogLevel::Info};
    return level;
}

inline void SetLogLevel(const LogLevel level) noexcept {
    MinimumLogLevel().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline bool IsLogEnabled(const LogLevel level) noexcept {
    return level >= MinimumLogLevel().load(std::memory_order_relaxed);
}

inline const char* LevelToString(const LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "OFF";
    }
}

inline void WriteLogLine(const LogLevel level, const char* component, const std::string& message) {
    fprintf(stderr, "[DMSYNC] %s %s: %s\n", LevelToString(level), component, message.c_str());
    fflush(stderr);
}

} // namespace dmsync::debug

#define DMSYNC_LOG_AT(level, component, ...) \
    do { \
        if (::dmsync::debug::IsLogEnabled(level)) { \
            ::dmsync::debug::WriteLogLine(level, component, \
                ::dmsync::compat::format(__VA_ARGS__)); \
        } \
    } while (0)

#ifdef DMSYNC_DEBUG_LOG
#define DMSYNC_LOG_DEBUG(component, ...) \
    DMSYNC_LOG_AT(::dmsync::debug::LogLevel::Debug, component, __VA_ARGS__)
#else
#define DMSYNC_LOG_DEBUG(component, ...) ((void)0)
#endif

#define DMSYNC_LOG_INFO(component, ...) \
    DMSYNC_LOG_AT(::dmsync::debug::LogLevel::Info, component, __VA_ARGS__)
#define DMSYNC_LOG_WARN(component, ...) \
    DMSYNC_LOG_AT(::dmsync::debug::LogLevel::Warn, component, __VA_ARGS__)
#define DMSYNC_LOG_ERROR(component, ...) \
    DMSYNC_LOG_AT(::dmsync::debug::LogLevel::Error, component, __VA_ARGS__)
