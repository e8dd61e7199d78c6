/**
 * @file logger.h
 * @brief Diagnostic logging for somaplay (spdlog)
 *
 * Everything logged here goes to stderr, or to a rotating file when the
 * config's "logging" section names one. stdout belongs to the now-playing
 * display. The default level is warn so a normal session prints only the
 * station header and track lines.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace somaplay {
namespace logging {

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off,
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    std::string filePath;  // empty = stderr only
    size_t maxFileSize = 1024 * 1024;
    size_t maxBackups = 2;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] %v";
};

// (Re)build the "somaplay" logger. A later call with stderr-only settings
// keeps the sinks and only adjusts level and pattern.
bool initialize(const LogConfig& config = LogConfig{});

// stderr logger with defaults, usable before the config file is located.
bool initializeEarly();

// Apply the "logging" object of a JSON config file. A missing file or
// section means defaults; a malformed one is reported on stderr.
bool initializeFromConfig(const std::string& configPath);

void shutdown();
void flush();

void setLevel(LogLevel level);
LogLevel getLevel();

// Never null after the first call; initializes with defaults on demand.
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

// Case-insensitive; unknown names map to Info.
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace somaplay

#include <spdlog/spdlog.h>

#define SOMAPLAY_LOG_AT(spdlogMacro, ...)                      \
    do {                                                       \
        auto somaplayLogger_ = somaplay::logging::getLogger(); \
        if (somaplayLogger_) {                                 \
            spdlogMacro(somaplayLogger_, __VA_ARGS__);         \
        }                                                      \
    } while (0)

#define LOG_TRACE(...) SOMAPLAY_LOG_AT(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) SOMAPLAY_LOG_AT(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) SOMAPLAY_LOG_AT(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) SOMAPLAY_LOG_AT(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) SOMAPLAY_LOG_AT(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) SOMAPLAY_LOG_AT(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition) {              \
            LOG_##level(__VA_ARGS__); \
        }                             \
    } while (0)

// At most once per call site for the life of the process.
#define LOG_ONCE(level, ...)                                                 \
    do {                                                                     \
        static std::atomic<bool> somaplayLoggedOnce_{false};                 \
        if (!somaplayLoggedOnce_.exchange(true, std::memory_order_relaxed)) { \
            LOG_##level(__VA_ARGS__);                                        \
        }                                                                    \
    } while (0)
