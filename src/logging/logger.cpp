#include "logging/logger.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace somaplay {
namespace logging {

namespace {

constexpr const char* kLoggerName = "somaplay";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_mutex;
std::atomic<bool> g_ready{false};

struct LevelName {
    LogLevel level;
    spdlog::level::level_enum spd;
    const char* name;
};

constexpr LevelName kLevels[] = {
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
};

spdlog::level::level_enum toSpd(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.spd;
        }
    }
    return spdlog::level::info;
}

LogLevel fromSpd(spdlog::level::level_enum level) {
    for (const auto& entry : kLevels) {
        if (entry.spd == level) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

void applyLevel(spdlog::logger& logger, LogLevel level) {
    logger.set_level(toSpd(level));
    for (auto& sink : logger.sinks()) {
        sink->set_level(toSpd(level));
    }
}

LogConfig configFromJson(const nlohmann::json& section) {
    LogConfig config;
    if (section.contains("level") && section["level"].is_string()) {
        config.level = stringToLevel(section["level"].get<std::string>());
    }
    if (section.contains("filePath")) {
        config.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize")) {
        config.maxFileSize = section["maxFileSize"].get<size_t>();
    }
    if (section.contains("maxBackups")) {
        config.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput")) {
        config.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("coloredOutput")) {
        config.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern")) {
        config.pattern = section["pattern"].get<std::string>();
    }
    return config;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);

    const bool stderrOnly = config.filePath.empty() && config.consoleOutput;
    if (g_ready.load(std::memory_order_acquire) && g_logger && stderrOnly) {
        g_logger->set_pattern(config.pattern);
        applyLevel(*g_logger, config.level);
        return true;
    }

    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (config.consoleOutput) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            if (!config.coloredOutput) {
                console->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console);
        }
        if (!config.filePath.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups));
        }
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "somaplay: cannot open log sink: " << ex.what() << std::endl;
        return false;
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    applyLevel(*logger, config.level);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(logger);
    g_logger = std::move(logger);
    g_ready.store(true, std::memory_order_release);

    if (!config.filePath.empty()) {
        SPDLOG_LOGGER_DEBUG(g_logger, "Logging to {} ({} bytes x {})", config.filePath,
                            config.maxFileSize, config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    return initialize(LogConfig{});
}

bool initializeFromConfig(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return initialize(LogConfig{});
    }

    LogConfig config;
    try {
        nlohmann::json j;
        file >> j;
        if (j.is_object() && j.contains("logging") && j["logging"].is_object()) {
            config = configFromJson(j["logging"]);
        }
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "somaplay: ignoring logging settings in " << configPath << ": " << ex.what()
                  << std::endl;
        config = LogConfig{};
    }
    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_ready.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

void setLevel(LogLevel level) {
    if (!g_logger) {
        return;
    }
    applyLevel(*g_logger, level);
}

LogLevel getLevel() {
    return g_logger ? fromSpd(g_logger->level()) : LogLevel::Warn;
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (!g_ready.load(std::memory_order_acquire)) {
        initialize();
    }
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    if (lower == "fatal") {
        return LogLevel::Critical;
    }
    if (lower == "none") {
        return LogLevel::Off;
    }
    for (const auto& entry : kLevels) {
        if (lower == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace somaplay
