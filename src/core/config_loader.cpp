#include "core/config_loader.h"

#include "logging/logger.h"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace somaplay {

namespace {

std::filesystem::path xdgDir(const GetEnvFn& getenvFn, const char* xdgVar,
                             const char* homeFallback) {
    const char* xdg = getenvFn ? getenvFn(xdgVar) : nullptr;
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "somaplay";
    }
    const char* home = getenvFn ? getenvFn("HOME") : nullptr;
    if (home && *home) {
        return std::filesystem::path(home) / homeFallback / "somaplay";
    }
    return std::filesystem::path(".") / "somaplay";
}

}  // namespace

std::filesystem::path defaultConfigPath(const GetEnvFn& getenvFn) {
    return xdgDir(getenvFn, "XDG_CONFIG_HOME", ".config") / DEFAULT_CONFIG_FILE;
}

std::filesystem::path defaultDataDir(const GetEnvFn& getenvFn) {
    return xdgDir(getenvFn, "XDG_DATA_HOME", ".local/share");
}

void resolveDefaultPaths(AppConfig& config, const GetEnvFn& getenvFn) {
    if (config.catalogPath.empty()) {
        config.catalogPath = (defaultDataDir(getenvFn) / DEFAULT_CATALOG_FILE).string();
    }
    if (config.trackLog.path.empty()) {
        config.trackLog.path = (defaultDataDir(getenvFn) / DEFAULT_TRACK_LOG_FILE).string();
    }
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Config: Failed to parse {}: {}", configPath.string(), e.what());
        return false;
    }
    if (!j.is_object()) {
        LOG_WARN("Config: {} is not a JSON object, using defaults", configPath.string());
        return false;
    }

    try {
        if (j.contains("player") && j["player"].is_string()) {
            std::string name = j["player"].get<std::string>();
            if (auto kind = stream::parsePlayerKind(name)) {
                outConfig.player = *kind;
            } else if (verbose) {
                LOG_WARN("Config: Unsupported player '{}', falling back to '{}'", name,
                         stream::playerKindToString(outConfig.player));
            }
        }
        if (j.contains("playerExecutable")) {
            outConfig.playerExecutable = j["playerExecutable"].get<std::string>();
        }
        if (j.contains("catalogPath")) {
            outConfig.catalogPath = j["catalogPath"].get<std::string>();
        }
        if (j.contains("streamUrlTemplate")) {
            outConfig.streamUrlTemplate = j["streamUrlTemplate"].get<std::string>();
        }
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_WARN("Config: Invalid top-level settings, using defaults: {}", e.what());
        }
        AppConfig defaults;
        outConfig.player = defaults.player;
        outConfig.playerExecutable = defaults.playerExecutable;
        outConfig.catalogPath = defaults.catalogPath;
        outConfig.streamUrlTemplate = defaults.streamUrlTemplate;
    }

    if (j.contains("trackLog") && j["trackLog"].is_object()) {
        auto trackLog = j["trackLog"];
        try {
            if (trackLog.contains("enabled")) {
                outConfig.trackLog.enabled = trackLog["enabled"].get<bool>();
            }
            if (trackLog.contains("path")) {
                outConfig.trackLog.path = trackLog["path"].get<std::string>();
            }
            if (trackLog.contains("deduplicate")) {
                outConfig.trackLog.deduplicate = trackLog["deduplicate"].get<bool>();
            }
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: Invalid trackLog settings, using defaults: {}", e.what());
            }
            outConfig.trackLog = AppConfig::TrackLogConfig{};
        }
    }

    if (j.contains("notify") && j["notify"].is_object()) {
        auto notify = j["notify"];
        try {
            if (notify.contains("enabled")) {
                outConfig.notify.enabled = notify["enabled"].get<bool>();
            }
            if (notify.contains("command")) {
                outConfig.notify.command = notify["command"].get<std::string>();
            }
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: Invalid notify settings, using defaults: {}", e.what());
            }
            outConfig.notify = AppConfig::NotifyConfig{};
        }
    }

    if (j.contains("display") && j["display"].is_object()) {
        auto display = j["display"];
        try {
            if (display.contains("stationHighlight")) {
                outConfig.display.stationHighlight = display["stationHighlight"].get<bool>();
            }
            if (display.contains("verbose")) {
                outConfig.display.verbose = display["verbose"].get<bool>();
            }
            if (display.contains("color")) {
                outConfig.display.color = display["color"].get<bool>();
            }
            if (display.contains("timestampFormat")) {
                outConfig.display.timestampFormat = display["timestampFormat"].get<std::string>();
            }
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: Invalid display settings, using defaults: {}", e.what());
            }
            outConfig.display = AppConfig::DisplayConfig{};
        }
    }

    if (j.contains("stationIds") && j["stationIds"].is_array()) {
        try {
            outConfig.stationIds = j["stationIds"].get<std::vector<std::string>>();
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: Invalid stationIds, using defaults: {}", e.what());
            }
            outConfig.stationIds = AppConfig{}.stationIds;
        }
    }

    if (verbose) {
        std::cout << "Config: Loaded from " << std::filesystem::absolute(configPath) << '\n';
    }
    return true;
}

}  // namespace somaplay
