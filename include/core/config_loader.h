#ifndef SOMAPLAY_CONFIG_LOADER_H
#define SOMAPLAY_CONFIG_LOADER_H

#include "stream/player_kind.h"

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace somaplay {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";
constexpr const char* DEFAULT_TRACK_LOG_FILE = "tracks.json";
constexpr const char* DEFAULT_CATALOG_FILE = "channels.json";
constexpr const char* DEFAULT_STREAM_URL_TEMPLATE = "https://ice1.somafm.com/{id}-128-mp3";

using GetEnvFn = std::function<const char*(const char*)>;

struct AppConfig {
    stream::PlayerKind player = stream::PlayerKind::Mpv;
    std::string playerExecutable = "";  // empty = player name on PATH
    std::string catalogPath = "";       // empty = default data dir
    std::string streamUrlTemplate = DEFAULT_STREAM_URL_TEMPLATE;

    struct TrackLogConfig {
        bool enabled = true;
        std::string path = "";  // empty = default data dir
        bool deduplicate = true;
    } trackLog;

    struct NotifyConfig {
        bool enabled = false;
        std::string command = "";  // custom command; the title is appended as last argument
    } notify;

    struct DisplayConfig {
        bool stationHighlight = true;
        bool verbose = false;
        bool color = true;
        std::string timestampFormat = "%H:%M:%S";
    } display;

    std::vector<std::string> stationIds = {"SomaFM"};
};

// $XDG_CONFIG_HOME/somaplay/config.json, else ~/.config/somaplay/config.json
std::filesystem::path defaultConfigPath(const GetEnvFn& getenvFn = ::getenv);

// $XDG_DATA_HOME/somaplay, else ~/.local/share/somaplay
std::filesystem::path defaultDataDir(const GetEnvFn& getenvFn = ::getenv);

// Resolve the empty path fields of config against defaultDataDir().
void resolveDefaultPaths(AppConfig& config, const GetEnvFn& getenvFn = ::getenv);

// Returns false when the file is missing or unparsable; outConfig then holds
// defaults. Sections with wrong types fall back to their defaults.
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

}  // namespace somaplay

#endif  // SOMAPLAY_CONFIG_LOADER_H
