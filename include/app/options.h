#pragma once

#include "logging/logger.h"
#include "stream/player_kind.h"

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace somaplay {
namespace app {

// Command-line settings. Unset optionals defer to the config file.
struct Options {
    std::string channel;
    std::optional<stream::PlayerKind> player;
    std::string configPath;  // empty = default XDG location
    std::optional<logging::LogLevel> logLevel;
    std::string replayPath;  // classify a captured player log instead of spawning
    bool verbose{false};
    bool notify{false};
    bool noLog{false};
    bool noHighlight{false};
};

struct ParseOptionsResult {
    std::optional<Options> options;
    bool showHelp{false};
    bool showVersion{false};
    bool hasError{false};
    std::string errorMessage;
};

std::optional<logging::LogLevel> parseLogLevelOption(std::string_view value);

ParseOptionsResult parseOptions(
    int argc, char** argv, std::string_view programName,
    const std::function<const char*(const char*)>& getenvFn = ::getenv);
void printHelp(std::string_view programName);
void printVersion(std::string_view programName);

}  // namespace app
}  // namespace somaplay
