#include "app/options.h"

#include <algorithm>
#include <iostream>
#include <string>

namespace somaplay {
namespace app {

namespace {

constexpr const char* kVersion = "0.1.0";

std::string toLower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool applyEnvOverrides(Options& opt, ParseOptionsResult& result,
                       const std::function<const char*(const char*)>& getenvFn) {
    auto fail = [&](const std::string& message) {
        result.hasError = true;
        result.errorMessage = message;
        return false;
    };

    if (!getenvFn) {
        return true;
    }
    if (const char* player = getenvFn("SOMAPLAY_PLAYER")) {
        auto parsed = stream::parsePlayerKind(player);
        if (!parsed) {
            return fail("Unsupported SOMAPLAY_PLAYER. Use one of: mpv|mplayer|mpg123");
        }
        opt.player = *parsed;
    }
    if (const char* config = getenvFn("SOMAPLAY_CONFIG")) {
        opt.configPath = config;
    }
    return true;
}

}  // namespace

std::optional<logging::LogLevel> parseLogLevelOption(std::string_view value) {
    const std::string lower = toLower(value);
    if (lower == "trace" || lower == "debug" || lower == "info" || lower == "warn" ||
        lower == "warning" || lower == "error" || lower == "err" || lower == "critical" ||
        lower == "off") {
        return logging::stringToLevel(lower);
    }
    return std::nullopt;
}

void printHelp(std::string_view programName) {
    std::cout << "Usage: " << programName << " [options] <channel>" << std::endl
              << std::endl
              << "Plays an internet radio channel through an external player and shows"
              << std::endl
              << "the tracks as they change." << std::endl
              << std::endl
              << "  -p, --player     Player to use: mpv | mplayer | mpg123" << std::endl
              << "  -c, --config     Config file (default: $XDG_CONFIG_HOME/somaplay/config.json)"
              << std::endl
              << "  -v, --verbose    Echo player output lines that are not recognized" << std::endl
              << "  -n, --notify     Desktop notification on every track change" << std::endl
              << "  --no-log         Do not record tracks in the track log" << std::endl
              << "  --no-highlight   Do not highlight station IDs" << std::endl
              << "  --log-level      Diagnostics: trace|debug|info|warn|error|off" << std::endl
              << "  --replay FILE    Read player output from FILE instead of starting a player"
              << std::endl
              << "  -h, --help       Show this help and exit" << std::endl
              << "  -V, --version    Show version and exit" << std::endl
              << std::endl
              << "<channel> is a catalog id or title, or a stream URL." << std::endl
              << "Environment overrides: SOMAPLAY_PLAYER, SOMAPLAY_CONFIG" << std::endl;
}

ParseOptionsResult parseOptions(int argc, char** argv, std::string_view programName,
                                const std::function<const char*(const char*)>& getenvFn) {
    Options opt{};
    ParseOptionsResult result{};

    if (!applyEnvOverrides(opt, result, getenvFn)) {
        return result;
    }

    auto fail = [&](const std::string& message) {
        result.hasError = true;
        result.errorMessage = message;
        return result;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "-h" || arg == "--help") {
            printHelp(programName);
            result.showHelp = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            printVersion(programName);
            result.showVersion = true;
            return result;
        } else if ((arg == "-p" || arg == "--player") && i + 1 < argc) {
            auto parsed = stream::parsePlayerKind(argv[++i]);
            if (!parsed) {
                return fail("Unsupported player. Use one of: mpv|mplayer|mpg123");
            }
            opt.player = *parsed;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opt.configPath = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            opt.verbose = true;
        } else if (arg == "-n" || arg == "--notify") {
            opt.notify = true;
        } else if (arg == "--no-log") {
            opt.noLog = true;
        } else if (arg == "--no-highlight") {
            opt.noHighlight = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = parseLogLevelOption(argv[++i]);
            if (!level) {
                return fail("Unsupported log level. Use one of: trace|debug|info|warn|error|off");
            }
            opt.logLevel = *level;
        } else if (arg == "--replay" && i + 1 < argc) {
            opt.replayPath = argv[++i];
        } else if (!arg.empty() && arg.front() == '-') {
            return fail(std::string("Unknown argument: ") + std::string(arg));
        } else if (opt.channel.empty()) {
            opt.channel = std::string(arg);
        } else {
            return fail(std::string("Unexpected argument: ") + std::string(arg));
        }
    }

    if (opt.channel.empty()) {
        return fail("Missing <channel>. See --help.");
    }

    result.options = opt;
    return result;
}

void printVersion(std::string_view programName) {
    std::cout << programName << " version " << kVersion << std::endl;
}

}  // namespace app
}  // namespace somaplay
