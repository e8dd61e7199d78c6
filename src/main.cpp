#include "app/options.h"
#include "catalog/channel_catalog.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "core/graceful_shutdown.h"
#include "hooks/command_notifier.h"
#include "hooks/console_printer.h"
#include "hooks/desktop_notifier.h"
#include "logging/logger.h"
#include "player/player_command.h"
#include "player/player_process.h"
#include "process/spawn.h"
#include "stream/line_source.h"
#include "stream/stream_session.h"
#include "track_log/track_log.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <unistd.h>

using namespace somaplay;

namespace {

stream::SessionOptions makeSessionOptions(const AppConfig& config, const app::Options& opt,
                                          const Channel& channel) {
    stream::SessionOptions options;
    options.verbose = opt.verbose || config.display.verbose;
    options.logEnabled = config.trackLog.enabled && !opt.noLog;
    options.notifyEnabled = config.notify.enabled || opt.notify;
    options.stationHighlight = config.display.stationHighlight && !opt.noHighlight;
    options.seedChannelName = channel.title;
    options.iconPath = channel.iconPath;
    options.stationIds = config.stationIds;
    return options;
}

void flushTrackLog(const TrackLog& trackLog, const AppConfig& config, bool enabled) {
    if (!enabled) {
        return;
    }
    const ErrorCode err = trackLog.flush(config.trackLog.path, config.trackLog.deduplicate);
    // Losing the log must not change how the session ends
    LOG_IF(ERROR, err != ErrorCode::OK, "[Main] Track log not saved to {}: {}",
           config.trackLog.path, errorCodeToString(err));
}

}  // namespace

int main(int argc, char** argv) {
    logging::initializeEarly();

    const auto parsed = app::parseOptions(argc, argv, "somaplay");
    if (parsed.showHelp || parsed.showVersion) {
        return 0;
    }
    if (parsed.hasError || !parsed.options) {
        std::cerr << "somaplay: " << parsed.errorMessage << std::endl;
        return toExitStatus(ErrorCode::CONFIG_INVALID_VALUE);
    }
    const app::Options opt = *parsed.options;

    const std::filesystem::path configPath =
        opt.configPath.empty() ? defaultConfigPath() : std::filesystem::path(opt.configPath);

    logging::initializeFromConfig(configPath.string());
    if (opt.logLevel) {
        logging::setLevel(*opt.logLevel);
    }

    AppConfig config;
    if (!loadAppConfig(configPath, config, false)) {
        LOG_DEBUG("[Main] No usable config at {}, using defaults", configPath.string());
    }
    resolveDefaultPaths(config);
    if (opt.player) {
        config.player = *opt.player;
    }

    ErrorCode catalogError = ErrorCode::OK;
    auto catalog = ChannelCatalog::loadFromFile(config.catalogPath, &catalogError);
    if (!catalog) {
        LOG_DEBUG("[Main] Catalog unavailable ({}), only stream URLs can be played",
                  errorCodeToString(catalogError));
        catalog = ChannelCatalog{};
    }

    ErrorCode resolveError = ErrorCode::OK;
    auto channel = resolveChannel(opt.channel, *catalog, config.streamUrlTemplate, &resolveError);
    if (!channel) {
        std::cerr << "somaplay: unknown channel '" << opt.channel << "'" << std::endl;
        return toExitStatus(resolveError);
    }

    stream::SessionOptions sessionOptions = makeSessionOptions(config, opt, *channel);

    TrackLog trackLog;
    if (sessionOptions.logEnabled) {
        trackLog = TrackLog::load(config.trackLog.path);
    }

    hooks::ConsoleStyle style;
    style.color = config.display.color && isatty(STDOUT_FILENO);
    style.timestampFormat = config.display.timestampFormat;
    hooks::ConsolePrinter printer(std::cout, style);

    process::ChildReaper reaper;
    hooks::DesktopNotifier desktopNotifier(reaper);
    std::unique_ptr<hooks::CommandNotifier> commandNotifier;
    std::vector<stream::TrackNotifier*> notifiers = {&desktopNotifier};
    if (!config.notify.command.empty()) {
        commandNotifier = std::make_unique<hooks::CommandNotifier>(reaper, config.notify.command);
        if (commandNotifier->valid()) {
            notifiers.push_back(commandNotifier.get());
        }
    }

    auto& signalState = graceful_shutdown::getGlobalSignalState();
    signalState.reset();
    graceful_shutdown::Controller controller;
    controller.setSignalState(&signalState);
    controller.setLogCallback([](const char* msg) { LOG_INFO("[Main] {}", msg); });
    if (!graceful_shutdown::installSignalHandlers()) {
        return toExitStatus(ErrorCode::INTERNAL_UNKNOWN);
    }
    auto stopRequested = [&controller]() {
        controller.processPendingSignals();
        return !controller.isRunning();
    };

    stream::StreamSession session(config.player, sessionOptions, printer, &trackLog, notifiers);

    // Replay: interpret a captured player log, no process involved
    if (!opt.replayPath.empty()) {
        std::ifstream replay(opt.replayPath);
        if (!replay.is_open()) {
            std::cerr << "somaplay: cannot open " << opt.replayPath << std::endl;
            return toExitStatus(ErrorCode::PLAYER_PIPE_FAILED);
        }
        stream::IstreamLineSource source(replay);
        session.run(source, stopRequested);
        flushTrackLog(trackLog, config, sessionOptions.logEnabled);
        reaper.waitAll(std::chrono::milliseconds(1000));
        return 0;
    }

    const auto args = player::PlayerCommandBuilder::build(config.player, channel->url,
                                                          config.playerExecutable);
    ErrorCode launchError = ErrorCode::OK;
    auto playerProcess = player::PlayerProcess::launch(args, &launchError);
    if (!playerProcess) {
        std::cerr << "somaplay: cannot start " << args.front() << std::endl;
        return toExitStatus(launchError);
    }

    stream::FdLineSource source(playerProcess->outputFd());
    const stream::SessionResult result = session.run(source, stopRequested);

    player::PlayerExit playerExit;
    if (result.cancelled) {
        playerExit = playerProcess->stop();
    } else {
        playerExit = playerProcess->wait();
    }

    flushTrackLog(trackLog, config, sessionOptions.logEnabled);
    reaper.waitAll(std::chrono::milliseconds(1000));

    LOG_INFO("[Main] Session ended: tracks={} logged={} station_ids={}", result.stats.tracksSeen,
             result.stats.tracksLogged, result.stats.stationIds);

    if (result.cancelled) {
        logging::shutdown();
        return 0;
    }

    const ErrorCode exitError = playerExit.toErrorCode();
    if (exitError != ErrorCode::OK) {
        if (playerExit.exited) {
            std::cerr << "somaplay: " << args.front() << " exited with status "
                      << playerExit.exitCode << std::endl;
        } else {
            std::cerr << "somaplay: " << args.front() << " killed by signal " << playerExit.signal
                      << std::endl;
        }
    }
    logging::shutdown();
    return toExitStatus(exitError);
}
