/**
 * @file test_stream_session.cpp
 * @brief Unit tests for the stream session state machine
 *
 * Sessions are fed canned player output through VectorLineSource (or a pipe
 * for the blocking-read cases) and observed through recording hooks; no
 * player process is involved.
 */

#include "core/graceful_shutdown.h"
#include "stream/stream_session.h"
#include "track_log/track_log.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace somaplay;
using namespace somaplay::stream;

namespace {

class RecordingConsole : public ConsoleSink {
   public:
    void headerField(FieldRole role, const std::string& value) override {
        headers.emplace_back(role, value);
    }
    void track(const TrackEvent& event) override {
        tracks.push_back(event);
    }
    void rawLine(const std::string& line) override {
        rawLines.push_back(line);
    }

    size_t calls() const {
        return headers.size() + tracks.size() + rawLines.size();
    }

    std::vector<std::pair<FieldRole, std::string>> headers;
    std::vector<TrackEvent> tracks;
    std::vector<std::string> rawLines;
};

class RecordingNotifier : public TrackNotifier {
   public:
    void notify(const std::string& title, const std::string& iconPath) override {
        titles.push_back(title);
        icons.push_back(iconPath);
    }

    std::vector<std::string> titles;
    std::vector<std::string> icons;
};

class ThrowingNotifier : public TrackNotifier {
   public:
    void notify(const std::string&, const std::string&) override {
        ++calls;
        throw std::runtime_error("notify-send missing");
    }

    int calls = 0;
};

const std::vector<std::string> kMplayerScenario = {
    "Name: Groove Salad",
    "Genre: Ambient",
    "Bitrate: 128kbps",
    "ICY Info: StreamTitle='SomaFM - Groove Salad';StreamUrl=http://x",
    "ICY Info: StreamTitle='Artist - Track';StreamUrl=http://x",
};

SessionOptions notifyingOptions() {
    SessionOptions options;
    options.notifyEnabled = true;
    return options;
}

}  // namespace

class StreamSessionTest : public ::testing::Test {
   protected:
    SessionResult runLines(PlayerKind kind, const std::vector<std::string>& lines,
                           SessionOptions options = SessionOptions{}) {
        StreamSession session(kind, std::move(options), console, &trackLog, {&notifier});
        VectorLineSource source(lines);
        std::atomic_bool stop{false};
        return session.run(source, stop);
    }

    RecordingConsole console;
    RecordingNotifier notifier;
    TrackLog trackLog;
};

// ============================================================
// Reference scenario
// ============================================================

TEST_F(StreamSessionTest, MplayerScenarioLogsOnlyRealTrack) {
    auto result = runLines(PlayerKind::Mplayer, kMplayerScenario, notifyingOptions());

    ASSERT_EQ(console.headers.size(), 3u);
    EXPECT_EQ(console.headers[0].first, FieldRole::ChannelName);
    EXPECT_EQ(console.headers[0].second, "Groove Salad");
    EXPECT_EQ(console.headers[1].first, FieldRole::Genre);
    EXPECT_EQ(console.headers[2].first, FieldRole::Bitrate);

    ASSERT_EQ(console.tracks.size(), 2u);
    EXPECT_EQ(console.tracks[0].title, "SomaFM - Groove Salad");
    EXPECT_TRUE(console.tracks[0].stationId);
    EXPECT_TRUE(console.tracks[0].highlight);
    EXPECT_EQ(console.tracks[1].title, "Artist - Track");
    EXPECT_FALSE(console.tracks[1].stationId);

    EXPECT_EQ(trackLog.titles("Groove Salad"), std::vector<std::string>{"Artist - Track"});
    EXPECT_EQ(trackLog.size(), 1u);
    EXPECT_EQ(notifier.titles, std::vector<std::string>{"Artist - Track"});

    EXPECT_EQ(result.state.phase, SessionPhase::Terminated);
    EXPECT_TRUE(result.state.headerPrinted);
    ASSERT_TRUE(result.state.channelName.has_value());
    EXPECT_EQ(*result.state.channelName, "Groove Salad");
    EXPECT_EQ(result.state.genre, "Ambient");
    EXPECT_EQ(result.state.bitrate, "128kbps");
    EXPECT_EQ(result.stats.stationIds, 1u);
    EXPECT_EQ(result.stats.tracksLogged, 1u);
    EXPECT_FALSE(result.cancelled);
}

TEST_F(StreamSessionTest, Mpg123HeaderThenTracks) {
    auto result = runLines(PlayerKind::Mpg123,
                           {
                               "High Performance MPEG 1.0/2.0/2.5 Audio Player",
                               "ICY-NAME: Drone Zone: Atmospheric textures",
                               "ICY-GENRE: Ambient",
                               "MPEG 1.0 L III cbr128 44100 j-s",
                               "ICY-META: StreamTitle='Stars of the Lid - Requiem';",
                               "ICY-META: StreamTitle='Biosphere - Kobresia';",
                           });

    EXPECT_EQ(result.state.playerAnnouncement, "High Performance MPEG 1.0/2.0/2.5 Audio Player");
    EXPECT_EQ(trackLog.titles("Drone Zone").size(), 2u);
    EXPECT_EQ(result.stats.tracksLogged, 2u);
}

// ============================================================
// Channel name requirements
// ============================================================

TEST_F(StreamSessionTest, EveryNonStationTitleIsLoggedUnderChannel) {
    std::vector<std::string> lines = {"Name: Lush", "Bitrate: 128kbps"};
    for (int i = 0; i < 5; ++i) {
        lines.push_back("ICY Info: StreamTitle='Track " + std::to_string(i) + "';");
    }
    runLines(PlayerKind::Mplayer, lines);

    EXPECT_EQ(trackLog.titles("Lush").size(), 5u);
}

TEST_F(StreamSessionTest, WithoutChannelNameNothingIsLogged) {
    auto result = runLines(PlayerKind::Mplayer,
                           {
                               "Genre: Ambient",
                               "Bitrate: 128kbps",
                               "ICY Info: StreamTitle='Track A';",
                               "ICY Info: StreamTitle='Track B';",
                           },
                           notifyingOptions());

    EXPECT_EQ(console.tracks.size(), 2u);
    EXPECT_TRUE(trackLog.empty());
    EXPECT_TRUE(notifier.titles.empty());
    EXPECT_EQ(result.stats.tracksLogged, 0u);
    EXPECT_FALSE(result.state.channelName.has_value());
}

TEST_F(StreamSessionTest, SeedNameFillsMissingChannelAtHeaderEnd) {
    SessionOptions options;
    options.seedChannelName = "Groove Salad";
    runLines(PlayerKind::Mplayer, {"Bitrate: 128kbps", "ICY Info: StreamTitle='Track A';"},
             options);

    EXPECT_EQ(trackLog.titles("Groove Salad"), std::vector<std::string>{"Track A"});
}

TEST_F(StreamSessionTest, AnnouncedNameBeatsSeedName) {
    SessionOptions options;
    options.seedChannelName = "groovesalad";
    runLines(PlayerKind::Mplayer,
             {"Name: Groove Salad", "Bitrate: 128kbps", "ICY Info: StreamTitle='Track A';"},
             options);

    EXPECT_EQ(trackLog.titles("Groove Salad").size(), 1u);
    EXPECT_TRUE(trackLog.titles("groovesalad").empty());
}

TEST_F(StreamSessionTest, FirstChannelNameWins) {
    auto result = runLines(PlayerKind::Mplayer, {"Name: First", "Name: Second", "Bitrate: 1"});

    EXPECT_EQ(*result.state.channelName, "First");
    // Both announcements are still shown
    EXPECT_EQ(console.headers.size(), 3u);
}

// ============================================================
// Header gate
// ============================================================

TEST_F(StreamSessionTest, TitleBeforeHeaderIsRenderedNotDispatched) {
    runLines(PlayerKind::Mplayer,
             {
                 "Name: Groove Salad",
                 "ICY Info: StreamTitle='Too Early';",
                 "Bitrate: 128kbps",
                 "ICY Info: StreamTitle='On Time';",
             },
             notifyingOptions());

    ASSERT_EQ(console.tracks.size(), 2u);
    EXPECT_EQ(trackLog.titles("Groove Salad"), std::vector<std::string>{"On Time"});
    EXPECT_EQ(notifier.titles, std::vector<std::string>{"On Time"});
}

TEST_F(StreamSessionTest, EarlyTitleRepeatedAfterHeaderIsDispatched) {
    auto result = runLines(PlayerKind::Mplayer,
                           {
                               "Name: Groove Salad",
                               "ICY Info: StreamTitle='Artist - Track';",
                               "Bitrate: 128kbps",
                               "ICY Info: StreamTitle='Artist - Track';",
                           },
                           notifyingOptions());

    EXPECT_EQ(console.tracks.size(), 2u);
    EXPECT_EQ(trackLog.titles("Groove Salad"), std::vector<std::string>{"Artist - Track"});
    EXPECT_EQ(notifier.titles, std::vector<std::string>{"Artist - Track"});
    EXPECT_EQ(result.stats.duplicateTracks, 0u);
}

TEST_F(StreamSessionTest, HeaderFieldsAfterHeaderEndAreNotReinterpreted) {
    auto result = runLines(PlayerKind::Mplayer,
                           {"Name: Groove Salad", "Bitrate: 128kbps", "Genre: Late Genre"});

    EXPECT_TRUE(result.state.genre.empty());
    EXPECT_EQ(result.stats.unrecognizedLines, 1u);
}

TEST_F(StreamSessionTest, MpvBypassesHeaderAndUsesSeedName) {
    SessionOptions options = notifyingOptions();
    options.seedChannelName = "Groove Salad";
    options.iconPath = "/tmp/groovesalad.png";

    StreamSession session(PlayerKind::Mpv, options, console, &trackLog, {&notifier});
    EXPECT_EQ(session.state().phase, SessionPhase::Streaming);
    EXPECT_TRUE(session.state().headerPrinted);

    VectorLineSource source({
        " icy-title: Tycho - Awake",
        "Playing: https://ice1.somafm.com/groovesalad-128-mp3",
        " icy-title: Bonobo - Kerala",
    });
    auto result = session.run(source, std::atomic_bool{false});

    EXPECT_EQ(trackLog.titles("Groove Salad").size(), 2u);
    EXPECT_EQ(notifier.icons, (std::vector<std::string>{"/tmp/groovesalad.png",
                                                        "/tmp/groovesalad.png"}));
    ASSERT_EQ(console.headers.size(), 1u);
    EXPECT_EQ(console.headers[0].first, FieldRole::PlayerAnnouncement);
    EXPECT_TRUE(result.state.headerEndSeen);
}

TEST_F(StreamSessionTest, MpvWithoutSeedDoesNotLog) {
    runLines(PlayerKind::Mpv, {" icy-title: Tycho - Awake"});

    EXPECT_EQ(console.tracks.size(), 1u);
    EXPECT_TRUE(trackLog.empty());
}

// ============================================================
// Degenerate streams
// ============================================================

TEST_F(StreamSessionTest, EmptyStreamTerminatesWithoutSideEffects) {
    auto result = runLines(PlayerKind::Mplayer, {});

    EXPECT_EQ(result.state.phase, SessionPhase::Terminated);
    EXPECT_FALSE(result.state.headerPrinted);
    EXPECT_EQ(console.calls(), 0u);
    EXPECT_TRUE(trackLog.empty());
    EXPECT_EQ(result.stats.linesRead, 0u);
}

TEST_F(StreamSessionTest, UnrecognizedLinesLeaveStateUntouched) {
    auto result = runLines(PlayerKind::Mplayer,
                           {"Cache fill: 12%", "A:   1.2 (01.2) of 0.0 (unknown)", "garbage"});

    EXPECT_EQ(result.state.phase, SessionPhase::Terminated);
    EXPECT_FALSE(result.state.headerPrinted);
    EXPECT_FALSE(result.state.channelName.has_value());
    EXPECT_FALSE(result.state.lastTitle.has_value());
    EXPECT_EQ(console.calls(), 0u);
    EXPECT_EQ(result.stats.unrecognizedLines, 3u);
}

TEST_F(StreamSessionTest, VerboseEchoesUnrecognizedLines) {
    SessionOptions options;
    options.verbose = true;
    runLines(PlayerKind::Mplayer, {"Cache fill: 12%"}, options);

    EXPECT_EQ(console.rawLines, std::vector<std::string>{"Cache fill: 12%"});
}

// ============================================================
// Per-track dispatch
// ============================================================

TEST_F(StreamSessionTest, ConsecutiveDuplicateTitleDispatchedOnce) {
    auto result = runLines(PlayerKind::Mplayer,
                           {
                               "Name: Groove Salad",
                               "Bitrate: 128kbps",
                               "ICY Info: StreamTitle='Same';",
                               "ICY Info: StreamTitle='Same';",
                               "ICY Info: StreamTitle='Other';",
                               "ICY Info: StreamTitle='Same';",
                           },
                           notifyingOptions());

    EXPECT_EQ(console.tracks.size(), 3u);
    EXPECT_EQ(trackLog.titles("Groove Salad"),
              (std::vector<std::string>{"Same", "Other", "Same"}));
    EXPECT_EQ(notifier.titles.size(), 3u);
    EXPECT_EQ(result.stats.duplicateTracks, 1u);
}

TEST_F(StreamSessionTest, NotifyDisabledSkipsNotifiers) {
    runLines(PlayerKind::Mplayer, kMplayerScenario);

    EXPECT_TRUE(notifier.titles.empty());
    EXPECT_EQ(trackLog.size(), 1u);
}

TEST_F(StreamSessionTest, LogDisabledSkipsTrackLog) {
    SessionOptions options = notifyingOptions();
    options.logEnabled = false;
    auto result = runLines(PlayerKind::Mplayer, kMplayerScenario, options);

    EXPECT_TRUE(trackLog.empty());
    EXPECT_EQ(notifier.titles.size(), 1u);
    EXPECT_EQ(result.stats.tracksLogged, 0u);
}

TEST_F(StreamSessionTest, HighlightCanBeDisabled) {
    SessionOptions options;
    options.stationHighlight = false;
    runLines(PlayerKind::Mplayer, kMplayerScenario, options);

    ASSERT_FALSE(console.tracks.empty());
    EXPECT_TRUE(console.tracks[0].stationId);
    EXPECT_FALSE(console.tracks[0].highlight);
}

TEST_F(StreamSessionTest, CustomStationIdList) {
    SessionOptions options;
    options.stationIds = {"Listener Supported"};
    runLines(PlayerKind::Mplayer,
             {"Name: Groove Salad", "Bitrate: 1", "ICY Info: StreamTitle='Listener Supported';",
              "ICY Info: StreamTitle='SomaFM - Groove Salad';"},
             options);

    EXPECT_EQ(trackLog.titles("Groove Salad"),
              std::vector<std::string>{"SomaFM - Groove Salad"});
}

TEST_F(StreamSessionTest, NoTrackLogIsAllowed) {
    StreamSession session(PlayerKind::Mplayer, SessionOptions{}, console);
    VectorLineSource source(kMplayerScenario);
    auto result = session.run(source, std::atomic_bool{false});

    EXPECT_EQ(console.tracks.size(), 2u);
    EXPECT_EQ(result.stats.tracksLogged, 0u);
}

// ============================================================
// Hook failures
// ============================================================

TEST_F(StreamSessionTest, ThrowingNotifierDoesNotStopOthers) {
    ThrowingNotifier throwing;
    StreamSession session(PlayerKind::Mplayer, notifyingOptions(), console, &trackLog,
                          {&throwing, &notifier});
    VectorLineSource source(kMplayerScenario);
    auto result = session.run(source, std::atomic_bool{false});

    EXPECT_EQ(throwing.calls, 1);
    EXPECT_EQ(notifier.titles, std::vector<std::string>{"Artist - Track"});
    EXPECT_EQ(trackLog.size(), 1u);
    EXPECT_EQ(result.stats.hookFailures, 1u);
    EXPECT_EQ(result.stats.notifications, 1u);
}

TEST_F(StreamSessionTest, ThrowingConsoleDoesNotEndSession) {
    class ThrowingConsole : public RecordingConsole {
       public:
        void headerField(FieldRole, const std::string&) override {
            throw std::runtime_error("stdout closed");
        }
    } throwingConsole;

    StreamSession session(PlayerKind::Mpv, SessionOptions{}, throwingConsole, &trackLog);
    VectorLineSource source({"Playing: http://x", " icy-title: Still Here"});
    auto result = session.run(source, std::atomic_bool{false});

    EXPECT_EQ(throwingConsole.tracks.size(), 1u);
    EXPECT_EQ(result.stats.linesRead, 2u);
    EXPECT_EQ(result.stats.hookFailures, 1u);
}

// ============================================================
// Cancellation
// ============================================================

TEST_F(StreamSessionTest, StopBeforeFirstReadConsumesNothing) {
    StreamSession session(PlayerKind::Mplayer, SessionOptions{}, console, &trackLog);
    VectorLineSource source(kMplayerScenario);
    std::atomic_bool stop{true};
    auto result = session.run(source, stop);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(source.consumed(), 0u);
    EXPECT_EQ(result.state.phase, SessionPhase::Terminated);
    EXPECT_EQ(console.calls(), 0u);
}

TEST_F(StreamSessionTest, StopMidStreamKeepsEarlierTracks) {
    StreamSession session(PlayerKind::Mplayer, SessionOptions{}, console, &trackLog);
    std::vector<std::string> lines = kMplayerScenario;
    lines.push_back("ICY Info: StreamTitle='Never Seen';");
    VectorLineSource source(lines);

    size_t checks = 0;
    auto result = session.run(source, [&checks]() { return ++checks > kMplayerScenario.size(); });

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(source.consumed(), kMplayerScenario.size());
    EXPECT_EQ(trackLog.titles("Groove Salad"), std::vector<std::string>{"Artist - Track"});
}

// Player pipe that stays open, so reads block until cancelled.
class BlockingPipeSessionTest : public StreamSessionTest {
   protected:
    void SetUp() override {
        ASSERT_EQ(pipe(fds_), 0);
        const std::string header = "Name: Groove Salad\nBitrate: 128kbps\n";
        ASSERT_EQ(write(fds_[1], header.data(), header.size()),
                  static_cast<ssize_t>(header.size()));
    }

    void TearDown() override {
        for (int fd : fds_) {
            if (fd >= 0) {
                close(fd);
            }
        }
    }

    int fds_[2] = {-1, -1};
};

TEST_F(BlockingPipeSessionTest, SignalCancelsBlockedRead) {
    const int handled[3] = {SIGINT, SIGTERM, SIGHUP};
    struct sigaction previous[3] = {};
    for (int i = 0; i < 3; ++i) {
        sigaction(handled[i], nullptr, &previous[i]);
    }

    auto& signals = graceful_shutdown::getGlobalSignalState();
    signals.reset();
    ASSERT_TRUE(graceful_shutdown::installSignalHandlers());

    graceful_shutdown::Controller controller;
    controller.setSignalState(&signals);
    int stopCalls = 0;
    controller.setStopPlayerCallback([&stopCalls]() { ++stopCalls; });

    // Long poll interval: only EINTR can end the wait in time
    StreamSession session(PlayerKind::Mplayer, SessionOptions{}, console, &trackLog);
    FdLineSource source(fds_[0], kDefaultMaxLineBytes, std::chrono::seconds(30));

    const pthread_t sessionThread = pthread_self();
    std::thread killer([sessionThread]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        pthread_kill(sessionThread, SIGTERM);
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = session.run(source, [&controller]() {
        controller.processPendingSignals();
        return !controller.isRunning();
    });
    const auto elapsed = std::chrono::steady_clock::now() - start;
    killer.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.state.headerPrinted);
    EXPECT_EQ(controller.getLastSignal(), SIGTERM);
    EXPECT_EQ(stopCalls, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    signals.reset();
    for (int i = 0; i < 3; ++i) {
        sigaction(handled[i], &previous[i], nullptr);
    }
}

TEST_F(BlockingPipeSessionTest, StopFlagIsSeenWithoutAnySignal) {
    StreamSession session(PlayerKind::Mplayer, SessionOptions{}, console, &trackLog);
    FdLineSource source(fds_[0], kDefaultMaxLineBytes, std::chrono::milliseconds(50));

    std::atomic_bool stop{false};
    std::thread stopper([&stop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop.store(true, std::memory_order_release);
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = session.run(source, stop);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.stats.linesRead, 2u);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(SessionPhase, Names) {
    EXPECT_STREQ(sessionPhaseToString(SessionPhase::AwaitingHeader), "awaiting_header");
    EXPECT_STREQ(sessionPhaseToString(SessionPhase::Streaming), "streaming");
    EXPECT_STREQ(sessionPhaseToString(SessionPhase::Terminated), "terminated");
}
