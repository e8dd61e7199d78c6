/**
 * @file stream_session.h
 * @brief Single-pass interpreter of a player's console output
 *
 * One StreamSession consumes the combined stdout/stderr of one player
 * process for one playback session:
 *
 *   AwaitingHeader --(end-of-header field)--> Streaming --(EOF/stop)--> Terminated
 *
 * Header fields are rendered as they arrive. Track titles are rendered,
 * checked against the station-ID list and, once a header has been seen and
 * a channel name is known, recorded in the track log and handed to the
 * notifiers. Profiles without a header (mpv) start in Streaming.
 */

#pragma once

#include "stream/dialect_profile.h"
#include "stream/line_classifier.h"
#include "stream/line_source.h"
#include "stream/session_hooks.h"
#include "stream/station_id.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace somaplay {

class TrackLog;

namespace stream {

enum class SessionPhase {
    AwaitingHeader,
    Streaming,
    Terminated,
};

const char* sessionPhaseToString(SessionPhase phase);

struct SessionOptions {
    bool verbose = false;
    bool logEnabled = true;
    bool notifyEnabled = false;
    bool stationHighlight = true;
    // Catalog title; the channel name for players that do not announce one.
    std::optional<std::string> seedChannelName;
    std::string iconPath;
    std::vector<std::string> stationIds = defaultStationIds();
};

struct SessionState {
    PlayerKind playerKind = PlayerKind::Mpv;
    SessionPhase phase = SessionPhase::AwaitingHeader;
    bool headerPrinted = false;  // dispatch gate for logging/notification
    bool headerEndSeen = false;  // end-of-header rule observed
    std::optional<std::string> channelName;
    std::string playerAnnouncement;
    std::string genre;
    std::string website;
    std::string bitrate;
    std::optional<std::string> lastTitle;
};

struct SessionStats {
    size_t linesRead = 0;
    size_t unrecognizedLines = 0;
    size_t tracksSeen = 0;
    size_t duplicateTracks = 0;
    size_t stationIds = 0;
    size_t tracksLogged = 0;
    size_t notifications = 0;
    size_t hookFailures = 0;
};

struct SessionResult {
    SessionState state;
    SessionStats stats;
    bool cancelled = false;
};

class StreamSession {
   public:
    using StopCheck = std::function<bool()>;

    StreamSession(PlayerKind kind, SessionOptions options, ConsoleSink& console,
                  TrackLog* trackLog = nullptr, std::vector<TrackNotifier*> notifiers = {});

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Consume the source until it is exhausted or stopRequested() returns
    // true. The stop check runs before every read and after every
    // interrupted read. May be called once.
    SessionResult run(LineSource& source, const StopCheck& stopRequested);
    SessionResult run(LineSource& source, const std::atomic_bool& stopFlag);

    // Process a single line; run() calls this for every line it reads.
    void handleLine(std::string_view line);

    const SessionState& state() const {
        return state_;
    }
    const SessionStats& stats() const {
        return stats_;
    }

   private:
    void handleHeader(const HeaderField& field);
    void handleTrack(const TrackUpdate& update);
    void handleUnrecognized(const Unrecognized& unrecognized);
    void completeHeader();
    void dispatchTrack(const std::string& title);

    const DialectProfile& profile_;
    SessionOptions options_;
    ConsoleSink& console_;
    TrackLog* trackLog_;
    std::vector<TrackNotifier*> notifiers_;
    SessionState state_;
    SessionStats stats_;
};

}  // namespace stream
}  // namespace somaplay
