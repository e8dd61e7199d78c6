#include "stream/stream_session.h"

#include "logging/logger.h"
#include "track_log/track_log.h"

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace somaplay {
namespace stream {

const char* sessionPhaseToString(SessionPhase phase) {
    switch (phase) {
    case SessionPhase::AwaitingHeader:
        return "awaiting_header";
    case SessionPhase::Streaming:
        return "streaming";
    case SessionPhase::Terminated:
        return "terminated";
    default:
        return "unknown";
    }
}

StreamSession::StreamSession(PlayerKind kind, SessionOptions options, ConsoleSink& console,
                             TrackLog* trackLog, std::vector<TrackNotifier*> notifiers)
    : profile_(dialectProfile(kind)),
      options_(std::move(options)),
      console_(console),
      trackLog_(trackLog),
      notifiers_(std::move(notifiers)) {
    state_.playerKind = kind;

    if (!profile_.headerRequired) {
        // No usable header: the catalog title is all we will ever know.
        state_.phase = SessionPhase::Streaming;
        state_.headerPrinted = true;
        state_.channelName = options_.seedChannelName;
    }
}

SessionResult StreamSession::run(LineSource& source, const std::atomic_bool& stopFlag) {
    return run(source, [&stopFlag]() { return stopFlag.load(std::memory_order_acquire); });
}

SessionResult StreamSession::run(LineSource& source, const StopCheck& stopRequested) {
    SessionResult result;
    std::string line;

    LOG_DEBUG("[StreamSession] start player={} phase={}", profile_.name,
              sessionPhaseToString(state_.phase));

    while (state_.phase != SessionPhase::Terminated) {
        if (stopRequested && stopRequested()) {
            result.cancelled = true;
            break;
        }

        const ReadStatus status = source.readLine(line);
        if (status == ReadStatus::EndOfStream) {
            break;
        }
        if (status == ReadStatus::Interrupted) {
            continue;
        }

        ++stats_.linesRead;
        try {
            handleLine(line);
        } catch (const std::exception& e) {
            // One bad line must not end the session
            ++stats_.hookFailures;
            LOG_ERROR("[StreamSession] failed to handle line: {}", e.what());
        }
    }

    if (state_.phase == SessionPhase::AwaitingHeader) {
        LOG_DEBUG("[StreamSession] stream ended before a complete header");
    }
    state_.phase = SessionPhase::Terminated;

    LOG_IF(WARN, stats_.hookFailures > 0, "[StreamSession] {} hook failure(s) during session",
           stats_.hookFailures);
    LOG_DEBUG("[StreamSession] end lines={} tracks={} logged={} station_ids={} cancelled={}",
              stats_.linesRead, stats_.tracksSeen, stats_.tracksLogged, stats_.stationIds,
              result.cancelled);

    result.state = state_;
    result.stats = stats_;
    return result;
}

void StreamSession::handleLine(std::string_view line) {
    if (state_.phase == SessionPhase::Terminated) {
        return;
    }

    ClassifiedEvent event = classifyLine(line, profile_, state_.headerEndSeen);
    std::visit(
        [this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, HeaderField>) {
                handleHeader(e);
            } else if constexpr (std::is_same_v<T, TrackUpdate>) {
                handleTrack(e);
            } else {
                handleUnrecognized(e);
            }
        },
        event);
}

void StreamSession::handleHeader(const HeaderField& field) {
    switch (field.role) {
    case FieldRole::PlayerAnnouncement:
        state_.playerAnnouncement = field.value;
        break;
    case FieldRole::ChannelName:
        // First announcement wins; some players repeat the name
        if (!state_.channelName) {
            state_.channelName = field.value;
        }
        break;
    case FieldRole::Genre:
        state_.genre = field.value;
        break;
    case FieldRole::Website:
        state_.website = field.value;
        break;
    case FieldRole::Bitrate:
        state_.bitrate = field.value;
        break;
    case FieldRole::TrackTitle:
        break;
    }

    console_.headerField(field.role, field.value);

    if (field.endsHeader) {
        completeHeader();
    }
}

void StreamSession::completeHeader() {
    state_.headerEndSeen = true;
    if (state_.phase != SessionPhase::AwaitingHeader) {
        return;
    }
    if (!state_.channelName && options_.seedChannelName) {
        state_.channelName = options_.seedChannelName;
    }
    state_.headerPrinted = true;
    state_.phase = SessionPhase::Streaming;
    // A title seen before the header was never dispatched; its repeat counts
    state_.lastTitle.reset();
    LOG_DEBUG("[StreamSession] header complete (channel='{}')",
              state_.channelName ? *state_.channelName : std::string{});
}

void StreamSession::handleTrack(const TrackUpdate& update) {
    if (state_.lastTitle && *state_.lastTitle == update.title) {
        // Players resend metadata; a repeat is not a track change
        ++stats_.duplicateTracks;
        return;
    }
    state_.lastTitle = update.title;
    ++stats_.tracksSeen;

    TrackEvent event;
    event.title = update.title;
    event.timestamp = std::chrono::system_clock::now();
    event.stationId = isStationId(update.title, options_.stationIds);
    event.highlight = event.stationId && options_.stationHighlight;
    console_.track(event);

    if (event.stationId) {
        ++stats_.stationIds;
        return;
    }
    dispatchTrack(update.title);
}

void StreamSession::dispatchTrack(const std::string& title) {
    if (profile_.headerRequired && !state_.headerPrinted) {
        LOG_DEBUG("[StreamSession] title before header, not dispatched: {}", title);
        return;
    }
    if (!state_.channelName) {
        LOG_ONCE(WARN, "[StreamSession] channel name unknown; titles will not be logged");
        return;
    }

    if (options_.logEnabled && trackLog_) {
        trackLog_->record(*state_.channelName, title);
        ++stats_.tracksLogged;
    }

    if (!options_.notifyEnabled) {
        return;
    }
    for (auto* notifier : notifiers_) {
        if (!notifier) {
            continue;
        }
        try {
            notifier->notify(title, options_.iconPath);
            ++stats_.notifications;
        } catch (const std::exception& e) {
            ++stats_.hookFailures;
            LOG_WARN("[StreamSession] notifier failed: {}", e.what());
        }
    }
}

void StreamSession::handleUnrecognized(const Unrecognized& unrecognized) {
    ++stats_.unrecognizedLines;
    if (options_.verbose) {
        console_.rawLine(unrecognized.line);
    }
}

}  // namespace stream
}  // namespace somaplay
