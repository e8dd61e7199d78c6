#pragma once

#include "stream/dialect_profile.h"

#include <chrono>
#include <string>

namespace somaplay {
namespace stream {

struct TrackEvent {
    std::string title;
    std::chrono::system_clock::time_point timestamp;
    bool stationId = false;
    bool highlight = false;  // render with station-ID highlighting
};

// Receives everything the session wants shown on the terminal.
class ConsoleSink {
   public:
    virtual ~ConsoleSink() = default;

    virtual void headerField(FieldRole role, const std::string& value) = 0;
    virtual void track(const TrackEvent& event) = 0;
    // Verbose mode only: a line no dialect rule recognized.
    virtual void rawLine(const std::string& line) = 0;
};

// Fire-and-forget side effect run once per new (non station ID) track.
// Implementations own their failures; nothing is reported back.
class TrackNotifier {
   public:
    virtual ~TrackNotifier() = default;

    virtual void notify(const std::string& title, const std::string& iconPath) = 0;
};

}  // namespace stream
}  // namespace somaplay
