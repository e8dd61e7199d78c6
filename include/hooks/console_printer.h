#pragma once

#include "stream/session_hooks.h"

#include <ostream>
#include <string>

namespace somaplay {
namespace hooks {

struct ConsoleStyle {
    bool color = true;  // ANSI escapes; disable when stdout is not a tty
    std::string timestampFormat = "%H:%M:%S";
};

// Renders the now-playing display:
//   Channel: Groove Salad
//   Genre:   Ambient
//   [12:04:31] Artist - Track
class ConsolePrinter : public stream::ConsoleSink {
   public:
    explicit ConsolePrinter(std::ostream& out, ConsoleStyle style = {});

    void headerField(stream::FieldRole role, const std::string& value) override;
    void track(const stream::TrackEvent& event) override;
    void rawLine(const std::string& line) override;

    static const char* labelFor(stream::FieldRole role);

   private:
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) const;

    std::ostream& out_;
    ConsoleStyle style_;
};

}  // namespace hooks
}  // namespace somaplay
