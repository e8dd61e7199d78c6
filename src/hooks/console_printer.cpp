#include "hooks/console_printer.h"

#include <ctime>

namespace somaplay {
namespace hooks {

namespace {

constexpr const char* kBold = "\033[1m";
constexpr const char* kDim = "\033[2m";
constexpr const char* kStationId = "\033[33m";  // yellow
constexpr const char* kReset = "\033[0m";

}  // namespace

ConsolePrinter::ConsolePrinter(std::ostream& out, ConsoleStyle style)
    : out_(out), style_(std::move(style)) {}

const char* ConsolePrinter::labelFor(stream::FieldRole role) {
    switch (role) {
    case stream::FieldRole::PlayerAnnouncement:
        return "Player";
    case stream::FieldRole::ChannelName:
        return "Channel";
    case stream::FieldRole::Genre:
        return "Genre";
    case stream::FieldRole::Website:
        return "Website";
    case stream::FieldRole::Bitrate:
        return "Bitrate";
    case stream::FieldRole::TrackTitle:
        return "Title";
    default:
        return "Info";
    }
}

void ConsolePrinter::headerField(stream::FieldRole role, const std::string& value) {
    std::string label = std::string(labelFor(role)) + ":";
    label.resize(9, ' ');
    if (style_.color) {
        out_ << kBold << label << kReset << value << '\n';
    } else {
        out_ << label << value << '\n';
    }
    out_.flush();
}

void ConsolePrinter::track(const stream::TrackEvent& event) {
    const std::string stamp = "[" + formatTimestamp(event.timestamp) + "] ";
    if (!style_.color) {
        out_ << stamp << event.title << '\n';
    } else if (event.highlight) {
        out_ << kDim << stamp << kReset << kStationId << event.title << kReset << '\n';
    } else {
        out_ << kDim << stamp << kReset << kBold << event.title << kReset << '\n';
    }
    out_.flush();
}

void ConsolePrinter::rawLine(const std::string& line) {
    if (style_.color) {
        out_ << kDim << line << kReset << '\n';
    } else {
        out_ << line << '\n';
    }
}

std::string ConsolePrinter::formatTimestamp(
    const std::chrono::system_clock::time_point& tp) const {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);

    char buf[64];
    const size_t n = std::strftime(buf, sizeof(buf), style_.timestampFormat.c_str(), &local);
    if (n == 0) {
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    }
    return buf;
}

}  // namespace hooks
}  // namespace somaplay
