#include "stream/player_kind.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace somaplay {
namespace stream {

std::optional<PlayerKind> parsePlayerKind(std::string_view name) {
    std::string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "mpv") {
        return PlayerKind::Mpv;
    }
    if (lower == "mplayer") {
        return PlayerKind::Mplayer;
    }
    if (lower == "mpg123") {
        return PlayerKind::Mpg123;
    }
    return std::nullopt;
}

const char* playerKindToString(PlayerKind kind) {
    switch (kind) {
    case PlayerKind::Mplayer:
        return "mplayer";
    case PlayerKind::Mpg123:
        return "mpg123";
    case PlayerKind::Mpv:
    default:
        return "mpv";
    }
}

}  // namespace stream
}  // namespace somaplay
