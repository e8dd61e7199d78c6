#include "player/player_command.h"

namespace somaplay {
namespace player {

std::string PlayerCommandBuilder::defaultExecutable(stream::PlayerKind kind) {
    return stream::playerKindToString(kind);
}

std::vector<std::string> PlayerCommandBuilder::build(stream::PlayerKind kind,
                                                     const std::string& url,
                                                     const std::string& executable) {
    std::vector<std::string> args;
    args.push_back(executable.empty() ? defaultExecutable(kind) : executable);

    switch (kind) {
    case stream::PlayerKind::Mplayer:
        // -nolirc silences the LIRC probe noise before the stream header
        args.push_back("-nolirc");
        args.push_back("-cache");
        args.push_back("256");
        break;
    case stream::PlayerKind::Mpg123:
        // -v prints the MPEG line that closes the header; -@ accepts playlists
        args.push_back("-v");
        args.push_back("-@");
        break;
    case stream::PlayerKind::Mpv:
        // The status line would otherwise be redrawn several times a second
        args.push_back("--no-video");
        args.push_back("--term-status-msg=");
        break;
    }

    args.push_back(url);
    return args;
}

}  // namespace player
}  // namespace somaplay
