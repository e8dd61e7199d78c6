// Build the command line that starts a player on a stream URL
#pragma once

#include "stream/player_kind.h"

#include <string>
#include <vector>

namespace somaplay {
namespace player {

class PlayerCommandBuilder {
   public:
    // executable overrides the binary name (e.g. a full path) when non-empty
    static std::vector<std::string> build(stream::PlayerKind kind, const std::string& url,
                                          const std::string& executable = "");

    static std::string defaultExecutable(stream::PlayerKind kind);
};

}  // namespace player
}  // namespace somaplay
