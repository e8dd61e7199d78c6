#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace somaplay {
namespace stream {

// External players whose console output we know how to read.
enum class PlayerKind : std::uint8_t {
    Mpv,
    Mplayer,
    Mpg123,
};

// Case-insensitive; returns nullopt for unknown names.
std::optional<PlayerKind> parsePlayerKind(std::string_view name);

const char* playerKindToString(PlayerKind kind);

}  // namespace stream
}  // namespace somaplay
