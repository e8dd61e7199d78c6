/**
 * @file dialect_profile.h
 * @brief Per-player tables describing the console output "dialect"
 *
 * mpv, mplayer and mpg123 each print stream metadata in their own
 * undocumented, line-oriented format. Every format is captured here as data:
 * an ordered list of prefix rules, each naming the field it carries and how
 * its value is cut out of the line. Adding a player means adding a profile,
 * never adding branches to the classifier.
 */

#pragma once

#include "stream/player_kind.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace somaplay {
namespace stream {

enum class FieldRole : std::uint8_t {
    PlayerAnnouncement,
    ChannelName,
    Genre,
    Website,
    Bitrate,
    TrackTitle,
};

enum class ExtractMode : std::uint8_t {
    WholeLine,          // the trimmed line
    AfterFirstColon,    // "Genre  : Ambient Chill" -> "Ambient Chill"
    FirstColonSegment,  // "Name: Groove Salad: chilled beats" -> "Groove Salad"
    AfterPrefix,        // text following the matched prefix
    IcyStreamTitle,     // "StreamTitle='...';" payload
    IcyTitleMarker,     // text following a literal "icy-title:"
};

struct DialectRule {
    std::string_view prefix;
    FieldRole role;
    ExtractMode mode;
    bool endsHeader = false;
    bool matchAnywhere = false;  // search for prefix anywhere, not only at line start
};

struct DialectProfile {
    PlayerKind kind;
    std::string_view name;
    // When false the session skips AwaitingHeader and never gates track
    // dispatch on a header (mpv prints no usable stream header).
    bool headerRequired;
    std::vector<DialectRule> headerRules;
    std::vector<DialectRule> trackRules;
};

// Immutable profile for a player; safe to share between sessions.
const DialectProfile& dialectProfile(PlayerKind kind);

const char* fieldRoleToString(FieldRole role);

}  // namespace stream
}  // namespace somaplay
