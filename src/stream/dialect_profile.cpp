#include "stream/dialect_profile.h"

namespace somaplay {
namespace stream {

namespace {

const DialectProfile& mplayerProfile() {
    static const DialectProfile profile{
        PlayerKind::Mplayer,
        "mplayer",
        true,
        {
            {"MPlayer", FieldRole::PlayerAnnouncement, ExtractMode::WholeLine},
            {"Name", FieldRole::ChannelName, ExtractMode::FirstColonSegment},
            {"Genre", FieldRole::Genre, ExtractMode::AfterFirstColon},
            {"Website", FieldRole::Website, ExtractMode::AfterFirstColon},
            {"Bitrate", FieldRole::Bitrate, ExtractMode::AfterFirstColon, true},
        },
        {
            {"ICY Info:", FieldRole::TrackTitle, ExtractMode::IcyStreamTitle},
        },
    };
    return profile;
}

const DialectProfile& mpg123Profile() {
    static const DialectProfile profile{
        PlayerKind::Mpg123,
        "mpg123",
        true,
        {
            {"High Performance MPEG", FieldRole::PlayerAnnouncement, ExtractMode::WholeLine},
            {"ICY-NAME:", FieldRole::ChannelName, ExtractMode::FirstColonSegment},
            {"ICY-GENRE:", FieldRole::Genre, ExtractMode::AfterFirstColon},
            {"ICY-URL:", FieldRole::Website, ExtractMode::AfterFirstColon},
            // "MPEG 1.0 L III cbr128 44100 j-s"
            {"MPEG ", FieldRole::Bitrate, ExtractMode::AfterPrefix, true},
        },
        {
            {"ICY-META:", FieldRole::TrackTitle, ExtractMode::IcyStreamTitle},
        },
    };
    return profile;
}

const DialectProfile& mpvProfile() {
    static const DialectProfile profile{
        PlayerKind::Mpv,
        "mpv",
        false,
        {
            {"Playing:", FieldRole::PlayerAnnouncement, ExtractMode::AfterFirstColon, true},
        },
        {
            // mpv indents file tags, e.g. " icy-title: Artist - Track"
            {"icy-title:", FieldRole::TrackTitle, ExtractMode::IcyTitleMarker, false, true},
        },
    };
    return profile;
}

}  // namespace

const DialectProfile& dialectProfile(PlayerKind kind) {
    switch (kind) {
    case PlayerKind::Mplayer:
        return mplayerProfile();
    case PlayerKind::Mpg123:
        return mpg123Profile();
    case PlayerKind::Mpv:
    default:
        return mpvProfile();
    }
}

const char* fieldRoleToString(FieldRole role) {
    switch (role) {
    case FieldRole::PlayerAnnouncement:
        return "player";
    case FieldRole::ChannelName:
        return "name";
    case FieldRole::Genre:
        return "genre";
    case FieldRole::Website:
        return "website";
    case FieldRole::Bitrate:
        return "bitrate";
    case FieldRole::TrackTitle:
        return "title";
    default:
        return "unknown";
    }
}

}  // namespace stream
}  // namespace somaplay
