#pragma once

#include "stream/dialect_profile.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace somaplay {
namespace stream {

struct HeaderField {
    FieldRole role;
    std::string value;
    bool endsHeader = false;
};

struct TrackUpdate {
    std::string title;
};

struct Unrecognized {
    std::string line;
};

using ClassifiedEvent = std::variant<HeaderField, TrackUpdate, Unrecognized>;

// Classify one raw output line. Never throws for malformed input: anything
// that is not valid UTF-8, contains NUL bytes, or matches no rule of the
// profile comes back as Unrecognized. Header rules are consulted only while
// the header is incomplete; track rules are consulted at any time.
ClassifiedEvent classifyLine(std::string_view line, const DialectProfile& profile,
                             bool headerComplete);

// Pull the title out of "StreamTitle='...';StreamUrl=...". The title ends at
// the first "';" so single quotes and semicolons inside it survive.
std::optional<std::string> extractIcyStreamTitle(std::string_view line);

// Apply one rule to a line that is already known to match its prefix.
std::optional<std::string> extractRuleValue(std::string_view line, const DialectRule& rule);

bool ruleMatches(std::string_view line, const DialectRule& rule);

bool isValidUtf8(std::string_view text);

std::string_view stripLineEnding(std::string_view line);

}  // namespace stream
}  // namespace somaplay
