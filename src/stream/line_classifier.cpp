#include "stream/line_classifier.h"

#include <cstdint>

namespace somaplay {
namespace stream {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";
constexpr std::string_view kStreamTitleKey = "StreamTitle='";
constexpr std::string_view kIcyTitleMarker = "icy-title:";

std::string_view trimView(std::string_view s) {
    auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(kWhitespace);
    return s.substr(start, end - start + 1);
}

std::string_view trimLeft(std::string_view s) {
    auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    return s.substr(start);
}

std::optional<std::string> nonEmpty(std::string_view value) {
    value = trimView(value);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string{value};
}

}  // namespace

std::string_view stripLineEnding(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

bool isValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<std::uint8_t>(text[i]);
        if (c == 0x00) {
            return false;
        }
        size_t continuation = 0;
        if (c < 0x80) {
            continuation = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            continuation = 1;
        } else if ((c & 0xF0) == 0xE0) {
            continuation = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            continuation = 3;
        } else {
            return false;
        }
        if (i + continuation >= text.size()) {
            return false;  // truncated sequence
        }
        // Second-byte bounds rule out overlongs, surrogates and > U+10FFFF
        std::uint8_t low = 0x80;
        std::uint8_t high = 0xBF;
        if (c == 0xE0) {
            low = 0xA0;
        } else if (c == 0xED) {
            high = 0x9F;
        } else if (c == 0xF0) {
            low = 0x90;
        } else if (c == 0xF4) {
            high = 0x8F;
        }
        for (size_t k = 1; k <= continuation; ++k) {
            const auto cc = static_cast<std::uint8_t>(text[i + k]);
            if (k == 1 ? (cc < low || cc > high) : (cc & 0xC0) != 0x80) {
                return false;
            }
        }
        i += continuation + 1;
    }
    return true;
}

std::optional<std::string> extractIcyStreamTitle(std::string_view line) {
    auto key = line.find(kStreamTitleKey);
    if (key == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t start = key + kStreamTitleKey.size();

    size_t end = line.find("';", start);
    if (end == std::string_view::npos) {
        // Truncated metadata: fall back to the last quote on the line
        end = line.rfind('\'');
        if (end == std::string_view::npos || end < start) {
            return std::nullopt;
        }
    }
    return nonEmpty(line.substr(start, end - start));
}

bool ruleMatches(std::string_view line, const DialectRule& rule) {
    if (rule.matchAnywhere) {
        return line.find(rule.prefix) != std::string_view::npos;
    }
    const auto trimmed = trimLeft(line);
    return trimmed.substr(0, rule.prefix.size()) == rule.prefix;
}

std::optional<std::string> extractRuleValue(std::string_view line, const DialectRule& rule) {
    const auto trimmed = trimLeft(line);

    switch (rule.mode) {
    case ExtractMode::WholeLine:
        return nonEmpty(trimmed);

    case ExtractMode::AfterFirstColon: {
        auto colon = trimmed.find(':');
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }
        return nonEmpty(trimmed.substr(colon + 1));
    }

    case ExtractMode::FirstColonSegment: {
        auto colon = trimmed.find(':');
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }
        auto rest = trimmed.substr(colon + 1);
        auto second = rest.find(':');
        if (second != std::string_view::npos) {
            rest = rest.substr(0, second);
        }
        return nonEmpty(rest);
    }

    case ExtractMode::AfterPrefix:
        if (trimmed.size() < rule.prefix.size()) {
            return std::nullopt;
        }
        return nonEmpty(trimmed.substr(rule.prefix.size()));

    case ExtractMode::IcyStreamTitle:
        return extractIcyStreamTitle(trimmed);

    case ExtractMode::IcyTitleMarker: {
        auto marker = line.find(kIcyTitleMarker);
        if (marker == std::string_view::npos) {
            return std::nullopt;
        }
        return nonEmpty(line.substr(marker + kIcyTitleMarker.size()));
    }
    }
    return std::nullopt;
}

ClassifiedEvent classifyLine(std::string_view rawLine, const DialectProfile& profile,
                             bool headerComplete) {
    const std::string_view line = stripLineEnding(rawLine);
    if (!isValidUtf8(line)) {
        return Unrecognized{std::string{line}};
    }

    if (!headerComplete) {
        for (const auto& rule : profile.headerRules) {
            if (!ruleMatches(line, rule)) {
                continue;
            }
            if (auto value = extractRuleValue(line, rule)) {
                return HeaderField{rule.role, std::move(*value), rule.endsHeader};
            }
        }
    }

    for (const auto& rule : profile.trackRules) {
        if (!ruleMatches(line, rule)) {
            continue;
        }
        if (auto value = extractRuleValue(line, rule)) {
            return TrackUpdate{std::move(*value)};
        }
    }

    return Unrecognized{std::string{line}};
}

}  // namespace stream
}  // namespace somaplay
