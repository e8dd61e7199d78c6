#pragma once

#include "core/error_codes.h"

#include <cstddef>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace somaplay {

// Titles heard per channel. Appends during a session; persisted as one JSON
// object mapping channel name to an array of titles. Loaded before and
// flushed after the live session, never during.
class TrackLog {
   public:
    using TitleList = std::vector<std::string>;

    // Missing file -> empty log. Unreadable or malformed file -> empty log
    // and a warning; the optional error receives the reason.
    static TrackLog load(const std::filesystem::path& path, ErrorCode* error = nullptr);

    // Accepts {"channel": ["title", ...]}; other member types are skipped.
    static TrackLog fromJson(const nlohmann::json& j);

    void record(const std::string& channel, const std::string& title);

    // Full overwrite of path via temp file + rename. With deduplicate each
    // channel's titles collapse to a sorted set.
    ErrorCode flush(const std::filesystem::path& path, bool deduplicate) const;

    nlohmann::json toJson(bool deduplicate) const;

    const TitleList& titles(const std::string& channel) const;
    std::vector<std::string> channels() const;
    size_t size() const;
    bool empty() const;

   private:
    std::map<std::string, TitleList> entries_;
};

}  // namespace somaplay
