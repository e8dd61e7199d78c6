#pragma once

#include "core/error_codes.h"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace somaplay {

struct Channel {
    std::string id;
    std::string title;
    std::string genre;
    std::string url;
    std::string iconPath;
};

// Locally cached channel list. Fetching and refreshing the cache is done by
// an external tool; this class only reads it.
class ChannelCatalog {
   public:
    ChannelCatalog() = default;
    explicit ChannelCatalog(std::vector<Channel> channels) : channels_(std::move(channels)) {}

    // {"channels": [{"id", "title", "genre", "url", "icon"}, ...]}
    static std::optional<ChannelCatalog> loadFromFile(const std::filesystem::path& path,
                                                      ErrorCode* error = nullptr);
    static ChannelCatalog fromJson(const nlohmann::json& j);

    // Exact id first, then case-insensitive id or title.
    std::optional<Channel> find(const std::string& query) const;

    const std::vector<Channel>& channels() const {
        return channels_;
    }

   private:
    std::vector<Channel> channels_;
};

// Replace every "{id}" in the template with the channel id.
std::string expandStreamUrl(const std::string& urlTemplate, const std::string& id);

// Resolve a user-supplied channel argument to something playable. Unknown
// arguments that look like URLs ("://") are played directly, titled by the
// URL itself; anything else is CATALOG_CHANNEL_NOT_FOUND.
std::optional<Channel> resolveChannel(const std::string& query, const ChannelCatalog& catalog,
                                      const std::string& urlTemplate,
                                      ErrorCode* error = nullptr);

}  // namespace somaplay
