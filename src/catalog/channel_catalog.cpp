#include "catalog/channel_catalog.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace somaplay {

namespace {

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string stringMember(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

}  // namespace

ChannelCatalog ChannelCatalog::fromJson(const nlohmann::json& j) {
    std::vector<Channel> channels;
    if (!j.is_object() || !j.contains("channels") || !j["channels"].is_array()) {
        return ChannelCatalog{};
    }
    for (const auto& item : j["channels"]) {
        if (!item.is_object()) {
            continue;
        }
        Channel channel;
        channel.id = stringMember(item, "id");
        if (channel.id.empty()) {
            continue;
        }
        channel.title = stringMember(item, "title");
        if (channel.title.empty()) {
            channel.title = channel.id;
        }
        channel.genre = stringMember(item, "genre");
        channel.url = stringMember(item, "url");
        channel.iconPath = stringMember(item, "icon");
        channels.push_back(std::move(channel));
    }
    return ChannelCatalog{std::move(channels)};
}

std::optional<ChannelCatalog> ChannelCatalog::loadFromFile(const std::filesystem::path& path,
                                                           ErrorCode* error) {
    if (error) {
        *error = ErrorCode::OK;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_DEBUG("Channel catalog {} not found", path.string());
        if (error) {
            *error = ErrorCode::CATALOG_NOT_FOUND;
        }
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        auto catalog = fromJson(j);
        LOG_DEBUG("Loaded {} channels from {}", catalog.channels().size(), path.string());
        return catalog;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Failed to parse channel catalog {}: {}", path.string(), e.what());
        if (error) {
            *error = ErrorCode::CATALOG_PARSE_ERROR;
        }
        return std::nullopt;
    }
}

std::optional<Channel> ChannelCatalog::find(const std::string& query) const {
    for (const auto& channel : channels_) {
        if (channel.id == query) {
            return channel;
        }
    }
    const std::string lower = toLower(query);
    for (const auto& channel : channels_) {
        if (toLower(channel.id) == lower || toLower(channel.title) == lower) {
            return channel;
        }
    }
    return std::nullopt;
}

std::string expandStreamUrl(const std::string& urlTemplate, const std::string& id) {
    static const std::string kPlaceholder = "{id}";
    std::string url = urlTemplate;
    size_t pos = 0;
    while ((pos = url.find(kPlaceholder, pos)) != std::string::npos) {
        url.replace(pos, kPlaceholder.size(), id);
        pos += id.size();
    }
    return url;
}

std::optional<Channel> resolveChannel(const std::string& query, const ChannelCatalog& catalog,
                                      const std::string& urlTemplate, ErrorCode* error) {
    if (error) {
        *error = ErrorCode::OK;
    }

    if (auto channel = catalog.find(query)) {
        if (channel->url.empty()) {
            channel->url = expandStreamUrl(urlTemplate, channel->id);
        }
        return channel;
    }

    if (query.find("://") != std::string::npos) {
        Channel direct;
        direct.id = query;
        direct.title = query;
        direct.url = query;
        return direct;
    }

    if (error) {
        *error = ErrorCode::CATALOG_CHANNEL_NOT_FOUND;
    }
    return std::nullopt;
}

}  // namespace somaplay
