#include "track_log/track_log.h"

#include "logging/logger.h"

#include <cstdio>
#include <fstream>
#include <set>
#include <system_error>

namespace somaplay {

TrackLog TrackLog::load(const std::filesystem::path& path, ErrorCode* error) {
    if (error) {
        *error = ErrorCode::OK;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_DEBUG("Track log {} not found, starting empty", path.string());
        return TrackLog{};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot read track log {}, starting empty", path.string());
        if (error) {
            *error = ErrorCode::TRACKLOG_READ_FAILED;
        }
        return TrackLog{};
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            LOG_WARN("Track log {} is not a JSON object, starting empty", path.string());
            if (error) {
                *error = ErrorCode::TRACKLOG_PARSE_ERROR;
            }
            return TrackLog{};
        }
        TrackLog log = fromJson(j);
        LOG_DEBUG("Loaded track log {} ({} titles)", path.string(), log.size());
        return log;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Failed to parse track log {}: {}", path.string(), e.what());
        if (error) {
            *error = ErrorCode::TRACKLOG_PARSE_ERROR;
        }
        return TrackLog{};
    }
}

TrackLog TrackLog::fromJson(const nlohmann::json& j) {
    TrackLog log;
    if (!j.is_object()) {
        return log;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_array()) {
            continue;
        }
        auto& titles = log.entries_[it.key()];
        for (const auto& item : it.value()) {
            if (item.is_string()) {
                titles.push_back(item.get<std::string>());
            }
        }
    }
    return log;
}

void TrackLog::record(const std::string& channel, const std::string& title) {
    entries_[channel].push_back(title);
}

nlohmann::json TrackLog::toJson(bool deduplicate) const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [channel, titles] : entries_) {
        if (deduplicate) {
            std::set<std::string> unique(titles.begin(), titles.end());
            j[channel] = unique;
        } else {
            j[channel] = titles;
        }
    }
    return j;
}

ErrorCode TrackLog::flush(const std::filesystem::path& path, bool deduplicate) const {
    if (path.empty()) {
        LOG_ERROR("Track log path is empty");
        return ErrorCode::TRACKLOG_WRITE_FAILED;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create directory for track log {}: {}", path.string(),
                      ec.message());
            return ErrorCode::TRACKLOG_WRITE_FAILED;
        }
    }

    const std::string tmpPath = path.string() + ".tmp";
    {
        std::ofstream ofs(tmpPath);
        if (!ofs) {
            LOG_ERROR("Cannot write track log {}", tmpPath);
            return ErrorCode::TRACKLOG_WRITE_FAILED;
        }
        ofs << toJson(deduplicate).dump(2) << '\n';
        if (!ofs) {
            LOG_ERROR("Failed while writing track log {}", tmpPath);
            std::filesystem::remove(tmpPath, ec);
            return ErrorCode::TRACKLOG_WRITE_FAILED;
        }
    }

    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        LOG_ERROR("Cannot replace track log {}", path.string());
        std::filesystem::remove(tmpPath, ec);
        return ErrorCode::TRACKLOG_WRITE_FAILED;
    }

    LOG_DEBUG("Track log written to {} ({} titles)", path.string(), size());
    return ErrorCode::OK;
}

const TrackLog::TitleList& TrackLog::titles(const std::string& channel) const {
    static const TitleList kEmpty;
    auto it = entries_.find(channel);
    if (it == entries_.end()) {
        return kEmpty;
    }
    return it->second;
}

std::vector<std::string> TrackLog::channels() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.first);
    }
    return names;
}

size_t TrackLog::size() const {
    size_t total = 0;
    for (const auto& entry : entries_) {
        total += entry.second.size();
    }
    return total;
}

bool TrackLog::empty() const {
    return size() == 0;
}

}  // namespace somaplay
