#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace somaplay {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Configuration
    {ErrorCode::CONFIG_FILE_NOT_FOUND, "CONFIG_FILE_NOT_FOUND"},
    {ErrorCode::CONFIG_PARSE_ERROR, "CONFIG_PARSE_ERROR"},
    {ErrorCode::CONFIG_INVALID_VALUE, "CONFIG_INVALID_VALUE"},
    {ErrorCode::CONFIG_UNSUPPORTED_PLAYER, "CONFIG_UNSUPPORTED_PLAYER"},

    // Player process
    {ErrorCode::PLAYER_SPAWN_FAILED, "PLAYER_SPAWN_FAILED"},
    {ErrorCode::PLAYER_PIPE_FAILED, "PLAYER_PIPE_FAILED"},
    {ErrorCode::PLAYER_EXITED_WITH_ERROR, "PLAYER_EXITED_WITH_ERROR"},
    {ErrorCode::PLAYER_KILLED_BY_SIGNAL, "PLAYER_KILLED_BY_SIGNAL"},

    // Channel catalog
    {ErrorCode::CATALOG_NOT_FOUND, "CATALOG_NOT_FOUND"},
    {ErrorCode::CATALOG_PARSE_ERROR, "CATALOG_PARSE_ERROR"},
    {ErrorCode::CATALOG_CHANNEL_NOT_FOUND, "CATALOG_CHANNEL_NOT_FOUND"},

    // Track log
    {ErrorCode::TRACKLOG_READ_FAILED, "TRACKLOG_READ_FAILED"},
    {ErrorCode::TRACKLOG_PARSE_ERROR, "TRACKLOG_PARSE_ERROR"},
    {ErrorCode::TRACKLOG_WRITE_FAILED, "TRACKLOG_WRITE_FAILED"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// Reverse lookup
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = {
    {"OK", ErrorCode::OK},
    {"CONFIG_FILE_NOT_FOUND", ErrorCode::CONFIG_FILE_NOT_FOUND},
    {"CONFIG_PARSE_ERROR", ErrorCode::CONFIG_PARSE_ERROR},
    {"CONFIG_INVALID_VALUE", ErrorCode::CONFIG_INVALID_VALUE},
    {"CONFIG_UNSUPPORTED_PLAYER", ErrorCode::CONFIG_UNSUPPORTED_PLAYER},
    {"PLAYER_SPAWN_FAILED", ErrorCode::PLAYER_SPAWN_FAILED},
    {"PLAYER_PIPE_FAILED", ErrorCode::PLAYER_PIPE_FAILED},
    {"PLAYER_EXITED_WITH_ERROR", ErrorCode::PLAYER_EXITED_WITH_ERROR},
    {"PLAYER_KILLED_BY_SIGNAL", ErrorCode::PLAYER_KILLED_BY_SIGNAL},
    {"CATALOG_NOT_FOUND", ErrorCode::CATALOG_NOT_FOUND},
    {"CATALOG_PARSE_ERROR", ErrorCode::CATALOG_PARSE_ERROR},
    {"CATALOG_CHANNEL_NOT_FOUND", ErrorCode::CATALOG_CHANNEL_NOT_FOUND},
    {"TRACKLOG_READ_FAILED", ErrorCode::TRACKLOG_READ_FAILED},
    {"TRACKLOG_PARSE_ERROR", ErrorCode::TRACKLOG_PARSE_ERROR},
    {"TRACKLOG_WRITE_FAILED", ErrorCode::TRACKLOG_WRITE_FAILED},
    {"INTERNAL_UNKNOWN", ErrorCode::INTERNAL_UNKNOWN},
};

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isConfigError(code)) {
        return "config";
    }
    if (isPlayerError(code)) {
        return "player";
    }
    if (isCatalogError(code)) {
        return "catalog";
    }
    if (isTrackLogError(code)) {
        return "track_log";
    }
    return "internal";
}

int toExitStatus(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return 0;
    }
    if (isConfigError(code)) {
        return 2;
    }
    if (isPlayerError(code)) {
        return 3;
    }
    if (isCatalogError(code)) {
        return 4;
    }
    if (isTrackLogError(code)) {
        return 5;
    }
    return 1;
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace somaplay
