#ifndef SOMAPLAY_ERROR_CODES_H
#define SOMAPLAY_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace somaplay {

/**
 * @brief Error codes for somaplay.
 *
 * Categories use upper 4 bits of the 16-bit value (0xF000 mask):
 * - 0x1xxx: Configuration
 * - 0x2xxx: Player process
 * - 0x3xxx: Channel catalog
 * - 0x4xxx: Track log persistence
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Configuration (0x1000)
    CONFIG_FILE_NOT_FOUND = 0x1001,
    CONFIG_PARSE_ERROR = 0x1002,
    CONFIG_INVALID_VALUE = 0x1003,
    CONFIG_UNSUPPORTED_PLAYER = 0x1004,

    // Player process (0x2000)
    PLAYER_SPAWN_FAILED = 0x2001,
    PLAYER_PIPE_FAILED = 0x2002,
    PLAYER_EXITED_WITH_ERROR = 0x2003,
    PLAYER_KILLED_BY_SIGNAL = 0x2004,

    // Channel catalog (0x3000)
    CATALOG_NOT_FOUND = 0x3001,
    CATALOG_PARSE_ERROR = 0x3002,
    CATALOG_CHANNEL_NOT_FOUND = 0x3003,

    // Track log (0x4000)
    TRACKLOG_READ_FAILED = 0x4001,
    TRACKLOG_PARSE_ERROR = 0x4002,
    TRACKLOG_WRITE_FAILED = 0x4003,

    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "PLAYER_SPAWN_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "player"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Map an error code to the process exit status reported by main().
 * @return 0 for OK, category-specific non-zero value otherwise
 */
int toExitStatus(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x2001").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isConfigError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isPlayerError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isCatalogError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isTrackLogError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

}  // namespace somaplay

#endif  // SOMAPLAY_ERROR_CODES_H
