/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error codes, categories and exit statuses.
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace somaplay;

// ============================================================
// ErrorCode to String Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::PLAYER_SPAWN_FAILED), "PLAYER_SPAWN_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::CATALOG_CHANNEL_NOT_FOUND),
                 "CATALOG_CHANNEL_NOT_FOUND");
    EXPECT_STREQ(errorCodeToString(ErrorCode::TRACKLOG_WRITE_FAILED), "TRACKLOG_WRITE_FAILED");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
}

TEST(ErrorCodes, StringRoundTrip) {
    EXPECT_EQ(stringToErrorCode("PLAYER_KILLED_BY_SIGNAL"), ErrorCode::PLAYER_KILLED_BY_SIGNAL);
    EXPECT_EQ(stringToErrorCode("NOT_A_CODE"), ErrorCode::INTERNAL_UNKNOWN);
}

TEST(ErrorCodes, HexFormatting) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::PLAYER_SPAWN_FAILED), "0x2001");
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
}

// ============================================================
// Error Category Tests
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::CONFIG_PARSE_ERROR), "config");
    EXPECT_STREQ(getErrorCategory(ErrorCode::PLAYER_PIPE_FAILED), "player");
    EXPECT_STREQ(getErrorCategory(ErrorCode::CATALOG_NOT_FOUND), "catalog");
    EXPECT_STREQ(getErrorCategory(ErrorCode::TRACKLOG_READ_FAILED), "track_log");
    EXPECT_STREQ(getErrorCategory(ErrorCode::INTERNAL_UNKNOWN), "internal");
}

TEST(ErrorCodes, CategoryPredicates) {
    EXPECT_TRUE(isConfigError(ErrorCode::CONFIG_UNSUPPORTED_PLAYER));
    EXPECT_TRUE(isPlayerError(ErrorCode::PLAYER_EXITED_WITH_ERROR));
    EXPECT_TRUE(isCatalogError(ErrorCode::CATALOG_PARSE_ERROR));
    EXPECT_TRUE(isTrackLogError(ErrorCode::TRACKLOG_PARSE_ERROR));
    EXPECT_TRUE(isInternalError(ErrorCode::INTERNAL_UNKNOWN));
    EXPECT_FALSE(isPlayerError(ErrorCode::CONFIG_PARSE_ERROR));
}

// ============================================================
// Exit Status Tests
// ============================================================

TEST(ErrorCodes, ExitStatusPerCategory) {
    EXPECT_EQ(toExitStatus(ErrorCode::OK), 0);
    EXPECT_EQ(toExitStatus(ErrorCode::CONFIG_INVALID_VALUE), 2);
    EXPECT_EQ(toExitStatus(ErrorCode::PLAYER_EXITED_WITH_ERROR), 3);
    EXPECT_EQ(toExitStatus(ErrorCode::CATALOG_CHANNEL_NOT_FOUND), 4);
    EXPECT_EQ(toExitStatus(ErrorCode::TRACKLOG_WRITE_FAILED), 5);
    EXPECT_EQ(toExitStatus(ErrorCode::INTERNAL_UNKNOWN), 1);
}
