/**
 * @file test_cstring_guard.cpp
 * @brief Tests for bounded C string extraction and UTF-8 handling
 */

#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <vector>

#include "wsf/core/wsf_logger.h"
#include "wsf/core/wsf_structured_error.h"
#include "wsf/ffi/wsf_cstring_guard.h"

using namespace whispersafe;

namespace {

const std::string kReplacement = "\xEF\xBF\xBD";

void count_errors(LogLevel level, const char*, const char*, void* user_data) {
    if (level == LogLevel::Error) {
        ++*static_cast<int*>(user_data);
    }
}

}  // namespace

// =============================================================================
// GUARD
// =============================================================================

TEST(CStringGuard, NullPointer) {
    BoundedCStr view;
    EXPECT_EQ(guard_cstr(nullptr, 16, &view), WSF_ERROR_NULL_POINTER);

    std::string s = "unchanged";
    EXPECT_EQ(guard_string(nullptr, 16, Utf8Policy::Lossy, &s), WSF_ERROR_NULL_POINTER);
    EXPECT_EQ(s, "unchanged");
}

TEST(CStringGuard, TerminatorWithinBound) {
    BoundedCStr view;
    ASSERT_EQ(guard_cstr("hello", 6, &view), WSF_SUCCESS);
    EXPECT_EQ(view.length, 5u);
    EXPECT_EQ(view.data[view.length], '\0');
}

TEST(CStringGuard, LongestAcceptedIsMaxLenMinusOne) {
    BoundedCStr view;
    EXPECT_EQ(guard_cstr("hello", 5, &view), WSF_ERROR_INVALID_STRING);
    EXPECT_STREQ(wsf_error_detail(wsf_get_last_error(), "max_len"), "5");
    EXPECT_EQ(guard_cstr("", 1, &view), WSF_SUCCESS);
    EXPECT_EQ(view.length, 0u);
    EXPECT_EQ(guard_cstr("", 0, &view), WSF_ERROR_INVALID_STRING);
}

TEST(CStringGuard, NeverReadsPastBound) {
    // No terminator anywhere in the buffer; the scan must stop at max_len
    char buffer[32];
    std::memset(buffer, 'a', sizeof(buffer));

    BoundedCStr view;
    EXPECT_EQ(guard_cstr(buffer, sizeof(buffer), &view), WSF_ERROR_INVALID_STRING);

    std::vector<uint8_t> bytes = {1, 2, 3};
    EXPECT_EQ(guard_bytes(buffer, sizeof(buffer), &bytes), WSF_ERROR_INVALID_STRING);
    EXPECT_EQ(bytes.size(), 3u);
}

TEST(CStringGuard, StrictRejectsInvalidUtf8) {
    std::string s;
    EXPECT_EQ(guard_string("ab\xFF" "cd", 16, Utf8Policy::Strict, &s), WSF_ERROR_INVALID_UTF8);
    EXPECT_EQ(guard_string("caf\xC3\xA9", 16, Utf8Policy::Strict, &s), WSF_SUCCESS);
    EXPECT_EQ(s, "caf\xC3\xA9");
}

TEST(CStringGuard, PartialUtf8IsNotLoggedAsError) {
    int errors = 0;
    Logger::instance().setCallback(count_errors, &errors);

    std::string out;
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(guard_string("\xE4\xBD", 16, Utf8Policy::Strict, &out),
                  WSF_ERROR_INVALID_UTF8);
    }

    Logger::instance().setCallback(nullptr);
    EXPECT_EQ(errors, 0);
    EXPECT_EQ(wsf_get_last_error()->code, WSF_ERROR_INVALID_UTF8);
}

TEST(CStringGuard, NullOutputIsRejected) {
    EXPECT_EQ(guard_cstr("abc", 8, nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(guard_string("abc", 8, Utf8Policy::Lossy, nullptr), WSF_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(guard_bytes("abc", 8, nullptr), WSF_ERROR_INVALID_ARGUMENT);
}

TEST(CStringGuard, LossyReplacesInvalidSequences) {
    std::string s;
    ASSERT_EQ(guard_string("ab\xFF" "cd", 16, Utf8Policy::Lossy, &s), WSF_SUCCESS);
    EXPECT_EQ(s, "ab" + kReplacement + "cd");
}

TEST(CStringGuard, BytesKeepPartialSequences) {
    // First two bytes of a three-byte character, as a token piece can carry
    std::vector<uint8_t> bytes;
    ASSERT_EQ(guard_bytes("\xE2\x82", 8, &bytes), WSF_SUCCESS);
    ASSERT_EQ(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], 0xE2);
    EXPECT_EQ(bytes[1], 0x82);
}

// =============================================================================
// UTF-8
// =============================================================================

TEST(Utf8, WellFormed) {
    EXPECT_TRUE(is_valid_utf8("", 0));
    EXPECT_TRUE(is_valid_utf8(nullptr, 0));
    EXPECT_TRUE(is_valid_utf8("plain", 5));
    EXPECT_TRUE(is_valid_utf8("\xE2\x82\xAC", 3));          // U+20AC
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x8E\xA4", 4));      // U+1F3A4
    EXPECT_TRUE(is_valid_utf8("\xF4\x8F\xBF\xBF", 4));      // U+10FFFF
}

TEST(Utf8, IllFormed) {
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF", 2));             // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xE0\x80\xAF", 3));         // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80", 3));         // surrogate D800
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80", 4));     // above U+10FFFF
    EXPECT_FALSE(is_valid_utf8("\xE2\x82", 2));             // truncated
    EXPECT_FALSE(is_valid_utf8("\x80", 1));                 // lone continuation
}

TEST(Utf8, LossyUsesMaximalSubparts) {
    // Truncated three-byte sequence followed by ASCII: one replacement
    EXPECT_EQ(utf8_lossy("\xE2\x82" "A", 3), kReplacement + "A");
    // Overlong lead E0 80: each byte is its own ill-formed subpart
    EXPECT_EQ(utf8_lossy("\xE0\x80", 2), kReplacement + kReplacement);
    EXPECT_EQ(utf8_lossy("ok", 2), "ok");
}
