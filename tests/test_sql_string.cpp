/**
 * @file test_sql_string.cpp
 * @brief Unit tests for SQL literal encoding (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "jsonsql/SqlString.hpp"

#include <string>

using namespace jsonsql;

// ============================================================================
// encode_string_sql
// ============================================================================

TEST(EncodeStringSql, PlainText) {
    EXPECT_EQ(encode_string_sql("hello"), "'hello'");
    EXPECT_EQ(encode_string_sql(""), "''");
}

TEST(EncodeStringSql, Quotes) {
    EXPECT_EQ(encode_string_sql("a'b"), "'a\\'b'");
    EXPECT_EQ(encode_string_sql("say \"hi\""), "'say \\\"hi\\\"'");
}

TEST(EncodeStringSql, ControlCharacters) {
    EXPECT_EQ(encode_string_sql("a\nb\rc\td\b"), "'a\\nb\\rc\\td\\b'");
    EXPECT_EQ(encode_string_sql(std::string("x\0y", 3)), "'x\\0y'");
    EXPECT_EQ(encode_string_sql("\x1a"), "'\\Z'");
}

TEST(EncodeStringSql, Backslash) {
    EXPECT_EQ(encode_string_sql("C:\\dir"), "'C:\\\\dir'");
}

TEST(EncodeStringSql, Utf8PassesThrough) {
    EXPECT_EQ(encode_string_sql("caf\xC3\xA9 \xE2\x82\xAC"), "'caf\xC3\xA9 \xE2\x82\xAC'");
}

// ============================================================================
// encode_hex
// ============================================================================

TEST(EncodeHex, Lowercase) {
    EXPECT_EQ(encode_hex("\xAB\xCD"), "abcd");
    EXPECT_EQ(encode_hex(std::string("\x00\x0f\xf0", 3)), "000ff0");
}

TEST(EncodeHex, Empty) {
    EXPECT_EQ(encode_hex(""), "");
}

// ============================================================================
// bits_to_binary_text
// ============================================================================

TEST(BitsToBinaryText, StripsLeadingZeros) {
    EXPECT_EQ(bits_to_binary_text("\x05"), "101");
    EXPECT_EQ(bits_to_binary_text(std::string("\x00\x01\x00", 3)), "100000000");
}

TEST(BitsToBinaryText, FullBytes) {
    EXPECT_EQ(bits_to_binary_text("\x80\xff"), "1000000011111111");
}

TEST(BitsToBinaryText, ZeroValue) {
    EXPECT_EQ(bits_to_binary_text(""), "0");
    EXPECT_EQ(bits_to_binary_text(std::string("\x00\x00", 2)), "0");
}
