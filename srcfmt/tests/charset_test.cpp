//! # Charset Tests
//!
//! Decoding and encoding through iconv, including rejection of bytes that
//! are not valid in the configured charset.

#include "charset/charset.hpp"

#include <gtest/gtest.h>

using namespace srcfmt;
using namespace srcfmt::charset;

TEST(CharsetTest, KnownAndUnknownCharsets) {
    EXPECT_TRUE(is_supported("UTF-8"));
    EXPECT_TRUE(is_supported("ISO-8859-1"));
    EXPECT_FALSE(is_supported("NO-SUCH-CHARSET"));
    EXPECT_FALSE(is_supported(""));
}

TEST(CharsetTest, Utf8PassesThrough) {
    std::string text = "caf\xC3\xA9 // \xE2\x82\xAC\n";
    auto decoded = decode(text, "UTF-8");
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded), text);
}

TEST(CharsetTest, InvalidUtf8IsRejectedWithOffset) {
    std::string bytes = "ok\xFF\xFE";
    auto decoded = decode(bytes, "UTF-8");
    ASSERT_TRUE(is_err(decoded));
    EXPECT_EQ(unwrap_err(decoded).charset, "UTF-8");
    EXPECT_EQ(unwrap_err(decoded).offset, 2u);
}

TEST(CharsetTest, Latin1RoundTrip) {
    std::string latin1 = "caf\xE9";
    auto decoded = decode(latin1, "ISO-8859-1");
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded), "caf\xC3\xA9");

    auto encoded = encode(unwrap(decoded), "ISO-8859-1");
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded), latin1);
}

TEST(CharsetTest, UnrepresentableCharacterFailsEncode) {
    // U+20AC EURO SIGN has no ISO-8859-1 code point
    auto encoded = encode("price: \xE2\x82\xAC", "ISO-8859-1");
    ASSERT_TRUE(is_err(encoded));
    EXPECT_EQ(unwrap_err(encoded).offset, 7u);
}

TEST(CharsetTest, LargeInputGrowsBuffer) {
    std::string latin1(100000, '\xE9');
    auto decoded = decode(latin1, "ISO-8859-1");
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded).size(), 200000u);
}

TEST(CharsetTest, EmptyInput) {
    auto decoded = decode("", "UTF-8");
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_TRUE(unwrap(decoded).empty());
}
