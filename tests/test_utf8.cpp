/// @file test_utf8.cpp
/// @brief Escape decoding in strings and the detail::utf8 helpers.

#include <rdjson/rdjson.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace rdjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Simple escapes
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Escapes, EachSimpleEscape) {
    EXPECT_EQ(parse(R"("\"")").as_string(), "\"");
    EXPECT_EQ(parse(R"("\\")").as_string(), "\\");
    EXPECT_EQ(parse(R"("\/")").as_string(), "/");
    EXPECT_EQ(parse(R"("\b")").as_string(), "\b");
    EXPECT_EQ(parse(R"("\f")").as_string(), "\f");
    EXPECT_EQ(parse(R"("\n")").as_string(), "\n");
    EXPECT_EQ(parse(R"("\r")").as_string(), "\r");
    EXPECT_EQ(parse(R"("\t")").as_string(), "\t");
}

TEST(Escapes, EscapedQuoteDoesNotTerminate) {
    auto v = parse(R"(["a\"b", "c"])");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0].as_string(), "a\"b");
    EXPECT_EQ(v[1].as_string(), "c");
}

TEST(Escapes, EscapesInKeys) {
    auto v = parse(R"({"tab\tkey": 1, "quo\"te": 2})");
    EXPECT_EQ(v["tab\tkey"].as_int(), 1);
    EXPECT_EQ(v["quo\"te"].as_int(), 2);
}

TEST(Escapes, TrailingBackslashEscape) {
    EXPECT_EQ(parse(R"("ends with \\")").as_string(), "ends with \\");
}

// ═══════════════════════════════════════════════════════════════════════════════
// \uXXXX
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Escapes, UnicodeAscii) {
    EXPECT_EQ(parse(R"("\u0041b")").as_string(), "Ab");
}

TEST(Escapes, UnicodeNul) {
    const auto v = parse(R"("a\u0000b")");
    const auto& s = v.as_string();
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[1], '\0');
}

TEST(Escapes, UnicodeTwoByte) {
    // U+00E9 LATIN SMALL LETTER E WITH ACUTE
    EXPECT_EQ(parse(R"("caf\u00e9")").as_string(), "caf\xC3\xA9");
}

TEST(Escapes, UnicodeThreeByte) {
    // U+20AC EURO SIGN, upper- and lower-case hex
    EXPECT_EQ(parse(R"("\u20AC")").as_string(), "\xE2\x82\xAC");
    EXPECT_EQ(parse(R"("\u20ac")").as_string(), "\xE2\x82\xAC");
}

TEST(Escapes, SurrogatePair) {
    // U+1F600 as UTF-16 D83D DE00
    EXPECT_EQ(parse(R"("\uD83D\uDE00")").as_string(), "\xF0\x9F\x98\x80");
    // U+1D11E as UTF-16 D834 DD1E
    EXPECT_EQ(parse(R"("x\uD834\uDD1Ey")").as_string(), "x\xF0\x9D\x84\x9Ey");
}

TEST(Escapes, RawUtf8PassesThrough) {
    const std::string text = "\"\xD0\x9F\xD1\x80\xD0\xB8 \xE4\xBD\xA0\xE5\xA5\xBD\"";
    EXPECT_EQ(parse(text).as_string(), "\xD0\x9F\xD1\x80\xD0\xB8 \xE4\xBD\xA0\xE5\xA5\xBD");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Escape errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Escapes, UnknownEscape) {
    auto r = try_parse(R"("\x41")");
    EXPECT_EQ(r.ec, errc::invalid_escape);
    EXPECT_EQ(r.location.offset, 1u);
    EXPECT_EQ(r.expected, "escape sequence");
}

TEST(Escapes, BackslashAtEndOfInput) {
    auto r = try_parse("\"abc\\");
    EXPECT_EQ(r.ec, errc::invalid_escape);
    EXPECT_EQ(r.location.offset, 4u);
}

TEST(Escapes, InvalidHexDigit) {
    auto r = try_parse(R"("\u12G4")");
    EXPECT_EQ(r.ec, errc::invalid_escape);
    EXPECT_EQ(r.location.offset, 1u);
    EXPECT_EQ(r.expected, "4 hex digits");
}

TEST(Escapes, TruncatedUnicodeEscape) {
    EXPECT_EQ(try_parse(R"("\u12")").ec, errc::invalid_escape);
    EXPECT_EQ(try_parse(R"("\u)").ec, errc::invalid_escape);
}

TEST(Escapes, LoneHighSurrogate) {
    auto r = try_parse(R"("\uD83D")");
    EXPECT_EQ(r.ec, errc::invalid_escape);
    EXPECT_EQ(r.location.offset, 1u);
    EXPECT_EQ(try_parse(R"("\uD83Dabcdef")").ec, errc::invalid_escape);
}

TEST(Escapes, LoneLowSurrogate) {
    auto r = try_parse(R"("ab\uDC00")");
    EXPECT_EQ(r.ec, errc::invalid_escape);
    EXPECT_EQ(r.location.offset, 3u);
}

TEST(Escapes, HighSurrogateFollowedByNonSurrogate) {
    auto r = try_parse(R"("\uD83D\u0041")");
    EXPECT_EQ(r.ec, errc::invalid_escape);
    EXPECT_EQ(r.location.offset, 7u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// detail::utf8
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

std::string encode_to_string(uint32_t cp) {
    char buf[4];
    const unsigned n = detail::utf8::encode(cp, buf);
    return std::string(buf, n);
}

} // namespace

TEST(Utf8Utils, EncodeLengths) {
    EXPECT_EQ(encode_to_string(0x24), "$");
    EXPECT_EQ(encode_to_string(0x7F), "\x7F");
    EXPECT_EQ(encode_to_string(0x80), "\xC2\x80");
    EXPECT_EQ(encode_to_string(0x7FF), "\xDF\xBF");
    EXPECT_EQ(encode_to_string(0x800), "\xE0\xA0\x80");
    EXPECT_EQ(encode_to_string(0xFFFF), "\xEF\xBF\xBF");
    EXPECT_EQ(encode_to_string(0x10000), "\xF0\x90\x80\x80");
    EXPECT_EQ(encode_to_string(0x10FFFF), "\xF4\x8F\xBF\xBF");
}

TEST(Utf8Utils, EncodeRejectsBeyondUnicode) {
    char buf[4];
    EXPECT_EQ(detail::utf8::encode(0x110000, buf), 0u);
}

TEST(Utf8Utils, SurrogateClassification) {
    EXPECT_TRUE(detail::utf8::is_high_surrogate(0xD800));
    EXPECT_TRUE(detail::utf8::is_high_surrogate(0xDBFF));
    EXPECT_FALSE(detail::utf8::is_high_surrogate(0xDC00));
    EXPECT_TRUE(detail::utf8::is_low_surrogate(0xDC00));
    EXPECT_TRUE(detail::utf8::is_low_surrogate(0xDFFF));
    EXPECT_FALSE(detail::utf8::is_low_surrogate(0xE000));
}

TEST(Utf8Utils, CombineSurrogates) {
    EXPECT_EQ(detail::utf8::combine_surrogates(0xD83D, 0xDE00), 0x1F600u);
    EXPECT_EQ(detail::utf8::combine_surrogates(0xD800, 0xDC00), 0x10000u);
    EXPECT_EQ(detail::utf8::combine_surrogates(0xDBFF, 0xDFFF), 0x10FFFFu);
}
