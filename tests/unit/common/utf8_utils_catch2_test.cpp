// Tests for UTF-8 validation and wide-text conversion.

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

#include <sift/common/utf8_utils.h>

using sift::common::decodeUtf8;
using sift::common::encodeUtf8;
using sift::common::isValidUtf8;

TEST_CASE("isValidUtf8 accepts well-formed text", "[common][utf8][catch2]") {
    CHECK(isValidUtf8(""));
    CHECK(isValidUtf8("plain ascii\n"));
    CHECK(isValidUtf8("caf\xC3\xA9"));             // é
    CHECK(isValidUtf8("\xE2\x82\xAC 5"));          // €
    CHECK(isValidUtf8("\xF0\x9F\x98\x80 smile")); // U+1F600
}

TEST_CASE("isValidUtf8 rejects malformed sequences", "[common][utf8][catch2]") {
    CHECK_FALSE(isValidUtf8("\xFF"));
    CHECK_FALSE(isValidUtf8("abc\xC3"));          // truncated
    CHECK_FALSE(isValidUtf8("\xC0\xAF"));         // overlong
    CHECK_FALSE(isValidUtf8("\xED\xA0\x80"));     // surrogate
    CHECK_FALSE(isValidUtf8("\xF4\x90\x80\x80")); // above U+10FFFF
    CHECK_FALSE(isValidUtf8(std::string("\x80", 1)));
}

TEST_CASE("decodeUtf8 yields one element per code point", "[common][utf8][catch2]") {
    const std::wstring wide = decodeUtf8("caf\xC3\xA9 \xE2\x82\xAC\xF0\x9F\x98\x80");
    REQUIRE(wide.size() == 7);
    CHECK(static_cast<std::uint32_t>(wide[3]) == 0xE9u);
    CHECK(static_cast<std::uint32_t>(wide[5]) == 0x20ACu);
    CHECK(static_cast<std::uint32_t>(wide[6]) == 0x1F600u);
}

TEST_CASE("decodeUtf8 replaces malformed bytes", "[common][utf8][catch2]") {
    const std::wstring wide = decodeUtf8("a\xFF" "b\xC3");
    REQUIRE(wide.size() == 4);
    CHECK(static_cast<std::uint32_t>(wide[0]) == 0x61u);
    CHECK(static_cast<std::uint32_t>(wide[1]) == 0xFFFDu);
    CHECK(static_cast<std::uint32_t>(wide[2]) == 0x62u);
    CHECK(static_cast<std::uint32_t>(wide[3]) == 0xFFFDu);
}

TEST_CASE("encodeUtf8 restores the original bytes", "[common][utf8][catch2]") {
    const std::string text = "\xC3\xA9t\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80\n";
    CHECK(encodeUtf8(decodeUtf8(text)) == text);
    CHECK(isValidUtf8(encodeUtf8(std::wstring(1, static_cast<wchar_t>(0xD800)))));
}
