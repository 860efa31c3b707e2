// Copyright (c) 2024 liudegui. MIT License.
// Tests for UTF-8 <-> UTF-16 conversion used by the wide ODBC calls.

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "unidb/utf16.hpp"

using namespace unidb;

TEST_CASE("Utf16: non-ASCII text converts both ways", "[utf16]") {
  // U+00E9, U+4E2D and U+1F600 (a surrogate pair)
  const std::string text = "caf\xC3\xA9 \xE4\xB8\xAD \xF0\x9F\x98\x80";
  std::u16string wide;
  REQUIRE(Utf8ToUtf16(text, &wide));
  REQUIRE(wide.size() == 9);
  REQUIRE(wide[3] == 0x00E9);
  REQUIRE(wide[5] == 0x4E2D);
  REQUIRE(wide[7] == 0xD83D);
  REQUIRE(wide[8] == 0xDE00);
  REQUIRE(Utf16ToUtf8(wide) == text);
}

TEST_CASE("Utf16: empty and ASCII", "[utf16]") {
  std::u16string wide = u"x";
  REQUIRE(Utf8ToUtf16("", &wide));
  REQUIRE(wide.empty());
  REQUIRE(Utf8ToUtf16("plain", &wide));
  REQUIRE(wide == u"plain");
  REQUIRE(Utf16ToUtf8(wide) == "plain");
}

TEST_CASE("Utf16: malformed UTF-8 is rejected", "[utf16]") {
  std::u16string wide;
  REQUIRE_FALSE(Utf8ToUtf16("\xC3", &wide));              // truncated
  REQUIRE_FALSE(Utf8ToUtf16("\xC0\xAF", &wide));          // overlong
  REQUIRE_FALSE(Utf8ToUtf16("\xED\xA0\x80", &wide));      // surrogate
  REQUIRE_FALSE(Utf8ToUtf16("\xF4\x90\x80\x80", &wide));  // above U+10FFFF
  REQUIRE_FALSE(Utf8ToUtf16("\xFF", &wide));
}

TEST_CASE("Utf16: unpaired surrogates become U+FFFD", "[utf16]") {
  const char16_t lone[] = {u'a', 0xD800, u'b'};
  REQUIRE(Utf16ToUtf8(lone, 3) == "a\xEF\xBF\xBD" "b");
}
