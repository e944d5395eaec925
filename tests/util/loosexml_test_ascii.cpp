// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "loosexml/util/ascii.hpp"

#include <string>
#include <string_view>

using namespace loosexml::util;

TEST_CASE("ASCII - Whitespace is every byte up to 0x20", "[util][ascii]")
{
  for (int b = 0; b <= 0x20; ++b)
  {
    REQUIRE(isWhitespace(static_cast<char>(b)));
  }
  REQUIRE_FALSE(isWhitespace('!'));
  REQUIRE_FALSE(isWhitespace('a'));
  REQUIRE_FALSE(isWhitespace(static_cast<char>(0x7F)));
  REQUIRE_FALSE(isWhitespace(static_cast<char>(0xA0)));
}

TEST_CASE("ASCII - Name start table", "[util][ascii][name]")
{
  SECTION("ASCII letters are valid")
  {
    REQUIRE(isNameStart('a'));
    REQUIRE(isNameStart('z'));
    REQUIRE(isNameStart('A'));
    REQUIRE(isNameStart('Z'));
  }

  SECTION("Excluded ranges")
  {
    for (int b = 0; b <= 0x20; ++b)
      REQUIRE_FALSE(isNameStart(static_cast<char>(b)));
    for (int b = '!'; b <= '9'; ++b)
      REQUIRE_FALSE(isNameStart(static_cast<char>(b)));
    for (int b = ':'; b <= '@'; ++b)
      REQUIRE_FALSE(isNameStart(static_cast<char>(b)));
    for (int b = '['; b <= '`'; ++b)
      REQUIRE_FALSE(isNameStart(static_cast<char>(b)));
    for (int b = '{'; b <= 0x7F; ++b)
      REQUIRE_FALSE(isNameStart(static_cast<char>(b)));
  }

  SECTION("Bytes above 0x7F are valid so UTF-8 names pass")
  {
    for (int b = 0x80; b <= 0xFF; ++b)
      REQUIRE(isNameStart(static_cast<char>(b)));
  }

  SECTION("Exactly the 52 ASCII letters are valid below 0x80")
  {
    int valid = 0;
    for (int b = 0; b < 0x80; ++b)
    {
      if (kNameStartTable[b])
        ++valid;
    }
    REQUIRE(valid == 52);
  }

  SECTION("Table is usable in constant expressions")
  {
    static_assert(isNameStart('N'), "letters start names");
    static_assert(!isNameStart('0'), "digits do not start names");
    static_assert(isValidTagName("Name"), "plain name");
  }
}

TEST_CASE("ASCII - Tag name validation checks only the first byte", "[util][ascii][name]")
{
  REQUIRE(isValidTagName("Name"));
  REQUIRE(isValidTagName("N0.-:!"));
  REQUIRE(isValidTagName("\xC3\xA9t\xC3\xA9"));
  REQUIRE_FALSE(isValidTagName(""));
  REQUIRE_FALSE(isValidTagName("0Name"));
  REQUIRE_FALSE(isValidTagName(".Name"));
  REQUIRE_FALSE(isValidTagName("_Name"));
  REQUIRE_FALSE(isValidTagName(":Name"));
}

TEST_CASE("ASCII - Trim", "[util][ascii][trim]")
{
  SECTION("Strips control bytes and spaces on both ends")
  {
    REQUIRE(trim("  hello \t\r\n") == "hello");
    REQUIRE(trim(std::string_view("\0\x01x y\x1F", 6)) == "x y");
  }

  SECTION("Interior whitespace is kept")
  {
    REQUIRE(trim(" a  b ") == "a  b");
  }

  SECTION("Result is a sub-view of the input")
  {
    std::string_view in = "  abc  ";
    std::string_view out = trim(in);
    REQUIRE(out.data() == in.data() + 2);
    REQUIRE(out.size() == 3);
  }

  SECTION("Empty and all-whitespace input give an empty view")
  {
    REQUIRE(trim("").empty());
    REQUIRE(trim(" \n\t ").empty());
  }

  SECTION("Non-ASCII bytes are not whitespace")
  {
    REQUIRE(trim("\xC2\xA0x\xC2\xA0") == "\xC2\xA0x\xC2\xA0");
  }
}

TEST_CASE("ASCII - Skip whitespace", "[util][ascii]")
{
  REQUIRE(skipWhitespace("abc") == 0);
  REQUIRE(skipWhitespace("  \tabc") == 3);
  REQUIRE(skipWhitespace("   ") == std::string_view::npos);
  REQUIRE(skipWhitespace("") == std::string_view::npos);
}
