// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "loosexml/util/byte_search.hpp"

#include <string>
#include <string_view>

using namespace loosexml::util;

TEST_CASE("Byte search - findByte", "[util][search]")
{
  REQUIRE(findByte("hello<world", '<') == 5);
  REQUIRE(findByte("<", '<') == 0);
  REQUIRE(findByte("no tags here", '<') == std::string_view::npos);
  REQUIRE(findByte("", '<') == std::string_view::npos);

  SECTION("Finds the first of several")
  {
    REQUIRE(findByte("a=b=c", '=') == 1);
  }

  SECTION("Embedded NUL bytes are searched through")
  {
    std::string s("a\0b>c", 5);
    REQUIRE(findByte(s, '>') == 3);
    REQUIRE(findByte(s, '\0') == 1);
  }

  SECTION("High bytes")
  {
    REQUIRE(findByte("ab\xFF", '\xFF') == 2);
  }

  SECTION("Long haystack")
  {
    std::string s(10000, 'x');
    s[9876] = '>';
    REQUIRE(findByte(s, '>') == 9876);
  }
}

TEST_CASE("Byte search - findEitherByte takes whichever comes first", "[util][search]")
{
  REQUIRE(findEitherByte(R"( "x" )", '"', '\'') == 1);
  REQUIRE(findEitherByte(R"( 'x" )", '"', '\'') == 1);
  REQUIRE(findEitherByte(R"(abc"'x)", '\'', '"') == 3);
  REQUIRE(findEitherByte("none", '"', '\'') == std::string_view::npos);
  REQUIRE(findEitherByte("", '"', '\'') == std::string_view::npos);
}

TEST_CASE("Byte search - findWhitespace", "[util][search]")
{
  REQUIRE(findWhitespace("Name a=\"1\"") == 4);
  REQUIRE(findWhitespace("Name\ta") == 4);
  REQUIRE(findWhitespace("Name\x01") == 4);
  REQUIRE(findWhitespace("Name") == std::string_view::npos);
  REQUIRE(findWhitespace(" ") == 0);
}
