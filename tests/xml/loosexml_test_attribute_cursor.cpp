// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace loosexml::xml;

namespace
{
Tag onlyTag(std::string_view source)
{
  Reader reader(source);
  REQUIRE(reader.next());
  REQUIRE(reader.current().isTag());
  return reader.current().tag;
}
} // namespace

TEST_CASE("Attribute cursor - Script element", "[xml][attributes]")
{
  SECTION("Spaced attributes with an embedded newline")
  {
    Tag tag = onlyTag("<Script time=\"0\" a=\"e\" what='\n   '/>");
    auto attrs = collectAttributes(tag);

    REQUIRE(attrs.size() == 3);
    REQUIRE(attrs[0].key == "time");
    REQUIRE(attrs[0].value == "0");
    REQUIRE(attrs[0].offset == 8);
    REQUIRE(attrs[1].key == "a");
    REQUIRE(attrs[1].value == "e");
    REQUIRE(attrs[1].offset == 17);
    REQUIRE(attrs[2].key == "what");
    REQUIRE(attrs[2].value == "\n   ");
    REQUIRE(attrs[2].offset == 23);
  }

  SECTION("Attributes run together without whitespace")
  {
    Tag tag = onlyTag("<Script time=\"0\"a='1'/>");
    auto attrs = collectAttributes(tag);

    REQUIRE(attrs.size() == 2);
    REQUIRE(attrs[0].key == "time");
    REQUIRE(attrs[0].value == "0");
    REQUIRE(attrs[1].key == "a");
    REQUIRE(attrs[1].value == "1");
  }
}

TEST_CASE("Attribute cursor - Quoting", "[xml][attributes]")
{
  SECTION("A value ends at the matching quote only")
  {
    AttributeCursor cursor(R"(a="it's" b='say "hi"')");
    REQUIRE(cursor.next());
    REQUIRE(cursor.current().value == "it's");
    REQUIRE(cursor.next());
    REQUIRE(cursor.current().value == "say \"hi\"");
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error() == nullptr);
  }

  SECTION("Whitespace around '=' is allowed")
  {
    AttributeCursor cursor("  a =\t\"1\"  ");
    REQUIRE(cursor.next());
    REQUIRE(cursor.current().key == "a");
    REQUIRE(cursor.current().value == "1");
    REQUIRE(cursor.current().offset == 2);
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error() == nullptr);
  }

  SECTION("Values are not unescaped")
  {
    AttributeCursor cursor(R"(a="&lt;&amp;")");
    REQUIRE(cursor.next());
    REQUIRE(cursor.current().value == "&lt;&amp;");
  }

  SECTION("Empty values")
  {
    AttributeCursor cursor(R"(a="" b='')");
    REQUIRE(cursor.next());
    REQUIRE(cursor.current().value.empty());
    REQUIRE(cursor.next());
    REQUIRE(cursor.current().key == "b");
    REQUIRE(cursor.current().value.empty());
  }

  SECTION("Keys and values are views into the content")
  {
    std::string_view content = R"(key="value")";
    AttributeCursor cursor(content);
    REQUIRE(cursor.next());
    REQUIRE(cursor.current().key.data() == content.data());
    REQUIRE(cursor.current().value.data() == content.data() + 5);
  }
}

TEST_CASE("Attribute cursor - End of region", "[xml][attributes]")
{
  SECTION("Empty content")
  {
    AttributeCursor cursor("");
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error() == nullptr);
  }

  SECTION("Whitespace-only content")
  {
    AttributeCursor cursor(" \t\n");
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error() == nullptr);
    REQUIRE(cursor.offset() == 3);
  }

  SECTION("Default constructed")
  {
    AttributeCursor cursor;
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error() == nullptr);
  }

  SECTION("Finished cursor keeps returning false")
  {
    AttributeCursor cursor("a=\"1\"");
    REQUIRE(cursor.next());
    REQUIRE_FALSE(cursor.next());
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error() == nullptr);
  }
}

TEST_CASE("Attribute cursor - Errors", "[xml][attributes][error]")
{
  SECTION("Bare word through the tag reports the absolute offset")
  {
    Tag tag = onlyTag("<Name a>");
    AttributeCursor cursor = tag.attributes();
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error() != nullptr);
    REQUIRE(cursor.error()->kind == ErrorKind::InvalidAttribute);
    REQUIRE(cursor.error()->offset == 6);
  }

  SECTION("Bare word on a standalone cursor")
  {
    AttributeCursor cursor("a");
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error()->kind == ErrorKind::InvalidAttribute);
    REQUIRE(cursor.error()->offset == 0);
  }

  SECTION("Missing quote")
  {
    Tag tag = onlyTag("<Name a= >");
    AttributeCursor cursor = tag.attributes();
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error()->kind == ErrorKind::InvalidAttribute);
    REQUIRE(cursor.error()->offset == 6);
  }

  SECTION("Empty key")
  {
    Tag tag = onlyTag("<Name =\"1\">");
    AttributeCursor cursor = tag.attributes();
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error()->kind == ErrorKind::InvalidAttribute);
    REQUIRE(cursor.error()->offset == 6);
  }

  SECTION("Unterminated value")
  {
    AttributeCursor cursor("a=\"1");
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error()->kind == ErrorKind::UnexpectedEof);
    REQUIRE(cursor.error()->offset == 0);
  }

  SECTION("Mismatched quotes do not close the value")
  {
    AttributeCursor cursor("a=\"1'");
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error()->kind == ErrorKind::UnexpectedEof);
  }

  SECTION("A later attribute fails after an earlier one succeeded")
  {
    AttributeCursor cursor("a=\"1\" b", 100);
    REQUIRE(cursor.next());
    REQUIRE(cursor.current().offset == 100);
    REQUIRE_FALSE(cursor.next());
    REQUIRE(cursor.error()->kind == ErrorKind::InvalidAttribute);
    REQUIRE(cursor.error()->offset == 106);
  }

  SECTION("Retrying reproduces the same error")
  {
    AttributeCursor cursor("a=\"1\"  b");
    REQUIRE(cursor.next());
    REQUIRE_FALSE(cursor.next());
    const Error first = *cursor.error();
    const std::size_t parked = cursor.offset();
    REQUIRE(parked == 7);

    REQUIRE_FALSE(cursor.next());
    REQUIRE(*cursor.error() == first);
    REQUIRE(cursor.offset() == parked);
  }

  SECTION("collectAttributes throws")
  {
    Tag tag = onlyTag("<Name ok=\"1\" bad>");
    REQUIRE_THROWS_AS(collectAttributes(tag), ParseError);
    try
    {
      collectAttributes(tag);
    }
    catch (const ParseError &e)
    {
      REQUIRE(e.kind() == ErrorKind::InvalidAttribute);
      REQUIRE(e.offset() == 13);
    }
  }
}
