// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "loosexml/xml/attribute_cursor.hpp"

#include <cstddef>
#include <string_view>

namespace loosexml
{
namespace xml
{

/// \brief Event kinds produced by the Reader.
enum class EventKind
{
  OpenTag,  ///< `<Name ...>`
  CloseTag, ///< `</Name>`
  EmptyTag, ///< `<Name ... />`
  Text      ///< Character data between tags
};

inline const char *toString(EventKind kind)
{
  switch (kind)
  {
  case EventKind::OpenTag:
    return "open";
  case EventKind::CloseTag:
    return "close";
  case EventKind::EmptyTag:
    return "empty";
  case EventKind::Text:
    return "text";
  default:
    return "unknown";
  }
}

/// \brief A recognised tag.
///
/// \c content is everything after the first whitespace byte following the name,
/// up to but excluding `>`, minus the `/` of `<Empty />`. It is left unparsed;
/// call attributes() to walk it.
struct Tag
{
  std::string_view name;
  std::string_view content;
  std::size_t offset{0};        ///< Absolute position of `<`
  std::size_t contentOffset{0}; ///< Absolute position of content's first byte

  AttributeCursor attributes() const { return AttributeCursor(content, contentOffset); }
};

/// \brief A run of character data, trimmed when the Reader trims whitespace.
struct Text
{
  std::string_view content;
  std::size_t offset{0}; ///< Absolute position of content's first byte
};

/// \brief One scan step's result. Only the member matching \c kind is set.
struct Event
{
  EventKind kind{EventKind::Text};
  Tag tag{};
  Text text{};
  std::string_view raw; ///< Source bytes covered: `<...>` for tags, the text span otherwise

  bool isTag() const { return kind != EventKind::Text; }

  std::size_t offset() const { return isTag() ? tag.offset : text.offset; }
};

} // namespace xml
} // namespace loosexml
