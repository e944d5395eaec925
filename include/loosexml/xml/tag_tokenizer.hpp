// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "loosexml/util/ascii.hpp"
#include "loosexml/util/byte_search.hpp"
#include "loosexml/xml/error.hpp"
#include "loosexml/xml/event.hpp"

#include <cstddef>
#include <string_view>

namespace loosexml
{
namespace xml
{

/// \brief Result of tokenizing one tag.
struct TagScan
{
  EventKind kind{EventKind::OpenTag};
  Tag tag{};
  std::size_t length{0}; ///< Bytes from `<` through `>` inclusive
};

/// \brief Splits the bytes of one `<...>` into kind, name and content.
///
/// The name ends at the first whitespace byte; whatever follows is content.
/// Only the first byte of the name is validated. A trailing `/` marks an empty
/// tag and a leading `/` a closing tag; both slashes are removed independently,
/// so `</Name/>` comes out as a closing tag named `Name`.
class TagTokenizer
{
public:
  /// \param rest Bytes immediately after `<`, up to the end of the buffer.
  /// \param tagStart Absolute offset of `<`.
  /// \param out Filled on success.
  /// \param err Filled on failure; every error is reported at \p tagStart.
  static bool tokenize(std::string_view rest, std::size_t tagStart, TagScan &out, Error &err)
  {
    if (rest.empty())
    {
      err = Error{ErrorKind::UnexpectedEof, tagStart, "input ends after '<'"};
      return false;
    }
    // TODO: tokenize `<!...>` and `<?...?>` as their own event kinds.
    if (rest.front() == '!')
    {
      err = Error{ErrorKind::InvalidName, tagStart, "declarations are not supported"};
      return false;
    }
    if (rest.front() == '?')
    {
      err = Error{ErrorKind::InvalidName, tagStart, "processing instructions are not supported"};
      return false;
    }

    std::size_t close = util::findByte(rest, '>');
    if (close == std::string_view::npos)
    {
      err = Error{ErrorKind::UnexpectedEof, tagStart, "tag is missing its closing '>'"};
      return false;
    }

    const std::size_t innerStart = tagStart + 1;
    std::string_view inner = rest.substr(0, close);
    const bool isClosing = !inner.empty() && inner.front() == '/';
    const bool isEmpty = !inner.empty() && inner.back() == '/';

    // <[Name] [a="1"]/>, <[Name] []/>, <[Name/][]>
    std::string_view head = inner;
    std::string_view tail = inner.substr(inner.size());
    std::size_t space = util::findWhitespace(inner);
    if (space != std::string_view::npos)
    {
      head = inner.substr(0, space);
      tail = inner.substr(space + 1);
    }
    std::size_t tailStart = innerStart + (inner.size() - tail.size());

    if (isEmpty)
    {
      if (tail.empty())
      {
        head.remove_suffix(1);
      }
      else
      {
        tail.remove_suffix(1);
      }
    }

    if (isClosing)
    {
      if (head.empty())
      {
        // `</>`: the empty-tag strip already took the only slash
        err = Error{ErrorKind::InvalidName, tagStart, "closing tag has no name"};
        return false;
      }
      head.remove_prefix(1);
    }

    if (!util::isValidTagName(head))
    {
      err = Error{ErrorKind::InvalidName, tagStart,
                  head.empty() ? "tag name is empty" : "tag name starts with a disallowed byte"};
      return false;
    }

    if (isClosing)
      out.kind = EventKind::CloseTag;
    else if (isEmpty)
      out.kind = EventKind::EmptyTag;
    else
      out.kind = EventKind::OpenTag;
    out.tag = Tag{head, tail, tagStart, tailStart};
    out.length = close + 2;
    return true;
  }
};

} // namespace xml
} // namespace loosexml
