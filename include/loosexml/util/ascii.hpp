// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace loosexml
{
namespace util
{

/// \brief Whitespace is any byte <= 0x20: space and every ASCII control character.
constexpr bool isWhitespace(char ch) { return static_cast<unsigned char>(ch) <= 0x20; }

namespace detail
{
  constexpr std::array<bool, 256> buildNameStartTable()
  {
    std::array<bool, 256> table{};
    for (std::size_t i = 0; i < table.size(); ++i)
    {
      bool valid = true;
      if (i <= 0x20)
        valid = false; // controls and space
      else if (i >= '!' && i <= '9')
        valid = false;
      else if (i >= ':' && i <= '@')
        valid = false;
      else if (i >= '[' && i <= '`')
        valid = false;
      else if (i >= '{' && i <= 0x7F)
        valid = false;
      table[i] = valid;
    }
    return table;
  }
} // namespace detail

/// \brief First-byte table for tag names. Only ASCII letters and bytes >= 0x80
/// may start a name; the bytes after the first are never checked.
inline constexpr std::array<bool, 256> kNameStartTable = detail::buildNameStartTable();

constexpr bool isNameStart(char ch) { return kNameStartTable[static_cast<unsigned char>(ch)]; }

/// \brief True when \p name is non-empty and its first byte may start a tag name.
constexpr bool isValidTagName(std::string_view name)
{
  return !name.empty() && isNameStart(name.front());
}

/// \brief Strip leading and trailing whitespace bytes. An all-whitespace span
/// yields an empty view positioned at the end of \p text.
constexpr std::string_view trim(std::string_view text)
{
  std::size_t first = 0;
  while (first < text.size() && isWhitespace(text[first]))
  {
    ++first;
  }
  std::size_t last = text.size();
  while (last > first && isWhitespace(text[last - 1]))
  {
    --last;
  }
  return text.substr(first, last - first);
}

/// \brief Index of the first non-whitespace byte, or npos.
constexpr std::size_t skipWhitespace(std::string_view text)
{
  for (std::size_t i = 0; i < text.size(); ++i)
  {
    if (!isWhitespace(text[i]))
    {
      return i;
    }
  }
  return std::string_view::npos;
}

} // namespace util
} // namespace loosexml
