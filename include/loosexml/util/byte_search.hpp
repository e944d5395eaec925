// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "loosexml/util/ascii.hpp"

#include <cstddef>
#include <cstring>
#include <string_view>

namespace loosexml
{
namespace util
{

/// \brief Position of the first \p needle in \p haystack, or npos.
/// Backed by std::memchr, which the C library vectorises.
inline std::size_t findByte(std::string_view haystack, char needle)
{
  if (haystack.empty())
  {
    return std::string_view::npos;
  }
  const void *hit = std::memchr(haystack.data(), static_cast<unsigned char>(needle),
                                haystack.size());
  if (!hit)
  {
    return std::string_view::npos;
  }
  return static_cast<std::size_t>(static_cast<const char *>(hit) - haystack.data());
}

/// \brief Position of the first byte equal to either \p a or \p b, or npos.
/// Neither candidate is preferred; whichever occurs first wins.
inline std::size_t findEitherByte(std::string_view haystack, char a, char b)
{
  for (std::size_t i = 0; i < haystack.size(); ++i)
  {
    char ch = haystack[i];
    if (ch == a || ch == b)
    {
      return i;
    }
  }
  return std::string_view::npos;
}

/// \brief Position of the first whitespace byte (<= 0x20), or npos.
inline std::size_t findWhitespace(std::string_view haystack)
{
  for (std::size_t i = 0; i < haystack.size(); ++i)
  {
    if (isWhitespace(haystack[i]))
    {
      return i;
    }
  }
  return std::string_view::npos;
}

} // namespace util
} // namespace loosexml
