// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace loosexml
{
namespace util
{

/// \brief The UTF-8 encoding of U+FEFF.
inline constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF", 3};

/// \brief Strict UTF-8 check: rejects truncated and overlong sequences, UTF-16
/// surrogate halves and code points above U+10FFFF.
inline bool isValidUtf8(std::string_view text)
{
  const auto *p = reinterpret_cast<const std::uint8_t *>(text.data());
  const std::size_t n = text.size();
  std::size_t i = 0;
  while (i < n)
  {
    std::uint8_t lead = p[i];
    if (lead < 0x80u)
    {
      ++i;
      continue;
    }

    std::size_t length = 0;
    std::uint32_t cp = 0;
    std::uint32_t minimum = 0;
    if ((lead & 0xE0u) == 0xC0u)
    {
      length = 2;
      cp = lead & 0x1Fu;
      minimum = 0x80u;
    }
    else if ((lead & 0xF0u) == 0xE0u)
    {
      length = 3;
      cp = lead & 0x0Fu;
      minimum = 0x800u;
    }
    else if ((lead & 0xF8u) == 0xF0u)
    {
      length = 4;
      cp = lead & 0x07u;
      minimum = 0x10000u;
    }
    else
    {
      return false; // stray continuation byte or 0xF8..0xFF
    }

    if (n - i < length)
    {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k)
    {
      std::uint8_t cont = p[i + k];
      if ((cont & 0xC0u) != 0x80u)
      {
        return false;
      }
      cp = (cp << 6) | (cont & 0x3Fu);
    }

    if (cp < minimum || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
    {
      return false;
    }
    i += length;
  }
  return true;
}

/// \brief Drop every leading byte-order-mark. Returns the remaining view.
inline std::string_view stripBom(std::string_view text)
{
  while (text.substr(0, kUtf8Bom.size()) == kUtf8Bom)
  {
    text.remove_prefix(kUtf8Bom.size());
  }
  return text;
}

} // namespace util
} // namespace loosexml
