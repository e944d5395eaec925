// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "loosexml/core/logger.hpp"
#include "loosexml/util/utf8.hpp"
#include "loosexml/xml/reader.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace loosexml
{
namespace xml
{

/// \brief Reader over text known to be UTF-8.
///
/// The input is validated once up front. Every delimiter the tokenizer cuts at
/// (`<`, `>`, `/`, `=`, quotes, bytes <= 0x20) is a single-byte code point and
/// never appears inside a multi-byte sequence, so all names, contents, keys and
/// values handed out are themselves valid UTF-8. The spans are the same
/// std::string_view slices the byte Reader produces; nothing is copied.
///
/// With Options::stripBom, leading byte-order-marks are skipped and offsets are
/// relative to the first byte after them (see bomLength()).
class TextReader
{
public:
  /// \throws std::invalid_argument if \p text is not valid UTF-8.
  explicit TextReader(std::string_view text, const Options &opt = Options{})
    : _bomLength(opt.stripBom ? text.size() - util::stripBom(text).size() : 0),
      _reader(checked(text.substr(_bomLength)), opt)
  {
    if (_bomLength != 0)
    {
      LOOSEXML_LOG_TRACE("TextReader: skipped " << _bomLength << " byte-order-mark bytes");
    }
  }

  TextReader &trimWhitespace(bool trim)
  {
    _reader.trimWhitespace(trim);
    return *this;
  }

  bool trimsWhitespace() const { return _reader.trimsWhitespace(); }

  bool next() { return _reader.next(); }

  const Event &current() const { return _reader.current(); }

  const Error *error() const { return _reader.error(); }

  std::size_t offset() const { return _reader.offset(); }

  bool atEnd() const { return _reader.atEnd(); }

  /// \brief Reader::seek(), moved back to the first byte of the code point
  /// \p offset falls in.
  void seek(std::size_t offset)
  {
    std::string_view src = _reader.source();
    offset = std::min(offset, src.size());
    while (offset > 0 && offset < src.size() &&
           (static_cast<unsigned char>(src[offset]) & 0xC0u) == 0x80u)
    {
      --offset;
    }
    _reader.seek(offset);
  }

  /// \brief The validated text, after any stripped byte-order-marks.
  std::string_view source() const { return _reader.source(); }

  /// \brief Bytes skipped at the front of the caller's buffer.
  std::size_t bomLength() const { return _bomLength; }

  /// \brief The underlying byte Reader. Read-only so that repositioning always
  /// goes through seek() above.
  const Reader &reader() const { return _reader; }

private:
  static std::string_view checked(std::string_view text)
  {
    if (!util::isValidUtf8(text))
    {
      throw std::invalid_argument("TextReader: input is not valid UTF-8");
    }
    return text;
  }

  std::size_t _bomLength;
  Reader _reader;
};

} // namespace xml
} // namespace loosexml
