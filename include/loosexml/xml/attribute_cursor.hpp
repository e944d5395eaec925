// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "loosexml/core/logger.hpp"
#include "loosexml/util/ascii.hpp"
#include "loosexml/util/byte_search.hpp"
#include "loosexml/xml/error.hpp"

#include <cstddef>
#include <string_view>

namespace loosexml
{
namespace xml
{

/// \brief One key/value pair. Both are views into the scanned buffer; the value
/// is the literal text between its quotes, entities untouched.
struct Attribute
{
  std::string_view key;
  std::string_view value;
  std::size_t offset{0}; ///< Absolute position of the attribute's first byte
};

/// \brief Forward-only cursor over the attribute region of a tag.
///
/// Pairs are split on `=` and matching quotes only, which is what lets markup
/// such as `a="1"b='2'` or keys containing quote characters through. The
/// cursor never looks further ahead than the attribute it is reading.
///
/// \code
/// auto attrs = tag.attributes();
/// while (attrs.next())
/// {
///   use(attrs.current().key, attrs.current().value);
/// }
/// if (attrs.error()) { /* report attrs.error()->offset */ }
/// \endcode
class AttributeCursor
{
public:
  AttributeCursor() = default;

  /// \param content The attribute region.
  /// \param baseOffset Absolute offset of \p content in the scanned buffer;
  /// added to every reported offset.
  explicit AttributeCursor(std::string_view content, std::size_t baseOffset = 0)
    : _content(content), _base(baseOffset)
  {
  }

  /// \brief Read the next pair. Returns false at the end of the region or on
  /// error; error() tells the two apart. A failed step leaves the cursor on the
  /// offending attribute.
  bool next()
  {
    _hasError = false;

    std::size_t skip = util::skipWhitespace(_content.substr(_offset));
    if (skip == std::string_view::npos)
    {
      _offset = _content.size();
      return false;
    }
    const std::size_t anchor = _offset + skip;
    std::string_view rest = _content.substr(anchor);

    std::size_t sep = util::findByte(rest, '=');
    if (sep == std::string_view::npos)
    {
      return fail(ErrorKind::InvalidAttribute, anchor, "attribute has no '=' separator");
    }

    std::string_view key = util::trim(rest.substr(0, sep));
    if (key.empty())
    {
      return fail(ErrorKind::InvalidAttribute, anchor, "attribute key is empty");
    }

    std::string_view afterSep = rest.substr(sep + 1);
    std::size_t open = util::findEitherByte(afterSep, '"', '\'');
    if (open == std::string_view::npos)
    {
      return fail(ErrorKind::InvalidAttribute, anchor, "attribute value is not quoted");
    }

    std::string_view quoted = afterSep.substr(open + 1);
    std::size_t close = util::findByte(quoted, afterSep[open]);
    if (close == std::string_view::npos)
    {
      return fail(ErrorKind::UnexpectedEof, anchor, "attribute value is missing its closing quote");
    }

    _current = Attribute{key, quoted.substr(0, close), _base + anchor};
    // anchor + key/sep + '=' + gap + opening quote + value + closing quote
    _offset = anchor + sep + 1 + open + 1 + close + 1;
    return true;
  }

  /// \brief The pair produced by the last successful next().
  const Attribute &current() const { return _current; }

  /// \brief Error of the last next() call, or nullptr.
  const Error *error() const { return _hasError ? &_error : nullptr; }

  /// \brief Cursor position relative to the start of the region.
  std::size_t offset() const { return _offset; }

  std::string_view content() const { return _content; }

  std::size_t baseOffset() const { return _base; }

private:
  bool fail(ErrorKind kind, std::size_t anchor, const char *detail)
  {
    _hasError = true;
    _error = Error{kind, _base + anchor, detail};
    // Parked on the attribute so that retrying reproduces the error.
    _offset = anchor;
    LOOSEXML_LOG_DEBUG("AttributeCursor: " << _error.message());
    return false;
  }

  std::string_view _content;
  std::size_t _base{0};
  std::size_t _offset{0};

  Attribute _current{};
  bool _hasError{false};
  Error _error{};
};

} // namespace xml
} // namespace loosexml
