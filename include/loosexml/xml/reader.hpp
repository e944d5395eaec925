// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file reader.hpp
/// \brief Lenient, non-validating, zero-copy pull tokenizer for XML-like markup.
///
/// The Reader turns a buffer into open/close/empty tag and text events without
/// checking the document against XML 1.0. Quotes, whitespace and slashes are
/// handled loosely so that markup from sloppy writers still scans, e.g.
/// `<Script time="0"a='1'/>` is an empty tag with two attributes.
///
/// Example:
/// \code
/// loosexml::xml::Reader reader("<Test>hello, world!</Test>");
/// while (reader.next())
/// {
///   const auto &ev = reader.current();
///   if (ev.kind == loosexml::xml::EventKind::OpenTag)
///   {
///     // ev.tag.name, ev.tag.attributes() ...
///   }
/// }
/// if (const auto *err = reader.error()) { /* err->offset */ }
/// \endcode
///
/// Not handled: entities, namespaces, DTDs, comments, CDATA, declarations and
/// processing instructions (the last two fail with ErrorKind::InvalidName).

#include "loosexml/core/logger.hpp"
#include "loosexml/util/ascii.hpp"
#include "loosexml/util/byte_search.hpp"
#include "loosexml/xml/error.hpp"
#include "loosexml/xml/event.hpp"
#include "loosexml/xml/tag_tokenizer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace loosexml
{
namespace xml
{

/// \brief Reader configuration.
struct Options
{
  bool trimWhitespace{true}; ///< Trim text events and drop the ones left empty
  bool stripBom{true};       ///< TextReader only: drop leading U+FEFF marks
};

/// \brief Pull tokenizer over a borrowed buffer. The buffer must outlive the
/// Reader and every view it hands out.
class Reader
{
public:
  explicit Reader(std::string_view source, const Options &opt = Options{})
    : _source(source), _trim(opt.trimWhitespace)
  {
  }

  /// \brief Raw byte entry point; bytes are scanned as-is.
  Reader(const std::uint8_t *data, std::size_t size, const Options &opt = Options{})
    : Reader(std::string_view(reinterpret_cast<const char *>(data), size), opt)
  {
  }

  /// \brief Enable or disable trimming of text events. May be changed between
  /// any two next() calls; applies from the next text run on.
  Reader &trimWhitespace(bool trim)
  {
    _trim = trim;
    return *this;
  }

  bool trimsWhitespace() const { return _trim; }

  /// \brief Absolute byte offset of the scan cursor. While positioned on a tag
  /// this is one past its `<`.
  std::size_t offset() const { return _offset; }

  bool atEnd() const { return _state == State::End; }

  std::string_view source() const { return _source; }

  /// \brief Produce the next event. Returns false at end of input (error() is
  /// null) or on failure (error() set). A failing tag is not consumed, so
  /// calling next() again reports the same error; use seek() to move on.
  bool next()
  {
    _hasError = false;
    while (true)
    {
      switch (_state)
      {
      case State::Searching:
        if (readText())
        {
          return true;
        }
        break; // empty run, keep scanning
      case State::LocatedTag:
        return readTag();
      case State::End:
      default:
        return false;
      }
    }
  }

  /// \brief The event produced by the last successful next().
  const Event &current() const { return _event; }

  /// \brief Error of the last next() call, or nullptr.
  const Error *error() const { return _hasError ? &_error : nullptr; }

  /// \brief Move the cursor to \p offset (clamped to the buffer) and resume
  /// looking for text or the next tag from there.
  void seek(std::size_t offset)
  {
    _offset = std::min(offset, _source.size());
    _state = State::Searching;
    _hasError = false;
  }

private:
  enum class State
  {
    Searching,  ///< Looking for text or the next `<`
    LocatedTag, ///< One byte past a `<`
    End         ///< Input exhausted
  };

  /// Emits the run before the next `<`, or the tail of the input. Returns false
  /// when the run is empty (after trimming, if enabled).
  bool readText()
  {
    std::string_view rest = _source.substr(_offset);
    const std::size_t start = _offset;
    std::string_view text;

    std::size_t lt = util::findByte(rest, '<');
    if (lt != std::string_view::npos)
    {
      text = rest.substr(0, lt);
      _offset += lt + 1;
      _state = State::LocatedTag;
    }
    else
    {
      text = rest;
      _offset = _source.size();
      _state = State::End;
    }

    if (_trim)
    {
      text = util::trim(text);
    }
    if (text.empty())
    {
      return false;
    }

    _event = Event{};
    _event.kind = EventKind::Text;
    _event.text = Text{text, start + static_cast<std::size_t>(text.data() - rest.data())};
    _event.raw = text;
    return true;
  }

  bool readTag()
  {
    const std::size_t tagStart = _offset - 1;
    TagScan scan;
    if (!TagTokenizer::tokenize(_source.substr(_offset), tagStart, scan, _error))
    {
      _hasError = true;
      LOOSEXML_LOG_DEBUG("Reader: " << _error.message());
      return false;
    }

    _offset = tagStart + scan.length;
    _state = State::Searching;

    _event = Event{};
    _event.kind = scan.kind;
    _event.tag = scan.tag;
    _event.raw = _source.substr(tagStart, scan.length);
    return true;
  }

  std::string_view _source;
  std::size_t _offset{0};
  State _state{State::Searching};
  bool _trim{true};

  Event _event{};
  bool _hasError{false};
  Error _error{};
};

/// \brief Scan \p source to the end and return every event.
/// \throws ParseError on the first failing tag.
inline std::vector<Event> readAll(std::string_view source, const Options &opt = Options{})
{
  Reader reader(source, opt);
  std::vector<Event> events;
  while (reader.next())
  {
    events.push_back(reader.current());
  }
  if (const Error *err = reader.error())
  {
    throw ParseError(*err);
  }
  return events;
}

/// \brief Read every attribute of \p tag.
/// \throws ParseError on the first malformed attribute.
inline std::vector<Attribute> collectAttributes(const Tag &tag)
{
  AttributeCursor cursor = tag.attributes();
  std::vector<Attribute> attrs;
  while (cursor.next())
  {
    attrs.push_back(cursor.current());
  }
  if (const Error *err = cursor.error())
  {
    throw ParseError(*err);
  }
  return attrs;
}

} // namespace xml
} // namespace loosexml
