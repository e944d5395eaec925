// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "loosexml/core/logger.hpp"
#include "loosexml/xml/reader.hpp"

#include <cstddef>
#include <cstdio>
#include <ostream>
#include <string>
#include <string_view>

namespace loosexml
{
namespace xml
{

struct DumpOptions
{
  bool attributes{false}; ///< Print one `attr` line per attribute under each tag
  bool recover{false};    ///< Skip past failures instead of stopping at the first
};

struct DumpSummary
{
  std::size_t events{0};
  std::size_t attributes{0};
  std::size_t errors{0};
};

/// \brief Escape \p bytes for single-line display. Backslash, quote and control
/// bytes are escaped; everything else is written through unchanged.
inline std::string escapeForDump(std::string_view bytes)
{
  std::string out;
  out.reserve(bytes.size());
  for (char ch : bytes)
  {
    switch (ch)
    {
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7F)
      {
        char buf[5];
        std::snprintf(buf, sizeof(buf), "\\x%02X",
                      static_cast<unsigned>(static_cast<unsigned char>(ch)));
        out += buf;
      }
      else
      {
        out += ch;
      }
    }
  }
  return out;
}

/// \brief escapeForDump() wrapped in double quotes.
inline std::string quoteForDump(std::string_view bytes)
{
  return '"' + escapeForDump(bytes) + '"';
}

/// \brief Write every event of \p reader to \p os, one line each:
///
///     <offset>\t<open|close|empty>\t<name>
///     <offset>\ttext\t"<escaped text>"
///     <offset>\tattr\t<escaped key>="<escaped value>"
///     <offset>\terror\t<message>
///
/// Without DumpOptions::recover the dump stops at the first error. With it, a
/// failing tag is skipped by resuming the scan one byte past its `<`, and a
/// failing attribute abandons the rest of that tag's attributes.
///
/// \p reader is a Reader or a TextReader; recovery goes through its own seek().
template <typename EventSource>
DumpSummary dumpEvents(EventSource &reader, std::ostream &os, const DumpOptions &opt = {})
{
  DumpSummary summary;

  auto reportError = [&](const Error &err)
  {
    ++summary.errors;
    os << err.offset << "\terror\t" << err.message() << '\n';
  };

  while (true)
  {
    if (!reader.next())
    {
      const Error *err = reader.error();
      if (!err)
      {
        break;
      }
      reportError(*err);
      if (!opt.recover)
      {
        break;
      }
      LOOSEXML_LOG_INFO("dumpEvents: skipping malformed tag at offset " << err->offset);
      reader.seek(err->offset + 1);
      continue;
    }

    const Event &ev = reader.current();
    ++summary.events;
    if (!ev.isTag())
    {
      os << ev.text.offset << "\ttext\t" << quoteForDump(ev.text.content) << '\n';
      continue;
    }

    os << ev.tag.offset << '\t' << toString(ev.kind) << '\t' << ev.tag.name << '\n';
    if (!opt.attributes)
    {
      continue;
    }

    AttributeCursor attrs = ev.tag.attributes();
    while (attrs.next())
    {
      const Attribute &attr = attrs.current();
      ++summary.attributes;
      os << attr.offset << "\tattr\t" << escapeForDump(attr.key) << '='
         << quoteForDump(attr.value) << '\n';
    }
    if (const Error *err = attrs.error())
    {
      reportError(*err);
      if (!opt.recover)
      {
        break;
      }
    }
  }

  LOOSEXML_LOG_DEBUG("dumpEvents: " << summary.events << " events, " << summary.attributes
                                    << " attributes, " << summary.errors << " errors");
  return summary;
}

} // namespace xml
} // namespace loosexml
