// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file attribute_walk_example.cpp
/// \brief Example that lists every tag of a document together with its
/// attributes, tolerating sloppy markup along the way.
///
/// The sample shows how to:
///
/// - Drive the `loosexml::xml::Reader` pull loop and switch on event kinds.
/// - Walk a tag's attribute region lazily with `Tag::attributes()`, which
///   reports attribute errors at absolute buffer offsets.
/// - Recover from a malformed tag by seeking one byte past its `<`.
/// - Report progress through the `Logger` macros.
///
/// Run it without arguments to scan the built-in document, or pass markup
/// as the first argument.

#include "loosexml/loosexml.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv)
{
  using namespace loosexml::xml;

  std::string document = "<Scene name='intro'>\n"
                         "  <Script time=\"0\"a='1'/>\n"
                         "  <0broken>\n"
                         "  <Light color=\"#fff\" on/>\n"
                         "</Scene>\n";
  if (argc > 1)
  {
    document = argv[1];
  }

  loosexml::core::Logger::init(loosexml::core::Logger::Level::Info);

  Reader reader(document);
  int depth = 0;
  while (true)
  {
    if (!reader.next())
    {
      const Error *err = reader.error();
      if (!err)
      {
        break;
      }
      LOOSEXML_LOG_WARN("skipping: " << err->message());
      reader.seek(err->offset + 1);
      continue;
    }

    const Event &ev = reader.current();
    if (ev.kind == EventKind::CloseTag)
    {
      if (depth > 0)
      {
        --depth;
      }
      continue;
    }
    if (!ev.isTag())
    {
      continue;
    }

    std::cout << std::string(depth * 2, ' ') << ev.tag.name << '\n';
    AttributeCursor attrs = ev.tag.attributes();
    while (attrs.next())
    {
      std::cout << std::string(depth * 2 + 2, ' ') << '@' << attrs.current().key << " = "
                << attrs.current().value << '\n';
    }
    if (attrs.error())
    {
      LOOSEXML_LOG_WARN("attributes of <" << ev.tag.name << ">: " << attrs.error()->message());
    }
    if (ev.kind == EventKind::OpenTag)
    {
      ++depth;
    }
  }
  return 0;
}
