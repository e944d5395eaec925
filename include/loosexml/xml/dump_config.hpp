// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "loosexml/core/config_loader.hpp"
#include "loosexml/xml/event_dump.hpp"
#include "loosexml/xml/reader.hpp"

#include <optional>
#include <string>

namespace loosexml
{
namespace xml
{

/// \brief Settings of the loosexml-dump tool. Unset fields are filled from the
/// configuration file, then from the defaults below; command-line flags set
/// fields first and therefore win.
struct DumpConfig
{
  static constexpr bool DEFAULT_TRIM_WHITESPACE = true;
  static constexpr bool DEFAULT_UTF8 = false;
  static constexpr bool DEFAULT_STRIP_BOM = true;
  static constexpr bool DEFAULT_ATTRIBUTES = false;
  static constexpr bool DEFAULT_RECOVER = false;
  static constexpr const char *DEFAULT_LOG_LEVEL = "info";
  static constexpr const char *DEFAULT_LOG_FORMAT = "[%T] [%L] %m";

  std::optional<std::string> configFile;
  std::string input; ///< Path of the document, "-" for stdin

  struct
  {
    std::optional<bool> trimWhitespace;
    std::optional<bool> utf8;
    std::optional<bool> stripBom;
  } reader;

  struct
  {
    std::optional<bool> attributes;
    std::optional<bool> recover;
  } dump;

  struct
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
    std::optional<std::string> format;
  } log;

  /// \brief Fill every field still unset from \p loader.
  void applyConfig(const core::ConfigLoader &loader)
  {
    fill(reader.trimWhitespace, loader.getBool("reader.trim_whitespace"));
    fill(reader.utf8, loader.getBool("reader.utf8"));
    fill(reader.stripBom, loader.getBool("reader.strip_bom"));
    fill(dump.attributes, loader.getBool("dump.attributes"));
    fill(dump.recover, loader.getBool("dump.recover"));
    fill(log.level, loader.getString("log.level"));
    fill(log.file, loader.getString("log.file"));
    fill(log.format, loader.getString("log.format"));
  }

  Options readerOptions() const
  {
    Options opt;
    opt.trimWhitespace = reader.trimWhitespace.value_or(DEFAULT_TRIM_WHITESPACE);
    opt.stripBom = reader.stripBom.value_or(DEFAULT_STRIP_BOM);
    return opt;
  }

  DumpOptions dumpOptions() const
  {
    DumpOptions opt;
    opt.attributes = dump.attributes.value_or(DEFAULT_ATTRIBUTES);
    opt.recover = dump.recover.value_or(DEFAULT_RECOVER);
    return opt;
  }

  bool utf8() const { return reader.utf8.value_or(DEFAULT_UTF8); }

  core::Logger::Level logLevel() const
  {
    return core::Logger::parseLevel(log.level.value_or(DEFAULT_LOG_LEVEL));
  }

private:
  template <typename T> static void fill(std::optional<T> &field, std::optional<T> value)
  {
    if (!field.has_value() && value.has_value())
    {
      field = std::move(value);
    }
  }
};

} // namespace xml
} // namespace loosexml
