// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "loosexml/core/logger.hpp"
#include "loosexml/parsers/minimal_toml.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace loosexml
{
namespace core
{
/// \brief Loads a TOML configuration file and serves typed values by dotted key.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file is missing or malformed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Builds a loader over an in-memory TOML document (no file backing).
  static ConfigLoader fromString(const std::string &toml)
  {
    ConfigLoader loader;
    loader._table = parsers::toml::parse(toml);
    loader._loaded = true;
    return loader;
  }

  /// \brief Re-reads the file; on failure the previous table is kept.
  bool reload()
  {
    if (_filename.empty())
    {
      return _loaded;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      LOOSEXML_LOG_DEBUG("ConfigLoader: loaded " << _filename << " (" << _table.size()
                                                 << " top-level entries)");
      return true;
    }
    catch (const std::exception &e)
    {
      LOOSEXML_LOG_ERROR("ConfigLoader: failed to load " << _filename << ": " << e.what());
      _lastError = e.what();
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

private:
  ConfigLoader() = default;

  std::string _filename;
  std::string _lastError;
  parsers::toml::table _table;
  bool _loaded{false};
};

} // namespace core
} // namespace loosexml
