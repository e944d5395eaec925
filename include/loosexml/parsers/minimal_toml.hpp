// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file minimal_toml.hpp
/// \brief The TOML subset used by loosexml configuration files: [dotted.sections],
/// bare keys, basic and literal strings, integers, floats, booleans and # comments.
/// Arrays, inline tables and dates are rejected.

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace loosexml
{
namespace parsers
{
namespace toml
{

class table;

using value_type =
  std::variant<std::monostate, int64_t, double, bool, std::string, std::shared_ptr<table>>;

/// \brief A single TOML value or sub-table; a default-constructed node is "missing".
class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access; integers widen to double, nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, bool> ||
                       std::is_same_v<T, std::string>)
    {
      if (auto *val = std::get_if<T>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  table *as_table()
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

  /// \brief Resolve "a.b.c" through nested tables; returns a missing node when absent.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
      {
        return node();
      }
      if (dot == std::string::npos)
      {
        return it->second;
      }
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

  container_type::const_iterator begin() const { return _values.begin(); }
  container_type::const_iterator end() const { return _values.end(); }

private:
  container_type _values;
};

/// \brief Single-pass parser; throws std::runtime_error with the line number on bad input.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    while (true)
    {
      skipBlankLinesAndComments();
      if (isEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        current = ensureTable(root, parseSectionHeader());
      }
      else
      {
        std::string key = parseKey();
        skipSpaces();
        expect('=');
        skipSpaces();
        if (current->contains(key))
        {
          fail("duplicate key '" + key + "'");
        }
        current->insert(key, parseValue());
      }
      finishLine();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  [[noreturn]] void fail(const std::string &what) const
  {
    throw std::runtime_error("TOML line " + std::to_string(_line) + ": " + what);
  }

  void expect(char c)
  {
    if (peek() != c)
    {
      fail(std::string("expected '") + c + "'");
    }
    advance();
  }

  void skipSpaces()
  {
    while (!isEnd() && (peek() == ' ' || peek() == '\t'))
      advance();
  }

  void skipBlankLinesAndComments()
  {
    while (!isEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
      {
        advance();
      }
      else if (c == '#')
      {
        while (!isEnd() && peek() != '\n')
          advance();
      }
      else
      {
        break;
      }
    }
  }

  /// Only whitespace or a comment may follow a key/value pair or header.
  void finishLine()
  {
    skipSpaces();
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
    if (peek() == '\r')
      advance();
    if (!isEnd() && peek() != '\n')
    {
      fail("unexpected trailing characters");
    }
  }

  static bool isKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::string parseKey()
  {
    std::string key;
    while (!isEnd() && isKeyChar(peek()))
      key += advance();
    if (key.empty())
    {
      fail("expected a key");
    }
    return key;
  }

  std::string parseSectionHeader()
  {
    advance(); // '['
    skipSpaces();
    std::string path = parseKey();
    skipSpaces();
    while (peek() == '.')
    {
      advance();
      skipSpaces();
      path += '.';
      path += parseKey();
      skipSpaces();
    }
    expect(']');
    return path;
  }

  node parseValue()
  {
    char c = peek();
    if (c == '"')
      return node(parseBasicString());
    if (c == '\'')
      return node(parseLiteralString());
    if (c == 't' || c == 'f')
      return node(parseBool());
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return node(parseNumber());
    fail("unsupported value");
  }

  std::string parseBasicString()
  {
    advance(); // opening quote
    std::string str;
    while (!isEnd() && peek() != '"' && peek() != '\n')
    {
      char c = advance();
      if (c != '\\')
      {
        str += c;
        continue;
      }
      if (isEnd())
      {
        break;
      }
      switch (advance())
      {
      case 'n':
        str += '\n';
        break;
      case 't':
        str += '\t';
        break;
      case 'r':
        str += '\r';
        break;
      case '\\':
        str += '\\';
        break;
      case '"':
        str += '"';
        break;
      default:
        fail("unsupported escape sequence");
      }
    }
    expect('"');
    return str;
  }

  std::string parseLiteralString()
  {
    advance(); // opening quote
    std::string str;
    while (!isEnd() && peek() != '\'' && peek() != '\n')
      str += advance();
    expect('\'');
    return str;
  }

  bool parseBool()
  {
    std::string word;
    while (!isEnd() && std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean '" + word + "'");
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      num += advance();
    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
      }
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !((c == '+' || c == '-') && (num.back() == 'e' || num.back() == 'E')))
      {
        break;
      }
      num += advance();
    }

    try
    {
      std::size_t used = 0;
      value_type result;
      if (isFloat)
        result = std::stod(num, &used);
      else
        result = static_cast<int64_t>(std::stoll(num, &used));
      if (used != num.size())
      {
        fail("invalid number '" + num + "'");
      }
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number '" + num + "'");
    }
  }

  table *ensureTable(table &root, const std::string &path)
  {
    table *current = &root;
    std::size_t start = 0;
    while (true)
    {
      std::size_t dot = path.find('.', start);
      std::string key = path.substr(start, dot == std::string::npos ? dot : dot - start);
      if (!current->contains(key))
      {
        current->insert(key, node(std::make_shared<table>()));
      }
      current = (*current)[key].as_table();
      if (!current)
      {
        fail("'" + key + "' is already a value, not a table");
      }
      if (dot == std::string::npos)
      {
        return current;
      }
      start = dot + 1;
    }
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace loosexml
