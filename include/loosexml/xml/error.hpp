// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace loosexml
{
namespace xml
{

/// \brief The three ways a scan step can fail.
enum class ErrorKind
{
  InvalidName,      ///< Tag name empty or starting with a disallowed byte: `<>`, `</>`, `<0Name>`
  InvalidAttribute, ///< Bare word, empty key or missing quote: `<Name a>`, `<Name a= >`
  UnexpectedEof     ///< Tag or quoted value still open at end of input: `<Name`, `a="1`
};

inline const char *toString(ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::InvalidName:
    return "invalid name";
  case ErrorKind::InvalidAttribute:
    return "invalid attribute";
  case ErrorKind::UnexpectedEof:
    return "unexpected end of input";
  default:
    return "unknown error";
  }
}

/// \brief Failure of one Reader or AttributeCursor step.
///
/// \c offset is an absolute byte position in the scanned buffer: the `<` of the
/// offending tag, or the first byte of the offending attribute.
struct Error
{
  ErrorKind kind{ErrorKind::UnexpectedEof};
  std::size_t offset{0};
  const char *detail{""}; ///< Static description, never null

  std::string message() const
  {
    std::string msg = toString(kind);
    msg += " at offset ";
    msg += std::to_string(offset);
    if (detail && *detail)
    {
      msg += ": ";
      msg += detail;
    }
    return msg;
  }
};

inline bool operator==(const Error &a, const Error &b)
{
  return a.kind == b.kind && a.offset == b.offset;
}

inline bool operator!=(const Error &a, const Error &b) { return !(a == b); }

/// \brief Exception form of Error, thrown by the readAll/collectAttributes drivers.
class ParseError : public std::runtime_error
{
public:
  explicit ParseError(const Error &error) : std::runtime_error(error.message()), _error(error) {}

  const Error &error() const { return _error; }

  ErrorKind kind() const { return _error.kind; }

  std::size_t offset() const { return _error.offset; }

private:
  Error _error;
};

} // namespace xml
} // namespace loosexml
