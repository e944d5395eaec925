// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace loosexml
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

/// \brief Process-wide synchronous logger with levels, a pre-compiled line
/// format, an optional log file and an external handler hook.
///
/// Output goes to stderr unless a file is configured, so that tools built on
/// the tokenizer keep stdout for their own data.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler: level, formatted line, raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief (Re)initialise the logger. An empty \p filePath logs to stderr.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
    }
  }

  /// \brief Flush and close the log file, falling back to stderr.
  static void shutdown()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
      data.fileStream.reset();
    }
    std::cerr.flush();
  }

  static void setLevel(Level level) { getData().minLevel = level; }

  static Level level() { return getData().minLevel; }

  static bool enabled(Level level) { return level >= getData().minLevel.load(); }

  /// \brief Route every line to \p handler instead of the file or stderr.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the line format. Placeholders:
  ///   %T timestamp, %L level, %m message, %F source file, %l source line,
  ///   %f function, %% literal percent. Empty formats are ignored.
  /// \note Source location placeholders are only filled by LOOSEXML_LOG_* macros.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    compileFormat(format, data.compiledFormat);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information.
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    if (!enabled(level))
    {
      return;
    }

    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }
    std::string output = formatLine(level, message, file, line, function, data.compiledFormat,
                                     data.timestampFormat);

    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cerr << output;
    }
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  /// \brief Map a case-insensitive level name ("trace" .. "fatal", "warn") to a
  /// level; unknown names yield \p fallback.
  static Level parseLevel(const std::string &name, Level fallback = Level::Info)
  {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "info")
    {
      return Level::Info;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return fallback;
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal; ///< Only used when token == Literal
  };

  struct LoggerData
  {
    std::mutex mutex;
    std::atomic<Level> minLevel{Level::Info};
    std::unique_ptr<std::ofstream> fileStream;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static void compileFormat(const std::string &format, std::vector<FormatSegment> &segments)
  {
    segments.clear();
    std::string literal;

    auto flushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(literal)});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }

      FormatToken token = FormatToken::Literal;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        literal += '%';
        ++i;
        continue;
      default:
        // Unknown placeholder, keep the percent sign as text
        literal += format[i];
        continue;
      }
      flushLiteral();
      segments.push_back({token, ""});
      ++i;
    }
    flushLiteral();
  }

  static std::string timestamp(const std::string &timestampFmt)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&t), timestampFmt.c_str());
    if (timestampFmt.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  /// \note Caller holds the data mutex.
  static std::string formatLine(Level level, const std::string &message, const char *file,
                                int line, const char *function,
                                const std::vector<FormatSegment> &segments,
                                const std::string &timestampFmt)
  {
    std::ostringstream oss;
    for (const auto &seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << timestamp(timestampFmt);
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
        {
          oss << detail::basename(file);
        }
        break;
      case FormatToken::Line:
        if (file)
        {
          oss << line;
        }
        break;
      case FormatToken::Function:
        if (function)
        {
          oss << function;
        }
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Stream-style logging macro with source location support.
/// The message expression is only evaluated when the level is enabled.
#define LOOSEXML_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    if (loosexml::core::Logger::enabled(loosexml::core::Logger::Level::level))                     \
    {                                                                                              \
      std::ostringstream _oss;                                                                     \
      _oss << msg;                                                                                 \
      loosexml::core::Logger::log(loosexml::core::Logger::Level::level, _oss.str(), __FILE__,      \
                                  __LINE__, __func__);                                             \
    }                                                                                              \
  } while (0)

#define LOOSEXML_LOG_TRACE(msg) LOOSEXML_LOG_WITH_LEVEL(Trace, msg)
#define LOOSEXML_LOG_DEBUG(msg) LOOSEXML_LOG_WITH_LEVEL(Debug, msg)
#define LOOSEXML_LOG_INFO(msg) LOOSEXML_LOG_WITH_LEVEL(Info, msg)
#define LOOSEXML_LOG_WARN(msg) LOOSEXML_LOG_WITH_LEVEL(Warning, msg)
#define LOOSEXML_LOG_ERROR(msg) LOOSEXML_LOG_WITH_LEVEL(Error, msg)
#define LOOSEXML_LOG_FATAL(msg) LOOSEXML_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace loosexml
