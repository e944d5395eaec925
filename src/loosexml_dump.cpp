// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <loosexml/loosexml.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace
{
constexpr int EXIT_PARSE_ERRORS = 1;
constexpr int EXIT_USAGE = 2;

/// \brief Print help message
void printHelp()
{
  std::cout << "Usage: loosexml-dump [options] <file|->\n"
            << "Tokenizes XML-like markup and prints one line per event.\n\n"
            << "  -h, --help                 Show this help message\n"
            << "  -c, --config <file>        Configuration file path\n"
            << "  -l, --log-level <level>    Log level (trace, debug, info, warning, error, "
               "fatal)\n"
            << "  -f, --log-file <file>      Log file path (default: stderr)\n"
            << "      --no-trim              Keep whitespace around text events\n"
            << "      --utf8                 Require the input to be valid UTF-8\n"
            << "      --keep-bom             With --utf8, do not skip a leading byte-order-mark\n"
            << "  -a, --attributes           Print the attributes of every tag\n"
            << "  -r, --recover              Skip malformed tags instead of stopping\n";
}

/// \brief Parse command-line arguments into the dump config.
/// \returns false when help was requested.
bool parseCliArgs(int argc, char **argv, loosexml::xml::DumpConfig &config)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      config.configFile = argv[++i];
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      config.log.level = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      config.log.file = argv[++i];
    }
    else if (arg == "--no-trim")
    {
      config.reader.trimWhitespace = false;
    }
    else if (arg == "--utf8")
    {
      config.reader.utf8 = true;
    }
    else if (arg == "--keep-bom")
    {
      config.reader.stripBom = false;
    }
    else if (arg == "-a" || arg == "--attributes")
    {
      config.dump.attributes = true;
    }
    else if (arg == "-r" || arg == "--recover")
    {
      config.dump.recover = true;
    }
    else if (arg == "-h" || arg == "--help")
    {
      return false;
    }
    else if (arg.size() > 1 && arg[0] == '-')
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
    else if (config.input.empty())
    {
      config.input = arg;
    }
    else
    {
      throw std::runtime_error("Only one input file may be given, got '" + arg + "'");
    }
  }
  if (config.input.empty())
  {
    throw std::runtime_error("No input file given");
  }
  return true;
}

/// \brief Merge the TOML configuration: the explicit file, else the default
/// path when it exists.
void parseTomlConfig(loosexml::xml::DumpConfig &config)
{
  std::string path;
  if (config.configFile)
  {
    path = *config.configFile;
  }
  else if (std::filesystem::exists(LOOSEXML_DEFAULT_CONFIG_FILE_PATH))
  {
    path = LOOSEXML_DEFAULT_CONFIG_FILE_PATH;
  }
  if (path.empty())
  {
    return;
  }

  loosexml::core::ConfigLoader loader(path);
  config.applyConfig(loader);
}

std::string readInput(const std::string &path)
{
  if (path == "-")
  {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open input file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}
} // namespace

int main(int argc, char **argv)
{
  using namespace loosexml;

  xml::DumpConfig config;
  std::string document;
  try
  {
    if (!parseCliArgs(argc, argv, config))
    {
      printHelp();
      return 0;
    }
    parseTomlConfig(config);

    core::Logger::init(config.logLevel(), config.log.file.value_or(""));
    core::Logger::setLogFormat(config.log.format.value_or(xml::DumpConfig::DEFAULT_LOG_FORMAT));

    document = readInput(config.input);
    LOOSEXML_LOG_INFO("loosexml-dump: read " << document.size() << " bytes from "
                                             << config.input);
  }
  catch (const std::exception &e)
  {
    std::cerr << "loosexml-dump: " << e.what() << "\n";
    std::cerr << "Try 'loosexml-dump --help' for more information.\n";
    return EXIT_USAGE;
  }

  xml::DumpSummary summary;
  if (config.utf8())
  {
    std::unique_ptr<xml::TextReader> text;
    try
    {
      text = std::make_unique<xml::TextReader>(document, config.readerOptions());
    }
    catch (const std::invalid_argument &e)
    {
      LOOSEXML_LOG_ERROR("loosexml-dump: " << config.input << ": " << e.what());
      core::Logger::shutdown();
      return EXIT_PARSE_ERRORS;
    }
    summary = xml::dumpEvents(*text, std::cout, config.dumpOptions());
  }
  else
  {
    xml::Reader reader(document, config.readerOptions());
    summary = xml::dumpEvents(reader, std::cout, config.dumpOptions());
  }
  std::cout.flush();

  LOOSEXML_LOG_INFO("loosexml-dump: " << summary.events << " events, " << summary.attributes
                                      << " attributes, " << summary.errors << " errors");
  core::Logger::shutdown();
  return summary.errors == 0 ? 0 : EXIT_PARSE_ERRORS;
}
