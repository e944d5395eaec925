// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of loosexml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "parsers/minimal_toml.hpp"
#include "util/ascii.hpp"
#include "util/byte_search.hpp"
#include "util/utf8.hpp"
#include "xml/attribute_cursor.hpp"
#include "xml/dump_config.hpp"
#include "xml/error.hpp"
#include "xml/event.hpp"
#include "xml/event_dump.hpp"
#include "xml/reader.hpp"
#include "xml/tag_tokenizer.hpp"
#include "xml/text_reader.hpp"

#define LOOSEXML_DEFAULT_CONFIG_FILE_PATH "/etc/loosexml/loosexml.toml"
