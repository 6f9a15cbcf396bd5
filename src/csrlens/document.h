// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "common/types.h"

#include "rapidjson/fwd.h"

#include <optional>
#include <string_view>

class Error;

// Schema and enrichment documents may be written in YAML or JSON. Both are parsed into a rapidjson DOM, so
// the consumers only ever walk one document model.
namespace CSRLens::Document {

enum class Format : u8
{
  YAML,
  JSON,

  MaxCount
};

const char* GetFormatName(Format format);

/// Selects the format from the file extension (yml, yaml or json). Returns nullopt for anything else.
std::optional<Format> GetFormatForPath(std::string_view path);

/// Parses YAML text. Plain scalars are typed using the YAML core schema: null, booleans, integers (decimal,
/// 0x hex, 0o octal) and floats. Everything else, including all quoted scalars, becomes a string.
bool ParseYaml(std::string_view name, std::string_view data, rapidjson::Document* doc, Error* error = nullptr);

bool ParseJson(std::string_view name, std::string_view data, rapidjson::Document* doc, Error* error = nullptr);

bool Parse(Format format, std::string_view name, std::string_view data, rapidjson::Document* doc,
           Error* error = nullptr);

/// Reads and parses a file. Files with an unknown extension are parsed as YAML, which also accepts JSON.
bool ParseFile(const char* path, rapidjson::Document* doc, Error* error = nullptr);

} // namespace CSRLens::Document
