// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "diagnostic.h"
#include "register.h"
#include "settings.h"

#include "rapidjson/fwd.h"

#include <string_view>

namespace CSRLens {

struct LoadResult
{
  RegisterTable table;
  DiagnosticList diagnostics;

  /// Number of schema files found in the directory, including ones that were skipped.
  u32 file_count = 0;
};

namespace SchemaLoader {

/// Loads every yml/yaml/json document directly inside the directory, one register per document. Files are
/// processed in byte order of their path, so a later file replaces an earlier register with the same name.
LoadResult LoadDirectory(std::string_view directory, const Settings& settings = Settings());

/// Loads a single parsed document into the table. Returns false if the document does not describe a
/// register. Per-field problems are appended to diagnostics and do not reject the document.
bool LoadDocument(std::string_view path, const rapidjson::Value& document, const Settings& settings,
                  RegisterTable* table, DiagnosticList* diagnostics);

} // namespace SchemaLoader

/// Loads the schema directory, then applies the enrichment source. An empty enrichment_path falls back to
/// the path in the settings.
LoadResult BuildRegisterTable(std::string_view directory, std::string_view enrichment_path,
                              const Settings& settings = Settings());

} // namespace CSRLens
