// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "common/types.h"

#include <string>
#include <vector>

namespace CSRLens {

enum class DiagnosticType : u8
{
  UnreadableDirectory,
  UnreadableDocument,
  InvalidFieldDescriptor,
  MissingFieldLocation,
  MalformedRangeSpec,
  BitIndexOutOfRange,
  EnrichmentSourceUnavailable,

  MaxCount
};

const char* GetDiagnosticTypeName(DiagnosticType type);

/// A recoverable problem found while loading. Register and field names are empty when not applicable.
struct Diagnostic
{
  DiagnosticType type;
  std::string path;
  std::string register_name;
  std::string field_name;
  std::string message;

  std::string ToString() const;
};

using DiagnosticList = std::vector<Diagnostic>;

} // namespace CSRLens
