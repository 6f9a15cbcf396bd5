// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "diagnostic.h"
#include "types.h"

#include "rapidjson/fwd.h"

#include <optional>
#include <string>
#include <string_view>

namespace CSRLens {

class RegisterTable;

// Merges access-type metadata from a per-hart configuration document into loaded registers. Access types
// that are already set are never overwritten.
namespace ConfigEnricher {

struct Classification
{
  AccessType type = AccessType::Unset;

  /// Compact JSON text of the legal value payload, if the descriptor carries one.
  std::optional<std::string> legal_values;
};

/// Classifies a type descriptor such as {warl: {legal: [0, 1]}}. Keys are checked in a fixed order, and the
/// first one present wins.
Classification Classify(const rapidjson::Value& descriptor);

/// Reads the enrichment source and applies it. An empty path or a missing file is a no-op.
void Enrich(RegisterTable& table, std::string_view path, DiagnosticList* diagnostics = nullptr);

/// Applies an already-parsed document. Returns the number of fields whose access type was set.
u32 EnrichFromDocument(RegisterTable& table, const rapidjson::Value& document);

} // namespace ConfigEnricher

} // namespace CSRLens
