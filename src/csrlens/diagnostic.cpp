// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "diagnostic.h"

#include "fmt/format.h"

#include <array>
#include <iterator>

namespace CSRLens {
static constexpr const std::array s_diagnostic_type_names = {
  "UnreadableDirectory", "UnreadableDocument", "InvalidFieldDescriptor",      "MissingFieldLocation",
  "MalformedRangeSpec",  "BitIndexOutOfRange", "EnrichmentSourceUnavailable",
};
static_assert(s_diagnostic_type_names.size() == static_cast<size_t>(DiagnosticType::MaxCount));
} // namespace CSRLens

const char* CSRLens::GetDiagnosticTypeName(DiagnosticType type)
{
  return s_diagnostic_type_names[static_cast<size_t>(type)];
}

std::string CSRLens::Diagnostic::ToString() const
{
  std::string ret = fmt::format("{}: {}", GetDiagnosticTypeName(type), path);
  if (!register_name.empty())
  {
    fmt::format_to(std::back_inserter(ret), " [{}", register_name);
    if (!field_name.empty())
      fmt::format_to(std::back_inserter(ret), ".{}", field_name);
    ret.push_back(']');
  }

  if (!message.empty())
    fmt::format_to(std::back_inserter(ret), ": {}", message);

  return ret;
}
