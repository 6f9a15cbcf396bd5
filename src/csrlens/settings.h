// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "common/log.h"
#include "common/types.h"

#include <array>
#include <optional>
#include <string>

class SettingsInterface;

namespace CSRLens {

struct Settings
{
  Settings();

  // Loader
  u32 location_xlen = DEFAULT_LOCATION_XLEN;
  std::string enrichment_path;

  // Logging
  Log::Level log_level = DEFAULT_LOG_LEVEL;
  bool log_timestamps : 1 = true;
  bool log_to_console : 1 = false;
  bool log_to_file : 1 = false;
  std::string log_file_name = DEFAULT_LOG_FILE_NAME;

  /// Field location keys in the order they are tried. The generic key always comes first.
  std::array<const char*, 3> GetLocationKeys() const;

  void Load(const SettingsInterface& si);
  void Save(SettingsInterface& si) const;

  /// Applies the logging options to the global log state.
  void UpdateLogSettings() const;

  static std::optional<Log::Level> ParseLogLevelName(const char* str);
  static const char* GetLogLevelName(Log::Level level);

  static constexpr u32 DEFAULT_LOCATION_XLEN = 64;
  static constexpr Log::Level DEFAULT_LOG_LEVEL = Log::DEFAULT_LOG_LEVEL;
  static constexpr const char* DEFAULT_LOG_FILE_NAME = "csrlens.log";
};

} // namespace CSRLens
