// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "settings.h"

#include "common/settings_interface.h"
#include "common/string_util.h"

LOG_CHANNEL(Settings);

namespace CSRLens {
static constexpr const std::array s_log_level_names = {
  "None", "Error", "Warning", "Info", "Verbose", "Dev", "Debug", "Trace",
};
static_assert(s_log_level_names.size() == static_cast<size_t>(Log::Level::MaxCount));
} // namespace CSRLens

CSRLens::Settings::Settings() = default;

std::array<const char*, 3> CSRLens::Settings::GetLocationKeys() const
{
  if (location_xlen == 32)
    return {"location", "location_rv32", "location_rv64"};
  else
    return {"location", "location_rv64", "location_rv32"};
}

void CSRLens::Settings::Load(const SettingsInterface& si)
{
  location_xlen = si.GetUIntValue("Loader", "LocationXLEN", DEFAULT_LOCATION_XLEN);
  if (location_xlen != 32 && location_xlen != 64)
  {
    WARNING_LOG("Invalid LocationXLEN {}, using {}", location_xlen, DEFAULT_LOCATION_XLEN);
    location_xlen = DEFAULT_LOCATION_XLEN;
  }

  enrichment_path = si.GetStringValue("Loader", "EnrichmentPath");

  const std::string log_level_name = si.GetStringValue("Logging", "LogLevel", GetLogLevelName(DEFAULT_LOG_LEVEL));
  log_level = ParseLogLevelName(log_level_name.c_str()).value_or(DEFAULT_LOG_LEVEL);
  log_timestamps = si.GetBoolValue("Logging", "LogTimestamps", true);
  log_to_console = si.GetBoolValue("Logging", "LogToConsole", false);
  log_to_file = si.GetBoolValue("Logging", "LogToFile", false);
  log_file_name = si.GetStringValue("Logging", "LogFileName", DEFAULT_LOG_FILE_NAME);
  if (log_file_name.empty())
    log_file_name = DEFAULT_LOG_FILE_NAME;
}

void CSRLens::Settings::Save(SettingsInterface& si) const
{
  si.SetUIntValue("Loader", "LocationXLEN", location_xlen);
  si.SetStringValue("Loader", "EnrichmentPath", enrichment_path.c_str());

  si.SetStringValue("Logging", "LogLevel", GetLogLevelName(log_level));
  si.SetBoolValue("Logging", "LogTimestamps", log_timestamps);
  si.SetBoolValue("Logging", "LogToConsole", log_to_console);
  si.SetBoolValue("Logging", "LogToFile", log_to_file);
  si.SetStringValue("Logging", "LogFileName", log_file_name.c_str());
}

void CSRLens::Settings::UpdateLogSettings() const
{
  Log::SetLogLevel(log_level);
  Log::SetConsoleOutputParams(log_to_console, log_timestamps);

  if (log_to_file)
    Log::SetFileOutputParams(log_to_file, log_file_name.c_str(), log_timestamps);
  else
    Log::SetFileOutputParams(false, nullptr);
}

std::optional<Log::Level> CSRLens::Settings::ParseLogLevelName(const char* str)
{
  int index = 0;
  for (const char* name : s_log_level_names)
  {
    if (StringUtil::Strcasecmp(name, str) == 0)
      return static_cast<Log::Level>(index);

    index++;
  }

  return std::nullopt;
}

const char* CSRLens::Settings::GetLogLevelName(Log::Level level)
{
  return s_log_level_names[static_cast<size_t>(level)];
}
