// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "types.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

class Error;

class SettingsInterface
{
public:
  virtual ~SettingsInterface() = default;

  virtual bool Save(Error* error = nullptr) = 0;
  virtual void Clear() = 0;

  virtual bool GetIntValue(const char* section, const char* key, s32* value) const = 0;
  virtual bool GetUIntValue(const char* section, const char* key, u32* value) const = 0;
  virtual bool GetBoolValue(const char* section, const char* key, bool* value) const = 0;
  virtual bool GetStringValue(const char* section, const char* key, std::string* value) const = 0;

  virtual void SetIntValue(const char* section, const char* key, s32 value) = 0;
  virtual void SetUIntValue(const char* section, const char* key, u32 value) = 0;
  virtual void SetBoolValue(const char* section, const char* key, bool value) = 0;
  virtual void SetStringValue(const char* section, const char* key, const char* value) = 0;

  virtual std::vector<std::pair<std::string, std::string>> GetKeyValueList(const char* section) const = 0;

  virtual bool ContainsValue(const char* section, const char* key) const = 0;
  virtual void DeleteValue(const char* section, const char* key) = 0;
  virtual void ClearSection(const char* section) = 0;

  ALWAYS_INLINE s32 GetIntValue(const char* section, const char* key, s32 default_value = 0) const
  {
    s32 value;
    return GetIntValue(section, key, &value) ? value : default_value;
  }

  ALWAYS_INLINE u32 GetUIntValue(const char* section, const char* key, u32 default_value = 0) const
  {
    u32 value;
    return GetUIntValue(section, key, &value) ? value : default_value;
  }

  ALWAYS_INLINE bool GetBoolValue(const char* section, const char* key, bool default_value = false) const
  {
    bool value;
    return GetBoolValue(section, key, &value) ? value : default_value;
  }

  ALWAYS_INLINE std::string GetStringValue(const char* section, const char* key, const char* default_value = "") const
  {
    std::string value;
    if (!GetStringValue(section, key, &value))
      value.assign(default_value);
    return value;
  }

  ALWAYS_INLINE std::optional<u32> GetOptionalUIntValue(const char* section, const char* key,
                                                        std::optional<u32> default_value = std::nullopt) const
  {
    u32 ret;
    return GetUIntValue(section, key, &ret) ? std::optional<u32>(ret) : default_value;
  }

  ALWAYS_INLINE std::optional<std::string>
  GetOptionalStringValue(const char* section, const char* key,
                         std::optional<const char*> default_value = std::nullopt) const
  {
    std::string ret;
    return GetStringValue(section, key, &ret) ? std::optional<std::string>(ret) : default_value;
  }

  ALWAYS_INLINE void SetOptionalStringValue(const char* section, const char* key,
                                            const std::optional<const char*>& value)
  {
    value.has_value() ? SetStringValue(section, key, value.value()) : DeleteValue(section, key);
  }
};
