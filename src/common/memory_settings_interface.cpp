// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "memory_settings_interface.h"
#include "string_util.h"

MemorySettingsInterface::MemorySettingsInterface() = default;

MemorySettingsInterface::~MemorySettingsInterface() = default;

bool MemorySettingsInterface::Save(Error* error)
{
  // nothing to persist
  return true;
}

void MemorySettingsInterface::Clear()
{
  m_sections.clear();
}

const std::string* MemorySettingsInterface::FindValue(const char* section, const char* key) const
{
  const auto sit = m_sections.find(section);
  if (sit == m_sections.end())
    return nullptr;

  const auto iter = sit->second.find(key);
  if (iter == sit->second.end())
    return nullptr;

  return &iter->second;
}

bool MemorySettingsInterface::GetIntValue(const char* section, const char* key, s32* value) const
{
  const std::string* str = FindValue(section, key);
  if (!str)
    return false;

  const std::optional<s32> parsed = StringUtil::FromChars<s32>(*str, 10);
  if (!parsed.has_value())
    return false;

  *value = parsed.value();
  return true;
}

bool MemorySettingsInterface::GetUIntValue(const char* section, const char* key, u32* value) const
{
  const std::string* str = FindValue(section, key);
  if (!str)
    return false;

  const std::optional<u32> parsed = StringUtil::FromChars<u32>(*str, 10);
  if (!parsed.has_value())
    return false;

  *value = parsed.value();
  return true;
}

bool MemorySettingsInterface::GetBoolValue(const char* section, const char* key, bool* value) const
{
  const std::string* str = FindValue(section, key);
  if (!str)
    return false;

  const std::optional<bool> parsed = StringUtil::FromChars<bool>(*str, 10);
  if (!parsed.has_value())
    return false;

  *value = parsed.value();
  return true;
}

bool MemorySettingsInterface::GetStringValue(const char* section, const char* key, std::string* value) const
{
  const std::string* str = FindValue(section, key);
  if (!str)
    return false;

  value->assign(*str);
  return true;
}

void MemorySettingsInterface::SetValue(const char* section, const char* key, std::string value)
{
  auto sit = m_sections.find(section);
  if (sit == m_sections.end())
    sit = m_sections.emplace(std::string(section), KeyMap()).first;

  sit->second.insert_or_assign(std::string(key), std::move(value));
}

void MemorySettingsInterface::SetIntValue(const char* section, const char* key, s32 value)
{
  SetValue(section, key, StringUtil::ToChars(value));
}

void MemorySettingsInterface::SetUIntValue(const char* section, const char* key, u32 value)
{
  SetValue(section, key, StringUtil::ToChars(value));
}

void MemorySettingsInterface::SetBoolValue(const char* section, const char* key, bool value)
{
  SetValue(section, key, StringUtil::ToChars(value));
}

void MemorySettingsInterface::SetStringValue(const char* section, const char* key, const char* value)
{
  SetValue(section, key, value);
}

std::vector<std::pair<std::string, std::string>> MemorySettingsInterface::GetKeyValueList(const char* section) const
{
  std::vector<std::pair<std::string, std::string>> output;
  const auto sit = m_sections.find(section);
  if (sit != m_sections.end())
  {
    for (const auto& it : sit->second)
      output.emplace_back(it.first, it.second);
  }

  return output;
}

bool MemorySettingsInterface::ContainsValue(const char* section, const char* key) const
{
  return (FindValue(section, key) != nullptr);
}

void MemorySettingsInterface::DeleteValue(const char* section, const char* key)
{
  auto sit = m_sections.find(section);
  if (sit == m_sections.end())
    return;

  const auto iter = sit->second.find(key);
  if (iter != sit->second.end())
    sit->second.erase(iter);
}

void MemorySettingsInterface::ClearSection(const char* section)
{
  auto sit = m_sections.find(section);
  if (sit == m_sections.end())
    return;

  m_sections.erase(sit);
}
