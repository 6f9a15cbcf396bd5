// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "common/memory_settings_interface.h"

#include <gtest/gtest.h>

TEST(MemorySettingsInterface, DefaultsWhenMissing)
{
  MemorySettingsInterface si;
  ASSERT_EQ(si.GetIntValue("Loader", "Missing", -3), -3);
  ASSERT_EQ(si.GetUIntValue("Loader", "LocationXLEN", 64u), 64u);
  ASSERT_TRUE(si.GetBoolValue("Logging", "LogTimestamps", true));
  ASSERT_EQ(si.GetStringValue("Loader", "EnrichmentPath", "cfg.yaml"), "cfg.yaml");
  ASSERT_FALSE(si.GetOptionalUIntValue("Loader", "LocationXLEN").has_value());
  ASSERT_FALSE(si.ContainsValue("Loader", "LocationXLEN"));
}

TEST(MemorySettingsInterface, SetAndGet)
{
  MemorySettingsInterface si;
  si.SetUIntValue("Loader", "LocationXLEN", 32);
  si.SetIntValue("Loader", "Signed", -12);
  si.SetBoolValue("Logging", "LogToConsole", true);
  si.SetStringValue("Loader", "EnrichmentPath", "/tmp/cfg.yaml");

  ASSERT_EQ(si.GetUIntValue("Loader", "LocationXLEN", 64u), 32u);
  ASSERT_EQ(si.GetIntValue("Loader", "Signed", 0), -12);
  ASSERT_TRUE(si.GetBoolValue("Logging", "LogToConsole", false));
  ASSERT_EQ(si.GetStringValue("Loader", "EnrichmentPath"), "/tmp/cfg.yaml");
  ASSERT_EQ(si.GetOptionalUIntValue("Loader", "LocationXLEN"), 32u);
}

TEST(MemorySettingsInterface, UnparseableValuesFallBack)
{
  MemorySettingsInterface si;
  si.SetStringValue("Loader", "LocationXLEN", "sixty-four");
  si.SetStringValue("Logging", "LogToFile", "perhaps");

  u32 value = 0;
  ASSERT_FALSE(si.GetUIntValue("Loader", "LocationXLEN", &value));
  ASSERT_EQ(si.GetUIntValue("Loader", "LocationXLEN", 64u), 64u);
  ASSERT_FALSE(si.GetBoolValue("Logging", "LogToFile", false));
}

TEST(MemorySettingsInterface, DeleteAndClear)
{
  MemorySettingsInterface si;
  si.SetStringValue("Loader", "EnrichmentPath", "a.yaml");
  si.SetUIntValue("Loader", "LocationXLEN", 32);
  si.SetStringValue("Logging", "LogLevel", "Verbose");

  si.DeleteValue("Loader", "EnrichmentPath");
  ASSERT_FALSE(si.ContainsValue("Loader", "EnrichmentPath"));
  ASSERT_EQ(si.GetKeyValueList("Loader").size(), 1u);

  si.SetOptionalStringValue("Loader", "EnrichmentPath", std::nullopt);
  ASSERT_FALSE(si.ContainsValue("Loader", "EnrichmentPath"));

  si.ClearSection("Loader");
  ASSERT_TRUE(si.GetKeyValueList("Loader").empty());
  ASSERT_TRUE(si.ContainsValue("Logging", "LogLevel"));

  si.Clear();
  ASSERT_FALSE(si.ContainsValue("Logging", "LogLevel"));
  ASSERT_TRUE(si.Save());
}
