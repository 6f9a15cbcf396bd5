// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "common/log.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

LOG_CHANNEL(Log);

namespace {
struct CapturedMessage
{
  Log::Level level;
  Log::Channel channel;
  std::string function_name;
  std::string message;
};

class LogTest : public testing::Test
{
protected:
  void SetUp() override
  {
    Log::SetLogLevel(Log::Level::Info);
    Log::RegisterCallback(&LogTest::Callback, this);
  }

  void TearDown() override
  {
    Log::UnregisterCallback(&LogTest::Callback, this);
    Log::SetLogChannelEnabled(Log::Channel::Log, true);
    Log::SetLogLevel(Log::DEFAULT_LOG_LEVEL);
  }

  static void Callback(void* param, Log::MessageCategory cat, const char* function_name, std::string_view message)
  {
    static_cast<LogTest*>(param)->m_messages.push_back(CapturedMessage{
      Log::UnpackLevel(cat), Log::UnpackChannel(cat), function_name ? function_name : "", std::string(message)});
  }

  std::vector<CapturedMessage> m_messages;
};
} // namespace

TEST_F(LogTest, CategoryPacking)
{
  const Log::MessageCategory cat = Log::PackCategory(Log::Channel::Decoder, Log::Level::Warning, Log::Color::Blue);
  ASSERT_EQ(Log::UnpackChannel(cat), Log::Channel::Decoder);
  ASSERT_EQ(Log::UnpackLevel(cat), Log::Level::Warning);
  ASSERT_EQ(Log::UnpackColor(cat), Log::Color::Blue);
}

TEST_F(LogTest, CallbackReceivesFormattedMessage)
{
  INFO_LOG("{} fields in {}", 3, "demo");
  ASSERT_EQ(m_messages.size(), 1u);
  ASSERT_EQ(m_messages[0].level, Log::Level::Info);
  ASSERT_EQ(m_messages[0].channel, Log::Channel::Log);
  ASSERT_EQ(m_messages[0].message, "3 fields in demo");
  ASSERT_FALSE(m_messages[0].function_name.empty());
}

TEST_F(LogTest, LevelFiltering)
{
  VERBOSE_LOG("hidden");
  WARNING_LOG("shown");
  ASSERT_EQ(m_messages.size(), 1u);
  ASSERT_EQ(m_messages[0].message, "shown");
  ASSERT_FALSE(Log::IsLogVisible(Log::Level::Dev, Log::Channel::Log));
  ASSERT_TRUE(Log::IsLogVisible(Log::Level::Error, Log::Channel::Log));

  Log::SetLogLevel(Log::Level::Verbose);
  VERBOSE_LOG("now shown");
  ASSERT_EQ(m_messages.size(), 2u);
}

TEST_F(LogTest, ChannelFiltering)
{
  Log::SetLogChannelEnabled(Log::Channel::Log, false);
  ERROR_LOG("dropped");
  ASSERT_TRUE(m_messages.empty());
  ASSERT_FALSE(Log::IsLogVisible(Log::Level::Error, Log::Channel::Log));
  ASSERT_TRUE(Log::IsLogVisible(Log::Level::Error, Log::Channel::Decoder));

  Log::SetLogChannelEnabled(Log::Channel::Log, true);
  ERROR_LOG("kept");
  ASSERT_EQ(m_messages.size(), 1u);
}

TEST_F(LogTest, ChannelNames)
{
  ASSERT_STREQ(Log::GetChannelName(Log::Channel::SchemaLoader), "SchemaLoader");
  ASSERT_STREQ(Log::GetChannelName(Log::Channel::ConfigEnricher), "ConfigEnricher");
}
