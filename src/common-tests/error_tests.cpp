// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "common/error.h"

#include <gtest/gtest.h>

#include <cerrno>

TEST(Error, DefaultIsNone)
{
  Error error;
  ASSERT_FALSE(error.IsValid());
  ASSERT_TRUE(error.GetDescription().empty());
  ASSERT_EQ(error, Error::CreateNone());
}

TEST(Error, SetString)
{
  Error error;
  error.SetStringView("Malformed range spec: 7..x");
  ASSERT_TRUE(error.IsValid());
  ASSERT_EQ(error.GetDescription(), "Malformed range spec: 7..x");

  error.SetStringFmt("Bits {}..{} are outside 0..{}", 70, 64, 63);
  ASSERT_EQ(error.GetDescription(), "Bits 70..64 are outside 0..63");

  error.Clear();
  ASSERT_FALSE(error.IsValid());
}

TEST(Error, SetErrno)
{
  const Error error = Error::CreateErrno(ENOENT);
  ASSERT_TRUE(error.IsValid());
  ASSERT_EQ(error.GetDescription().rfind("errno 2: ", 0), 0u);

  Error prefixed;
  prefixed.SetErrno("opendir() failed: ", ENOENT);
  ASSERT_EQ(prefixed.GetDescription().rfind("opendir() failed: errno 2: ", 0), 0u);
}

TEST(Error, NullPointerSettersAreIgnored)
{
  Error::SetStringView(nullptr, "ignored");
  Error::SetStringFmt(static_cast<Error*>(nullptr), "ignored {}", 1);
  Error::SetErrno(nullptr, EINVAL);
  Error::AddPrefix(nullptr, "ignored");
  Error::Clear(nullptr);
}

TEST(Error, PrefixAndSuffix)
{
  Error error = Error::CreateString("parse failed");
  error.AddPrefix("mstatus.yaml: ");
  error.AddSuffix(".");
  ASSERT_EQ(error.GetDescription(), "mstatus.yaml: parse failed.");

  Error::AddPrefixFmt(&error, "[{}] ", 3);
  ASSERT_EQ(error.GetDescription(), "[3] mstatus.yaml: parse failed.");

  Error copy;
  Error::Copy(&copy, error);
  ASSERT_EQ(copy, error);
  copy.AddSuffix("!");
  ASSERT_NE(copy, error);
}
