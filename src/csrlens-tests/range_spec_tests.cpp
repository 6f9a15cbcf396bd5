// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "test_utils.h"

#include "csrlens/range_spec.h"

#include "common/error.h"

#include "fmt/format.h"

#include <gtest/gtest.h>

using namespace CSRLens;

static std::optional<BitRange> NormalizeJson(std::string_view json, Error* error = nullptr)
{
  rapidjson::Document doc;
  Tests::ParseTestJson(json, &doc);
  return RangeSpec::NormalizeValue(doc, error);
}

static BitRange Range(s64 high, s64 low)
{
  return BitRange{high, low};
}

TEST(RangeSpec, Scalar)
{
  ASSERT_EQ(NormalizeJson("0"), Range(0, 0));
  ASSERT_EQ(NormalizeJson("7"), Range(7, 7));
  ASSERT_EQ(NormalizeJson("63"), Range(63, 63));
}

TEST(RangeSpec, Pair)
{
  ASSERT_EQ(NormalizeJson("[31, 12]"), Range(31, 12));
  ASSERT_EQ(NormalizeJson("[12, 31]"), Range(31, 12));
  ASSERT_EQ(NormalizeJson("[5, 5]"), Range(5, 5));
  ASSERT_EQ(NormalizeJson("[\"6\", \"5\"]"), Range(6, 5));
  ASSERT_EQ(NormalizeJson("[\"3\", 9]"), Range(9, 3));
}

TEST(RangeSpec, KeyedPair)
{
  ASSERT_EQ(NormalizeJson("{\"msb\": 31, \"lsb\": 12}"), Range(31, 12));
  ASSERT_EQ(NormalizeJson("{\"lsb\": 31, \"msb\": 12}"), Range(31, 12));
  ASSERT_EQ(NormalizeJson("{\"hi\": 7, \"lo\": 4}"), Range(7, 4));
  ASSERT_EQ(NormalizeJson("{\"from\": 12, \"to\": 31}"), Range(31, 12));
  ASSERT_EQ(NormalizeJson("{\"high\": 2, \"low\": 1}"), Range(2, 1));
  ASSERT_EQ(NormalizeJson("{\"msb\": \"9\", \"lsb\": \"8\"}"), Range(9, 8));

  // First key in the search order wins.
  ASSERT_EQ(NormalizeJson("{\"hi\": 10, \"msb\": 20, \"lsb\": 0}"), Range(20, 0));
  ASSERT_EQ(NormalizeJson("{\"msb\": 20, \"lo\": 5, \"lsb\": 1}"), Range(20, 1));

  // Extra members are ignored.
  ASSERT_EQ(NormalizeJson("{\"msb\": 3, \"lsb\": 2, \"note\": \"x\"}"), Range(3, 2));
}

TEST(RangeSpec, DelimitedText)
{
  ASSERT_EQ(NormalizeJson("\"31..12\""), Range(31, 12));
  ASSERT_EQ(NormalizeJson("\"31:12\""), Range(31, 12));
  ASSERT_EQ(NormalizeJson("\"31-12\""), Range(31, 12));
  ASSERT_EQ(NormalizeJson("\"33-32\""), Range(33, 32));
  ASSERT_EQ(NormalizeJson("\"12..31\""), Range(31, 12));
  ASSERT_EQ(NormalizeJson("\"  6 .. 5  \""), Range(6, 5));
  ASSERT_EQ(NormalizeJson("\"4 : 4\""), Range(4, 4));
}

TEST(RangeSpec, ScalarText)
{
  ASSERT_EQ(NormalizeJson("\"7\""), Range(7, 7));
  ASSERT_EQ(NormalizeJson("\" 12 \""), Range(12, 12));
}

TEST(RangeSpec, Classification)
{
  rapidjson::Document doc;

  Tests::ParseTestJson("3", &doc);
  ASSERT_TRUE(std::holds_alternative<RangeSpec::Scalar>(RangeSpec::FromValue(doc)->GetEncoding()));
  Tests::ParseTestJson("[3, 1]", &doc);
  ASSERT_TRUE(std::holds_alternative<RangeSpec::Pair>(RangeSpec::FromValue(doc)->GetEncoding()));
  Tests::ParseTestJson("{\"msb\": 3, \"lsb\": 1}", &doc);
  ASSERT_TRUE(std::holds_alternative<RangeSpec::KeyedPair>(RangeSpec::FromValue(doc)->GetEncoding()));
  Tests::ParseTestJson("\"3..1\"", &doc);
  ASSERT_TRUE(std::holds_alternative<RangeSpec::DelimitedText>(RangeSpec::FromValue(doc)->GetEncoding()));
  Tests::ParseTestJson("\"3\"", &doc);
  ASSERT_TRUE(std::holds_alternative<RangeSpec::ScalarText>(RangeSpec::FromValue(doc)->GetEncoding()));
}

TEST(RangeSpec, Malformed)
{
  Error error;
  ASSERT_FALSE(NormalizeJson("\"abc\"", &error).has_value());
  ASSERT_EQ(error.GetDescription(), "Malformed range spec: abc");

  ASSERT_FALSE(NormalizeJson("\"7..\"", &error).has_value());
  ASSERT_FALSE(NormalizeJson("\"..7\"", &error).has_value());
  ASSERT_FALSE(NormalizeJson("\"-5\"", &error).has_value());
  ASSERT_FALSE(NormalizeJson("\"1..2..3\"", &error).has_value());
  ASSERT_FALSE(NormalizeJson("\"\"", &error).has_value());
  ASSERT_FALSE(NormalizeJson("\"0x10\"", &error).has_value());
  ASSERT_FALSE(NormalizeJson("\"99999999999999999999\"", &error).has_value());

  ASSERT_FALSE(NormalizeJson("{\"msb\": 3}", &error).has_value());
  ASSERT_FALSE(NormalizeJson("{\"lsb\": 3}", &error).has_value());
  ASSERT_FALSE(NormalizeJson("{\"msb\": \"x\", \"lsb\": 1}", &error).has_value());
  ASSERT_FALSE(NormalizeJson("{}", &error).has_value());

  ASSERT_FALSE(NormalizeJson("[1]", &error).has_value());
  ASSERT_FALSE(NormalizeJson("[1, 2, 3]", &error).has_value());
  ASSERT_FALSE(NormalizeJson("[1, \"x\"]", &error).has_value());
  ASSERT_FALSE(NormalizeJson("[1, 2.5]", &error).has_value());

  ASSERT_FALSE(NormalizeJson("true", &error).has_value());
  ASSERT_EQ(error.GetDescription(), "Malformed range spec: true");
  ASSERT_FALSE(NormalizeJson("null", &error).has_value());
  ASSERT_FALSE(NormalizeJson("1.5", &error).has_value());
  ASSERT_EQ(error.GetDescription(), "Malformed range spec: 1.5");

  ASSERT_FALSE(NormalizeJson("[1, 2, 3]", &error).has_value());
  ASSERT_EQ(error.GetDescription(), "Malformed range spec: [1,2,3]");
}

TEST(RangeSpec, OutOfDomainIndicesSurvive)
{
  // Range checking is the caller's job.
  const std::optional<BitRange> range = NormalizeJson("[70, 64]");
  ASSERT_EQ(range, Range(70, 64));
  ASSERT_FALSE(range->IsWithinRegister());

  const std::optional<BitRange> negative = NormalizeJson("-1");
  ASSERT_EQ(negative, Range(-1, -1));
  ASSERT_FALSE(negative->IsWithinRegister());

  ASSERT_TRUE(Range(63, 0).IsWithinRegister());
}

TEST(RangeSpec, Idempotent)
{
  static constexpr const char* inputs[] = {
    "5", "[3, 9]", "{\"from\": 2, \"to\": 8}", "\"31..12\"", "\"12:31\"", "\"4-0\"", "\"17\"",
  };

  for (const char* input : inputs)
  {
    const std::optional<BitRange> first = NormalizeJson(input);
    ASSERT_TRUE(first.has_value()) << input;

    // Feed the canonical pair back in, both as a pair and as delimited text.
    const std::string as_pair = fmt::format("[{}, {}]", first->high, first->low);
    const std::string as_text = fmt::format("\"{}..{}\"", first->high, first->low);
    ASSERT_EQ(NormalizeJson(as_pair), first) << input;
    ASSERT_EQ(NormalizeJson(as_text), first) << input;
  }
}

TEST(RangeSpec, FromText)
{
  const RangeSpec delimited = RangeSpec::FromText("7:4");
  ASSERT_TRUE(std::holds_alternative<RangeSpec::DelimitedText>(delimited.GetEncoding()));
  ASSERT_EQ(delimited.GetRaw(), "7:4");
  ASSERT_EQ(delimited.Normalize(), Range(7, 4));

  const RangeSpec scalar = RangeSpec::FromText("9");
  ASSERT_TRUE(std::holds_alternative<RangeSpec::ScalarText>(scalar.GetEncoding()));
  ASSERT_EQ(scalar.Normalize(), Range(9, 9));
}
