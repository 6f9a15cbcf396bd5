// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "range_spec.h"

#include "common/error.h"
#include "common/log.h"
#include "common/rapidjson_helpers.h"
#include "common/string_util.h"

#include <algorithm>
#include <array>

LOG_CHANNEL(RangeSpec);

namespace CSRLens {

static constexpr const std::array s_high_keys = {"msb", "hi", "from", "high"};
static constexpr const std::array s_low_keys = {"lsb", "lo", "to", "low"};
static constexpr const std::array s_text_separators = {"..", ":", "-"};

static std::optional<s64> ParseIndexText(std::string_view text);
static std::optional<s64> GetIntegralValue(const rapidjson::Value& value);
static std::optional<s64> FindKeyedIndex(const RangeSpec::KeyedPair& kp, const std::array<const char*, 4>& keys);
static std::optional<BitRange> ParseDelimitedText(std::string_view text);
static BitRange MakeRange(s64 a, s64 b);
static void SetMalformedError(Error* error, std::string_view raw);

} // namespace CSRLens

std::optional<s64> CSRLens::ParseIndexText(std::string_view text)
{
  text = StringUtil::StripWhitespace(text);
  if (text.empty() || !std::all_of(text.begin(), text.end(), StringUtil::IsDecimalDigit))
    return std::nullopt;

  // FromChars() fails on overflow.
  return StringUtil::FromChars<s64>(text);
}

std::optional<s64> CSRLens::GetIntegralValue(const rapidjson::Value& value)
{
  if (value.IsInt64())
    return value.GetInt64();
  else if (value.IsString())
    return ParseIndexText(GetStringView(value));
  else
    return std::nullopt;
}

std::optional<s64> CSRLens::FindKeyedIndex(const RangeSpec::KeyedPair& kp, const std::array<const char*, 4>& keys)
{
  for (const char* key : keys)
  {
    const auto iter = std::find_if(kp.members.begin(), kp.members.end(),
                                   [key](const auto& member) { return (member.first == key); });
    if (iter != kp.members.end())
      return iter->second;
  }

  return std::nullopt;
}

std::optional<CSRLens::BitRange> CSRLens::ParseDelimitedText(std::string_view text)
{
  text = StringUtil::StripWhitespace(text);

  for (const char* separator : s_text_separators)
  {
    const std::string_view sep(separator);
    const std::string_view::size_type pos = text.find(sep);
    if (pos == std::string_view::npos)
      continue;

    const std::optional<s64> a = ParseIndexText(text.substr(0, pos));
    const std::optional<s64> b = ParseIndexText(text.substr(pos + sep.length()));
    if (!a.has_value() || !b.has_value())
      return std::nullopt;

    return MakeRange(a.value(), b.value());
  }

  return std::nullopt;
}

CSRLens::BitRange CSRLens::MakeRange(s64 a, s64 b)
{
  return BitRange{std::max(a, b), std::min(a, b)};
}

void CSRLens::SetMalformedError(Error* error, std::string_view raw)
{
  VERBOSE_LOG("Malformed range spec: {}", raw);
  Error::SetStringFmt(error, "Malformed range spec: {}", raw);
}

CSRLens::RangeSpec::RangeSpec(Encoding encoding, std::string raw) : m_encoding(std::move(encoding)), m_raw(std::move(raw))
{
}

CSRLens::RangeSpec::~RangeSpec() = default;

CSRLens::RangeSpec CSRLens::RangeSpec::FromText(std::string_view text)
{
  std::string raw(text);
  for (const char* separator : s_text_separators)
  {
    if (text.find(separator) != std::string_view::npos)
      return RangeSpec(DelimitedText{raw}, raw);
  }

  return RangeSpec(ScalarText{raw}, raw);
}

std::optional<CSRLens::RangeSpec> CSRLens::RangeSpec::FromValue(const rapidjson::Value& value, Error* error)
{
  if (value.IsInt64())
    return RangeSpec(Scalar{value.GetInt64()}, GetValueAsText(value));

  if (value.IsString())
    return FromText(GetStringView(value));

  if (value.IsArray() && value.Size() == 2)
  {
    const std::optional<s64> first = GetIntegralValue(value[0]);
    const std::optional<s64> second = GetIntegralValue(value[1]);
    if (first.has_value() && second.has_value())
      return RangeSpec(Pair{first.value(), second.value()}, GetValueAsText(value));
  }
  else if (value.IsObject())
  {
    KeyedPair kp;
    kp.members.reserve(value.MemberCount());
    for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it)
    {
      if (!it->name.IsString())
        continue;

      kp.members.emplace_back(std::string(GetStringView(it->name)), GetIntegralValue(it->value));
    }

    return RangeSpec(std::move(kp), GetValueAsText(value));
  }

  SetMalformedError(error, GetValueAsText(value));
  return std::nullopt;
}

std::optional<CSRLens::BitRange> CSRLens::RangeSpec::NormalizeValue(const rapidjson::Value& value, Error* error)
{
  const std::optional<RangeSpec> spec = FromValue(value, error);
  if (!spec.has_value())
    return std::nullopt;

  return spec->Normalize(error);
}

std::optional<CSRLens::BitRange> CSRLens::RangeSpec::Normalize(Error* error) const
{
  std::optional<BitRange> ret;

  if (const Scalar* scalar = std::get_if<Scalar>(&m_encoding))
  {
    ret = BitRange{scalar->index, scalar->index};
  }
  else if (const Pair* pair = std::get_if<Pair>(&m_encoding))
  {
    ret = MakeRange(pair->first, pair->second);
  }
  else if (const KeyedPair* kp = std::get_if<KeyedPair>(&m_encoding))
  {
    const std::optional<s64> high = FindKeyedIndex(*kp, s_high_keys);
    const std::optional<s64> low = FindKeyedIndex(*kp, s_low_keys);
    if (high.has_value() && low.has_value())
      ret = MakeRange(high.value(), low.value());
  }
  else if (const DelimitedText* dt = std::get_if<DelimitedText>(&m_encoding))
  {
    ret = ParseDelimitedText(dt->text);
  }
  else if (const ScalarText* st = std::get_if<ScalarText>(&m_encoding))
  {
    if (const std::optional<s64> index = ParseIndexText(st->text); index.has_value())
      ret = BitRange{index.value(), index.value()};
  }

  if (!ret.has_value())
    SetMalformedError(error, m_raw);

  return ret;
}
