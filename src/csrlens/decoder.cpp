// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "decoder.h"
#include "register.h"

#include "common/log.h"

#include "fmt/format.h"

#include <algorithm>
#include <bit>

LOG_CHANNEL(Decoder);

std::vector<const CSRLens::Field*> CSRLens::Decoder::GetFieldsInDecodeOrder(const Register& reg)
{
  std::vector<const Field*> fields;
  fields.reserve(reg.GetFieldCount());
  for (const Field& field : reg.GetFields())
    fields.push_back(&field);

  std::stable_sort(fields.begin(), fields.end(),
                   [](const Field* lhs, const Field* rhs) { return (lhs->GetMSB() > rhs->GetMSB()); });
  return fields;
}

std::vector<CSRLens::FieldValue> CSRLens::Decoder::DecodeValue(const Register& reg, u64 value)
{
  if (!reg.HasFields())
    DEV_LOG("{} has no fields to decode", reg.GetName());

  std::vector<FieldValue> ret;
  ret.reserve(reg.GetFieldCount());

  for (const Field* field : GetFieldsInDecodeOrder(reg))
  {
    const u64 extracted = field->ExtractValue(value);
    ret.push_back(FieldValue{field->GetName(), field->GetMSB(), field->GetLSB(), field->GetWidth(), extracted,
                             fmt::format("{:#x}", extracted), fmt::format("{:#b}", extracted),
                             field->GetDescription()});
  }

  return ret;
}

std::vector<CSRLens::FieldChange> CSRLens::Decoder::DecodeXorMask(const Register& reg, u64 xor_value)
{
  std::vector<FieldChange> ret;

  for (const Field* field : GetFieldsInDecodeOrder(reg))
  {
    const u64 changed = field->GetChangedBits(xor_value);
    if (changed == 0)
      continue;

    ret.push_back(FieldChange{field->GetName(), field->GetMSB(), field->GetLSB(), field->GetWidth(), changed,
                              changed >> field->GetLSB(), static_cast<u32>(std::popcount(changed)),
                              field->GetDescription()});
  }

  return ret;
}

std::vector<CSRLens::FieldDifference> CSRLens::Decoder::Compare(const Register& reg, u64 a, u64 b)
{
  std::vector<FieldValue> decoded_a = DecodeValue(reg, a);
  std::vector<FieldValue> decoded_b = DecodeValue(reg, b);

  std::vector<FieldDifference> ret;
  for (size_t i = 0; i < decoded_a.size(); i++)
  {
    if (decoded_a[i].value != decoded_b[i].value)
      ret.push_back(FieldDifference{std::move(decoded_a[i]), std::move(decoded_b[i])});
  }

  return ret;
}
