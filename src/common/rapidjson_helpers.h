// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "types.h"

#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <optional>
#include <string>
#include <string_view>

// RapidJSON utility routines.

static inline std::string_view GetStringView(const rapidjson::Value& value)
{
  return std::string_view(value.GetString(), value.GetStringLength());
}

/// Returns the member with the given key, or nullptr. Null members are treated as absent.
static inline const rapidjson::Value* FindMemberValue(const rapidjson::Value& object, std::string_view key)
{
  if (!object.IsObject())
    return nullptr;

  const auto member = object.FindMember(rapidjson::Value(rapidjson::StringRef(key.data(), key.length())));
  if (member == object.MemberEnd() || member->value.IsNull())
    return nullptr;

  return &member->value;
}

static inline bool GetStringFromObject(const rapidjson::Value& object, std::string_view key, std::string* dest)
{
  dest->clear();

  const rapidjson::Value* member = FindMemberValue(object, key);
  if (!member || !member->IsString())
    return false;

  dest->assign(member->GetString(), member->GetStringLength());
  return true;
}

static inline bool GetBoolFromObject(const rapidjson::Value& object, std::string_view key, bool* dest)
{
  const rapidjson::Value* member = FindMemberValue(object, key);
  if (!member || !member->IsBool())
    return false;

  *dest = member->GetBool();
  return true;
}

static inline bool GetInt64FromObject(const rapidjson::Value& object, std::string_view key, s64* dest)
{
  const rapidjson::Value* member = FindMemberValue(object, key);
  if (!member || !member->IsInt64())
    return false;

  *dest = member->GetInt64();
  return true;
}

/// Renders a value as compact JSON text.
static inline std::string WriteCompactJSON(const rapidjson::Value& value)
{
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  value.Accept(writer);
  return std::string(buffer.GetString(), buffer.GetSize());
}

/// Renders a value as text. Strings are returned verbatim, everything else as compact JSON.
static inline std::string GetValueAsText(const rapidjson::Value& value)
{
  if (value.IsString())
    return std::string(value.GetString(), value.GetStringLength());

  return WriteCompactJSON(value);
}
