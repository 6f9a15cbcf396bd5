// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "config_enricher.h"
#include "document.h"
#include "register.h"

#include "common/error.h"
#include "common/file_system.h"
#include "common/log.h"
#include "common/rapidjson_helpers.h"
#include "common/string_util.h"

#include <algorithm>

LOG_CHANNEL(ConfigEnricher);

namespace CSRLens::ConfigEnricher {

static const rapidjson::Value* SelectHart(const rapidjson::Value& document, std::string_view* hart_name);
static u32 ApplyRegisterType(Register* reg, const rapidjson::Value& entry, const rapidjson::Value& type);
static u32 ApplyFieldType(Register* reg, std::string_view field_name, const rapidjson::Value& descriptor);
static u32 ApplyFields(Register* reg, const rapidjson::Value& fields);
static std::optional<s64> GetBitIndex(const rapidjson::Value& entry, const char* key);

} // namespace CSRLens::ConfigEnricher

CSRLens::ConfigEnricher::Classification CSRLens::ConfigEnricher::Classify(const rapidjson::Value& descriptor)
{
  Classification ret;
  if (!descriptor.IsObject())
    return ret;

  // Members may be present with a null value (e.g. "wpri:" in YAML), so this can't use FindMemberValue().
  const auto find = [&descriptor](const char* key) -> const rapidjson::Value* {
    const auto iter = descriptor.FindMember(key);
    return (iter != descriptor.MemberEnd()) ? &iter->value : nullptr;
  };
  const auto payload = [](const rapidjson::Value& value) -> std::optional<std::string> {
    return value.IsNull() ? std::nullopt : std::optional<std::string>(WriteCompactJSON(value));
  };

  if (const rapidjson::Value* warl = find("warl"))
  {
    ret.type = AccessType::WARL;
    if (const rapidjson::Value* legal = FindMemberValue(*warl, "legal"))
      ret.legal_values = WriteCompactJSON(*legal);
  }
  else if (const rapidjson::Value* wlrl = find("wlrl"))
  {
    ret.type = AccessType::WLRL;
    ret.legal_values = payload(*wlrl);
  }
  else if (find("wpri"))
  {
    ret.type = AccessType::WPRI;
  }
  else if (find("wiri"))
  {
    ret.type = AccessType::WIRI;
  }
  else if (const rapidjson::Value* ro_constant = find("ro_constant"))
  {
    ret.type = AccessType::ROConstant;
    ret.legal_values = payload(*ro_constant);
  }
  else if (const rapidjson::Value* ro_variable = find("ro_variable"))
  {
    ret.type = AccessType::ROVariable;
    ret.legal_values = payload(*ro_variable);
  }

  return ret;
}

const rapidjson::Value* CSRLens::ConfigEnricher::SelectHart(const rapidjson::Value& document,
                                                            std::string_view* hart_name)
{
  if (!document.IsObject())
    return nullptr;

  for (auto it = document.MemberBegin(); it != document.MemberEnd(); ++it)
  {
    const std::string_view key = GetStringView(it->name);
    if (!key.starts_with("hart") || key == "hart_ids")
      continue;

    *hart_name = key;
    return it->value.IsObject() ? &it->value : nullptr;
  }

  return nullptr;
}

std::optional<s64> CSRLens::ConfigEnricher::GetBitIndex(const rapidjson::Value& entry, const char* key)
{
  s64 value;
  if (!GetInt64FromObject(entry, key, &value))
    return std::nullopt;

  return value;
}

u32 CSRLens::ConfigEnricher::ApplyRegisterType(Register* reg, const rapidjson::Value& entry,
                                               const rapidjson::Value& type)
{
  Classification cls = Classify(type);

  if (!reg->HasFields())
  {
    // Describe the whole register as one field.
    const s64 msb = GetBitIndex(entry, "msb").value_or(static_cast<s64>(MAX_REGISTER_BITS) - 1);
    const s64 lsb = GetBitIndex(entry, "lsb").value_or(0);
    const BitRange range{std::max(msb, lsb), std::min(msb, lsb)};
    if (!range.IsWithinRegister())
    {
      WARNING_LOG("{}: bits {}..{} are out of range, not adding a field", reg->GetName(), range.high, range.low);
      return 0;
    }

    Field field(reg->GetName(), static_cast<u32>(range.high), static_cast<u32>(range.low));
    const bool set = field.SetAccessTypeIfUnset(cls.type, std::move(cls.legal_values));
    reg->AddField(std::move(field));
    VERBOSE_LOG("{}: added whole-register field {}..{} ({})", reg->GetName(), range.high, range.low,
                GetAccessTypeName(cls.type));
    return set ? 1 : 0;
  }

  u32 count = 0;
  for (Field& field : reg->GetFields())
  {
    if (field.SetAccessTypeIfUnset(cls.type, cls.legal_values))
      count++;
  }

  return count;
}

u32 CSRLens::ConfigEnricher::ApplyFieldType(Register* reg, std::string_view field_name,
                                            const rapidjson::Value& descriptor)
{
  const rapidjson::Value* type = FindMemberValue(descriptor, "type");
  if (!type)
    return 0;

  Field* field = reg->FindFieldNoCase(field_name);
  if (!field)
  {
    DEV_LOG("{}: no field named {}", reg->GetName(), field_name);
    return 0;
  }

  Classification cls = Classify(*type);
  return field->SetAccessTypeIfUnset(cls.type, std::move(cls.legal_values)) ? 1 : 0;
}

u32 CSRLens::ConfigEnricher::ApplyFields(Register* reg, const rapidjson::Value& fields)
{
  u32 count = 0;

  if (fields.IsObject())
  {
    for (auto it = fields.MemberBegin(); it != fields.MemberEnd(); ++it)
      count += ApplyFieldType(reg, GetStringView(it->name), it->value);
  }
  else if (fields.IsArray())
  {
    for (const rapidjson::Value& item : fields.GetArray())
    {
      // Bare names carry no descriptor.
      if (!item.IsObject())
        continue;

      std::string name;
      if (GetStringFromObject(item, "name", &name))
        count += ApplyFieldType(reg, name, item);
      else if (item.MemberCount() == 1 && item.MemberBegin()->value.IsObject())
        count += ApplyFieldType(reg, GetStringView(item.MemberBegin()->name), item.MemberBegin()->value);
    }
  }

  return count;
}

u32 CSRLens::ConfigEnricher::EnrichFromDocument(RegisterTable& table, const rapidjson::Value& document)
{
  std::string_view hart_name;
  const rapidjson::Value* hart = SelectHart(document, &hart_name);
  if (!hart)
  {
    VERBOSE_LOG("No hart entry in enrichment document");
    return 0;
  }

  u32 count = 0;
  for (auto it = hart->MemberBegin(); it != hart->MemberEnd(); ++it)
  {
    Register* reg = table.FindExact(GetStringView(it->name));
    if (!reg)
      continue;

    const rapidjson::Value* entry = FindMemberValue(it->value, "rv64");
    if (!entry || !entry->IsObject())
      entry = FindMemberValue(it->value, "rv32");
    if (!entry || !entry->IsObject())
      continue;

    // The whole-register type is applied first; field descriptors only fill fields it left unset.
    if (const rapidjson::Value* type = FindMemberValue(*entry, "type"))
      count += ApplyRegisterType(reg, *entry, *type);

    if (const rapidjson::Value* fields = FindMemberValue(*entry, "fields"))
      count += ApplyFields(reg, *fields);
  }

  INFO_LOG("Set access type on {} fields from {}", count, hart_name);
  return count;
}

void CSRLens::ConfigEnricher::Enrich(RegisterTable& table, std::string_view path, DiagnosticList* diagnostics)
{
  if (path.empty())
    return;

  const std::string path_str(path);
  if (!FileSystem::FileExists(path_str.c_str()) && !FileSystem::DirectoryExists(path_str.c_str()))
  {
    VERBOSE_LOG("Enrichment source {} does not exist", path);
    return;
  }

  Error error;
  rapidjson::Document document;
  if (!Document::ParseFile(path_str.c_str(), &document, &error))
  {
    WARNING_LOG("Failed to read enrichment source {}: {}", path, error.GetDescription());
    if (diagnostics)
    {
      diagnostics->push_back(Diagnostic{DiagnosticType::EnrichmentSourceUnavailable, path_str, std::string(),
                                        std::string(), error.GetDescription()});
    }

    return;
  }

  EnrichFromDocument(table, document);
}
