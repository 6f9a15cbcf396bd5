// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "schema_loader.h"
#include "config_enricher.h"
#include "document.h"
#include "range_spec.h"

#include "common/error.h"
#include "common/file_system.h"
#include "common/log.h"
#include "common/path.h"
#include "common/rapidjson_helpers.h"
#include "common/timer.h"

LOG_CHANNEL(SchemaLoader);

namespace CSRLens::SchemaLoader {

static void LoadRegisterAttributes(Register* reg, const rapidjson::Value& document);
static void LoadFields(std::string_view path, Register* reg, const rapidjson::Value& fields, const Settings& settings,
                       DiagnosticList* diagnostics);
static const rapidjson::Value* FindFieldLocation(const rapidjson::Value& descriptor, const Settings& settings);
static void AddDiagnostic(DiagnosticList* diagnostics, DiagnosticType type, std::string_view path,
                          std::string_view register_name, std::string_view field_name, std::string message);

} // namespace CSRLens::SchemaLoader

void CSRLens::SchemaLoader::AddDiagnostic(DiagnosticList* diagnostics, DiagnosticType type, std::string_view path,
                                          std::string_view register_name, std::string_view field_name,
                                          std::string message)
{
  if (!diagnostics)
    return;

  diagnostics->push_back(Diagnostic{type, std::string(path), std::string(register_name), std::string(field_name),
                                    std::move(message)});
}

const rapidjson::Value* CSRLens::SchemaLoader::FindFieldLocation(const rapidjson::Value& descriptor,
                                                                 const Settings& settings)
{
  for (const char* key : settings.GetLocationKeys())
  {
    if (const rapidjson::Value* location = FindMemberValue(descriptor, key))
      return location;
  }

  return nullptr;
}

void CSRLens::SchemaLoader::LoadRegisterAttributes(Register* reg, const rapidjson::Value& document)
{
  if (const rapidjson::Value* long_name = FindMemberValue(document, "long_name"))
    reg->SetLongName(GetValueAsText(*long_name));

  if (const rapidjson::Value* length = FindMemberValue(document, "length"))
  {
    if (length->IsUint() && length->GetUint() > 0 && length->GetUint() <= MAX_REGISTER_BITS)
      reg->SetLength(length->GetUint());
    else
      VERBOSE_LOG("{}: length {} is not a bit count, using {}", reg->GetName(), GetValueAsText(*length),
                  DEFAULT_REGISTER_LENGTH);
  }

  if (const rapidjson::Value* description = FindMemberValue(document, "description"))
    reg->SetDescription(GetValueAsText(*description));

  bool writable;
  if (GetBoolFromObject(document, "writable", &writable))
    reg->SetWritable(writable);

  if (const rapidjson::Value* priv_mode = FindMemberValue(document, "priv_mode"))
    reg->SetPrivMode(GetValueAsText(*priv_mode));

  if (const rapidjson::Value* defined_by = FindMemberValue(document, "definedBy"))
    reg->SetDefinedBy(WriteCompactJSON(*defined_by));
}

void CSRLens::SchemaLoader::LoadFields(std::string_view path, Register* reg, const rapidjson::Value& fields,
                                       const Settings& settings, DiagnosticList* diagnostics)
{
  for (auto it = fields.MemberBegin(); it != fields.MemberEnd(); ++it)
  {
    const std::string_view field_name = GetStringView(it->name);
    const rapidjson::Value& descriptor = it->value;
    if (!descriptor.IsObject())
    {
      VERBOSE_LOG("{}.{}: descriptor is not a mapping", reg->GetName(), field_name);
      AddDiagnostic(diagnostics, DiagnosticType::InvalidFieldDescriptor, path, reg->GetName(), field_name,
                    "Field descriptor is not a mapping");
      continue;
    }

    const rapidjson::Value* location = FindFieldLocation(descriptor, settings);
    if (!location)
    {
      VERBOSE_LOG("{}.{}: no location", reg->GetName(), field_name);
      AddDiagnostic(diagnostics, DiagnosticType::MissingFieldLocation, path, reg->GetName(), field_name,
                    "Field has no location");
      continue;
    }

    Error error;
    const std::optional<BitRange> range = RangeSpec::NormalizeValue(*location, &error);
    if (!range.has_value())
    {
      VERBOSE_LOG("{}.{}: {}", reg->GetName(), field_name, error.GetDescription());
      AddDiagnostic(diagnostics, DiagnosticType::MalformedRangeSpec, path, reg->GetName(), field_name,
                    error.GetDescription());
      continue;
    }

    if (!range->IsWithinRegister())
    {
      VERBOSE_LOG("{}.{}: bits {}..{} out of range", reg->GetName(), field_name, range->high, range->low);
      AddDiagnostic(diagnostics, DiagnosticType::BitIndexOutOfRange, path, reg->GetName(), field_name,
                    fmt::format("Bits {}..{} are outside 0..{}", range->high, range->low, MAX_REGISTER_BITS - 1));
      continue;
    }

    Field field(std::string(field_name), static_cast<u32>(range->high), static_cast<u32>(range->low));
    if (const rapidjson::Value* description = FindMemberValue(descriptor, "description"))
      field.SetDescription(GetValueAsText(*description));
    if (const rapidjson::Value* type = FindMemberValue(descriptor, "type"))
      field.SetTypeTag(GetValueAsText(*type));
    if (const rapidjson::Value* reset_value = FindMemberValue(descriptor, "reset_value"))
      field.SetResetValue(WriteCompactJSON(*reset_value));
    if (const rapidjson::Value* alias = FindMemberValue(descriptor, "alias"))
      field.SetAlias(GetValueAsText(*alias));

    reg->AddField(std::move(field));
  }
}

bool CSRLens::SchemaLoader::LoadDocument(std::string_view path, const rapidjson::Value& document,
                                         const Settings& settings, RegisterTable* table, DiagnosticList* diagnostics)
{
  std::string kind;
  const rapidjson::Value* name = FindMemberValue(document, "name");
  if (!GetStringFromObject(document, "kind", &kind) || kind != "csr" || !name)
  {
    DEV_LOG("Skipping {}, not a register definition", Path::GetFileName(path));
    return false;
  }

  Register reg(GetValueAsText(*name));
  LoadRegisterAttributes(&reg, document);

  if (const rapidjson::Value* fields = FindMemberValue(document, "fields"); fields && fields->IsObject())
    LoadFields(path, &reg, *fields, settings, diagnostics);

  DEV_LOG("Loaded {} with {} fields from {}", reg.GetName(), reg.GetFieldCount(), Path::GetFileName(path));
  if (table->Insert(std::move(reg)))
    DEV_LOG("{} replaced an earlier definition", Path::GetFileName(path));

  return true;
}

CSRLens::LoadResult CSRLens::SchemaLoader::LoadDirectory(std::string_view directory, const Settings& settings)
{
  LoadResult result;
  Timer timer;

  const std::string directory_str(directory);
  FileSystem::FindResultsArray files;
  Error error;
  if (!FileSystem::FindFiles(directory_str.c_str(), "*", FILESYSTEM_FIND_FILES | FILESYSTEM_FIND_SORT_BY_NAME, &files,
                             &error) &&
      error.IsValid())
  {
    ERROR_LOG("Failed to enumerate {}: {}", directory, error.GetDescription());
    AddDiagnostic(&result.diagnostics, DiagnosticType::UnreadableDirectory, directory, {}, {},
                  error.GetDescription());
    return result;
  }

  for (const FILESYSTEM_FIND_DATA& fd : files)
  {
    const std::optional<Document::Format> format = Document::GetFormatForPath(fd.FileName);
    if (!format.has_value())
      continue;

    result.file_count++;

    rapidjson::Document document;
    const std::optional<std::string> data = FileSystem::ReadFileToString(fd.FileName.c_str(), &error);
    if (!data.has_value() || !Document::Parse(format.value(), fd.FileName, data.value(), &document, &error))
    {
      WARNING_LOG("Skipping {}: {}", Path::GetFileName(fd.FileName), error.GetDescription());
      AddDiagnostic(&result.diagnostics, DiagnosticType::UnreadableDocument, fd.FileName, {}, {},
                    error.GetDescription());
      continue;
    }

    LoadDocument(fd.FileName, document, settings, &result.table, &result.diagnostics);
  }

  INFO_LOG("Loaded {} register definitions from {} files in {:.2f} ms", result.table.GetSize(), result.file_count,
           timer.GetTimeMilliseconds());
  return result;
}

CSRLens::LoadResult CSRLens::BuildRegisterTable(std::string_view directory, std::string_view enrichment_path,
                                                const Settings& settings)
{
  LoadResult result = SchemaLoader::LoadDirectory(directory, settings);
  ConfigEnricher::Enrich(result.table, enrichment_path.empty() ? std::string_view(settings.enrichment_path) :
                                                                 enrichment_path,
                         &result.diagnostics);
  return result;
}
