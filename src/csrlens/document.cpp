// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "document.h"

#include "common/error.h"
#include "common/file_system.h"
#include "common/log.h"
#include "common/path.h"
#include "common/rapidjson_helpers.h"
#include "common/ryml_helpers.h"
#include "common/string_util.h"

#include "rapidjson/error/en.h"

#include <array>
#include <charconv>
#include <limits>

LOG_CHANNEL(Document);

namespace CSRLens::Document {

using Allocator = rapidjson::Document::AllocatorType;

static void ConvertYamlNode(const ryml::ConstNodeRef& node, rapidjson::Value* out, Allocator& allocator);
static void ConvertYamlScalar(std::string_view text, bool quoted, rapidjson::Value* out, Allocator& allocator);
static bool ParseYamlInteger(std::string_view text, rapidjson::Value* out);
static bool ParseYamlFloat(std::string_view text, rapidjson::Value* out);

static constexpr const std::array s_format_names = {"YAML", "JSON"};
static_assert(s_format_names.size() == static_cast<size_t>(Format::MaxCount));

} // namespace CSRLens::Document

const char* CSRLens::Document::GetFormatName(Format format)
{
  return s_format_names[static_cast<size_t>(format)];
}

std::optional<CSRLens::Document::Format> CSRLens::Document::GetFormatForPath(std::string_view path)
{
  const std::string_view extension = Path::GetExtension(path);
  if (extension == "yml" || extension == "yaml")
    return Format::YAML;
  else if (extension == "json")
    return Format::JSON;
  else
    return std::nullopt;
}

void CSRLens::Document::ConvertYamlNode(const ryml::ConstNodeRef& node, rapidjson::Value* out, Allocator& allocator)
{
  if (node.is_map())
  {
    out->SetObject();
    for (const ryml::ConstNodeRef& child : node.cchildren())
    {
      const std::string_view key = child.has_key() ? to_stringview(child.key()) : std::string_view();
      rapidjson::Value value;
      ConvertYamlNode(child, &value, allocator);

      // Repeated keys: the last one wins.
      const auto existing = out->FindMember(rapidjson::Value(rapidjson::StringRef(key.data(), key.length())));
      if (existing != out->MemberEnd())
      {
        existing->value = value;
        continue;
      }

      out->AddMember(rapidjson::Value(key.data(), static_cast<rapidjson::SizeType>(key.length()), allocator), value,
                     allocator);
    }
  }
  else if (node.is_seq())
  {
    out->SetArray();
    for (const ryml::ConstNodeRef& child : node.cchildren())
    {
      rapidjson::Value value;
      ConvertYamlNode(child, &value, allocator);
      out->PushBack(value, allocator);
    }
  }
  else if (node.has_val())
  {
    ConvertYamlScalar(to_stringview(node.val()), node.is_val_quoted(), out, allocator);
  }
  else
  {
    out->SetNull();
  }
}

void CSRLens::Document::ConvertYamlScalar(std::string_view text, bool quoted, rapidjson::Value* out,
                                          Allocator& allocator)
{
  if (!quoted)
  {
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL")
    {
      out->SetNull();
      return;
    }
    else if (text == "true" || text == "True" || text == "TRUE")
    {
      out->SetBool(true);
      return;
    }
    else if (text == "false" || text == "False" || text == "FALSE")
    {
      out->SetBool(false);
      return;
    }
    else if (ParseYamlInteger(text, out) || ParseYamlFloat(text, out))
    {
      return;
    }
  }

  out->SetString(text.data(), static_cast<rapidjson::SizeType>(text.length()), allocator);
}

bool CSRLens::Document::ParseYamlInteger(std::string_view text, rapidjson::Value* out)
{
  bool negative = false;
  if (text.front() == '-' || text.front() == '+')
  {
    negative = (text.front() == '-');
    text = text.substr(1);
  }

  int base = 10;
  if (text.length() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
  {
    base = 16;
    text = text.substr(2);
  }
  else if (text.length() > 2 && text[0] == '0' && text[1] == 'o')
  {
    base = 8;
    text = text.substr(2);
  }

  std::string_view remaining;
  const std::optional<u64> value = StringUtil::FromChars<u64>(text, base, &remaining);
  if (text.empty() || !value.has_value() || !remaining.empty())
    return false;

  if (!negative)
  {
    if (value.value() <= static_cast<u64>(std::numeric_limits<s64>::max()))
      out->SetInt64(static_cast<s64>(value.value()));
    else
      out->SetUint64(value.value());

    return true;
  }

  // Magnitudes beyond INT64_MIN cannot be represented, leave those as strings.
  if (value.value() > static_cast<u64>(std::numeric_limits<s64>::max()) + 1)
    return false;

  out->SetInt64(static_cast<s64>(~value.value() + 1));
  return true;
}

bool CSRLens::Document::ParseYamlFloat(std::string_view text, rapidjson::Value* out)
{
  // Only decimal notation with a fraction or exponent, so that version strings like "1.2.3" stay text.
  if (text.find_first_of(".eE") == std::string_view::npos)
    return false;

  const char* start = text.data();
  const char* end = start + text.length();
  if (*start == '+')
    start++;

  double value;
  const std::from_chars_result result = std::from_chars(start, end, value);
  if (result.ec != std::errc() || result.ptr != end)
    return false;

  out->SetDouble(value);
  return true;
}

bool CSRLens::Document::ParseYaml(std::string_view name, std::string_view data, rapidjson::Document* doc,
                                  Error* error)
{
  SetRymlCallbacks();

  bool result = true;
  try
  {
    const ryml::Tree tree = ryml::parse_in_arena(to_csubstr(name), to_csubstr(data));
    ryml::ConstNodeRef root = tree.rootref();

    // Multi-document streams only use the first document.
    if (root.is_stream())
      root = root.has_children() ? root.first_child() : ryml::ConstNodeRef();

    if (root.valid())
      ConvertYamlNode(root, doc, doc->GetAllocator());
    else
      doc->SetNull();
  }
  catch (const RymlParseException& e)
  {
    Error::SetStringView(error, e.GetMessage());
    result = false;
  }

  ryml::reset_callbacks();
  return result;
}

bool CSRLens::Document::ParseJson(std::string_view name, std::string_view data, rapidjson::Document* doc,
                                  Error* error)
{
  doc->Parse(data.data(), data.length());
  if (doc->HasParseError())
  {
    Error::SetStringFmt(error, "JSON parse error in {} at offset {}: {}", name, doc->GetErrorOffset(),
                        rapidjson::GetParseError_En(doc->GetParseError()));
    return false;
  }

  return true;
}

bool CSRLens::Document::Parse(Format format, std::string_view name, std::string_view data, rapidjson::Document* doc,
                              Error* error)
{
  if (format == Format::JSON)
    return ParseJson(name, data, doc, error);
  else
    return ParseYaml(name, data, doc, error);
}

bool CSRLens::Document::ParseFile(const char* path, rapidjson::Document* doc, Error* error)
{
  // fopen() accepts directories on POSIX, the read would fail later with a less useful error.
  if (FileSystem::DirectoryExists(path))
  {
    Error::SetStringFmt(error, "{} is a directory", path);
    return false;
  }

  const std::optional<std::string> data = FileSystem::ReadFileToString(path, error);
  if (!data.has_value())
    return false;

  const Format format = GetFormatForPath(path).value_or(Format::YAML);
  DEV_LOG("Parsing {} as {}", Path::GetFileName(path), GetFormatName(format));
  return Parse(format, path, data.value(), doc, error);
}
