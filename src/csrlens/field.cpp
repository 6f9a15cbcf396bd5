// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "field.h"

#include "common/assert.h"
#include "common/string_util.h"

#include <array>

namespace CSRLens {

static constexpr const std::array s_access_type_names = {
  "unset", "warl", "wlrl", "wpri", "wiri", "ro_constant", "ro_variable",
};
static_assert(s_access_type_names.size() == static_cast<size_t>(AccessType::MaxCount));

} // namespace CSRLens

const char* CSRLens::GetAccessTypeName(AccessType type)
{
  return s_access_type_names[static_cast<size_t>(type)];
}

std::optional<CSRLens::AccessType> CSRLens::ParseAccessTypeName(std::string_view name)
{
  int index = 0;
  for (const char* type_name : s_access_type_names)
  {
    if (StringUtil::EqualNoCase(type_name, name))
      return static_cast<AccessType>(index);

    index++;
  }

  return std::nullopt;
}

CSRLens::Field::Field(std::string name, u32 msb, u32 lsb) : m_name(std::move(name)), m_msb(msb), m_lsb(lsb)
{
  DebugAssert(msb >= lsb && msb < MAX_REGISTER_BITS);
}

CSRLens::Field::~Field() = default;

u64 CSRLens::Field::GetMask() const
{
  // shifting a u64 by 64 is undefined
  const u32 width = GetWidth();
  const u64 ones = (width >= 64) ? ~static_cast<u64>(0) : ((static_cast<u64>(1) << width) - 1);
  return (ones << m_lsb);
}

void CSRLens::Field::SetDescription(std::string_view description)
{
  m_description = StringUtil::StripWhitespace(description);
  StringUtil::ReplaceAll(&m_description, '\n', ' ');
}

bool CSRLens::Field::SetAccessTypeIfUnset(AccessType type, std::optional<std::string> legal_values)
{
  if (m_access_type != AccessType::Unset || type == AccessType::Unset)
    return false;

  m_access_type = type;
  m_legal_values = std::move(legal_values);
  return true;
}
