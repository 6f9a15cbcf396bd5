// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "register.h"

#include "common/string_util.h"

#include <algorithm>

CSRLens::Register::Register(std::string name) : m_name(std::move(name))
{
}

CSRLens::Register::~Register() = default;

void CSRLens::Register::AddField(Field field)
{
  m_fields.push_back(std::move(field));
}

CSRLens::Field* CSRLens::Register::FindFieldNoCase(std::string_view name)
{
  for (Field& field : m_fields)
  {
    if (StringUtil::EqualNoCase(field.GetName(), name))
      return &field;
  }

  return nullptr;
}

const CSRLens::Field* CSRLens::Register::FindFieldNoCase(std::string_view name) const
{
  for (const Field& field : m_fields)
  {
    if (StringUtil::EqualNoCase(field.GetName(), name))
      return &field;
  }

  return nullptr;
}

CSRLens::RegisterTable::RegisterTable() = default;

CSRLens::RegisterTable::~RegisterTable() = default;

bool CSRLens::RegisterTable::Insert(Register reg)
{
  std::string name = reg.GetName();
  const auto [iter, inserted] = m_registers.insert_or_assign(std::move(name), std::move(reg));
  return !inserted;
}

const CSRLens::Register* CSRLens::RegisterTable::Lookup(std::string_view name) const
{
  if (const Register* reg = FindExact(name))
    return reg;

  for (const auto& [key, reg] : m_registers)
  {
    if (StringUtil::EqualNoCase(key, name))
      return &reg;
  }

  return nullptr;
}

CSRLens::Register* CSRLens::RegisterTable::FindExact(std::string_view name)
{
  const auto iter = m_registers.find(name);
  return (iter != m_registers.end()) ? &iter->second : nullptr;
}

const CSRLens::Register* CSRLens::RegisterTable::FindExact(std::string_view name) const
{
  const auto iter = m_registers.find(name);
  return (iter != m_registers.end()) ? &iter->second : nullptr;
}

std::vector<std::string_view> CSRLens::RegisterTable::GetNames(size_t max_count) const
{
  std::vector<std::string_view> ret;
  ret.reserve(std::min(max_count, m_registers.size()));
  for (const auto& [key, reg] : m_registers)
  {
    if (ret.size() >= max_count)
      break;

    ret.push_back(key);
  }

  return ret;
}
