// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "field.h"

#include "common/heterogeneous_containers.h"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace CSRLens {

class Register
{
public:
  explicit Register(std::string name);
  ~Register();

  ALWAYS_INLINE const std::string& GetName() const { return m_name; }
  ALWAYS_INLINE const std::string& GetLongName() const { return m_long_name; }
  ALWAYS_INLINE u32 GetLength() const { return m_length; }
  ALWAYS_INLINE const std::string& GetDescription() const { return m_description; }
  ALWAYS_INLINE bool IsWritable() const { return m_writable; }
  ALWAYS_INLINE const std::string& GetPrivMode() const { return m_priv_mode; }

  /// Compact JSON text of the definedBy payload, or empty if the document did not carry one.
  ALWAYS_INLINE const std::string& GetDefinedBy() const { return m_defined_by; }

  void SetLongName(std::string long_name) { m_long_name = std::move(long_name); }
  void SetLength(u32 length) { m_length = length; }
  void SetDescription(std::string description) { m_description = std::move(description); }
  void SetWritable(bool writable) { m_writable = writable; }
  void SetPrivMode(std::string priv_mode) { m_priv_mode = std::move(priv_mode); }
  void SetDefinedBy(std::string defined_by) { m_defined_by = std::move(defined_by); }

  /// Fields in insertion order. Fields can be modified in place, but never removed.
  ALWAYS_INLINE std::span<const Field> GetFields() const { return m_fields; }
  ALWAYS_INLINE std::span<Field> GetFields() { return m_fields; }
  ALWAYS_INLINE size_t GetFieldCount() const { return m_fields.size(); }
  ALWAYS_INLINE bool HasFields() const { return !m_fields.empty(); }

  void AddField(Field field);

  /// Returns the first field whose name matches, ignoring case.
  Field* FindFieldNoCase(std::string_view name);
  const Field* FindFieldNoCase(std::string_view name) const;

private:
  std::string m_name;
  std::string m_long_name;
  std::string m_description;
  std::string m_priv_mode;
  std::string m_defined_by;
  u32 m_length = DEFAULT_REGISTER_LENGTH;
  bool m_writable = false;

  std::vector<Field> m_fields;
};

/// Registers keyed by name. Inserting a register with an existing name replaces the previous entry.
class RegisterTable
{
public:
  using MapType = StringMap<Register>;

  RegisterTable();
  ~RegisterTable();

  ALWAYS_INLINE size_t GetSize() const { return m_registers.size(); }
  ALWAYS_INLINE bool IsEmpty() const { return m_registers.empty(); }

  ALWAYS_INLINE MapType::const_iterator begin() const { return m_registers.begin(); }
  ALWAYS_INLINE MapType::const_iterator end() const { return m_registers.end(); }

  /// Returns true if an existing register was replaced.
  bool Insert(Register reg);

  /// Exact lookup first, then a case-insensitive scan.
  const Register* Lookup(std::string_view name) const;

  Register* FindExact(std::string_view name);
  const Register* FindExact(std::string_view name) const;

  /// Returns up to max_count register names in ascending byte order.
  std::vector<std::string_view> GetNames(size_t max_count = static_cast<size_t>(-1)) const;

private:
  MapType m_registers;
};

} // namespace CSRLens
