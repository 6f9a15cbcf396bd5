// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "types.h"

#include <optional>
#include <string>
#include <string_view>

namespace CSRLens {

/// A named, contiguous bit range within a register.
class Field
{
public:
  Field(std::string name, u32 msb, u32 lsb);
  ~Field();

  ALWAYS_INLINE const std::string& GetName() const { return m_name; }
  ALWAYS_INLINE u32 GetMSB() const { return m_msb; }
  ALWAYS_INLINE u32 GetLSB() const { return m_lsb; }
  ALWAYS_INLINE u32 GetWidth() const { return m_msb - m_lsb + 1; }

  /// Returns GetWidth() contiguous one-bits, shifted up to the field's low bit.
  u64 GetMask() const;

  ALWAYS_INLINE bool ContainsAny(u64 mask) const { return ((GetMask() & mask) != 0); }
  ALWAYS_INLINE u64 GetChangedBits(u64 xor_mask) const { return (GetMask() & xor_mask); }
  ALWAYS_INLINE u64 ExtractValue(u64 value) const { return ((value & GetMask()) >> m_lsb); }

  ALWAYS_INLINE const std::string& GetDescription() const { return m_description; }
  ALWAYS_INLINE const std::string& GetTypeTag() const { return m_type_tag; }
  ALWAYS_INLINE const std::optional<std::string>& GetResetValue() const { return m_reset_value; }
  ALWAYS_INLINE const std::string& GetAlias() const { return m_alias; }

  /// Leading/trailing whitespace is stripped, and newlines are folded to spaces.
  void SetDescription(std::string_view description);
  void SetTypeTag(std::string type_tag) { m_type_tag = std::move(type_tag); }
  void SetResetValue(std::optional<std::string> reset_value) { m_reset_value = std::move(reset_value); }
  void SetAlias(std::string alias) { m_alias = std::move(alias); }

  ALWAYS_INLINE AccessType GetAccessType() const { return m_access_type; }
  ALWAYS_INLINE bool HasAccessType() const { return (m_access_type != AccessType::Unset); }
  ALWAYS_INLINE const std::optional<std::string>& GetLegalValues() const { return m_legal_values; }

  /// Assigns the access type and legal value payload, unless an access type has already been set. The first
  /// writer always wins. Returns true if the field was updated.
  bool SetAccessTypeIfUnset(AccessType type, std::optional<std::string> legal_values);

private:
  std::string m_name;
  u32 m_msb;
  u32 m_lsb;

  std::string m_description;
  std::string m_type_tag;
  std::optional<std::string> m_reset_value;
  std::string m_alias;

  AccessType m_access_type = AccessType::Unset;
  std::optional<std::string> m_legal_values;
};

} // namespace CSRLens
