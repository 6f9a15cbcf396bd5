// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "common/types.h"

#include <optional>
#include <string_view>

namespace CSRLens {

// Register values are 64-bit unsigned integers, so every bit index lives in [0, 63].
static constexpr u32 MAX_REGISTER_BITS = 64;
static constexpr u32 DEFAULT_REGISTER_LENGTH = 64;

enum class AccessType : u8
{
  Unset,
  WARL,
  WLRL,
  WPRI,
  WIRI,
  ROConstant,
  ROVariable,

  MaxCount
};

const char* GetAccessTypeName(AccessType type);
std::optional<AccessType> ParseAccessTypeName(std::string_view name);

/// Canonical bit range, high >= low. Indices are signed so that out-of-domain values survive normalization
/// and can be reported by the caller.
struct BitRange
{
  s64 high;
  s64 low;

  ALWAYS_INLINE bool operator==(const BitRange& rhs) const { return (high == rhs.high && low == rhs.low); }
  ALWAYS_INLINE bool operator!=(const BitRange& rhs) const { return (high != rhs.high || low != rhs.low); }

  ALWAYS_INLINE bool IsWithinRegister() const
  {
    return (low >= 0 && high < static_cast<s64>(MAX_REGISTER_BITS) && high >= low);
  }
};

} // namespace CSRLens
