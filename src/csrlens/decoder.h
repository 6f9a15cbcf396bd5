// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "common/types.h"

#include <string>
#include <vector>

namespace CSRLens {

class Field;
class Register;

struct FieldValue
{
  std::string name;
  u32 msb;
  u32 lsb;
  u32 width;
  u64 value;
  std::string hex;
  std::string bin;
  std::string description;
};

struct FieldChange
{
  std::string name;
  u32 msb;
  u32 lsb;
  u32 width;
  u64 changed_mask;
  u64 changed_rel;
  u32 changed_bits;
  std::string description;
};

struct FieldDifference
{
  FieldValue a;
  FieldValue b;
};

// All decode operations are pure, so they can be called concurrently on a register that is no longer modified.
// Results are ordered by descending msb, fields with equal msb keep their schema order.
namespace Decoder {

std::vector<const Field*> GetFieldsInDecodeOrder(const Register& reg);

std::vector<FieldValue> DecodeValue(const Register& reg, u64 value);

/// Returns the fields which have at least one bit set in xor_value.
std::vector<FieldChange> DecodeXorMask(const Register& reg, u64 xor_value);

/// Returns the fields whose extracted value differs between a and b.
std::vector<FieldDifference> Compare(const Register& reg, u64 a, u64 b);

} // namespace Decoder

} // namespace CSRLens
