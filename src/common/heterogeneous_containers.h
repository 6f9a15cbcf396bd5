// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

/**
 * Provides a map template which doesn't require heap allocations for lookups.
 */

#pragma once

#include "types.h"
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace detail {
struct transparent_string_less
{
  using is_transparent = void;

  bool operator()(const std::string& lhs, const std::string_view& rhs) const { return lhs < rhs; }
  bool operator()(const std::string& lhs, const std::string& rhs) const { return lhs < rhs; }
  bool operator()(const std::string& lhs, const char* rhs) const { return lhs < rhs; }
  bool operator()(const std::string_view& lhs, const std::string& rhs) const { return lhs < rhs; }
  bool operator()(const char* lhs, const std::string& rhs) const { return lhs < rhs; }
};
} // namespace detail

template<typename ValueType>
using StringMap = std::map<std::string, ValueType, detail::transparent_string_less>;
using StringSet = std::set<std::string, detail::transparent_string_less>;
