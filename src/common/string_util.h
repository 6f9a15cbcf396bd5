// SPDX-FileCopyrightText: 2019-2025 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "types.h"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <strings.h>
#include <vector>

namespace StringUtil {

/// Checks if a wildcard matches a search string.
bool WildcardMatch(const char* subject, const char* mask, bool case_sensitive = true);

/// Platform-independent strcasecmp
static inline int Strcasecmp(const char* s1, const char* s2)
{
  return strcasecmp(s1, s2);
}

/// Platform-independent strcasecmp
static inline int Strncasecmp(const char* s1, const char* s2, std::size_t n)
{
  return strncasecmp(s1, s2, n);
}

// Case-insensitive equality of string views.
static inline bool EqualNoCase(std::string_view s1, std::string_view s2)
{
  const size_t s1_len = s1.length();
  const size_t s2_len = s2.length();
  if (s1_len != s2_len)
    return false;
  else if (s1_len == 0)
    return true;

  return (Strncasecmp(s1.data(), s2.data(), s1_len) == 0);
}

/// Wrapper around std::from_chars
template<typename T, std::enable_if_t<std::is_integral<T>::value, bool> = true>
inline std::optional<T> FromChars(const std::string_view str, int base = 10)
{
  T value;

  const std::from_chars_result result = std::from_chars(str.data(), str.data() + str.length(), value, base);
  if (result.ec != std::errc())
    return std::nullopt;

  return value;
}
template<typename T, std::enable_if_t<std::is_integral<T>::value, bool> = true>
inline std::optional<T> FromChars(const std::string_view str, int base, std::string_view* endptr)
{
  T value;

  const char* ptr = str.data();
  const char* end = ptr + str.length();
  const std::from_chars_result result = std::from_chars(ptr, end, value, base);
  if (result.ec != std::errc())
    return std::nullopt;

  if (endptr)
  {
    const size_t remaining_len = end - result.ptr;
    *endptr = (remaining_len > 0) ? std::string_view(result.ptr, remaining_len) : std::string_view();
  }

  return value;
}

/// Wrapper around std::to_chars
template<typename T, std::enable_if_t<std::is_integral<T>::value, bool> = true>
inline std::string ToChars(T value, int base = 10)
{
  constexpr size_t MAX_SIZE = 72;
  char buf[MAX_SIZE];
  std::string ret;

  const std::to_chars_result result = std::to_chars(buf, buf + MAX_SIZE, value, base);
  if (result.ec == std::errc())
    ret.append(buf, result.ptr - buf);

  return ret;
}

/// Explicit override for booleans
template<>
inline std::optional<bool> FromChars(const std::string_view str, int base)
{
  if (EqualNoCase(str, "true") || EqualNoCase(str, "yes") || EqualNoCase(str, "on") || str == "1" ||
      EqualNoCase(str, "enabled"))
  {
    return true;
  }

  if (EqualNoCase(str, "false") || EqualNoCase(str, "no") || EqualNoCase(str, "off") || str == "0" ||
      EqualNoCase(str, "disabled"))
  {
    return false;
  }

  return std::nullopt;
}

template<>
inline std::string ToChars(bool value, int base)
{
  return std::string(value ? "true" : "false");
}

/// Returns true if the given character is whitespace.
static inline bool IsWhitespace(char ch)
{
  return ((ch >= 0x09 && ch <= 0x0D) || // horizontal tab, line feed, vertical tab, form feed, carriage return
          ch == 0x20);                  // space
}

/// Returns true if the given character is a decimal digit.
static inline bool IsDecimalDigit(char ch)
{
  return (ch >= '0' && ch <= '9');
}

/// Strip whitespace from the start/end of the string.
std::string_view StripWhitespace(const std::string_view str);
void StripWhitespace(std::string* str);

/// Replaces all instances of search in subject with replacement.
[[nodiscard]] std::string ReplaceAll(const std::string_view subject, const std::string_view search,
                                     const std::string_view replacement);
void ReplaceAll(std::string* subject, const std::string_view search, const std::string_view replacement);
[[nodiscard]] std::string ReplaceAll(const std::string_view subject, const char search, const char replacement);
void ReplaceAll(std::string* subject, const char search, const char replacement);

} // namespace StringUtil
