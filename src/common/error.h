// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "types.h"

#include "fmt/format.h"

#include <string>
#include <string_view>

class Error
{
public:
  Error();
  Error(const Error& e);
  Error(Error&& e);
  ~Error();

  enum class Type : u8
  {
    None = 0,  // Set by default constructor, returns 'No Error'.
    Errno = 1, // Error that is set by system functions, such as open().
    User = 2,  // Error that is set by user code, carrying a free-form description.
  };

  ALWAYS_INLINE Type GetType() const { return m_type; }
  ALWAYS_INLINE bool IsValid() const { return (m_type != Type::None); }
  ALWAYS_INLINE const std::string& GetDescription() const { return m_description; }

  void Clear();

  /// Error that is set by system functions, such as open().
  void SetErrno(int err);
  void SetErrno(std::string_view prefix, int err);

  /// Error that is set by user code, with a free-form description.
  void SetString(std::string description);
  void SetStringView(std::string_view description);

  /// Formatted description.
  template<typename... T>
  void SetStringFmt(fmt::format_string<T...> fmt, T&&... args)
  {
    SetStringFmtArgs(fmt, fmt::make_format_args(args...));
  }

  // constructors
  static Error CreateNone();
  static Error CreateErrno(int err);
  static Error CreateString(std::string description);

  /// Helpers which accept a null error pointer.
  static void Clear(Error* errptr);
  static void SetErrno(Error* errptr, int err);
  static void SetErrno(Error* errptr, std::string_view prefix, int err);
  static void SetString(Error* errptr, std::string description);
  static void SetStringView(Error* errptr, std::string_view description);
  static void Copy(Error* errptr, const Error& error);

  template<typename... T>
  static void SetStringFmt(Error* errptr, fmt::format_string<T...> fmt, T&&... args)
  {
    if (errptr)
      errptr->SetStringFmtArgs(fmt, fmt::make_format_args(args...));
  }

  void AddPrefix(std::string_view prefix);
  void AddSuffix(std::string_view suffix);
  static void AddPrefix(Error* errptr, std::string_view prefix);
  static void AddSuffix(Error* errptr, std::string_view suffix);

  template<typename... T>
  void AddPrefixFmt(fmt::format_string<T...> fmt, T&&... args)
  {
    AddPrefix(fmt::vformat(fmt, fmt::make_format_args(args...)));
  }

  template<typename... T>
  static void AddPrefixFmt(Error* errptr, fmt::format_string<T...> fmt, T&&... args)
  {
    if (errptr)
      errptr->AddPrefix(fmt::vformat(fmt, fmt::make_format_args(args...)));
  }

  Error& operator=(const Error& e);
  Error& operator=(Error&& e);
  bool operator==(const Error& e) const;
  bool operator!=(const Error& e) const;

private:
  void SetStringFmtArgs(fmt::string_view fmt, fmt::format_args args);

  std::string m_description;
  Type m_type = Type::None;
};
