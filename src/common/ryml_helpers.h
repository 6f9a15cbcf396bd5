// SPDX-FileCopyrightText: 2019-2025 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "types.h"

#include "fmt/format.h"
#include "ryml.hpp"

#include <exception>
#include <string>
#include <string_view>

// RapidYAML utility routines.

static inline std::string_view to_stringview(const c4::csubstr& s)
{
  return std::string_view(s.data(), s.size());
}

static inline std::string_view to_stringview(const c4::substr& s)
{
  return std::string_view(s.data(), s.size());
}

static inline c4::csubstr to_csubstr(std::string_view sv)
{
  return c4::csubstr(sv.data(), sv.length());
}

/// Raised from the rapidyaml error callback. The callback is not allowed to return to the parser, so the error
/// is unwound to the caller of ParseYaml() instead, which converts it back to an Error.
class RymlParseException final : public std::exception
{
public:
  RymlParseException(std::string message) : m_message(std::move(message)) {}

  const char* what() const noexcept override { return m_message.c_str(); }

  const std::string& GetMessage() const { return m_message; }

private:
  std::string m_message;
};

/// Routes rapidyaml and c4core errors to RymlParseException. Callbacks are process-global, restore them with
/// ryml::reset_callbacks() once parsing is complete.
static inline void SetRymlCallbacks()
{
  ryml::Callbacks callbacks = ryml::get_callbacks();
  callbacks.m_error = [](const char* msg, size_t msg_len, ryml::Location loc, void* userdata) {
    throw RymlParseException(fmt::format("YAML parse error at {}:{} (bufpos={}): {}", loc.line, loc.col, loc.offset,
                                         std::string_view(msg, msg_len)));
  };
  ryml::set_callbacks(callbacks);
  c4::set_error_callback([](const char* msg, size_t msg_size) {
    throw RymlParseException(fmt::format("C4 error: {}", std::string_view(msg, msg_size)));
  });
}
