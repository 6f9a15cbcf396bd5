// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "error.h"

#include <cstring>
#include <utility>

Error::Error() = default;

Error::Error(const Error& c) = default;

Error::Error(Error&& e) = default;

Error::~Error() = default;

void Error::Clear()
{
  m_description = {};
  m_type = Type::None;
}

void Error::SetErrno(int err)
{
  SetErrno(std::string_view(), err);
}

void Error::SetErrno(std::string_view prefix, int err)
{
  m_type = Type::Errno;

  const char* message = std::strerror(err);
  if (message)
    m_description = fmt::format("{}errno {}: {}", prefix, err, message);
  else
    m_description = fmt::format("{}errno {}: <Could not get error message>", prefix, err);
}

void Error::SetString(std::string description)
{
  m_type = Type::User;
  m_description = std::move(description);
}

void Error::SetStringView(std::string_view description)
{
  m_type = Type::User;
  m_description = std::string(description);
}

void Error::SetStringFmtArgs(fmt::string_view fmt, fmt::format_args args)
{
  m_type = Type::User;
  m_description = fmt::vformat(fmt, args);
}

Error Error::CreateNone()
{
  return Error();
}

Error Error::CreateErrno(int err)
{
  Error ret;
  ret.SetErrno(err);
  return ret;
}

Error Error::CreateString(std::string description)
{
  Error ret;
  ret.SetString(std::move(description));
  return ret;
}

void Error::Clear(Error* errptr)
{
  if (errptr)
    errptr->Clear();
}

void Error::SetErrno(Error* errptr, int err)
{
  if (errptr)
    errptr->SetErrno(err);
}

void Error::SetErrno(Error* errptr, std::string_view prefix, int err)
{
  if (errptr)
    errptr->SetErrno(prefix, err);
}

void Error::SetString(Error* errptr, std::string description)
{
  if (errptr)
    errptr->SetString(std::move(description));
}

void Error::SetStringView(Error* errptr, std::string_view description)
{
  if (errptr)
    errptr->SetStringView(description);
}

void Error::Copy(Error* errptr, const Error& error)
{
  if (errptr)
    *errptr = error;
}

void Error::AddPrefix(std::string_view prefix)
{
  m_description.insert(0, prefix);
}

void Error::AddSuffix(std::string_view suffix)
{
  m_description.append(suffix);
}

void Error::AddPrefix(Error* errptr, std::string_view prefix)
{
  if (errptr)
    errptr->AddPrefix(prefix);
}

void Error::AddSuffix(Error* errptr, std::string_view suffix)
{
  if (errptr)
    errptr->AddSuffix(suffix);
}

Error& Error::operator=(const Error& e) = default;

Error& Error::operator=(Error&& e) = default;

bool Error::operator==(const Error& e) const
{
  return (m_type == e.m_type && m_description == e.m_description);
}

bool Error::operator!=(const Error& e) const
{
  return (m_type != e.m_type || m_description != e.m_description);
}
