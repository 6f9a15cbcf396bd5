// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "assert.h"

#include <cstdio>
#include <cstdlib>
#include <mutex>

static std::mutex s_AssertFailedMutex;

void Y_OnAssertFailed(const char* szMessage, const char* szFunction, const char* szFile, unsigned uLine)
{
  char szMsg[512];
  std::snprintf(szMsg, sizeof(szMsg), "%s in function %s (%s:%u)\n", szMessage, szFunction, szFile, uLine);

  std::unique_lock lock(s_AssertFailedMutex);
  std::fputs(szMsg, stderr);
  std::fflush(stderr);
  std::abort();
}

[[noreturn]] void Y_OnPanicReached(const char* szMessage, const char* szFunction, const char* szFile, unsigned uLine)
{
  char szMsg[512];
  std::snprintf(szMsg, sizeof(szMsg), "%s in function %s (%s:%u)\n", szMessage, szFunction, szFile, uLine);

  std::unique_lock guard(s_AssertFailedMutex);
  std::fputs(szMsg, stderr);
  std::fflush(stderr);
  std::abort();
}
