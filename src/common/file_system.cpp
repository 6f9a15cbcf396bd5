// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#include "file_system.h"
#include "error.h"
#include "log.h"
#include "path.h"
#include "string_util.h"

#include "fmt/format.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <utility>

#include <dirent.h>
#include <errno.h>
#include <limits.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

LOG_CHANNEL(FileSystem);

template<typename T>
static inline void PathAppendString(std::string& dst, const T& src)
{
  if (dst.capacity() < (dst.length() + src.length()))
    dst.reserve(dst.length() + src.length());

  bool last_separator = (!dst.empty() && dst.back() == FS_OSPATH_SEPARATOR_CHARACTER);

  for (size_t index = 0; index < src.length(); index++)
  {
    const char ch = src[index];
    if (ch == '/')
    {
      if (last_separator)
        continue;
      last_separator = true;
      dst.push_back(FS_OSPATH_SEPARATOR_CHARACTER);
    }
    else
    {
      last_separator = false;
      dst.push_back(ch);
    }
  }
}

bool Path::IsAbsolute(std::string_view path)
{
  return (path.length() >= 1 && path[0] == '/');
}

std::string_view Path::GetExtension(std::string_view path)
{
  const std::string_view filename = GetFileName(path);
  const std::string_view::size_type pos = filename.rfind('.');
  if (pos == std::string_view::npos)
    return std::string_view();
  else
    return filename.substr(pos + 1);
}

static std::string_view::size_type GetLastSeperatorPosition(std::string_view path, bool include_separator)
{
  std::string_view::size_type last_separator = path.rfind('/');
  if (include_separator && last_separator != std::string_view::npos)
    last_separator++;

  return last_separator;
}

std::string_view Path::GetDirectory(std::string_view path)
{
  const std::string::size_type pos = GetLastSeperatorPosition(path, false);
  if (pos == std::string_view::npos)
    return {};

  return path.substr(0, pos);
}

std::string_view Path::GetFileName(std::string_view path)
{
  const std::string_view::size_type pos = GetLastSeperatorPosition(path, true);
  if (pos == std::string_view::npos)
    return path;

  return path.substr(pos);
}

std::string_view Path::GetFileTitle(std::string_view path)
{
  const std::string_view filename(GetFileName(path));
  const std::string::size_type pos = filename.rfind('.');
  if (pos == std::string_view::npos)
    return filename;

  return filename.substr(0, pos);
}

std::string Path::Combine(std::string_view base, std::string_view next)
{
  std::string ret;
  ret.reserve(base.length() + next.length() + 1);

  PathAppendString(ret, base);
  while (!ret.empty() && ret.back() == FS_OSPATH_SEPARATOR_CHARACTER)
    ret.pop_back();

  ret += FS_OSPATH_SEPARATOR_CHARACTER;
  PathAppendString(ret, next);
  while (!ret.empty() && ret.back() == FS_OSPATH_SEPARATOR_CHARACTER)
    ret.pop_back();

  return ret;
}

std::FILE* FileSystem::OpenCFile(const char* path, const char* mode, Error* error)
{
  std::FILE* fp = std::fopen(path, mode);
  if (!fp)
    Error::SetErrno(error, "fopen() failed: ", errno);
  return fp;
}

FileSystem::ManagedCFilePtr FileSystem::OpenManagedCFile(const char* path, const char* mode, Error* error)
{
  return ManagedCFilePtr(OpenCFile(path, mode, error));
}

int FileSystem::FSeek64(std::FILE* fp, s64 offset, int whence)
{
  // Prevent truncation on platforms which don't have a 64-bit off_t.
  if constexpr (sizeof(off_t) != sizeof(s64))
  {
    if (offset < std::numeric_limits<off_t>::min() || offset > std::numeric_limits<off_t>::max())
      return -1;
  }

  return fseeko(fp, static_cast<off_t>(offset), whence);
}

s64 FileSystem::FTell64(std::FILE* fp)
{
  return static_cast<s64>(ftello(fp));
}

std::optional<std::string> FileSystem::ReadFileToString(const char* path, Error* error)
{
  std::optional<std::string> ret;

  ManagedCFilePtr fp = OpenManagedCFile(path, "rb", error);
  if (!fp)
    return ret;

  ret = ReadFileToString(fp.get(), error);
  return ret;
}

std::optional<std::string> FileSystem::ReadFileToString(std::FILE* fp, Error* error)
{
  std::optional<std::string> ret;

  if (FSeek64(fp, 0, SEEK_END) != 0) [[unlikely]]
  {
    Error::SetErrno(error, "FSeek64() to end failed: ", errno);
    return ret;
  }

  const s64 size = FTell64(fp);
  if (size < 0) [[unlikely]]
  {
    Error::SetErrno(error, "FTell64() for length failed: ", errno);
    return ret;
  }

  if constexpr (sizeof(s64) != sizeof(size_t))
  {
    if (size > static_cast<s64>(std::numeric_limits<long>::max())) [[unlikely]]
    {
      Error::SetStringFmt(error, "File size of {} is too large to read on this platform.", size);
      return ret;
    }
  }

  if (FSeek64(fp, 0, SEEK_SET) != 0) [[unlikely]]
  {
    Error::SetErrno(error, "FSeek64() to start failed: ", errno);
    return ret;
  }

  ret = std::string();
  ret->resize(static_cast<size_t>(size));
  if (size > 0 && std::fread(ret->data(), 1u, static_cast<size_t>(size), fp) != static_cast<size_t>(size))
  {
    Error::SetErrno(error, "fread() failed: ", errno);
    ret.reset();
  }

  return ret;
}

bool FileSystem::WriteStringToFile(const char* path, std::string_view sv, Error* error)
{
  ManagedCFilePtr fp = OpenManagedCFile(path, "wb", error);
  if (!fp)
    return false;

  if (sv.length() > 0 && std::fwrite(sv.data(), 1u, sv.length(), fp.get()) != sv.length())
  {
    Error::SetErrno(error, "fwrite() failed: ", errno);
    return false;
  }

  return true;
}

bool FileSystem::RecursiveDeleteDirectory(const char* path)
{
  FindResultsArray results;
  if (FindFiles(path, "*", FILESYSTEM_FIND_FILES | FILESYSTEM_FIND_FOLDERS | FILESYSTEM_FIND_HIDDEN_FILES, &results))
  {
    for (const FILESYSTEM_FIND_DATA& fd : results)
    {
      if (fd.Attributes & FILESYSTEM_FILE_ATTRIBUTE_DIRECTORY)
      {
        if (!RecursiveDeleteDirectory(fd.FileName.c_str()))
          return false;
      }
      else
      {
        Error error;
        if (!DeleteFile(fd.FileName.c_str(), &error))
        {
          ERROR_LOG("Failed to delete {}: {}", fd.FileName, error.GetDescription());
          return false;
        }
      }
    }
  }

  return DeleteDirectory(path);
}

static u32 TranslateStatAttributes(struct stat& st)
{
  return (S_ISDIR(st.st_mode) ? FILESYSTEM_FILE_ATTRIBUTE_DIRECTORY : 0) |
         (S_ISLNK(st.st_mode) ? FILESYSTEM_FILE_ATTRIBUTE_LINK : 0);
}

bool FileSystem::FindFiles(const char* path, const char* pattern, u32 flags, FindResultsArray* results, Error* error)
{
  // clear result array
  if (!(flags & FILESYSTEM_FIND_KEEP_ARRAY))
    results->clear();

  DIR* pDir = opendir(path);
  if (!pDir)
  {
    Error::SetErrno(error, "opendir() failed: ", errno);
    return false;
  }

  // small speed optimization for '*' case
  bool hasWildCards = false;
  bool wildCardMatchAll = false;
  u32 nFiles = 0;
  if (std::strpbrk(pattern, "*?"))
  {
    hasWildCards = true;
    wildCardMatchAll = (std::strcmp(pattern, "*") == 0);
  }

  // iterate results
  struct dirent* pDirEnt;
  while ((pDirEnt = readdir(pDir)) != nullptr)
  {
    if (pDirEnt->d_name[0] == '.')
    {
      if (pDirEnt->d_name[1] == '\0' || (pDirEnt->d_name[1] == '.' && pDirEnt->d_name[2] == '\0'))
        continue;

      if (!(flags & FILESYSTEM_FIND_HIDDEN_FILES))
        continue;
    }

    std::string full_path = Path::Combine(path, pDirEnt->d_name);

    struct stat sDir;
    if (stat(full_path.c_str(), &sDir) < 0)
      continue;

    FILESYSTEM_FIND_DATA outData;
    outData.Attributes = TranslateStatAttributes(sDir);

    if (S_ISDIR(sDir.st_mode))
    {
      if (!(flags & FILESYSTEM_FIND_FOLDERS))
        continue;
    }
    else
    {
      if (!(flags & FILESYSTEM_FIND_FILES))
        continue;
    }

    outData.Size = static_cast<s64>(sDir.st_size);
    outData.CreationTime = sDir.st_ctime;
    outData.ModificationTime = sDir.st_mtime;

    // match the filename
    if (hasWildCards)
    {
      if (!wildCardMatchAll && !StringUtil::WildcardMatch(pDirEnt->d_name, pattern))
        continue;
    }
    else
    {
      if (std::strcmp(pDirEnt->d_name, pattern) != 0)
        continue;
    }

    // add file to list
    if (!(flags & FILESYSTEM_FIND_RELATIVE_PATHS))
      outData.FileName = std::move(full_path);
    else
      outData.FileName = pDirEnt->d_name;

    nFiles++;
    results->push_back(std::move(outData));
  }

  closedir(pDir);

  if (nFiles == 0)
    return false;

  if (flags & FILESYSTEM_FIND_SORT_BY_NAME)
  {
    std::sort(results->begin(), results->end(), [](const FILESYSTEM_FIND_DATA& lhs, const FILESYSTEM_FIND_DATA& rhs) {
      // directories first
      if ((lhs.Attributes & FILESYSTEM_FILE_ATTRIBUTE_DIRECTORY) !=
          (rhs.Attributes & FILESYSTEM_FILE_ATTRIBUTE_DIRECTORY))
      {
        return ((lhs.Attributes & FILESYSTEM_FILE_ATTRIBUTE_DIRECTORY) != 0);
      }

      return (lhs.FileName < rhs.FileName);
    });
  }

  return true;
}

bool FileSystem::FileExists(const char* path)
{
  struct stat sysStatData;
  if (stat(path, &sysStatData) < 0)
    return false;

  if (S_ISDIR(sysStatData.st_mode))
    return false;
  else
    return true;
}

bool FileSystem::DirectoryExists(const char* path)
{
  struct stat sysStatData;
  if (stat(path, &sysStatData) < 0)
    return false;

  return S_ISDIR(sysStatData.st_mode);
}

bool FileSystem::CreateDirectory(const char* path, bool recursive, Error* error)
{
  // has a path
  const size_t pathLength = std::strlen(path);
  if (pathLength == 0)
  {
    Error::SetStringView(error, "Path is empty.");
    return false;
  }

  // try just flat-out, might work if there's no other segments that have to be made
  if (mkdir(path, 0777) == 0)
    return true;

  // check error
  int lastError = errno;
  if (lastError == EEXIST)
  {
    // check the attributes
    struct stat sysStatData;
    if (stat(path, &sysStatData) == 0 && S_ISDIR(sysStatData.st_mode))
      return true;
  }

  if (!recursive)
  {
    Error::SetErrno(error, "mkdir() failed: ", lastError);
    return false;
  }
  else if (lastError == ENOENT)
  {
    // part of the path does not exist, so we'll create the parent folders, then
    // the full path again.
    std::string tempPath;
    tempPath.reserve(pathLength);

    // create directories along the path
    for (size_t i = 0; i < pathLength; i++)
    {
      if (i > 0 && path[i] == '/')
      {
        if (mkdir(tempPath.c_str(), 0777) < 0)
        {
          lastError = errno;
          if (lastError != EEXIST) // fine, continue to next path segment
          {
            Error::SetErrno(error, "mkdir() failed: ", lastError);
            return false;
          }
        }
      }

      tempPath.push_back(path[i]);
    }

    // re-create the end if it's not a separator
    if (path[pathLength - 1] != '/')
    {
      if (mkdir(path, 0777) < 0)
      {
        lastError = errno;
        if (lastError != EEXIST)
        {
          Error::SetErrno(error, "mkdir() failed: ", lastError);
          return false;
        }
      }
    }

    // ok
    return true;
  }
  else
  {
    // unhandled error
    Error::SetErrno(error, "mkdir() failed: ", lastError);
    return false;
  }
}

bool FileSystem::DeleteFile(const char* path, Error* error)
{
  struct stat sysStatData;
  if (stat(path, &sysStatData) != 0 || S_ISDIR(sysStatData.st_mode))
  {
    Error::SetStringView(error, "File does not exist.");
    return false;
  }

  if (unlink(path) != 0)
  {
    Error::SetErrno(error, "unlink() failed: ", errno);
    return false;
  }

  return true;
}

bool FileSystem::DeleteDirectory(const char* path)
{
  struct stat sysStatData;
  if (stat(path, &sysStatData) != 0 || !S_ISDIR(sysStatData.st_mode))
    return false;

  return (rmdir(path) == 0);
}
