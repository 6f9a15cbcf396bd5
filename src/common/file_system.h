// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "types.h"

#include <cstdio>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class Error;

#define FS_OSPATH_SEPARATOR_CHARACTER '/'
#define FS_OSPATH_SEPARATOR_STR "/"

enum FILESYSTEM_FILE_ATTRIBUTES
{
  FILESYSTEM_FILE_ATTRIBUTE_DIRECTORY = (1 << 0),
  FILESYSTEM_FILE_ATTRIBUTE_READ_ONLY = (1 << 1),
  FILESYSTEM_FILE_ATTRIBUTE_LINK = (1 << 3),
};

enum FILESYSTEM_FIND_FLAGS
{
  FILESYSTEM_FIND_RELATIVE_PATHS = (1 << 1),
  FILESYSTEM_FIND_HIDDEN_FILES = (1 << 2),
  FILESYSTEM_FIND_FOLDERS = (1 << 3),
  FILESYSTEM_FIND_FILES = (1 << 4),
  FILESYSTEM_FIND_KEEP_ARRAY = (1 << 5),
  FILESYSTEM_FIND_SORT_BY_NAME = (1 << 6),
};

struct FILESYSTEM_FIND_DATA
{
  std::time_t CreationTime; // actually inode change time on linux
  std::time_t ModificationTime;
  std::string FileName;
  s64 Size;
  u32 Attributes;
};

namespace FileSystem {
using FindResultsArray = std::vector<FILESYSTEM_FIND_DATA>;

/// Search for files in a single directory. Returns false if nothing matched or the directory could not be opened.
bool FindFiles(const char* path, const char* pattern, u32 flags, FindResultsArray* results, Error* error = nullptr);

/// File exists?
bool FileExists(const char* path);

/// Directory exists?
bool DirectoryExists(const char* path);

/// Delete file
bool DeleteFile(const char* path, Error* error = nullptr);

/// Deleter functor for managed file pointers
struct FileDeleter
{
  ALWAYS_INLINE void operator()(std::FILE* fp)
  {
    if (fp)
      std::fclose(fp);
  }
};

/// open files
using ManagedCFilePtr = std::unique_ptr<std::FILE, FileDeleter>;
ManagedCFilePtr OpenManagedCFile(const char* path, const char* mode, Error* error = nullptr);
std::FILE* OpenCFile(const char* path, const char* mode, Error* error = nullptr);

int FSeek64(std::FILE* fp, s64 offset, int whence);
s64 FTell64(std::FILE* fp);

std::optional<std::string> ReadFileToString(const char* path, Error* error = nullptr);
std::optional<std::string> ReadFileToString(std::FILE* fp, Error* error = nullptr);
bool WriteStringToFile(const char* path, std::string_view sv, Error* error = nullptr);

/// creates a directory in the local filesystem
/// if the directory already exists, the return value will be true.
/// if Recursive is specified, all parent directories will be created
/// if they do not exist.
bool CreateDirectory(const char* path, bool recursive, Error* error = nullptr);

/// Removes a directory.
bool DeleteDirectory(const char* path);

/// Recursively removes a directory and all subdirectories/files.
bool RecursiveDeleteDirectory(const char* path);
}; // namespace FileSystem
