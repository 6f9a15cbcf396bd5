// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#include "types.h"

#include <string>
#include <string_view>

namespace Path {
/// Joins path components together, producing a new path.
std::string Combine(std::string_view base, std::string_view next);

/// Returns true if the specified path is an absolute path (/path on Unix).
bool IsAbsolute(std::string_view path);

/// Returns a view of the extension of a filename.
std::string_view GetExtension(std::string_view path);

/// Returns the directory component of a filename.
std::string_view GetDirectory(std::string_view path);

/// Returns the filename component of a filename.
std::string_view GetFileName(std::string_view path);

/// Returns the file title (less the extension and path) from a filename.
std::string_view GetFileTitle(std::string_view path);
} // namespace Path
