//===-- os.hpp - OS-specific code -----------------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of functions that are implemented differently on different
///    operating systems. Implementations are provided by corresponding
///    os_*.cpp.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "gamedepot/error.hpp"

#include <string>

namespace gamedepot {

/// @def GDI_OS_PATH_SEP_CHAR_STR
/// Path separator character for current operating system as a string literal.
#define GDI_OS_PATH_SEP_CHAR_STR "/"

/// Get path to the cache directory for current user.
///
/// @param [out] path
///    String that receives the path on success.
/// @return Value indicating whether the path could be determined.
[[gnu::visibility("internal")]] bool os_get_cache_dir(std::string &path);

/// Open a directory, or create it if it doesn't exist. Parent directories
///    must exist.
///
/// @param [in] path
///    Path to the directory to create.
/// @return Value indicating whether the directory exists after the call.
[[gnu::visibility("internal")]] bool os_dir_create(const std::string &path);

/// Read the whole content of a file.
///
/// @param [in] path
///    Path to the file to read.
/// @param [out] content
///    String that receives the file content.
/// @return An @ref err of type @ref err_type::os with primary code
///    @ref errc::file_read on failure, or a success value.
[[gnu::visibility("internal")]] err os_read_file(const std::string &path,
                                                 std::string &content);

/// Check whether an error returned by @ref os_read_file means that the file
///    doesn't exist.
[[gnu::visibility("internal")]] bool os_is_not_found(const err &e) noexcept;

} // namespace gamedepot
