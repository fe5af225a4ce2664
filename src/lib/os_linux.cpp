//===-- os_linux.cpp - Linux implementation of OS functions ---------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Linux implementation of functions declared in os.hpp.
///
//===----------------------------------------------------------------------===//
#include "os.hpp"

#include "common/error.hpp"
#include "gamedepot/error.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace gamedepot {

namespace {

/// Create an OS @ref err for a file operation.
static err os_err(const std::string &path) {
  return {.type = err_type::os,
          .primary = errc::file_read,
          .auxiliary = errno,
          .extra = 0,
          .context = path};
}

} // namespace

bool os_get_cache_dir(std::string &path) {
  if (const auto xdg_cache_home{std::getenv("XDG_CACHE_HOME")};
      xdg_cache_home && *xdg_cache_home) {
    path = xdg_cache_home;
    return true;
  }
  const auto home{std::getenv("HOME")};
  if (!home || !*home) {
    return false;
  }
  path = home;
  path.append("/.cache");
  return true;
}

bool os_dir_create(const std::string &path) {
  return mkdir(path.data(), 0755) == 0 || errno == EEXIST;
}

err os_read_file(const std::string &path, std::string &content) {
  const int fd{open(path.data(), O_RDONLY | O_CLOEXEC)};
  if (fd < 0) {
    return os_err(path);
  }
  struct stat st;
  if (fstat(fd, &st) < 0) {
    const auto res{os_err(path)};
    close(fd);
    return res;
  }
  content.resize(st.st_size);
  for (std::size_t offset{}; offset < content.size();) {
    const auto bytes_read{
        read(fd, content.data() + offset, content.size() - offset)};
    if (bytes_read < 0) {
      if (errno == EINTR) {
        continue;
      }
      const auto res{os_err(path)};
      close(fd);
      return res;
    }
    if (bytes_read == 0) {
      // File was truncated while reading
      content.resize(offset);
      break;
    }
    offset += bytes_read;
  }
  close(fd);
  return err_ok();
}

bool os_is_not_found(const err &e) noexcept {
  return e.type == err_type::os && e.auxiliary == ENOENT;
}

} // namespace gamedepot
