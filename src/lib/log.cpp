//===-- log.cpp - library logger implementation ---------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::lib_log, @ref gamedepot::set_logger and
///    @ref gamedepot::version.
///
//===----------------------------------------------------------------------===//
#include "log.hpp"

#include "config.h"
#include "gamedepot/base.hpp"

#include <memory>
#include <mutex>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace gamedepot {

namespace {

//===-- Private variables -------------------------------------------------===//

/// Currently installed logger.
static std::shared_ptr<spdlog::logger> cur_logger;
/// Mutex locking concurrent access to @ref cur_logger.
static std::mutex logger_mtx;

//===-- Private functions -------------------------------------------------===//

/// Get the default logger, creating it on first use.
static std::shared_ptr<spdlog::logger> default_logger() {
  if (auto logger{spdlog::get(logger_name)}; logger) {
    return logger;
  }
  return spdlog::stderr_color_mt(logger_name);
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

std::shared_ptr<spdlog::logger> lib_log() {
  const std::scoped_lock lock{logger_mtx};
  if (!cur_logger) {
    cur_logger = default_logger();
  }
  return cur_logger;
}

//===-- Public functions --------------------------------------------------===//

void set_logger(std::shared_ptr<spdlog::logger> logger) {
  const std::scoped_lock lock{logger_mtx};
  cur_logger = std::move(logger);
}

const char *version() noexcept { return GAMEDEPOT_VERSION; }

} // namespace gamedepot
