//===-- log.hpp - library logger access -----------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declaration of the function that provides the library's logger.
///
//===----------------------------------------------------------------------===//
#pragma once

#include <memory>
#include <spdlog/logger.h>

namespace gamedepot {

/// Name of the default logger.
inline constexpr char logger_name[]{"gamedepot"};

/// Get the logger that the library writes its diagnostics to.
///
/// @return Reference to the current logger, either the one installed via
///    @ref set_logger or the default one.
[[gnu::visibility("internal")]] std::shared_ptr<spdlog::logger> lib_log();

} // namespace gamedepot
