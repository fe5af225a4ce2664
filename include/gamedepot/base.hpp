//===-- base.hpp - basic gamedepot declarations ---------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of gamedepot's basic macros and functions.
///
//===----------------------------------------------------------------------===//
#pragma once

#include <memory>

namespace spdlog {
class logger;
} // namespace spdlog

//===-- Compiler macros ---------------------------------------------------===//

// Public API attribute.
#if defined(_WIN32) && !defined(GAMEDEPOT_STATIC)

// Use DLL exports/imports.
#ifdef GAMEDEPOT_EXPORT
#define GAMEDEPOT_API dllexport
#else // def GAMEDEPOT_EXPORT
#define GAMEDEPOT_API dllimport
#endif // def GAMEDEPOT_EXPORT else

#else // defined(_WIN32) && !defined(GAMEDEPOT_STATIC)
#define GAMEDEPOT_API visibility("default")
#endif // defined(_WIN32) && !defined(GAMEDEPOT_STATIC) else

namespace gamedepot {

//===-- Functions ---------------------------------------------------------===//

/// Get the version of gamedepot library.
///
/// @return Pointer to the statically allocated null-terminated version string.
[[gnu::GAMEDEPOT_API, gnu::returns_nonnull]] const char *version() noexcept;

/// Replace the logger that the library writes its diagnostics to.
///
/// By default the library creates a logger named "gamedepot" that writes to
///    standard error. Link acquisition failures are only observable through
///    this logger, so applications that collect logs should install theirs
///    before starting any operation.
///
/// @param logger
///    The logger to use from now on. Passing `nullptr` restores the default
///    logger.
[[gnu::GAMEDEPOT_API]] void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace gamedepot
