//===-- error.hpp - error creation helpers --------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Helper functions for creating @ref gamedepot::err objects.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "gamedepot/error.hpp"

#include <string>
#include <utility>

namespace gamedepot {

/// Create a basic @ref err for specified error code.
///
/// @param code
///    Error code to create error object for.
/// @return An @ref err for specified error code.
inline err err_basic(errc code) {
  return {.type = err_type::basic,
          .primary = code,
          .auxiliary = 0,
          .extra = 0,
          .context = {}};
}

/// Create an @ref err object indicating success.
/// @return An @ref err indicating success.
inline err err_ok() { return err_basic(errc::ok); }

/// Create a compound @ref err.
///
/// @param prim
///    Primary error code.
/// @param aux
///    Auxiliary error code.
/// @return An @ref err for specified error codes.
inline err err_sub(errc prim, errc aux) {
  return {.type = err_type::sub,
          .primary = prim,
          .auxiliary = static_cast<int>(aux),
          .extra = 0,
          .context = {}};
}

/// Create an @ref err for a manifest invariant violation.
///
/// @param which
///    The violated invariant.
/// @param context
///    Description of the offending element.
/// @return An @ref err of type @ref err_type::invariant.
inline err err_invariant(invariant which, std::string context) {
  return {.type = err_type::invariant,
          .primary = errc::invariant_violation,
          .auxiliary = static_cast<int>(which),
          .extra = 0,
          .context = std::move(context)};
}

/// Re-target an error produced by a sub-operation to a new primary code,
///    keeping its details.
///
/// @param prim
///    New primary error code.
/// @param e
///    The error to re-target.
/// @return @p e with `primary` replaced, or converted to a compound error if
///    it was a basic one.
inline err err_wrap(errc prim, err e) {
  if (e.type == err_type::basic) {
    return err_sub(prim, e.primary);
  }
  e.primary = prim;
  return e;
}

} // namespace gamedepot
