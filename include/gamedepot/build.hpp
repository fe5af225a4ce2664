//===-- build.hpp - build list and resolution declarations ----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of build list types and the build resolution function.
///
/// Every product has a list of builds, newest first, each published on a
///    branch (or on the default branch when it has none) and produced by one
///    of two depot generations. Resolution picks exactly one of them.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.hpp"
#include "error.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gamedepot {

//===-- Types -------------------------------------------------------------===//

/// Remote build list entry, and the result of build resolution.
struct build_descriptor {
  std::string build_id;
  /// Name of the branch that the build is published on. Empty optional means
  ///    the default branch.
  std::optional<std::string> branch;
  /// Depot generation of the build, 1 or 2.
  int generation;
  /// URL of the build's manifest. May be empty.
  std::string link;
  /// Build ID used by generation 1 depots, if different from `build_id`.
  std::optional<std::string> legacy_build_id;

  friend bool operator==(const build_descriptor &,
                         const build_descriptor &) = default;
};

/// Build selection criteria.
struct build_selector {
  /// ID of the build to select, overrides all other criteria except
  ///    @ref cached_generation_override.
  std::optional<std::string> explicit_build_id;
  /// Name of the branch to select the newest build of.
  std::optional<std::string> branch;
  /// Generation of an already installed build, replaces generation of the
  ///    selected build.
  std::optional<int> cached_generation_override;
};

//===-- Functions ---------------------------------------------------------===//

/// Parse build list JSON document.
///
/// @param json
///    The document text, an object with `items` array.
/// @param [out] builds
///    Vector that receives parsed entries, in document order. Entries that
///    lack `build_id` or have a non-numeric `generation` are skipped.
/// @return A @ref err indicating the result of operation.
///    @ref errc::no_builds is returned when `total_count` is 0 or there are
///    no valid entries.
[[gnu::GAMEDEPOT_API]] err parse_builds(std::string_view json,
                                        std::vector<build_descriptor> &builds);

/// Select the build to operate on.
///
/// Candidates are checked in following order, later matches replacing
///    earlier ones: the first build; the first build on the default branch;
///    the first build on `selector.branch`; the build with
///    `selector.explicit_build_id`. Finally, generation of the chosen build
///    is replaced with `selector.cached_generation_override` if set.
///
/// @param builds
///    Build list in remote order.
/// @param [in] selector
///    Selection criteria.
/// @param [out] result
///    Variable that receives the selected build on success.
/// @return A @ref err indicating the result of operation, with `primary` code
///    @ref errc::build_resolve on failure.
[[gnu::GAMEDEPOT_API]] err resolve(std::span<const build_descriptor> builds,
                                   const build_selector &selector,
                                   build_descriptor &result);

} // namespace gamedepot
