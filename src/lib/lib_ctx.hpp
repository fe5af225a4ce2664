//===-- lib_ctx.hpp - internal library context definitions ----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Definition of @ref gamedepot::lib_ctx structure to be used by library
///    implementation modules.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "gamedepot/build.hpp"
#include "gamedepot/depot.hpp"
#include "gamedepot/manifest.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gamedepot {

/// Key identifying a build of a product: product ID and build ID.
using build_key = std::pair<std::string, std::string>;

/// @copydoc lib_ctx
struct lib_ctx {
  /// Value indicating whether @ref lib_cleanup should attempt saving cached
  ///    data to a file.
  bool use_file_cache;
  /// Decoded manifests.
  std::map<build_key, std::shared_ptr<const manifest>> manifests;
  /// Manifest bytes loaded from the cache file, decoded on first lookup.
  ///    Not modified after @ref lib_init returns.
  std::map<build_key, std::vector<unsigned char>> persisted;
  /// Bytes of manifests inserted during this session that are not in the
  ///    cache file yet.
  std::map<build_key, std::vector<unsigned char>> pending;
  /// Mutex locking concurrent access to @ref manifests and @ref pending.
  std::shared_mutex manifests_mtx;
  /// Build lists fetched during this session, keyed by product ID.
  std::map<std::string, std::vector<build_descriptor>, std::less<>> builds;
  /// Mutex locking concurrent access to @ref builds.
  std::shared_mutex builds_mtx;
  /// Value indicating whether @ref pending has entries that should be
  ///    written to the cache file.
  std::atomic_bool dirty;
};

/// Get build list of a product fetched earlier in this session.
///
/// @param [in, out] ctx
///    Library context.
/// @param product_id
///    ID of the product.
/// @param [out] builds
///    Vector that receives a copy of the list.
/// @return Value indicating whether the list was found.
[[gnu::visibility("internal")]]
bool lib_get_builds(lib_ctx &ctx, std::string_view product_id,
                    std::vector<build_descriptor> &builds);

/// Store build list of a product, replacing the previous one.
[[gnu::visibility("internal")]]
void lib_set_builds(lib_ctx &ctx, std::string_view product_id,
                    std::vector<build_descriptor> builds);

} // namespace gamedepot
