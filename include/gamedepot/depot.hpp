//===-- depot.hpp - depot operations declarations -------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of the library context and the depot orchestrator.
///
/// The orchestrator ties build resolution, manifest fetching and secure link
///    acquisition together. Once a build is resolved, everything that depends
///    on its generation is dispatched through @ref depot_protocol, so the
///    generation check happens exactly once.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.hpp"
#include "build.hpp"
#include "error.hpp"
#include "http.hpp"
#include "manifest.hpp"
#include "secure_link.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gamedepot {

//===-- Library context ---------------------------------------------------===//

/// Opaque library context type.
/// Holds build lists and decoded manifests shared by all orchestrators that
///    use it. Decoded manifests are optionally persisted between runs.
struct lib_ctx;

/// Create a library context.
///
/// @param use_file_cache
///    Value indicating whether manifests should be loaded from and saved to
///    the cache file in user's cache directory.
/// @return Pointer to the created context, or `nullptr` if libcurl global
///    initialization fails. It must be destroyed with @ref lib_cleanup.
[[gnu::GAMEDEPOT_API]] lib_ctx *lib_init(bool use_file_cache);

/// Destroy a library context, writing newly cached manifests to the cache
///    file if it was created with `use_file_cache`.
///
/// @param [in, out] ctx
///    Pointer to the context to destroy.
[[gnu::GAMEDEPOT_API]] void lib_cleanup(lib_ctx *ctx);

/// Find a cached manifest.
///
/// @param [in, out] ctx
///    Library context.
/// @param product_id
///    ID of the product that the manifest belongs to.
/// @param build_id
///    ID of the build that the manifest describes.
/// @return Pointer to the manifest, or `nullptr` if it isn't cached.
[[gnu::GAMEDEPOT_API]] std::shared_ptr<const manifest>
lib_get_manifest(lib_ctx &ctx, std::string_view product_id,
                 std::string_view build_id);

/// Insert a manifest into the cache unless there already is one for the same
///    build.
///
/// @param [in, out] ctx
///    Library context.
/// @param product_id
///    ID of the product that the manifest belongs to.
/// @param build_id
///    ID of the build that the manifest describes.
/// @param man
///    The decoded manifest.
/// @param data
///    Decodable bytes that @p man was obtained from, persisted when the
///    context uses the file cache.
/// @return The manifest that is in the cache after the call, which is the
///    previously inserted one if another thread won the race.
[[gnu::GAMEDEPOT_API]] std::shared_ptr<const manifest>
lib_insert_manifest(lib_ctx &ctx, std::string_view product_id,
                    std::string_view build_id,
                    std::shared_ptr<const manifest> man,
                    std::span<const unsigned char> data);

//===-- Configuration -----------------------------------------------------===//

/// Runtime settings of @ref depot_orchestrator.
struct depot_config {
  /// Base URL of the content system. Empty string selects the built-in
  ///    default.
  std::string content_system_url;
  /// Base URL of the embed API used for ownership checks. Empty string
  ///    selects the built-in default.
  std::string embed_url;
  /// Platform to request builds for.
  std::string platform = "windows";
  /// Directory holding per-product manifest cache files written by previous
  ///    installations. Empty string disables reading them.
  std::string manifests_dir;
  /// Password for private branches.
  std::optional<std::string> branch_password;
  /// Build list generation to request instead of 2.
  std::optional<int> forced_generation;
  /// Secure link retry policy.
  retry_policy retry;
};

//===-- Generation protocols ----------------------------------------------===//

/// Operations on a generation 1 build.
struct generation_one_protocol {
  build_descriptor build;

  static constexpr int generation = 1;
  /// Get build ID that the depot is addressed by.
  const std::string &depot_build_id() const noexcept {
    return build.legacy_build_id ? *build.legacy_build_id : build.build_id;
  }
  /// Turn manifest response body into decodable bytes.
  err unpack_manifest(std::string &body,
                      std::vector<unsigned char> &data) const;
};

/// Operations on a generation 2 build.
struct generation_two_protocol {
  build_descriptor build;

  static constexpr int generation = 2;
  /// Get build ID that the depot is addressed by.
  const std::string &depot_build_id() const noexcept { return build.build_id; }
  /// Turn manifest response body into decodable bytes, inflating it if it's
  ///    zlib-wrapped.
  err unpack_manifest(std::string &body,
                      std::vector<unsigned char> &data) const;
};

/// Protocol of a resolved build.
using depot_protocol =
    std::variant<generation_one_protocol, generation_two_protocol>;

/// Create protocol object for a resolved build.
///
/// @param build
///    The resolved build.
/// @param [out] protocol
///    Variable that receives the protocol object on success.
/// @return A @ref err indicating the result of operation,
///    @ref errc::unsupported_generation if build's generation is not 1 or 2.
[[gnu::GAMEDEPOT_API]] err make_protocol(build_descriptor build,
                                         depot_protocol &protocol);

//===-- Orchestrator ------------------------------------------------------===//

/// Coordinates depot operations for a single account.
class depot_orchestrator {
public:
  /// @param [in, out] http
  ///    HTTP client to perform requests with. Must outlive the instance.
  /// @param [in, out] ctx
  ///    Library context to cache results in. Must outlive the instance.
  /// @param config
  ///    Runtime settings.
  /// @param sleep
  ///    Function used to wait between secure link attempts, see
  ///    @ref secure_link_client.
  [[gnu::GAMEDEPOT_API]] depot_orchestrator(http_client &http, lib_ctx &ctx,
                                            depot_config config,
                                            sleep_func sleep = {});

  /// Fetch build list of a product.
  ///
  /// @param product_id
  ///    ID of the product.
  /// @param [out] builds
  ///    Vector that receives the builds, in remote order.
  /// @return A @ref err indicating the result of operation, with `primary`
  ///    code @ref errc::builds_fetch or @ref errc::no_builds on failure.
  [[gnu::GAMEDEPOT_API]] err
  fetch_builds(std::string_view product_id,
               std::vector<build_descriptor> &builds);

  /// Resolve target build of a product and create its protocol object.
  ///
  /// @param product_id
  ///    ID of the product.
  /// @param selector
  ///    Selection criteria. When @p repair is set and the selector has no
  ///    generation override, the override is read from the product's
  ///    manifest cache file.
  /// @param repair
  ///    Value indicating whether an existing installation is being repaired.
  /// @param [out] protocol
  ///    Variable that receives the protocol object on success.
  /// @return A @ref err indicating the result of operation.
  [[gnu::GAMEDEPOT_API]] err select(std::string_view product_id,
                                    build_selector selector, bool repair,
                                    depot_protocol &protocol);

  /// Fetch and decode manifest of the resolved build, or get it from the
  ///    library context cache.
  ///
  /// @param product_id
  ///    ID of the product.
  /// @param [in] protocol
  ///    Protocol object of the resolved build.
  /// @param [out] man
  ///    Variable that receives pointer to the manifest on success.
  /// @return A @ref err indicating the result of operation.
  [[gnu::GAMEDEPOT_API]] err
  fetch_manifest(std::string_view product_id, const depot_protocol &protocol,
                 std::shared_ptr<const manifest> &man);

  /// Get download URLs for the resolved build.
  ///
  /// @param product_id
  ///    ID of the product.
  /// @param [in] protocol
  ///    Protocol object of the resolved build.
  /// @param path
  ///    Path to get links for. Empty string selects the depot root "/".
  /// @param root
  ///    Optional root path.
  /// @return Download URLs, empty if link acquisition failed.
  [[gnu::GAMEDEPOT_API]] std::vector<std::string>
  get_links(std::string_view product_id, const depot_protocol &protocol,
            std::string_view path = {},
            std::optional<std::string_view> root = {});

  /// Check whether the user owns a product.
  ///
  /// The owned product list is fetched once per orchestrator. If it can't be
  ///    fetched or parsed, ownership is assumed.
  ///
  /// @param product_id
  ///    ID of the product.
  /// @return Value indicating whether the user owns the product, or `true` if
  ///    that can't be determined.
  [[gnu::GAMEDEPOT_API]] bool does_user_own(std::string_view product_id);

  const depot_config &config() const noexcept { return cfg; }

private:
  /// Read generation override from product's manifest cache file.
  err read_cached_generation(std::string_view product_id,
                             std::optional<int> &generation) const;

  http_client &http;
  lib_ctx &ctx;
  depot_config cfg;
  secure_link_client links;
  /// Memoized list of owned product IDs.
  std::optional<std::vector<std::string>> owned;
  /// Mutex locking concurrent access to @ref owned.
  std::mutex owned_mtx;
};

} // namespace gamedepot
