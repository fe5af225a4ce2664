//===-- lib_ctx.cpp - library context implementation ----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of library context functions.
///
//===----------------------------------------------------------------------===//
#include "lib_ctx.hpp"

#include "gamedepot/codec.hpp"
#include "gamedepot/depot.hpp"
#include "gamedepot/error.hpp"
#include "gamedepot/manifest.hpp"
#include "log.hpp"
#include "os.hpp"

#include <cstddef>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <new>
#include <shared_mutex>
#include <span>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gamedepot {

namespace {

/// Name of the library's subdirectory in the OS user cache directory.
static constexpr std::string_view cache_subdir_name{"gamedepot"};
/// Path to the library cache file relative to the OS user cache directory.
static constexpr std::string_view cache_file_rel_path{
    GDI_OS_PATH_SEP_CHAR_STR "gamedepot" GDI_OS_PATH_SEP_CHAR_STR
                             "cache.sqlite3"};

//===-- Private functions -------------------------------------------------===//

/// Get a text column value of current row as a string.
static std::string column_str(sqlite3_stmt *stmt, int col) {
  const auto text{sqlite3_column_text(stmt, col)};
  if (!text) {
    return {};
  }
  return {reinterpret_cast<const char *>(text),
          static_cast<std::size_t>(sqlite3_column_bytes(stmt, col))};
}

/// Load persisted manifest bytes from the cache file.
///
/// @param [in, out] ctx
///    Library context to load data into.
/// @param [in] cache_file_path
///    Path to the cache file.
static void load_file_cache(lib_ctx &ctx, const std::string &cache_file_path) {
  // Open the database connection
  sqlite3 *db_ptr;
  if (sqlite3_open_v2(cache_file_path.data(), &db_ptr, SQLITE_OPEN_READONLY,
                      nullptr) != SQLITE_OK) {
    if (db_ptr) {
      sqlite3_close_v2(db_ptr);
    }
    return;
  }
  const std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)> db{
      db_ptr, sqlite3_close_v2};
  if (sqlite3_exec(db.get(), "BEGIN", nullptr, nullptr, nullptr) != SQLITE_OK) {
    return;
  }
  sqlite3_stmt *stmt_ptr;
  constexpr std::string_view query{
      "SELECT product_id, build_id, data FROM manifests"};
  if (sqlite3_prepare_v2(db.get(), query.data(), query.length() + 1, &stmt_ptr,
                         nullptr) == SQLITE_OK) {
    const std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt{
        stmt_ptr, sqlite3_finalize};
    for (int res{sqlite3_step(stmt.get())}; res == SQLITE_ROW;
         res = sqlite3_step(stmt.get())) {
      const auto blob{static_cast<const unsigned char *>(
          sqlite3_column_blob(stmt.get(), 2))};
      const auto blob_size{sqlite3_column_bytes(stmt.get(), 2)};
      if (!blob || blob_size <= 0) {
        continue;
      }
      ctx.persisted.try_emplace(
          build_key{column_str(stmt.get(), 0), column_str(stmt.get(), 1)},
          blob, blob + blob_size);
    }
  }
  sqlite3_exec(db.get(), "COMMIT", nullptr, nullptr, nullptr);
  lib_log()->debug("Loaded {} manifests from {}", ctx.persisted.size(),
                   cache_file_path);
}

/// Write manifests inserted during the session to the cache file.
///
/// @param [in] ctx
///    Library context to save data from.
static void save_file_cache(const lib_ctx &ctx) {
  // Get cache file path
  std::string cache_dir;
  if (!os_get_cache_dir(cache_dir)) {
    return;
  }
  const auto cache_file_path{
      std::string{cache_dir}.append(cache_file_rel_path)};
  // Open the database connection
  sqlite3 *db_ptr;
  int res{sqlite3_open_v2(cache_file_path.data(), &db_ptr,
                          SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr)};
  if (res != SQLITE_OK) {
    if (db_ptr) {
      sqlite3_close_v2(db_ptr);
    }
    if (res != SQLITE_CANTOPEN) {
      return;
    }
    // Most likely the parent directory doesn't exist yet, create the cache
    //    directory and its gamedepot subdirectory if they are missing
    if (!os_dir_create(cache_dir) ||
        !os_dir_create(std::string{cache_dir}
                           .append(GDI_OS_PATH_SEP_CHAR_STR)
                           .append(cache_subdir_name))) {
      return;
    }
    // Try opening the database connection again
    if (sqlite3_open_v2(cache_file_path.data(), &db_ptr,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                        nullptr) != SQLITE_OK) {
      if (db_ptr) {
        sqlite3_close_v2(db_ptr);
      }
      return;
    }
  }
  const std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)> db{
      db_ptr, sqlite3_close_v2};
  if (sqlite3_exec(db.get(), "BEGIN", nullptr, nullptr, nullptr) !=
      SQLITE_OK) {
    return;
  }
  if (sqlite3_exec(db.get(),
                   "CREATE TABLE IF NOT EXISTS manifests (product_id TEXT NOT "
                   "NULL, build_id TEXT NOT NULL, data BLOB NOT NULL, "
                   "UNIQUE(product_id, build_id))",
                   nullptr, nullptr, nullptr) != SQLITE_OK) {
    sqlite3_exec(db.get(), "ROLLBACK", nullptr, nullptr, nullptr);
    return;
  }
  sqlite3_stmt *stmt_ptr;
  constexpr std::string_view query{"INSERT OR IGNORE INTO manifests "
                                   "(product_id, build_id, data) VALUES (?, "
                                   "?, ?)"};
  if (sqlite3_prepare_v2(db.get(), query.data(), query.length() + 1, &stmt_ptr,
                         nullptr) == SQLITE_OK) {
    for (const std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt{
             stmt_ptr, sqlite3_finalize};
         const auto &[key, data] : ctx.pending) {
      if (sqlite3_bind_text(stmt.get(), 1, key.first.data(),
                            key.first.length(), SQLITE_STATIC) != SQLITE_OK) {
        break;
      }
      if (sqlite3_bind_text(stmt.get(), 2, key.second.data(),
                            key.second.length(), SQLITE_STATIC) != SQLITE_OK) {
        break;
      }
      if (sqlite3_bind_blob(stmt.get(), 3, data.data(), data.size(),
                            SQLITE_STATIC) != SQLITE_OK) {
        break;
      }
      res = sqlite3_step(stmt.get());
      if (res != SQLITE_DONE && res != SQLITE_CONSTRAINT) {
        break;
      }
      sqlite3_reset(stmt.get());
      sqlite3_clear_bindings(stmt.get());
    }
  }
  sqlite3_exec(db.get(), "COMMIT", nullptr, nullptr, nullptr);
}

/// Insert a manifest into the decoded manifest map.
///
/// @param data
///    Bytes to persist, or an empty span if the manifest came from the cache
///    file.
static std::shared_ptr<const manifest>
insert_manifest(lib_ctx &ctx, build_key key,
                std::shared_ptr<const manifest> man,
                std::span<const unsigned char> data) {
  const std::unique_lock lock{ctx.manifests_mtx};
  const auto [it, inserted]{ctx.manifests.try_emplace(key, std::move(man))};
  if (inserted && !data.empty() && !ctx.persisted.contains(key)) {
    ctx.pending.try_emplace(std::move(key), data.begin(), data.end());
    ctx.dirty.store(true, std::memory_order::relaxed);
  }
  return it->second;
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

bool lib_get_builds(lib_ctx &ctx, std::string_view product_id,
                    std::vector<build_descriptor> &builds) {
  const std::shared_lock lock{ctx.builds_mtx};
  const auto it{ctx.builds.find(product_id)};
  if (it == ctx.builds.cend()) {
    return false;
  }
  builds = it->second;
  return true;
}

void lib_set_builds(lib_ctx &ctx, std::string_view product_id,
                    std::vector<build_descriptor> builds) {
  const std::unique_lock lock{ctx.builds_mtx};
  ctx.builds.insert_or_assign(std::string{product_id}, std::move(builds));
}

//===-- Public functions --------------------------------------------------===//

lib_ctx *lib_init(bool use_file_cache) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    return nullptr;
  }
  const auto ctx{new (std::nothrow) lib_ctx()};
  if (!ctx) {
    curl_global_cleanup();
    return nullptr;
  }
  ctx->use_file_cache = use_file_cache;
  if (!use_file_cache) {
    return ctx;
  }
  // Get cache file path
  std::string cache_file_path;
  if (!os_get_cache_dir(cache_file_path)) {
    return ctx;
  }
  cache_file_path.append(cache_file_rel_path);
  load_file_cache(*ctx, cache_file_path);
  return ctx;
}

void lib_cleanup(lib_ctx *ctx) {
  if (ctx->use_file_cache && ctx->dirty.load(std::memory_order::relaxed)) {
    save_file_cache(*ctx);
  }
  curl_global_cleanup();
  delete ctx;
}

std::shared_ptr<const manifest> lib_get_manifest(lib_ctx &ctx,
                                                 std::string_view product_id,
                                                 std::string_view build_id) {
  build_key key{product_id, build_id};
  {
    const std::shared_lock lock{ctx.manifests_mtx};
    if (const auto it{ctx.manifests.find(key)}; it != ctx.manifests.cend()) {
      return it->second;
    }
  }
  const auto persisted{ctx.persisted.find(key)};
  if (persisted == ctx.persisted.cend()) {
    return nullptr;
  }
  auto man{std::make_shared<manifest>()};
  if (const auto res{detect_and_decode(persisted->second, *man)};
      !err_success(res)) {
    lib_log()->warn("Discarding cached manifest of {} build {}: {}",
                    product_id, build_id, err_describe(res));
    return nullptr;
  }
  return insert_manifest(ctx, std::move(key), std::move(man), {});
}

std::shared_ptr<const manifest>
lib_insert_manifest(lib_ctx &ctx, std::string_view product_id,
                    std::string_view build_id,
                    std::shared_ptr<const manifest> man,
                    std::span<const unsigned char> data) {
  return insert_manifest(ctx, build_key{product_id, build_id}, std::move(man),
                         data);
}

} // namespace gamedepot
