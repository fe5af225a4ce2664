//===-- depot.cpp - depot orchestrator implementation ---------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::depot_orchestrator and generation
///    protocols.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/depot.hpp"

#include "common/error.hpp"
#include "config.h"
#include "gamedepot/build.hpp"
#include "gamedepot/codec.hpp"
#include "gamedepot/error.hpp"
#include "gamedepot/http.hpp"
#include "gamedepot/manifest.hpp"
#include "lib_ctx.hpp"
#include "log.hpp"
#include "os.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <optional>
#include <rapidjson/document.h>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace gamedepot {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Fill in default URLs of a configuration.
static depot_config with_defaults(depot_config config) {
  if (config.content_system_url.empty()) {
    config.content_system_url = GAMEDEPOT_CONTENT_SYSTEM;
  }
  if (config.embed_url.empty()) {
    config.embed_url = GAMEDEPOT_EMBED;
  }
  return config;
}

/// Create an @ref err for a non-success HTTP response.
static err http_status_err(errc prim, long status, std::string url) {
  return {.type = err_type::http,
          .primary = prim,
          .auxiliary = 0,
          .extra = static_cast<int>(status),
          .context = std::move(url)};
}

/// Check whether data starts with a zlib stream header.
static bool is_zlib_stream(std::span<const unsigned char> data) noexcept {
  return data.size() >= 2 && data[0] == 0x78 &&
         ((data[0] << 8) | data[1]) % 31 == 0;
}

/// Copy response body into a byte vector.
static void body_to_bytes(const std::string &body,
                          std::vector<unsigned char> &data) {
  const auto ubody{reinterpret_cast<const unsigned char *>(body.data())};
  data.assign(ubody, ubody + body.size());
}

} // namespace

//===-- Generation protocols ----------------------------------------------===//

err generation_one_protocol::unpack_manifest(
    std::string &body, std::vector<unsigned char> &data) const {
  body_to_bytes(body, data);
  return err_ok();
}

err generation_two_protocol::unpack_manifest(
    std::string &body, std::vector<unsigned char> &data) const {
  const std::span ubody{reinterpret_cast<const unsigned char *>(body.data()),
                        body.size()};
  if (!is_zlib_stream(ubody)) {
    body_to_bytes(body, data);
    return err_ok();
  }
  if (!u_inflate(ubody, 0, data)) {
    return err_sub(errc::manifest_fetch, errc::decompression);
  }
  return err_ok();
}

err make_protocol(build_descriptor build, depot_protocol &protocol) {
  switch (build.generation) {
  case generation_one_protocol::generation:
    protocol = generation_one_protocol{.build = std::move(build)};
    return err_ok();
  case generation_two_protocol::generation:
    protocol = generation_two_protocol{.build = std::move(build)};
    return err_ok();
  default:
    return err_sub(errc::build_resolve, errc::unsupported_generation);
  }
}

//===-- depot_orchestrator members ----------------------------------------===//

depot_orchestrator::depot_orchestrator(http_client &http, lib_ctx &ctx,
                                       depot_config config, sleep_func sleep)
    : http(http), ctx(ctx), cfg(with_defaults(std::move(config))),
      links(http, cfg.content_system_url, cfg.retry, std::move(sleep)) {}

err depot_orchestrator::fetch_builds(std::string_view product_id,
                                     std::vector<build_descriptor> &builds) {
  auto url{fmt::format("{}/products/{}/os/{}/builds?generation={}",
                       cfg.content_system_url, product_id, cfg.platform,
                       cfg.forced_generation.value_or(2))};
  if (cfg.branch_password) {
    url.append("&password=").append(*cfg.branch_password);
  }
  http_response response{};
  if (auto res{http.get(url, response)}; !err_success(res)) {
    return err_wrap(errc::builds_fetch, std::move(res));
  }
  if (response.status != 200) {
    return http_status_err(errc::builds_fetch, response.status,
                           std::move(url));
  }
  if (auto res{parse_builds(response.body, builds)}; !err_success(res)) {
    return res;
  }
  lib_log()->debug("Fetched {} builds of {}", builds.size(), product_id);
  lib_set_builds(ctx, product_id, builds);
  return err_ok();
}

err depot_orchestrator::read_cached_generation(
    std::string_view product_id, std::optional<int> &generation) const {
  generation.reset();
  if (cfg.manifests_dir.empty()) {
    return err_ok();
  }
  const auto path{std::string{cfg.manifests_dir}.append("/").append(
      product_id)};
  std::string content;
  if (auto res{os_read_file(path, content)}; !err_success(res)) {
    if (os_is_not_found(res)) {
      return err_ok();
    }
    return err_wrap(errc::manifest_cache, std::move(res));
  }
  rapidjson::Document doc;
  doc.Parse(content.data(), content.length());
  if (doc.HasParseError() || !doc.IsObject()) {
    return err_sub(errc::manifest_cache, errc::json_parse);
  }
  const auto version{doc.FindMember("version")};
  if (version == doc.MemberEnd()) {
    return err_sub(errc::manifest_cache, errc::invalid_data);
  }
  if (version->value.IsInt()) {
    generation = version->value.GetInt();
  } else if (version->value.IsString()) {
    const std::string_view str{version->value.GetString(),
                               version->value.GetStringLength()};
    int num;
    if (const auto res{
            std::from_chars(str.data(), str.data() + str.length(), num)};
        res.ec != std::errc{} || res.ptr != str.data() + str.length()) {
      return err_sub(errc::manifest_cache, errc::invalid_data);
    }
    generation = num;
  } else {
    return err_sub(errc::manifest_cache, errc::invalid_data);
  }
  lib_log()->debug("Cached manifest of {} has generation {}", product_id,
                   *generation);
  return err_ok();
}

err depot_orchestrator::select(std::string_view product_id,
                               build_selector selector, bool repair,
                               depot_protocol &protocol) {
  std::vector<build_descriptor> builds;
  if (!lib_get_builds(ctx, product_id, builds)) {
    if (auto res{fetch_builds(product_id, builds)}; !err_success(res)) {
      return res;
    }
  }
  if (repair && !selector.cached_generation_override) {
    if (auto res{read_cached_generation(
            product_id, selector.cached_generation_override)};
        !err_success(res)) {
      return res;
    }
  }
  build_descriptor build;
  if (auto res{resolve(builds, selector, build)}; !err_success(res)) {
    return res;
  }
  return make_protocol(std::move(build), protocol);
}

err depot_orchestrator::fetch_manifest(std::string_view product_id,
                                       const depot_protocol &protocol,
                                       std::shared_ptr<const manifest> &man) {
  return std::visit(
      [&](const auto &proto) -> err {
        const auto &build{proto.build};
        if (auto cached{lib_get_manifest(ctx, product_id, build.build_id)};
            cached) {
          man = std::move(cached);
          return err_ok();
        }
        auto url{build.link.empty()
                     ? fmt::format("{}/products/{}/os/{}/builds/{}",
                                   cfg.content_system_url, product_id,
                                   cfg.platform, proto.depot_build_id())
                     : build.link};
        http_response response{};
        if (auto res{http.get(url, response)}; !err_success(res)) {
          lib_log()->error("Failed to fetch manifest of {} build {}: {}",
                           product_id, build.build_id, err_describe(res));
          return err_wrap(errc::manifest_fetch, std::move(res));
        }
        if (response.status != 200) {
          lib_log()->error("Failed to fetch manifest of {} build {}: HTTP {}",
                           product_id, build.build_id, response.status);
          return http_status_err(errc::manifest_fetch, response.status,
                                 std::move(url));
        }
        std::vector<unsigned char> data;
        if (auto res{proto.unpack_manifest(response.body, data)};
            !err_success(res)) {
          return res;
        }
        auto decoded{std::make_shared<manifest>()};
        if (auto res{detect_and_decode(data, *decoded)}; !err_success(res)) {
          lib_log()->error("Failed to decode manifest of {} build {}: {}",
                           product_id, build.build_id, err_describe(res));
          return res;
        }
        man = lib_insert_manifest(ctx, product_id, build.build_id,
                                  std::move(decoded), data);
        return err_ok();
      },
      protocol);
}

std::vector<std::string>
depot_orchestrator::get_links(std::string_view product_id,
                              const depot_protocol &protocol,
                              std::string_view path,
                              std::optional<std::string_view> root) {
  return std::visit(
      [&](const auto &proto) {
        return links.get_links(product_id, path.empty() ? "/" : path,
                               proto.generation, root);
      },
      protocol);
}

bool depot_orchestrator::does_user_own(std::string_view product_id) {
  const std::scoped_lock lock{owned_mtx};
  if (!owned) {
    const auto url{std::string{cfg.embed_url}.append("/user/data/games")};
    http_response response{};
    if (const auto res{http.get(url, response)}; !err_success(res)) {
      lib_log()->warn("Ownership check failed, assuming {} is owned: {}",
                      product_id, err_describe(res));
      return true;
    }
    if (response.status != 200) {
      lib_log()->warn("Ownership check failed, assuming {} is owned: HTTP {}",
                      product_id, response.status);
      return true;
    }
    rapidjson::Document doc;
    doc.Parse(response.body.data(), response.body.length());
    if (doc.HasParseError() || !doc.IsObject()) {
      lib_log()->warn("Ownership check failed, assuming {} is owned: "
                      "malformed response",
                      product_id);
      return true;
    }
    const auto owned_member{doc.FindMember("owned")};
    if (owned_member == doc.MemberEnd() || !owned_member->value.IsArray()) {
      lib_log()->warn("Ownership check failed, assuming {} is owned: no "
                      "owned list",
                      product_id);
      return true;
    }
    auto &ids{owned.emplace()};
    ids.reserve(owned_member->value.Size());
    for (const auto &id : owned_member->value.GetArray()) {
      if (id.IsUint64()) {
        ids.emplace_back(fmt::format("{}", id.GetUint64()));
      } else if (id.IsString()) {
        ids.emplace_back(id.GetString(), id.GetStringLength());
      }
    }
  }
  return std::ranges::find(*owned, product_id) != owned->cend();
}

} // namespace gamedepot
