//===-- test_depot.cpp - depot orchestrator tests -------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Tests for library context caching, generation protocols and
///    @ref gamedepot::depot_orchestrator.
///
//===----------------------------------------------------------------------===//
#include "fixtures.hpp"
#include "gamedepot/build.hpp"
#include "gamedepot/codec.hpp"
#include "gamedepot/depot.hpp"
#include "gamedepot/error.hpp"
#include "gamedepot/http.hpp"
#include "gamedepot/manifest.hpp"
#include "utils.hpp"

#include <catch2/catch.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace gamedepot;

namespace {

constexpr std::string_view product_id{"1207658924"};
constexpr std::string_view builds_url{
    "https://cs.example.com/products/1207658924/os/windows/builds"
    "?generation=2"};
constexpr std::string_view manifest_link{
    "https://cdn.example.com/content-system/v2/meta/3a/f1/3af1"};
constexpr std::string_view legacy_manifest_url{
    "https://cs.example.com/products/1207658924/os/windows/builds/51890455"};
constexpr std::string_view owned_url{
    "https://embed.example.com/user/data/games"};

constexpr std::string_view builds_json{R"({
  "total_count": 2,
  "items": [
    {"build_id": "56452082", "generation": 2, "branch": null,
     "link": "https://cdn.example.com/content-system/v2/meta/3a/f1/3af1"},
    {"build_id": "3101", "generation": 1, "branch": "beta",
     "legacy_build_id": "51890455"}
  ]
})"};

struct ctx_deleter {
  void operator()(lib_ctx *ctx) const noexcept { lib_cleanup(ctx); }
};
using ctx_ptr = std::unique_ptr<lib_ctx, ctx_deleter>;

ctx_ptr make_ctx() {
  ctx_ptr ctx{lib_init(false)};
  REQUIRE(ctx);
  return ctx;
}

std::string to_string(std::span<const unsigned char> data) {
  return {reinterpret_cast<const char *>(data.data()), data.size()};
}

/// Serves the build list, the sample manifest and the owned product list.
class content_system {
public:
  content_system() {
    std::vector<unsigned char> data;
    REQUIRE(err_success(encode_binary(test::sample_manifest(), data)));
    binary_manifest = to_string(data);
    std::string json;
    REQUIRE(err_success(encode_json(test::sample_manifest(), json)));
    std::vector<unsigned char> deflated;
    const std::span json_bytes{
        reinterpret_cast<const unsigned char *>(json.data()), json.size()};
    REQUIRE(u_deflate(json_bytes, deflated));
    zlib_json_manifest = to_string(deflated);
  }

  err handle(const std::string &url, http_response &response) {
    if (url == builds_url) {
      return test::respond(response, 200, std::string{builds_json});
    }
    if (url == manifest_link) {
      return test::respond(response, 200, zlib_json_manifest);
    }
    if (url == legacy_manifest_url) {
      return test::respond(response, 200, binary_manifest);
    }
    if (url == owned_url && owned_status == 200) {
      return test::respond(response, 200, R"({"owned": [1207658924, "42"]})");
    }
    return test::respond(response, owned_status == 200 ? 404 : owned_status,
                         "");
  }

  std::string binary_manifest;
  std::string zlib_json_manifest;
  long owned_status{200};
};

depot_config make_config() {
  return {.content_system_url = "https://cs.example.com",
          .embed_url = "https://embed.example.com",
          .platform = "windows",
          .manifests_dir = {},
          .branch_password = {},
          .forced_generation = {},
          .retry = {}};
}

} // namespace

TEST_CASE("Library context keeps the first inserted manifest") {
  const auto ctx{make_ctx()};
  REQUIRE_FALSE(lib_get_manifest(*ctx, product_id, "56452082"));
  auto first{std::make_shared<manifest>(test::sample_manifest())};
  const auto second{std::make_shared<manifest>()};
  const auto inserted{
      lib_insert_manifest(*ctx, product_id, "56452082", first, {})};
  REQUIRE(inserted == first);
  REQUIRE(lib_insert_manifest(*ctx, product_id, "56452082", second, {}) ==
          first);
  REQUIRE(lib_get_manifest(*ctx, product_id, "56452082") == first);
  REQUIRE_FALSE(lib_get_manifest(*ctx, "42", "56452082"));
}

TEST_CASE("Protocol objects are created per generation") {
  depot_protocol protocol;
  build_descriptor build{.build_id = "3101",
                         .branch = "beta",
                         .generation = 1,
                         .link = {},
                         .legacy_build_id = "51890455"};
  REQUIRE(err_success(make_protocol(build, protocol)));
  REQUIRE(std::holds_alternative<generation_one_protocol>(protocol));
  REQUIRE(std::get<generation_one_protocol>(protocol).depot_build_id() ==
          "51890455");
  build.generation = 2;
  REQUIRE(err_success(make_protocol(build, protocol)));
  REQUIRE(std::holds_alternative<generation_two_protocol>(protocol));
  REQUIRE(std::get<generation_two_protocol>(protocol).depot_build_id() ==
          "3101");
  build.generation = 3;
  const auto res{make_protocol(build, protocol)};
  REQUIRE(res.primary == errc::build_resolve);
  REQUIRE(res.auxiliary == static_cast<int>(errc::unsupported_generation));
}

TEST_CASE("Generation 2 protocol inflates zlib-wrapped manifests") {
  const generation_two_protocol protocol{
      .build = {.build_id = "1",
                .branch = {},
                .generation = 2,
                .link = {},
                .legacy_build_id = {}}};
  const std::string plain{R"({"version": 18})"};
  std::vector<unsigned char> deflated;
  REQUIRE(u_deflate({reinterpret_cast<const unsigned char *>(plain.data()),
                     plain.size()},
                    deflated));
  auto body{to_string(deflated)};
  std::vector<unsigned char> data;
  REQUIRE(err_success(protocol.unpack_manifest(body, data)));
  REQUIRE(to_string(data) == plain);
  body = plain;
  REQUIRE(err_success(protocol.unpack_manifest(body, data)));
  REQUIRE(to_string(data) == plain);
}

TEST_CASE("Orchestrator selects builds and fetches manifests") {
  const auto ctx{make_ctx()};
  content_system cs;
  test::fake_http http{[&cs](const std::string &url, http_response &response) {
    return cs.handle(url, response);
  }};
  depot_orchestrator orchestrator{http, *ctx, make_config(), [](auto) {}};

  SECTION("generation 2 build from the default branch") {
    depot_protocol protocol;
    REQUIRE(err_success(orchestrator.select(product_id, {}, false, protocol)));
    REQUIRE(std::holds_alternative<generation_two_protocol>(protocol));
    std::shared_ptr<const manifest> man;
    REQUIRE(
        err_success(orchestrator.fetch_manifest(product_id, protocol, man)));
    REQUIRE(*man == test::sample_manifest());
    REQUIRE(http.urls == std::vector<std::string>{std::string{builds_url},
                                                  std::string{manifest_link}});
    // Both the build list and the manifest are cached now
    std::shared_ptr<const manifest> cached;
    REQUIRE(err_success(orchestrator.select(product_id, {}, false, protocol)));
    REQUIRE(
        err_success(orchestrator.fetch_manifest(product_id, protocol, cached)));
    REQUIRE(cached == man);
    REQUIRE(http.urls.size() == 2);
  }

  SECTION("generation 1 build addressed by legacy ID") {
    depot_protocol protocol;
    REQUIRE(err_success(orchestrator.select(product_id,
                                            {.explicit_build_id = {},
                                             .branch = "beta",
                                             .cached_generation_override = {}},
                                            false, protocol)));
    REQUIRE(std::holds_alternative<generation_one_protocol>(protocol));
    std::shared_ptr<const manifest> man;
    REQUIRE(
        err_success(orchestrator.fetch_manifest(product_id, protocol, man)));
    REQUIRE(http.urls.back() == legacy_manifest_url);
    REQUIRE(man->files->elements.size() == 3);
  }

  SECTION("links are requested for the protocol's generation") {
    depot_protocol protocol;
    REQUIRE(err_success(orchestrator.select(product_id, {}, false, protocol)));
    REQUIRE(orchestrator.get_links(product_id, protocol).empty());
    REQUIRE(http.urls.back() ==
            "https://cs.example.com/products/1207658924/secure_link"
            "?_version=2&generation=2&path=/");
  }
}

TEST_CASE("Orchestrator reports build list failures") {
  const auto ctx{make_ctx()};
  long status{};
  std::string body;
  test::fake_http http{[&](const std::string &, http_response &response) {
    return test::respond(response, status, body);
  }};
  depot_orchestrator orchestrator{http, *ctx, make_config(), [](auto) {}};
  depot_protocol protocol;
  SECTION("HTTP error") {
    status = 500;
    const auto res{orchestrator.select(product_id, {}, false, protocol)};
    REQUIRE(res.type == err_type::http);
    REQUIRE(res.primary == errc::builds_fetch);
    REQUIRE(res.extra == 500);
  }
  SECTION("empty build list") {
    status = 200;
    body = R"({"total_count": 0, "items": []})";
    const auto res{orchestrator.select(product_id, {}, false, protocol)};
    REQUIRE(res.primary == errc::no_builds);
  }
}

TEST_CASE("Build list request carries generation and password") {
  const auto ctx{make_ctx()};
  test::fake_http http{[](const std::string &, http_response &response) {
    return test::respond(response, 200, std::string{builds_json});
  }};
  auto config{make_config()};
  config.forced_generation = 1;
  config.branch_password = "hunter2";
  depot_orchestrator orchestrator{http, *ctx, std::move(config)};
  std::vector<build_descriptor> builds;
  REQUIRE(err_success(orchestrator.fetch_builds(product_id, builds)));
  REQUIRE(builds.size() == 2);
  REQUIRE(http.urls.front() ==
          "https://cs.example.com/products/1207658924/os/windows/builds"
          "?generation=1&password=hunter2");
}

TEST_CASE("Repair uses the generation of the installed manifest") {
  const auto ctx{make_ctx()};
  content_system cs;
  test::fake_http http{[&cs](const std::string &url, http_response &response) {
    return cs.handle(url, response);
  }};
  const auto dir{std::filesystem::temp_directory_path() /
                 ("gamedepot-test-" +
                  std::to_string(std::chrono::steady_clock::now()
                                     .time_since_epoch()
                                     .count()))};
  std::filesystem::create_directories(dir);
  auto config{make_config()};
  config.manifests_dir = dir.string();
  depot_orchestrator orchestrator{http, *ctx, std::move(config), [](auto) {}};
  depot_protocol protocol;

  SECTION("no cached manifest") {
    REQUIRE(err_success(orchestrator.select(product_id, {}, true, protocol)));
    REQUIRE(std::holds_alternative<generation_two_protocol>(protocol));
  }
  SECTION("cached generation 1 manifest") {
    std::ofstream{dir / product_id} << R"({"version": 1, "depot": {}})";
    REQUIRE(err_success(orchestrator.select(product_id, {}, true, protocol)));
    REQUIRE(std::holds_alternative<generation_one_protocol>(protocol));
    REQUIRE(std::get<generation_one_protocol>(protocol).build.build_id ==
            "56452082");
  }
  SECTION("version as a string") {
    std::ofstream{dir / product_id} << R"({"version": "1"})";
    REQUIRE(err_success(orchestrator.select(product_id, {}, true, protocol)));
    REQUIRE(std::holds_alternative<generation_one_protocol>(protocol));
  }
  SECTION("not a repair") {
    std::ofstream{dir / product_id} << R"({"version": 1})";
    REQUIRE(err_success(orchestrator.select(product_id, {}, false, protocol)));
    REQUIRE(std::holds_alternative<generation_two_protocol>(protocol));
  }
  SECTION("malformed cached manifest") {
    std::ofstream{dir / product_id} << "{\"version\":";
    const auto res{orchestrator.select(product_id, {}, true, protocol)};
    REQUIRE(res.primary == errc::manifest_cache);
  }
  std::filesystem::remove_all(dir);
}

TEST_CASE("Ownership check") {
  const auto ctx{make_ctx()};
  content_system cs;
  test::fake_http http{[&cs](const std::string &url, http_response &response) {
    return cs.handle(url, response);
  }};
  depot_orchestrator orchestrator{http, *ctx, make_config(), [](auto) {}};
  SECTION("owned list is fetched once") {
    REQUIRE(orchestrator.does_user_own(product_id));
    REQUIRE(orchestrator.does_user_own("42"));
    REQUIRE_FALSE(orchestrator.does_user_own("1"));
    REQUIRE(http.urls == std::vector<std::string>{std::string{owned_url}});
  }
  SECTION("failures assume ownership") {
    cs.owned_status = 503;
    REQUIRE(orchestrator.does_user_own("1"));
  }
}
