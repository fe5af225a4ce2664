//===-- test_http.cpp - libcurl HTTP client tests -------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Tests for transport failures reported by @ref gamedepot::curl_http_client.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/error.hpp"
#include "gamedepot/http.hpp"

#include <catch2/catch.hpp>
#include <curl/curl.h>
#include <string>

using namespace gamedepot;

namespace {

curl_http_client make_client() {
  return curl_http_client{
      {.user_agent{}, .access_token{}, .timeout_ms = 5000,
       .connect_timeout_ms = 2000}};
}

} // namespace

TEST_CASE("Transport failures are reported as curl errors") {
  auto client{make_client()};
  http_response response{.status = 0, .body{}};

  SECTION("unsupported scheme") {
    const std::string url{"gdtest://example.com/builds"};
    const auto res{client.get(url, response)};
    REQUIRE(res.type == err_type::curle);
    REQUIRE(res.primary == errc::http_request);
    REQUIRE(res.auxiliary == CURLE_UNSUPPORTED_PROTOCOL);
    REQUIRE(res.context == url);
  }
  SECTION("unresolvable host") {
    // The public DNS fallback is attempted only where the resolver supports
    //    it, the request fails either way
    const std::string url{"http://gamedepot-test.invalid/builds"};
    const auto res{client.get(url, response)};
    REQUIRE(res.type == err_type::curle);
    REQUIRE(res.primary == errc::http_request);
    REQUIRE(res.auxiliary != CURLE_OK);
    REQUIRE(res.context == url);
  }
  REQUIRE(response.status == 0);
  REQUIRE(response.body.empty());
}
