//===-- http.hpp - HTTP client declarations -------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of the HTTP client interface and its libcurl implementation.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.hpp"
#include "error.hpp"

#include <memory>
#include <string>
#include <utility>

namespace gamedepot {

/// Response to an HTTP request.
struct http_response {
  /// HTTP status code.
  long status;
  /// Response body.
  std::string body;
};

/// Interface for performing authenticated HTTP GET requests.
class http_client {
public:
  virtual ~http_client() = default;

  /// Perform a GET request.
  ///
  /// @param url
  ///    URL to request.
  /// @param [out] response
  ///    Variable that receives the response. Non-success statuses are not
  ///    errors at this level.
  /// @return A @ref err indicating the result of operation, set only on
  ///    transport failures.
  virtual err get(const std::string &url, http_response &response) = 0;
};

/// Settings for @ref curl_http_client.
struct curl_http_config {
  /// Value of User-Agent header. Empty string selects the default.
  std::string user_agent;
  /// OAuth bearer token to authorize requests with. May be empty.
  std::string access_token;
  /// Timeout for the whole request, in milliseconds.
  long timeout_ms = 30000;
  /// Timeout for establishing connection, in milliseconds.
  long connect_timeout_ms = 8000;
};

/// @ref http_client implementation that uses libcurl easy interface.
class curl_http_client final : public http_client {
public:
  [[gnu::GAMEDEPOT_API]] explicit curl_http_client(curl_http_config config);
  [[gnu::GAMEDEPOT_API]] ~curl_http_client() override;

  [[gnu::GAMEDEPOT_API]] err get(const std::string &url,
                                 http_response &response) override;

  /// Replace the bearer token used for subsequent requests.
  void set_access_token(std::string token) {
    config.access_token = std::move(token);
  }

private:
  curl_http_config config;
};

} // namespace gamedepot
