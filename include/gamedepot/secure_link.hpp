//===-- secure_link.hpp - secure link client declarations -----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of the secure link client.
///
/// Chunk and manifest downloads are authorized through secure links:
///    short-lived CDN URLs that the content system hands out per product and
///    path. Acquiring them is the only network operation in the library that
///    is retried.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.hpp"
#include "http.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gamedepot {

//===-- Types -------------------------------------------------------------===//

/// Retry policy for link acquisition.
struct retry_policy {
  /// The maximum number of requests to perform.
  int max_retries = 3;
  /// Delay after the first failed attempt, doubled after each next one.
  std::chrono::milliseconds base_delay{200};
};

/// Function that blocks the calling thread for specified duration.
using sleep_func = std::function<void(std::chrono::milliseconds)>;

//===-- Constants ---------------------------------------------------------===//

/// Attempt index after which the backoff delay stops growing.
inline constexpr int max_backoff_shift = 16;

//===-- Functions ---------------------------------------------------------===//

/// Get the delay to wait after a failed attempt.
///
/// @param attempt
///    Zero-based index of the failed attempt.
/// @param base
///    Delay after the first failed attempt.
/// @return `base * 2^attempt`, with `attempt` clamped to
///    [0, @ref max_backoff_shift].
constexpr std::chrono::milliseconds
backoff_delay(int attempt,
              std::chrono::milliseconds base = std::chrono::milliseconds{
                  200}) noexcept {
  const int shift{attempt < 0                   ? 0
                  : attempt > max_backoff_shift ? max_backoff_shift
                                                : attempt};
  return base * (std::int64_t{1} << shift);
}

/// Build secure link request URL.
///
/// @param cs_url
///    Base URL of the content system, without trailing slash.
/// @param product_id
///    ID of the product.
/// @param path
///    Path to request link for, inserted verbatim.
/// @param generation
///    Depot generation, 1 or 2.
/// @param root
///    Optional root path, appended when non-empty.
/// @return The request URL.
[[gnu::GAMEDEPOT_API]] std::string
secure_link_url(std::string_view cs_url, std::string_view product_id,
                std::string_view path, int generation,
                std::optional<std::string_view> root);

/// Extract URLs from secure link response document.
///
/// @param json
///    Response body.
/// @param [out] urls
///    Vector that receives the URLs. String elements are taken as is,
///    endpoint objects are expanded from their `url_format` and `parameters`.
///    Elements that can't be turned into a complete URL are skipped.
/// @return Value indicating whether @p json is a valid JSON object.
[[gnu::GAMEDEPOT_API]] bool parse_links(std::string_view json,
                                        std::vector<std::string> &urls);

//===-- Client class ------------------------------------------------------===//

/// Acquires secure links with bounded retry.
class secure_link_client {
public:
  /// @param [in, out] http
  ///    HTTP client to perform requests with. Must outlive the instance.
  /// @param cs_url
  ///    Base URL of the content system.
  /// @param policy
  ///    Retry policy.
  /// @param sleep
  ///    Function used to wait between attempts. Empty function selects
  ///    `std::this_thread::sleep_for`.
  [[gnu::GAMEDEPOT_API]] secure_link_client(http_client &http,
                                            std::string cs_url,
                                            retry_policy policy = {},
                                            sleep_func sleep = {});

  /// Get download URLs for specified product path.
  ///
  /// At most `max_retries` requests are made. After each failed one (a
  ///    transport error, a non-200 status or an unparsable body) the calling
  ///    thread sleeps for @ref backoff_delay of that attempt. When all
  ///    attempts fail the failure is logged and an empty list is returned.
  ///
  /// @param product_id
  ///    ID of the product.
  /// @param path
  ///    Path to get links for.
  /// @param generation
  ///    Depot generation, 1 or 2. Any other value logs an error and yields
  ///    an empty list without any requests.
  /// @param root
  ///    Optional root path.
  /// @return Download URLs in server order, possibly empty.
  [[gnu::GAMEDEPOT_API]] std::vector<std::string>
  get_links(std::string_view product_id, std::string_view path,
            int generation, std::optional<std::string_view> root = {});

private:
  http_client &http;
  std::string cs_url;
  retry_policy policy;
  sleep_func sleep;
};

} // namespace gamedepot
