//===-- curl_http.cpp - libcurl HTTP client implementation ----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::curl_http_client.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/http.hpp"

#include "common/error.hpp"
#include "config.h"
#include "gamedepot/error.hpp"

#include <cstddef>
#include <curl/curl.h>
#include <memory>
#include <string>
#include <utility>

namespace gamedepot {

namespace {

//===-- Private type ------------------------------------------------------===//

/// Download context for curl.
struct gd_curl_ctx {
  /// curl easy handle that performs the download.
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl{curl_easy_init(),
                                                           curl_easy_cleanup};
  /// Buffer storing downloaded content.
  std::string buf;
};

//===-- Private functions -------------------------------------------------===//

/// curl write data callback that copies downloaded data to the context
/// buffer.
///
/// @param [in] buf
///    Pointer to the buffer containing downloaded content chunk.
/// @param size
///    Size of the content chunk, in bytes.
/// @param [in, out] ctx
///    Download context.
/// @return @p size.
[[using gnu: nonnull(1), access(read_only, 1, 3)]]
static std::size_t gd_curl_write(const char *buf, std::size_t,
                                 std::size_t size, gd_curl_ctx &ctx) {
  if (ctx.buf.empty()) {
    // This block is called only once, on first write
    // Get content length to do initial allocation
    if (curl_off_t content_len;
        curl_easy_getinfo(ctx.curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                          &content_len) == CURLE_OK &&
        content_len >= 0) {
      ctx.buf.reserve(content_len);
    }
  }
  ctx.buf.append(buf, size);
  return size;
}

} // namespace

//===-- Public functions --------------------------------------------------===//

curl_http_client::curl_http_client(curl_http_config config)
    : config(std::move(config)) {
  if (this->config.user_agent.empty()) {
    this->config.user_agent = GAMEDEPOT_UA;
  }
}

curl_http_client::~curl_http_client() = default;

err curl_http_client::get(const std::string &url, http_response &response) {
  gd_curl_ctx curl_ctx;
  if (!curl_ctx.curl) {
    return err_sub(errc::http_request, errc::curle_init);
  }
  const auto curl{curl_ctx.curl.get()};
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config.timeout_ms);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config.connect_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &curl_ctx);
  curl_easy_setopt(curl, CURLOPT_URL, url.data());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.data());
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, gd_curl_write);
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers{
      nullptr, curl_slist_free_all};
  if (!config.access_token.empty()) {
    const auto auth{
        std::string{"Authorization: Bearer "}.append(config.access_token)};
    headers.reset(curl_slist_append(nullptr, auth.data()));
    if (!headers) {
      return err_sub(errc::http_request, errc::curle_init);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  }
  auto res{curl_easy_perform(curl)};
  // Retry with public DNS servers, only possible with c-ares resolver
  if (res == CURLE_COULDNT_RESOLVE_HOST &&
      curl_easy_setopt(curl, CURLOPT_DNS_SERVERS, "1.1.1.1,1.0.0.1") ==
          CURLE_OK) {
    curl_ctx.buf.clear();
    res = curl_easy_perform(curl);
  }
  if (res != CURLE_OK) {
    return {.type = err_type::curle,
            .primary = errc::http_request,
            .auxiliary = res,
            .extra = 0,
            .context = url};
  }
  long status{};
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = status;
  response.body = std::move(curl_ctx.buf);
  return err_ok();
}

} // namespace gamedepot
