//===-- secure_link.cpp - secure link client implementation ---------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::secure_link_client and related
///    functions.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/secure_link.hpp"

#include "gamedepot/error.hpp"
#include "gamedepot/http.hpp"
#include "log.hpp"

#include <chrono>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace gamedepot {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Expand an endpoint object into a URL by substituting its parameters into
///    its URL format.
///
/// @param [in] endpoint
///    The endpoint object with `url_format` and `parameters` members.
/// @return The URL, or empty optional if the object is malformed or some
///    placeholders have no matching parameter.
static std::optional<std::string>
expand_endpoint(const rapidjson::Value &endpoint) {
  const auto format{endpoint.FindMember("url_format")};
  if (format == endpoint.MemberEnd() || !format->value.IsString()) {
    return {};
  }
  std::string url{format->value.GetString(),
                  format->value.GetStringLength()};
  if (const auto params{endpoint.FindMember("parameters")};
      params != endpoint.MemberEnd() && params->value.IsObject()) {
    for (const auto &param : params->value.GetObject()) {
      std::string val;
      if (param.value.IsString()) {
        val.assign(param.value.GetString(), param.value.GetStringLength());
      } else if (param.value.IsInt64()) {
        val = std::to_string(param.value.GetInt64());
      } else if (param.value.IsUint64()) {
        val = std::to_string(param.value.GetUint64());
      } else {
        continue;
      }
      const auto placeholder{std::string{"{"}
                                 .append(param.name.GetString(),
                                         param.name.GetStringLength())
                                 .append("}")};
      for (auto pos{url.find(placeholder)}; pos != std::string::npos;
           pos = url.find(placeholder, pos + val.length())) {
        url.replace(pos, placeholder.length(), val);
      }
    }
  }
  // Leftover placeholders make the URL unusable
  const auto open{url.find('{')};
  if (open != std::string::npos && url.find('}', open) != std::string::npos) {
    return {};
  }
  return url;
}

} // namespace

//===-- Public functions --------------------------------------------------===//

std::string secure_link_url(std::string_view cs_url,
                            std::string_view product_id, std::string_view path,
                            int generation,
                            std::optional<std::string_view> root) {
  auto url{std::string{cs_url}
               .append("/products/")
               .append(product_id)
               .append("/secure_link?_version=2")};
  url.append(generation == 2 ? "&generation=2" : "&type=depot")
      .append("&path=")
      .append(path);
  if (root && !root->empty()) {
    url.append("&root=").append(*root);
  }
  return url;
}

bool parse_links(std::string_view json, std::vector<std::string> &urls) {
  rapidjson::Document doc;
  doc.Parse(json.data(), json.length());
  if (doc.HasParseError() || !doc.IsObject()) {
    return false;
  }
  urls.clear();
  const auto urls_member{doc.FindMember("urls")};
  if (urls_member == doc.MemberEnd() || !urls_member->value.IsArray()) {
    return true;
  }
  urls.reserve(urls_member->value.Size());
  for (const auto &element : urls_member->value.GetArray()) {
    if (element.IsString()) {
      urls.emplace_back(element.GetString(), element.GetStringLength());
    } else if (element.IsObject()) {
      if (auto url{expand_endpoint(element)}; url) {
        urls.emplace_back(std::move(*url));
      }
    }
  }
  return true;
}

secure_link_client::secure_link_client(http_client &http, std::string cs_url,
                                       retry_policy policy, sleep_func sleep)
    : http(http), cs_url(std::move(cs_url)), policy(policy),
      sleep(sleep ? std::move(sleep) : [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
      }) {}

std::vector<std::string>
secure_link_client::get_links(std::string_view product_id,
                              std::string_view path, int generation,
                              std::optional<std::string_view> root) {
  std::vector<std::string> urls;
  if (generation != 1 && generation != 2) {
    lib_log()->error("Unsupported generation {} for secure link of {}",
                     generation, product_id);
    return urls;
  }
  const auto url{secure_link_url(cs_url, product_id, path, generation, root)};
  for (int attempt{}; attempt < policy.max_retries; ++attempt) {
    http_response response{};
    if (const auto res{http.get(url, response)}; !err_success(res)) {
      lib_log()->warn("Secure link attempt {}/{} for {} failed: {}",
                      attempt + 1, policy.max_retries, product_id,
                      err_describe(res));
    } else if (response.status != 200) {
      lib_log()->warn("Secure link attempt {}/{} for {} failed: HTTP {}",
                      attempt + 1, policy.max_retries, product_id,
                      response.status);
    } else if (!parse_links(response.body, urls)) {
      lib_log()->warn("Secure link attempt {}/{} for {} failed: malformed "
                      "response",
                      attempt + 1, policy.max_retries, product_id);
    } else {
      lib_log()->debug("Got {} secure links for {}", urls.size(), product_id);
      return urls;
    }
    sleep(backoff_delay(attempt, policy.base_delay));
  }
  lib_log()->error("Failed to get secure link for {} after {} attempts",
                   product_id, policy.max_retries);
  urls.clear();
  return urls;
}

} // namespace gamedepot
