//===-- error.cpp - error message functions implementation ----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::err_get_msgs and
///    @ref gamedepot::err_describe.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/error.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <string>
#include <system_error>

namespace gamedepot {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Get message for specified error code.
static std::string errc_msg(errc code) {
  switch (code) {
  case errc::ok:
    return "Operation completed successfully";
  case errc::body_digest_mismatch:
    return "SHA-1 digest of manifest body doesn't match the one in its header";
  case errc::build_resolve:
    return "Failed to resolve target build";
  case errc::builds_fetch:
    return "Failed to fetch build list";
  case errc::compression:
    return "zlib compression error";
  case errc::curle_init:
    return "Failed to create a libcurl easy handle";
  case errc::decompression:
    return "zlib decompression error";
  case errc::file_read:
    return "Failed to read a file";
  case errc::http_request:
    return "HTTP request failed";
  case errc::invalid_data:
    return "Encountered invalid data";
  case errc::invalid_magic:
    return "Magic number mismatch";
  case errc::invariant_violation:
    return "Manifest structural invariant violated";
  case errc::json_parse:
    return "JSON parsing error";
  case errc::malformed_utf8:
    return "Malformed UTF-8 or UTF-16 string";
  case errc::manifest_cache:
    return "Failed to read manifest cache file";
  case errc::manifest_decode:
    return "Failed to decode manifest";
  case errc::manifest_encode:
    return "Failed to encode manifest";
  case errc::manifest_fetch:
    return "Failed to fetch manifest";
  case errc::no_builds:
    return "No builds are available for the product";
  case errc::sha:
    return "SHA-1 hashing error";
  case errc::truncated_input:
    return "Input ended prematurely";
  case errc::unsupported_generation:
    return "Unsupported depot generation";
  case errc::unsupported_version:
    return "Unsupported manifest format version";
  }
  return fmt::format("Unknown error code {}", static_cast<int>(code));
}

/// Get message for specified invariant.
static std::string invariant_msg(invariant which) {
  switch (which) {
  case invariant::none:
    return "No invariant";
  case invariant::count_mismatch:
    return "Declared element count differs from the actual one";
  case invariant::part_contiguity:
    return "File chunk parts are not contiguous or don't add up to file size";
  case invariant::part_bounds:
    return "Chunk part exceeds window size of its chunk";
  case invariant::dangling_reference:
    return "Chunk part references an unknown chunk";
  case invariant::guid_mismatch:
    return "GUID string disagrees with GUID value";
  }
  return fmt::format("Unknown invariant {}", static_cast<int>(which));
}

} // namespace

//===-- Public functions --------------------------------------------------===//

err_msgs err_get_msgs(const err &e) {
  err_msgs msgs{.type = e.type,
                .type_str = {},
                .primary = errc_msg(e.primary),
                .auxiliary = {},
                .extra = {},
                .context_type = {}};
  switch (e.type) {
  case err_type::basic:
    msgs.type_str = "Basic error";
    break;
  case err_type::sub:
    msgs.type_str = "Compound error";
    msgs.auxiliary = errc_msg(static_cast<errc>(e.auxiliary));
    break;
  case err_type::os:
    msgs.type_str = "OS error";
    msgs.auxiliary = std::system_category().message(e.auxiliary);
    msgs.context_type = "File path";
    break;
  case err_type::curle:
    msgs.type_str = "libcurl error";
    msgs.auxiliary = curl_easy_strerror(static_cast<CURLcode>(e.auxiliary));
    msgs.context_type = "URL";
    break;
  case err_type::http:
    msgs.type_str = "HTTP error";
    msgs.extra = fmt::format("Response status {}", e.extra);
    msgs.context_type = "URL";
    break;
  case err_type::invariant:
    msgs.type_str = "Invariant violation";
    msgs.auxiliary = invariant_msg(static_cast<invariant>(e.auxiliary));
    msgs.context_type = "Element";
    break;
  }
  return msgs;
}

std::string err_describe(const err &e) {
  const auto msgs{err_get_msgs(e)};
  auto desc{fmt::format("{}: {}", msgs.type_str, msgs.primary)};
  if (!msgs.auxiliary.empty()) {
    desc.append(": ").append(msgs.auxiliary);
  }
  if (!msgs.extra.empty()) {
    desc.append(" (").append(msgs.extra).append(")");
  }
  if (!e.context.empty()) {
    desc.append(fmt::format(" [{}: {}]", msgs.context_type, e.context));
  }
  return desc;
}

} // namespace gamedepot
