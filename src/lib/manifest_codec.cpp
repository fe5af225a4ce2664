//===-- manifest_codec.cpp - manifest format detection --------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::detect_format and
///    @ref gamedepot::detect_and_decode.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/codec.hpp"

#include "gamedepot/error.hpp"
#include "gamedepot/manifest.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <cstdint>
#include <span>

namespace gamedepot {

manifest_format detect_format(std::span<const unsigned char> data) noexcept {
  if (data.size() < sizeof manifest_magic) {
    return manifest_format::json;
  }
  return u_load_le<std::uint32_t>(data.data()) == manifest_magic
             ? manifest_format::binary
             : manifest_format::json;
}

err detect_and_decode(std::span<const unsigned char> data, manifest &man) {
  const auto format{detect_format(data)};
  lib_log()->info("Decoding {} byte {} manifest", data.size(),
                  format == manifest_format::binary ? "binary" : "JSON");
  auto res{format == manifest_format::binary ? decode_binary(data, man)
                                             : decode_json(data, man)};
  if (!err_success(res)) {
    lib_log()->debug("Manifest decoding failed: {}", err_describe(res));
  }
  return res;
}

} // namespace gamedepot
