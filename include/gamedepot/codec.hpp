//===-- codec.hpp - manifest codec declarations ---------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of manifest decoding, encoding and validation functions.
///
/// Manifests come in two encodings: the binary one served by the content
///    system and a JSON rendition of the same model. @ref detect_and_decode
///    picks the decoder by looking at the magic number, so callers never need
///    to know which encoding they received.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.hpp"
#include "error.hpp"
#include "manifest.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace gamedepot {

//===-- Constants ---------------------------------------------------------===//

/// Magic number that binary manifests start with.
inline constexpr std::uint32_t manifest_magic = 0x44BEC00C;
/// Lowest header version that stores manifest data in binary form.
inline constexpr std::int32_t min_binary_version = 14;

//===-- Types -------------------------------------------------------------===//

/// Manifest encodings.
enum class manifest_format {
  binary,
  json
};

//===-- Functions ---------------------------------------------------------===//

/// Detect encoding of manifest data.
///
/// @param data
///    Raw manifest bytes.
/// @return @ref manifest_format::binary if @p data starts with
///    @ref manifest_magic, @ref manifest_format::json otherwise.
[[gnu::GAMEDEPOT_API]] manifest_format
detect_format(std::span<const unsigned char> data) noexcept;

/// Decode a manifest in either encoding.
///
/// @param data
///    Raw manifest bytes.
/// @param [out] man
///    Variable that receives the decoded manifest on success.
/// @return A @ref err indicating the result of operation. On failure its
///    `primary` code is @ref errc::manifest_decode and `auxiliary` code
///    specifies the reason.
[[gnu::GAMEDEPOT_API]] err
detect_and_decode(std::span<const unsigned char> data, manifest &man);

/// Decode a binary manifest.
/// @copydetails detect_and_decode
[[gnu::GAMEDEPOT_API]] err decode_binary(std::span<const unsigned char> data,
                                         manifest &man);

/// Decode a JSON manifest.
/// @copydetails detect_and_decode
[[gnu::GAMEDEPOT_API]] err decode_json(std::span<const unsigned char> data,
                                       manifest &man);

/// Encode a manifest in binary form.
///
/// @param [in] man
///    The manifest to encode. Its `version` must be at least
///    @ref min_binary_version, and blocks may only be omitted from the end.
/// @param [out] data
///    Vector that receives encoded bytes. Its previous content is discarded.
/// @return A @ref err indicating the result of operation.
[[gnu::GAMEDEPOT_API]] err encode_binary(const manifest &man,
                                         std::vector<unsigned char> &data);

/// Encode a manifest in JSON form.
///
/// @param [in] man
///    The manifest to encode.
/// @param [out] json
///    String that receives the JSON document. Its previous content is
///    discarded.
/// @return A @ref err indicating the result of operation.
[[gnu::GAMEDEPOT_API]] err encode_json(const manifest &man, std::string &json);

/// Check structural invariants of a manifest.
///
/// @param [in] man
///    The manifest to check.
/// @return A @ref err of type @ref err_type::invariant describing the first
///    violation found, or a success value.
[[gnu::GAMEDEPOT_API]] err validate(const manifest &man);

} // namespace gamedepot
