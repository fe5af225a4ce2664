//===-- error.hpp - gamedepot error type and function declarations --------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of error-related types and functions used in gamedepot.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.hpp"

#include <string>

namespace gamedepot {

//===-- Types -------------------------------------------------------------===//

/// gamedepot error type values.
/// This type identifies the error domain and which fields in @ref err are set,
///    as well as their types. `primary` is set for all error types.
enum class err_type {
  /// Library internal error, only `primary` code is set.
  basic,
  /// Compound library internal error with a sub-operation defined by
  ///    `auxiliary` code, which has type @ref errc.
  sub,
  /// System call error, `auxiliary` code is an `errno` value and `context`
  ///    is set to the path of the affected file.
  os,
  /// libcurl-easy interface error, `auxiliary` code is a `CURLcode`. `context`
  ///    is set to the URL of the failed request.
  curle,
  /// Non-success HTTP response status, `extra` is set to the status code and
  ///    `context` to the URL of the request.
  http,
  /// Manifest structural invariant violation, `auxiliary` code is an
  ///    @ref invariant, `context` describes the offending element.
  invariant
};

/// gamedepot error codes.
enum class errc {
  /// (0) Operation completed successfully.
  ok,
  /// (1) SHA-1 digest of manifest body doesn't match the one in its
  ///    header.
  body_digest_mismatch,
  /// (2) Failed to resolve target build.
  build_resolve,
  /// (3) Failed to fetch build list.
  builds_fetch,
  /// (4) zlib compression error.
  compression,
  /// (5) curl_easy_init() returned nullptr.
  curle_init,
  /// (6) zlib decompression error.
  decompression,
  /// (7) Failed to read a file.
  file_read,
  /// (8) HTTP request failed.
  http_request,
  /// (9) Encountered invalid data.
  invalid_data,
  /// (10) Magic number mismatch.
  invalid_magic,
  /// (11) Manifest structural invariant violated.
  invariant_violation,
  /// (12) JSON parsing error.
  json_parse,
  /// (13) Malformed UTF-8 or UTF-16 string.
  malformed_utf8,
  /// (14) Failed to read persisted manifest cache file.
  manifest_cache,
  /// (15) Failed to decode manifest.
  manifest_decode,
  /// (16) Failed to encode manifest.
  manifest_encode,
  /// (17) Failed to fetch manifest.
  manifest_fetch,
  /// (18) No builds are available for the product.
  no_builds,
  /// (19) SHA-1 hashing error.
  sha,
  /// (20) Input ended before a length prefix or a field could be read.
  truncated_input,
  /// (21) Unsupported depot generation.
  unsupported_generation,
  /// (22) Unsupported manifest format version.
  unsupported_version
};

/// Manifest structural invariants checked on decode.
enum class invariant {
  /// Not an invariant violation.
  none,
  /// A list's `count` differs from its number of elements.
  count_mismatch,
  /// File's chunk parts are not listed in file offset order gap-free from 0,
  ///    or their sizes don't add up to file size.
  part_contiguity,
  /// Chunk part exceeds window size of the chunk it references.
  part_bounds,
  /// Chunk part references a chunk that isn't in the chunk data list.
  dangling_reference,
  /// Canonical string form of a GUID disagrees with its numeric form.
  guid_mismatch
};

/// gamedepot error description structure.
struct err {
  /// Type of the error. Defines which fields are set.
  err_type type;
  /// Primary error code. Defines the outermost operation that has failed.
  errc primary;
  /// Auxiliary error code, the value and type depend on @ref type.
  int auxiliary;
  /// Extra information value, the value and type depend on @ref type.
  int extra;
  /// File path, URL or invariant violation context, depending on
  ///    @ref type. May be empty.
  std::string context;
};

/// Human-readable messages for @ref err fields.
struct err_msgs {
  /// Type of the error that the messages were produced for.
  err_type type;
  /// String representation of @ref type.
  std::string type_str;
  /// Message for the primary error code.
  std::string primary;
  /// Message for the auxiliary error code, empty if the error has none.
  std::string auxiliary;
  /// Message for the extra error code, empty if the error has none.
  std::string extra;
  /// Message identifying type of string that `context` holds, empty if the
  ///    error has none.
  std::string context_type;
};

//===-- Functions ---------------------------------------------------------===//

/// Check whether specified error structure indicates success.
///
/// @param [in] e
///    The error structure to examine.
/// @return Value indicating whether @p e indicates success.
[[nodiscard]] inline bool err_success(const err &e) noexcept {
  return e.primary == errc::ok;
}

/// Get human-readable messages for specified error structure.
///
/// @param [in] e
///    The error structure to get messages for.
/// @return A structure containing messages for the error structure fields.
[[gnu::GAMEDEPOT_API]] err_msgs err_get_msgs(const err &e);

/// Get a single-line description of specified error, suitable for logs.
///
/// @param [in] e
///    The error structure to describe.
/// @return Description composed of all messages of @p e.
[[gnu::GAMEDEPOT_API]] std::string err_describe(const err &e);

} // namespace gamedepot
