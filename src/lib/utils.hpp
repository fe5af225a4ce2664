//===-- utils.hpp - utility function declarations -------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of small utility functions that may be used anywhere in the
///    library.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "gamedepot/manifest.hpp"

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gamedepot {

/// Load a little-endian integer from unaligned memory.
template <typename T>
  requires std::integral<T>
inline T u_load_le(const unsigned char *src) noexcept {
  T val;
  std::memcpy(&val, src, sizeof val);
  if constexpr (std::endian::native == std::endian::big) {
    val = std::byteswap(val);
  }
  return val;
}

/// Store an integer into unaligned memory in little-endian byte order.
template <typename T>
  requires std::integral<T>
inline void u_store_le(unsigned char *dst, T val) noexcept {
  if constexpr (std::endian::native == std::endian::big) {
    val = std::byteswap(val);
  }
  std::memcpy(dst, &val, sizeof val);
}

/// Convert binary data to a hexadecimal string.
///
/// @param data
///    The data to convert.
/// @param upper
///    Value indicating whether upper-case digits should be used.
/// @return String of `2 * data.size()` hexadecimal digits.
[[gnu::visibility("internal")]]
std::string u_hex_encode(std::span<const unsigned char> data,
                         bool upper = false);

/// Convert a hexadecimal string to binary data.
///
/// @param str
///    The string to convert, of either case.
/// @param [out] data
///    Buffer that receives the data. @p str must have exactly
///    `2 * data.size()` digits.
/// @return Value indicating whether @p str is a valid hexadecimal string of
///    the right length.
[[gnu::visibility("internal")]]
bool u_hex_decode(std::string_view str, std::span<unsigned char> data) noexcept;

/// Compute SHA-1 digest of data.
///
/// @param data
///    The data to hash.
/// @param [out] hash
///    Variable that receives the digest.
/// @return Value indicating whether hashing succeeded.
[[gnu::visibility("internal")]]
bool u_sha1(std::span<const unsigned char> data, sha1_hash &hash) noexcept;

/// Check whether a string is well-formed UTF-8.
[[gnu::visibility("internal")]]
bool u_utf8_valid(std::string_view str) noexcept;

/// Check whether a string consists of 7-bit ASCII characters only.
[[gnu::visibility("internal")]]
bool u_is_ascii(std::string_view str) noexcept;

/// Convert UTF-16LE code units to a UTF-8 string.
///
/// @param units
///    Raw little-endian code units, its size must be even.
/// @param [out] str
///    String that the converted characters are appended to.
/// @return Value indicating whether @p units is well-formed UTF-16, i.e. has
///    no unpaired surrogates.
[[gnu::visibility("internal")]]
bool u_utf16le_to_utf8(std::span<const unsigned char> units, std::string &str);

/// Convert a UTF-8 string to UTF-16LE code units.
///
/// @param str
///    The string to convert, must be well-formed UTF-8.
/// @param [out] units
///    Vector that raw little-endian code units are appended to.
/// @return Number of code units appended.
[[gnu::visibility("internal")]]
std::size_t u_utf8_to_utf16le(std::string_view str,
                              std::vector<unsigned char> &units);

/// Inflate zlib-wrapped data.
///
/// @param data
///    Compressed data.
/// @param expected_size
///    Exact size of inflated data, 0 if unknown. Output buffer grows with the
///    actually inflated data, so a bogus value doesn't cause a large
///    allocation.
/// @param [out] out
///    Vector that receives inflated data. Its previous content is discarded.
/// @return Value indicating whether the stream was inflated completely and,
///    if @p expected_size is nonzero, to exactly that many bytes.
[[gnu::visibility("internal")]]
bool u_inflate(std::span<const unsigned char> data, std::size_t expected_size,
               std::vector<unsigned char> &out);

/// Deflate data into a zlib-wrapped stream.
///
/// @param data
///    Data to compress.
/// @param [out] out
///    Vector that receives compressed data. Its previous content is
///    discarded.
/// @return Value indicating whether compression succeeded.
[[gnu::visibility("internal")]]
bool u_deflate(std::span<const unsigned char> data,
               std::vector<unsigned char> &out);

} // namespace gamedepot
