//===-- utils.cpp - utility functions implementation ----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of utility functions declared in utils.hpp.
///
//===----------------------------------------------------------------------===//
#include "utils.hpp"

#include "zlib_api.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <openssl/evp.h>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gamedepot {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Get value of a hexadecimal digit.
///
/// @return Value of @p c, or -1 if it's not a hexadecimal digit.
static constexpr int hex_digit_val(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

/// Append a code point to a UTF-8 string.
static void append_utf8(std::string &str, char32_t cp) {
  if (cp < 0x80) {
    str.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    str.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    str.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    str.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    str.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    str.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    str.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

/// Append a UTF-16 code unit to a byte vector in little-endian order.
static void append_unit(std::vector<unsigned char> &units, char16_t unit) {
  units.push_back(static_cast<unsigned char>(unit));
  units.push_back(static_cast<unsigned char>(unit >> 8));
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

std::string u_hex_encode(std::span<const unsigned char> data, bool upper) {
  static constexpr char lower_digits[]{"0123456789abcdef"};
  static constexpr char upper_digits[]{"0123456789ABCDEF"};
  const auto digits{upper ? upper_digits : lower_digits};
  std::string str;
  str.reserve(data.size() * 2);
  for (const auto byte : data) {
    str.push_back(digits[byte >> 4]);
    str.push_back(digits[byte & 0xF]);
  }
  return str;
}

bool u_hex_decode(std::string_view str,
                  std::span<unsigned char> data) noexcept {
  if (str.length() != data.size() * 2) {
    return false;
  }
  for (std::size_t i{}; i < data.size(); ++i) {
    const int high{hex_digit_val(str[i * 2])};
    const int low{hex_digit_val(str[i * 2 + 1])};
    if (high < 0 || low < 0) {
      return false;
    }
    data[i] = static_cast<unsigned char>((high << 4) | low);
  }
  return true;
}

bool u_sha1(std::span<const unsigned char> data, sha1_hash &hash) noexcept {
  return EVP_Digest(data.data(), data.size(), hash.data(), nullptr,
                    EVP_sha1(), nullptr) == 1;
}

bool u_utf8_valid(std::string_view str) noexcept {
  const auto ustr{reinterpret_cast<const unsigned char *>(str.data())};
  for (std::size_t i{}; i < str.length();) {
    const unsigned char lead{ustr[i]};
    int num_cont;
    char32_t cp;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      num_cont = 1;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      num_cont = 2;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      num_cont = 3;
      cp = lead & 0x07;
    } else {
      return false;
    }
    if (static_cast<std::size_t>(num_cont) >= str.length() - i) {
      return false;
    }
    for (int j{1}; j <= num_cont; ++j) {
      const unsigned char cont{ustr[i + j]};
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }
    // Reject overlong forms, surrogates and out-of-range code points
    static constexpr char32_t min_cp[]{0, 0x80, 0x800, 0x10000};
    if (cp < min_cp[num_cont] || (cp >= 0xD800 && cp <= 0xDFFF) ||
        cp > 0x10FFFF) {
      return false;
    }
    i += num_cont + 1;
  }
  return true;
}

bool u_is_ascii(std::string_view str) noexcept {
  return std::ranges::all_of(
      str, [](auto c) { return static_cast<unsigned char>(c) < 0x80; });
}

bool u_utf16le_to_utf8(std::span<const unsigned char> units,
                       std::string &str) {
  const std::size_t num_units{units.size() / 2};
  str.reserve(str.length() + num_units);
  for (std::size_t i{}; i < num_units; ++i) {
    const char16_t unit{static_cast<char16_t>(units[i * 2] |
                                              (units[i * 2 + 1] << 8))};
    if (unit >= 0xDC00 && unit <= 0xDFFF) {
      // Low surrogate without a preceding high one
      return false;
    }
    if (unit < 0xD800 || unit > 0xDBFF) {
      append_utf8(str, unit);
      continue;
    }
    if (++i >= num_units) {
      return false;
    }
    const char16_t low{
        static_cast<char16_t>(units[i * 2] | (units[i * 2 + 1] << 8))};
    if (low < 0xDC00 || low > 0xDFFF) {
      return false;
    }
    append_utf8(str, 0x10000 + ((static_cast<char32_t>(unit - 0xD800) << 10) |
                                (low - 0xDC00)));
  }
  return true;
}

std::size_t u_utf8_to_utf16le(std::string_view str,
                              std::vector<unsigned char> &units) {
  const auto start_size{units.size()};
  const auto ustr{reinterpret_cast<const unsigned char *>(str.data())};
  for (std::size_t i{}; i < str.length();) {
    const unsigned char lead{ustr[i]};
    char32_t cp;
    int num_cont;
    if (lead < 0x80) {
      cp = lead;
      num_cont = 0;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      num_cont = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      num_cont = 2;
    } else {
      cp = lead & 0x07;
      num_cont = 3;
    }
    for (int j{1}; j <= num_cont; ++j) {
      cp = (cp << 6) | (ustr[i + j] & 0x3F);
    }
    i += num_cont + 1;
    if (cp < 0x10000) {
      append_unit(units, static_cast<char16_t>(cp));
    } else {
      cp -= 0x10000;
      append_unit(units, static_cast<char16_t>(0xD800 | (cp >> 10)));
      append_unit(units, static_cast<char16_t>(0xDC00 | (cp & 0x3FF)));
    }
  }
  return (units.size() - start_size) / 2;
}

bool u_inflate(std::span<const unsigned char> data, std::size_t expected_size,
               std::vector<unsigned char> &out) {
  gdi_z_stream stream{};
  if (gdi_z_inflateInit(&stream) != Z_OK) {
    return false;
  }
  // One byte past the expected size detects streams that inflate to more
  const std::size_t max_size{expected_size
                                 ? expected_size + 1
                                 : std::numeric_limits<unsigned>::max()};
  out.clear();
  out.resize(std::min(max_size, data.size() * 4 + 64));
  stream.next_in = data.data();
  stream.avail_in = static_cast<unsigned>(data.size());
  int res;
  for (;;) {
    stream.next_out = out.data() + stream.total_out;
    stream.avail_out = static_cast<unsigned>(out.size() - stream.total_out);
    res = gdi_z_inflate(&stream, Z_NO_FLUSH);
    if (res != Z_OK || (stream.avail_in == 0 && stream.avail_out != 0)) {
      break;
    }
    if (stream.avail_out == 0) {
      if (out.size() >= max_size) {
        break;
      }
      out.resize(std::min(max_size, out.size() * 2));
    }
  }
  out.resize(stream.total_out);
  gdi_z_inflateEnd(&stream);
  return res == Z_STREAM_END && (!expected_size || out.size() == expected_size);
}

bool u_deflate(std::span<const unsigned char> data,
               std::vector<unsigned char> &out) {
  gdi_z_stream stream{};
  if (gdi_z_deflateInit(&stream, Z_DEFAULT_COMPRESSION) != Z_OK) {
    return false;
  }
  out.resize(gdi_z_deflateBound(&stream, data.size()));
  stream.next_in = data.data();
  stream.avail_in = static_cast<unsigned>(data.size());
  stream.next_out = out.data();
  stream.avail_out = static_cast<unsigned>(out.size());
  const int res{gdi_z_deflate(&stream, Z_FINISH)};
  out.resize(stream.total_out);
  gdi_z_deflateEnd(&stream);
  return res == Z_STREAM_END;
}

} // namespace gamedepot
