//===-- test_codec.cpp - manifest codec tests -----------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Tests for binary and JSON manifest codecs.
///
//===----------------------------------------------------------------------===//
#include "fixtures.hpp"
#include "gamedepot/codec.hpp"
#include "gamedepot/error.hpp"
#include "gamedepot/manifest.hpp"
#include "utils.hpp"

#include <algorithm>
#include <catch2/catch.hpp>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace gamedepot;

namespace {

std::vector<unsigned char> encode(const manifest &man) {
  std::vector<unsigned char> data;
  const auto res{encode_binary(man, data)};
  REQUIRE(err_success(res));
  return data;
}

std::span<const unsigned char> as_bytes(const std::string &str) {
  return {reinterpret_cast<const unsigned char *>(str.data()), str.size()};
}

/// Offset of the body digest in the header.
constexpr std::size_t digest_offset{16};
/// Size of the header written by the encoder.
constexpr std::size_t header_size{41};

/// Recompute body digest of an uncompressed manifest after patching its body.
void reseal(std::vector<unsigned char> &data) {
  sha1_hash digest;
  REQUIRE(u_sha1(std::span{data}.subspan(header_size), digest));
  std::ranges::copy(digest, data.begin() + digest_offset);
}

/// Find the first occurrence of a byte sequence in encoded data.
std::size_t find_bytes(const std::vector<unsigned char> &data,
                       std::initializer_list<unsigned char> bytes) {
  const auto it{std::ranges::search(data, bytes).begin()};
  REQUIRE(it != data.end());
  return static_cast<std::size_t>(it - data.begin());
}

void require_encode_err(const manifest &man, errc aux) {
  std::vector<unsigned char> data;
  const auto res{encode_binary(man, data)};
  REQUIRE(res.type == err_type::sub);
  REQUIRE(res.primary == errc::manifest_encode);
  REQUIRE(res.auxiliary == static_cast<int>(aux));
}

void require_decode_err(const err &res, errc aux) {
  REQUIRE(res.type == err_type::sub);
  REQUIRE(res.primary == errc::manifest_decode);
  REQUIRE(res.auxiliary == static_cast<int>(aux));
}

} // namespace

TEST_CASE("Binary manifest survives encoding and decoding") {
  auto man{test::sample_manifest()};
  SECTION("uncompressed") { man.is_compressed = false; }
  SECTION("compressed") { man.is_compressed = true; }
  SECTION("with padded header") { man.header_size = 64; }
  const auto data{encode(man)};
  REQUIRE(detect_format(data) == manifest_format::binary);
  manifest decoded;
  REQUIRE(err_success(decode_binary(data, decoded)));
  REQUIRE(decoded == man);
}

TEST_CASE("Decoding the same buffer twice yields equal independent values") {
  const auto data{encode(test::sample_manifest())};
  manifest first, second;
  REQUIRE(err_success(detect_and_decode(data, first)));
  REQUIRE(err_success(detect_and_decode(data, second)));
  REQUIRE(first == second);
  first.files->elements.front().filename = "changed";
  REQUIRE(second.files->elements.front().filename == "bin/sample.exe");
}

TEST_CASE("Non-ASCII strings are stored as UTF-16") {
  auto man{test::sample_manifest()};
  man.files->elements.back().filename = "données/straße.txt";
  man.meta->app_name = "Ünïcode ✓";
  const auto data{encode(man)};
  const std::string_view utf8_name{"straße"};
  REQUIRE(std::ranges::search(data, utf8_name, {}, {}, [](char c) {
            return static_cast<unsigned char>(c);
          }).empty());
  manifest decoded;
  REQUIRE(err_success(decode_binary(data, decoded)));
  REQUIRE(decoded.files->elements.back().filename == "données/straße.txt");
  REQUIRE(decoded.meta->app_name == "Ünïcode ✓");
}

TEST_CASE("Trailing blocks may be absent") {
  auto man{test::sample_manifest()};
  man.custom_fields.reset();
  man.files.reset();
  const auto data{encode(man)};
  manifest decoded;
  REQUIRE(err_success(decode_binary(data, decoded)));
  REQUIRE(decoded.meta);
  REQUIRE(decoded.chunks);
  REQUIRE_FALSE(decoded.files);
  REQUIRE_FALSE(decoded.custom_fields);
}

TEST_CASE("Encoding rejects a block gap") {
  auto man{test::sample_manifest()};
  man.chunks.reset();
  std::vector<unsigned char> data;
  const auto res{encode_binary(man, data)};
  REQUIRE(res.primary == errc::manifest_encode);
  REQUIRE(res.auxiliary == static_cast<int>(errc::invalid_data));
}

TEST_CASE("Encoding rejects old versions") {
  auto man{test::sample_manifest()};
  man.version = 13;
  std::vector<unsigned char> data;
  const auto res{encode_binary(man, data)};
  REQUIRE(res.primary == errc::manifest_encode);
  REQUIRE(res.auxiliary == static_cast<int>(errc::unsupported_version));
}

TEST_CASE("Malformed binary manifests are rejected") {
  auto data{encode(test::sample_manifest())};
  manifest decoded;
  SECTION("empty input") {
    require_decode_err(decode_binary({}, decoded), errc::truncated_input);
  }
  SECTION("truncated header") {
    data.resize(20);
    require_decode_err(decode_binary(data, decoded), errc::truncated_input);
  }
  SECTION("truncated body") {
    data.pop_back();
    require_decode_err(decode_binary(data, decoded), errc::truncated_input);
  }
  SECTION("wrong magic") {
    data[0] ^= 0xFF;
    REQUIRE(detect_format(data) == manifest_format::json);
    require_decode_err(decode_binary(data, decoded), errc::invalid_magic);
  }
  SECTION("version below 14") {
    u_store_le(&data[37], std::int32_t{13});
    require_decode_err(decode_binary(data, decoded),
                       errc::unsupported_version);
  }
  SECTION("body digest mismatch") {
    data.back() ^= 0x01;
    require_decode_err(decode_binary(data, decoded),
                       errc::body_digest_mismatch);
  }
  SECTION("corrupted compressed body") {
    auto man{test::sample_manifest()};
    man.is_compressed = true;
    data = encode(man);
    // Break the zlib stream header
    data[41] ^= 0xFF;
    require_decode_err(decode_binary(data, decoded), errc::decompression);
  }
  SECTION("partial version field") {
    u_store_le(&data[4], std::uint32_t{39});
    require_decode_err(decode_binary(data, decoded), errc::invalid_data);
  }
}

TEST_CASE("Inflated body size must match the header") {
  auto man{test::sample_manifest()};
  man.is_compressed = true;
  auto data{encode(man)};
  const auto size_uncompressed{u_load_le<std::uint32_t>(&data[8])};
  manifest decoded;
  SECTION("huge declared size") {
    // Must fail without allocating the declared size
    u_store_le(&data[8], std::uint32_t{0xF0000000});
    require_decode_err(decode_binary(data, decoded), errc::decompression);
  }
  SECTION("smaller declared size") {
    u_store_le(&data[8], size_uncompressed - 1);
    require_decode_err(decode_binary(data, decoded), errc::decompression);
  }
  SECTION("larger declared size") {
    u_store_le(&data[8], size_uncompressed + 1);
    require_decode_err(decode_binary(data, decoded), errc::decompression);
  }
}

TEST_CASE("Binary strings must be well-formed") {
  auto man{test::sample_manifest()};
  manifest decoded;
  SECTION("invalid UTF-8 in a single-byte string") {
    auto data{encode(man)};
    data[find_bytes(data, {'r', 'e', 'a', 'd', 'm', 'e'})] = 0xFF;
    reseal(data);
    require_decode_err(decode_binary(data, decoded), errc::malformed_utf8);
  }
  SECTION("unpaired surrogate in a UTF-16 string") {
    // U+03A9 is written as a single UTF-16 unit
    man.files->elements.back().filename = "\u03A9readme.txt";
    auto data{encode(man)};
    const auto pos{find_bytes(data, {0xA9, 0x03, 'r', 0x00})};
    data[pos] = 0x00;
    data[pos + 1] = 0xD8;
    reseal(data);
    require_decode_err(decode_binary(data, decoded), errc::malformed_utf8);
  }
  SECTION("missing terminator") {
    auto data{encode(man)};
    const auto pos{find_bytes(data, {'t', 'e', 'x', 't', '/', 'p', 'l', 'a',
                                     'i', 'n', 0x00})};
    data[pos + 10] = 'x';
    reseal(data);
    require_decode_err(decode_binary(data, decoded), errc::malformed_utf8);
  }
}

TEST_CASE("Encoding rejects fields that block versions can't carry") {
  auto man{test::sample_manifest()};
  SECTION("build ID in meta version 0") { man.meta->data_version = 0; }
  SECTION("uninstall action in meta version 1") {
    man.meta->data_version = 1;
  }
  SECTION("MD5 and MIME type in file list version 0") {
    man.files->version = 0;
  }
  SECTION("SHA-256 in file list version 1") {
    man.files->version = 1;
    man.files->elements.front().hash_sha256[0] = 0x5A;
  }
  require_encode_err(man, errc::invalid_data);
}

TEST_CASE("JSON manifest survives encoding and decoding") {
  const auto man{test::sample_manifest()};
  std::string json;
  REQUIRE(err_success(encode_json(man, json)));
  REQUIRE(detect_format(as_bytes(json)) == manifest_format::json);
  manifest decoded;
  REQUIRE(err_success(detect_and_decode(as_bytes(json), decoded)));
  REQUIRE(decoded == man);
}

TEST_CASE("JSON decoding accepts alternative layouts") {
  const std::string json{R"({
    "version": 18,
    "meta": {"appName": "Sample", "appId": "1207658924"},
    "chunkDataList": {
      "version": 0,
      "elements": [{
        "guidStr": "11111111-22222222-33333333-44444444",
        "hash": 1234, "windowSize": 1048576, "fileSize": 100
      }]
    },
    "fileManifestList": {
      "version": 0,
      "elements": [{
        "filename": "bin\\game.exe",
        "flags": 4,
        "chunkParts": [
          {"guid": [286331153, 572662306, 858993459, 1145324612],
           "offset": 0, "size": 10},
          {"guid": [286331153, 572662306, 858993459, 1145324612],
           "offset": 10, "size": 20}
        ]
      }]
    },
    "customFields": null
  })"};
  manifest decoded;
  REQUIRE(err_success(decode_json(as_bytes(json), decoded)));
  REQUIRE(decoded.meta->app_id == 1207658924);
  REQUIRE(decoded.chunks->count == 1);
  REQUIRE(decoded.chunks->elements.front().guid == test::guid_a);
  REQUIRE(decoded.chunks->elements.front().hash == 1234);
  const auto &file{decoded.files->elements.front()};
  REQUIRE(file.filename == "bin/game.exe");
  REQUIRE(file.executable());
  REQUIRE(file.file_size == 30);
  REQUIRE(file.chunk_parts[1].file_offset == 10);
  REQUIRE_FALSE(decoded.custom_fields);
}

TEST_CASE("JSON GUID representations must agree") {
  const std::string json{R"({
    "chunkDataList": {
      "version": 0,
      "chunks": [{
        "guid": [1, 2, 3, 4],
        "guidStr": "00000001-00000002-00000003-00000005",
        "windowSize": 1048576
      }]
    }
  })"};
  manifest decoded;
  const auto res{decode_json(as_bytes(json), decoded)};
  REQUIRE(res.type == err_type::invariant);
  REQUIRE(res.primary == errc::manifest_decode);
  REQUIRE(res.auxiliary == static_cast<int>(invariant::guid_mismatch));
}

TEST_CASE("Malformed JSON manifests are rejected") {
  manifest decoded;
  SECTION("empty input") {
    require_decode_err(decode_json({}, decoded), errc::invalid_data);
  }
  SECTION("syntax error") {
    const std::string json{R"({"version": )"};
    require_decode_err(decode_json(as_bytes(json), decoded),
                       errc::invalid_data);
  }
  SECTION("wrong member type") {
    const std::string json{R"({"chunkDataList": {"version": "zero"}})"};
    require_decode_err(decode_json(as_bytes(json), decoded),
                       errc::invalid_data);
  }
  SECTION("invalid UTF-8") {
    const std::string json{"{\"fileManifestList\": {\"version\": 0, "
                           "\"files\": [{\"filename\": \"bad\xFF\"}]}}"};
    require_decode_err(decode_json(as_bytes(json), decoded),
                       errc::malformed_utf8);
  }
  SECTION("dangling chunk reference") {
    const std::string json{R"({
      "chunkDataList": {"version": 0, "chunks": []},
      "fileManifestList": {"version": 0, "files": [{
        "filename": "a.bin",
        "chunkParts": [{"guidStr": "00000001-00000002-00000003-00000004",
                        "offset": 0, "size": 1}]
      }]}
    })"};
    const auto res{decode_json(as_bytes(json), decoded)};
    REQUIRE(res.type == err_type::invariant);
    REQUIRE(res.primary == errc::manifest_decode);
    REQUIRE(res.auxiliary == static_cast<int>(invariant::dangling_reference));
  }
}
