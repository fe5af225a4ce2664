//===-- test_roundtrip.cpp - randomized manifest codec tests --------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Encoding and decoding of seeded random manifests in both formats.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/codec.hpp"
#include "gamedepot/error.hpp"
#include "gamedepot/manifest.hpp"

#include <array>
#include <catch2/catch.hpp>
#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace gamedepot;

namespace {

/// Number of seeds to run per format.
constexpr std::uint32_t num_seeds{200};

/// Random manifest generator producing models that pass validation.
class manifest_gen {
public:
  explicit manifest_gen(std::uint32_t seed) : rng(seed) {}

  manifest make() {
    manifest man;
    man.version = num<std::int32_t>(14, 21);
    man.is_compressed = num(0, 1);
    const int num_blocks{num(0, 4)};
    if (num_blocks >= 1) {
      man.meta = make_meta();
    }
    if (num_blocks >= 2) {
      auto &cdl{man.chunks.emplace()};
      cdl.version = num<std::uint8_t>(0, 3);
      const int num_chunks{num(0, 6)};
      for (int i{}; i < num_chunks; ++i) {
        cdl.elements.emplace_back(make_chunk(static_cast<std::uint32_t>(i)));
      }
      cdl.count = static_cast<std::uint32_t>(cdl.elements.size());
    }
    if (num_blocks >= 3) {
      auto &fml{man.files.emplace()};
      fml.version = num<std::uint8_t>(0, 2);
      const int num_files{num(0, 5)};
      for (int i{}; i < num_files; ++i) {
        fml.elements.emplace_back(make_file(fml.version, man.chunks->elements));
      }
      fml.count = static_cast<std::uint32_t>(fml.elements.size());
    }
    if (num_blocks >= 4) {
      auto &fields{man.custom_fields.emplace()};
      const int num_fields{num(0, 3)};
      for (int i{}; i < num_fields; ++i) {
        fields.insert_or_assign(str(), str());
      }
    }
    return man;
  }

private:
  std::mt19937 rng;

  template <typename T = int> T num(T min, T max) {
    return static_cast<T>(std::uniform_int_distribution<std::int64_t>{
        static_cast<std::int64_t>(min), static_cast<std::int64_t>(max)}(rng));
  }

  template <typename T> void fill(T &bytes) {
    for (auto &byte : bytes) {
      byte = num<unsigned char>(0, 255);
    }
  }

  /// Build a string from ASCII and non-ASCII fragments, including characters
  ///    outside of the Basic Multilingual Plane.
  std::string str() {
    static constexpr std::array<std::string_view, 10> fragments{
        "bin", "data", "/", "x", " ", "_01", "é", "Ω", "日",
        "\U0001F600"};
    std::string res;
    const int len{num(0, 4)};
    for (int i{}; i < len; ++i) {
      res.append(fragments[num<std::size_t>(0, fragments.size() - 1)]);
    }
    return res;
  }

  manifest_meta make_meta() {
    manifest_meta meta;
    meta.data_version = num<std::uint8_t>(0, 2);
    meta.feature_level = num<std::int32_t>(-1, 21);
    meta.is_file_data = num(0, 1);
    meta.app_id = num<std::uint32_t>(0, 0xFFFFFFFF);
    meta.app_name = str();
    meta.build_version = str();
    meta.launch_exe = str();
    meta.launch_command = str();
    const int num_prereqs{num(0, 2)};
    for (int i{}; i < num_prereqs; ++i) {
      meta.prereq_ids.emplace_back(str());
    }
    meta.prereq_name = str();
    meta.prereq_path = str();
    meta.prereq_args = str();
    if (meta.data_version >= 1) {
      meta.build_id = str();
    }
    if (meta.data_version >= 2) {
      meta.uninstall_action_path = str();
      meta.uninstall_action_args = str();
    }
    return meta;
  }

  /// Make a chunk, its GUID is unique for every @p index.
  chunk_info make_chunk(std::uint32_t index) {
    chunk_info chunk{.guid{.words{index + 1, num<std::uint32_t>(0, 0xFFFFFFFF),
                                  num<std::uint32_t>(0, 0xFFFFFFFF),
                                  num<std::uint32_t>(0, 0xFFFFFFFF)}},
                     .hash = num<std::uint64_t>(0, 0x7FFFFFFFFFFFFFFF),
                     .sha_hash{},
                     .group_num = num<std::uint8_t>(0, 99),
                     .window_size = num<std::uint32_t>(1, 1048576),
                     .file_size = num<std::int64_t>(0, 1048576)};
    fill(chunk.sha_hash);
    return chunk;
  }

  file_manifest make_file(std::uint8_t version,
                          std::span<const chunk_info> chunks) {
    file_manifest file;
    file.filename = str();
    if (num(0, 3) == 0) {
      file.symlink_target = str();
    }
    fill(file.hash);
    file.flags = num<std::uint8_t>(0, 255);
    const int num_tags{num(0, 2)};
    for (int i{}; i < num_tags; ++i) {
      file.install_tags.emplace_back(str());
    }
    if (!chunks.empty()) {
      const int num_parts{num(0, 4)};
      std::uint64_t file_offset{};
      for (int i{}; i < num_parts; ++i) {
        const auto &chunk{chunks[num<std::size_t>(0, chunks.size() - 1)]};
        const auto offset{num<std::uint32_t>(0, chunk.window_size - 1)};
        const auto size{num<std::uint32_t>(0, chunk.window_size - offset)};
        file.chunk_parts.push_back({.guid = chunk.guid,
                                    .offset = offset,
                                    .size = size,
                                    .file_offset = file_offset});
        file_offset += size;
      }
      file.file_size = static_cast<std::int64_t>(file_offset);
    }
    if (version >= 1) {
      if (num(0, 1)) {
        fill(file.hash_md5);
      }
      file.mime_type = str();
    }
    if (version >= 2) {
      fill(file.hash_sha256);
    }
    return file;
  }
};

} // namespace

TEST_CASE("Random manifests survive binary encoding and decoding") {
  for (std::uint32_t seed{1}; seed <= num_seeds; ++seed) {
    INFO("seed " << seed);
    const auto man{manifest_gen{seed}.make()};
    std::vector<unsigned char> data;
    REQUIRE(err_success(encode_binary(man, data)));
    manifest decoded;
    REQUIRE(err_success(decode_binary(data, decoded)));
    REQUIRE(decoded == man);
  }
}

TEST_CASE("Random manifests survive JSON encoding and decoding") {
  for (std::uint32_t seed{1}; seed <= num_seeds; ++seed) {
    INFO("seed " << seed);
    const auto man{manifest_gen{seed}.make()};
    std::string json;
    REQUIRE(err_success(encode_json(man, json)));
    manifest decoded;
    REQUIRE(err_success(decode_json(
        {reinterpret_cast<const unsigned char *>(json.data()), json.size()},
        decoded)));
    REQUIRE(decoded == man);
  }
}
