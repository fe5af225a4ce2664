//===-- manifest.cpp - manifest queries implementation --------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::chunk_guid members, @ref
///    gamedepot::chunk_index and read-only manifest queries.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/manifest.hpp"

#include "utils.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fmt/format.h>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gamedepot {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Normalize path separators to '/'.
static std::string normalize_path(std::string_view path) {
  std::string res{path};
  std::ranges::replace(res, '\\', '/');
  return res;
}

/// Check whether two files have the same content.
static bool same_content(const file_manifest &left,
                         const file_manifest &right) noexcept {
  return left.hash == right.hash && left.file_size == right.file_size &&
         left.symlink_target == right.symlink_target;
}

} // namespace

//===-- chunk_guid members ------------------------------------------------===//

std::string chunk_guid::str() const {
  return fmt::format("{:08x}-{:08x}-{:08x}-{:08x}", words[0], words[1],
                     words[2], words[3]);
}

std::string chunk_guid::hex() const {
  return fmt::format("{:08X}{:08X}{:08X}{:08X}", words[0], words[1], words[2],
                     words[3]);
}

std::array<unsigned char, 16> chunk_guid::bytes() const noexcept {
  std::array<unsigned char, 16> res;
  for (int i{}; i < 4; ++i) {
    for (int j{}; j < 4; ++j) {
      res[i * 4 + j] = static_cast<unsigned char>(words[i] >> (j * 8));
    }
  }
  return res;
}

bool chunk_guid::parse(std::string_view str, chunk_guid &guid) noexcept {
  // 4 groups of 8 digits and 3 separators
  if (str.length() != 35) {
    return false;
  }
  for (int i{}; i < 4; ++i) {
    const auto group{str.substr(i * 9, 8)};
    if (i < 3 && str[i * 9 + 8] != '-') {
      return false;
    }
    if (!std::ranges::all_of(group, [](char c) {
          return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
                 (c >= 'A' && c <= 'F');
        })) {
      return false;
    }
    if (std::from_chars(group.data(), group.data() + group.length(),
                        guid.words[i], 16)
            .ec != std::errc{}) {
      return false;
    }
  }
  return true;
}

//===-- chunk_index members -----------------------------------------------===//

chunk_index::chunk_index(const manifest &man) {
  if (!man.chunks) {
    return;
  }
  chunks.reserve(man.chunks->elements.size());
  for (const auto &chunk : man.chunks->elements) {
    chunks.try_emplace(chunk.guid, &chunk);
  }
}

const chunk_info *chunk_index::find(const chunk_guid &guid) const noexcept {
  const auto it{chunks.find(guid)};
  return it == chunks.cend() ? nullptr : it->second;
}

const chunk_info *chunk_index::find(std::string_view guid_str) const noexcept {
  chunk_guid guid;
  if (!chunk_guid::parse(guid_str, guid)) {
    return nullptr;
  }
  return find(guid);
}

const chunk_info *chunk_index::find(__uint128_t guid_num) const noexcept {
  return find(chunk_guid{.words{static_cast<std::uint32_t>(guid_num >> 96),
                                static_cast<std::uint32_t>(guid_num >> 64),
                                static_cast<std::uint32_t>(guid_num >> 32),
                                static_cast<std::uint32_t>(guid_num)}});
}

//===-- Public functions --------------------------------------------------===//

std::string_view chunk_dir(std::int32_t version) noexcept {
  if (version >= 15) {
    return "ChunksV4";
  }
  if (version >= 6) {
    return "ChunksV3";
  }
  if (version >= 3) {
    return "ChunksV2";
  }
  return "Chunks";
}

std::string chunk_path(const chunk_info &chunk, std::string_view dir) {
  return fmt::format("{}/{:02}/{:016X}_{}.chunk", dir, chunk.group_num,
                     chunk.hash, chunk.guid.hex());
}

std::int64_t download_size(const manifest &man) noexcept {
  if (!man.chunks) {
    return 0;
  }
  std::int64_t size{};
  for (const auto &chunk : man.chunks->elements) {
    size += chunk.file_size;
  }
  return size;
}

std::int64_t installed_size(const manifest &man) noexcept {
  if (!man.files) {
    return 0;
  }
  std::int64_t size{};
  for (const auto &file : man.files->elements) {
    size += file.file_size;
  }
  return size;
}

std::vector<const file_manifest *> executable_files(const manifest &man) {
  std::vector<const file_manifest *> res;
  if (man.files) {
    for (const auto &file : man.files->elements) {
      if (file.executable()) {
        res.emplace_back(&file);
      }
    }
  }
  return res;
}

const file_manifest *find_file(const manifest &man, std::string_view path) {
  if (!man.files) {
    return nullptr;
  }
  const auto norm_path{normalize_path(path)};
  const auto it{std::ranges::find(man.files->elements, norm_path,
                                  &file_manifest::filename)};
  return it == man.files->elements.cend() ? nullptr : &*it;
}

std::vector<const file_manifest *>
files_for_tags(const manifest &man, std::span<const std::string> tags) {
  std::vector<const file_manifest *> res;
  if (!man.files) {
    return res;
  }
  for (const auto &file : man.files->elements) {
    if (file.install_tags.empty() ||
        std::ranges::any_of(file.install_tags, [tags](const auto &tag) {
          return std::ranges::find(tags, tag) != tags.end();
        })) {
      res.emplace_back(&file);
    }
  }
  return res;
}

manifest_comparison compare(const manifest &old_man, const manifest &new_man) {
  manifest_comparison res;
  std::unordered_map<std::string_view, const file_manifest *> old_files;
  if (old_man.files) {
    old_files.reserve(old_man.files->elements.size());
    for (const auto &file : old_man.files->elements) {
      old_files.emplace(file.filename, &file);
    }
  }
  std::unordered_set<chunk_guid, chunk_guid_hash> needed;
  if (new_man.files) {
    for (const auto &file : new_man.files->elements) {
      const auto it{old_files.find(file.filename)};
      if (it == old_files.end()) {
        res.added.emplace_back(file.filename);
      } else {
        const bool unchanged{same_content(*it->second, file)};
        old_files.erase(it);
        if (unchanged) {
          res.unchanged.emplace_back(file.filename);
          continue;
        }
        res.modified.emplace_back(file.filename);
      }
      for (const auto &part : file.chunk_parts) {
        needed.emplace(part.guid);
      }
    }
  }
  if (old_man.files) {
    // Keep removed files in old manifest's order
    for (const auto &file : old_man.files->elements) {
      if (old_files.contains(file.filename)) {
        res.removed.emplace_back(file.filename);
      }
    }
  }
  if (new_man.chunks) {
    for (const auto &chunk : new_man.chunks->elements) {
      if (needed.contains(chunk.guid)) {
        res.needed_chunks.emplace_back(chunk.guid);
      }
    }
  }
  return res;
}

bool verify_manifest_hash(std::span<const unsigned char> data,
                          std::string_view expected_hex) {
  sha1_hash expected;
  if (!u_hex_decode(expected_hex, expected)) {
    return false;
  }
  sha1_hash actual;
  if (!u_sha1(data, actual)) {
    return false;
  }
  return actual == expected;
}

} // namespace gamedepot
