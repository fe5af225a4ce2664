//===-- manifest.hpp - content manifest model declarations ----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of content manifest types and read-only queries over them.
///
/// A manifest lists every file of a build and the content-addressed chunks
///    that the file is reconstructed from. Chunks are identified by 128-bit
///    GUIDs and are shared between any number of files that reference
///    overlapping byte ranges of them, which deduplicates both storage and
///    download size.
/// Manifests are decoded once and are immutable afterwards; consumers share
///    them via `std::shared_ptr<const manifest>`.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.hpp"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gamedepot {

//===-- Common types ------------------------------------------------------===//

/// SHA-1 digest.
using sha1_hash = std::array<unsigned char, 20>;
/// MD5 digest.
using md5_hash = std::array<unsigned char, 16>;
/// SHA-256 digest.
using sha256_hash = std::array<unsigned char, 32>;

/// 128-bit chunk identifier, stored as four 32-bit words in wire order.
struct chunk_guid {
  std::array<std::uint32_t, 4> words;

  /// Get canonical string form of the GUID: the four words as lower-case
  ///    8-digit hexadecimal numbers joined by '-'.
  [[gnu::GAMEDEPOT_API]] std::string str() const;
  /// Get the GUID as 32 upper-case hexadecimal digits without separators,
  ///    the form used in chunk file names.
  [[gnu::GAMEDEPOT_API]] std::string hex() const;
  /// Get the GUID as raw bytes, each word serialized little-endian.
  [[gnu::GAMEDEPOT_API]] std::array<unsigned char, 16> bytes() const noexcept;
  /// Get the GUID as a single 128-bit number, the first word being the most
  ///    significant.
  constexpr __uint128_t num() const noexcept {
    return (static_cast<__uint128_t>(words[0]) << 96) |
           (static_cast<__uint128_t>(words[1]) << 64) |
           (static_cast<__uint128_t>(words[2]) << 32) | words[3];
  }

  /// Parse canonical string form of a GUID. Upper-case digits are accepted.
  ///
  /// @param str
  ///    The string to parse.
  /// @param [out] guid
  ///    Variable that receives the parsed GUID on success.
  /// @return Value indicating whether @p str is a valid GUID string.
  [[gnu::GAMEDEPOT_API]] static bool parse(std::string_view str,
                                           chunk_guid &guid) noexcept;

  friend constexpr auto operator<=>(const chunk_guid &,
                                    const chunk_guid &) = default;
};

/// Hasher for @ref chunk_guid keys.
struct chunk_guid_hash {
  constexpr std::size_t operator()(const chunk_guid &guid) const noexcept {
    // Words are random, folding them is enough
    return (static_cast<std::size_t>(guid.words[0] ^ guid.words[2]) << 32) |
           (guid.words[1] ^ guid.words[3]);
  }
};

//===-- Manifest types ----------------------------------------------------===//

/// Build metadata block.
/// Fields introduced at a later data version keep their default values when
///    decoding older blocks.
struct manifest_meta {
  /// Version of the block's own layout.
  std::uint8_t data_version = 0;
  /// Feature level of the build tools that produced the manifest.
  std::int32_t feature_level = 18;
  /// Value indicating whether the build was produced in file data mode
  ///    rather than chunk mode.
  bool is_file_data = false;
  /// Numeric application ID.
  std::uint32_t app_id = 0;
  std::string app_name;
  std::string build_version;
  /// Relative path to the executable to launch.
  std::string launch_exe;
  /// Command line arguments to pass to @ref launch_exe.
  std::string launch_command;
  /// IDs of prerequisites that must be installed before launching.
  std::vector<std::string> prereq_ids;
  std::string prereq_name;
  std::string prereq_path;
  std::string prereq_args;
  /// Unique build ID, present since data version 1.
  std::string build_id;
  /// Uninstall action executable path, present since data version 2.
  std::string uninstall_action_path;
  /// Uninstall action arguments, present since data version 2.
  std::string uninstall_action_args;

  friend bool operator==(const manifest_meta &,
                         const manifest_meta &) = default;
};

/// Chunk entry of a manifest.
struct chunk_info {
  /// Identifier of the chunk.
  chunk_guid guid;
  /// 64-bit rolling hash of chunk data, used for deduplication lookups.
  std::uint64_t hash;
  /// SHA-1 digest of uncompressed chunk data.
  sha1_hash sha_hash;
  /// Storage group number that the chunk is placed into on the server.
  std::uint8_t group_num;
  /// Size of uncompressed chunk data, in bytes.
  std::uint32_t window_size;
  /// Size of the chunk file as stored on the server, in bytes.
  std::int64_t file_size;

  /// Get canonical string form of @ref guid.
  std::string guid_str() const { return guid.str(); }

  friend bool operator==(const chunk_info &, const chunk_info &) = default;
};

/// Chunk data list block.
struct chunk_data_list {
  /// Version of the block's own layout.
  std::uint8_t version = 0;
  /// Declared number of elements.
  std::uint32_t count = 0;
  std::vector<chunk_info> elements;

  friend bool operator==(const chunk_data_list &,
                         const chunk_data_list &) = default;
};

/// Flags that may be applied to manifest files.
enum file_flag : std::uint8_t {
  /// No flags.
  FILE_FLAG_none,
  /// The file should be read-only.
  FILE_FLAG_read_only = 1 << 0,
  /// The file is stored compressed.
  FILE_FLAG_compressed = 1 << 1,
  /// The file should have execute permission.
  FILE_FLAG_executable = 1 << 2
};

/// Slice of a chunk that is written into a file.
struct chunk_part {
  /// Identifier of the chunk that the data is taken from.
  chunk_guid guid;
  /// Offset of the slice from the beginning of uncompressed chunk data, in
  ///    bytes.
  std::uint32_t offset;
  /// Size of the slice, in bytes.
  std::uint32_t size;
  /// Offset in the reconstructed file where the slice is written, in bytes.
  std::uint64_t file_offset;

  /// Get canonical string form of @ref guid.
  std::string guid_str() const { return guid.str(); }

  friend bool operator==(const chunk_part &, const chunk_part &) = default;
};

/// File entry of a manifest.
struct file_manifest {
  /// Path of the file relative to installation root, using '/' separators.
  std::string filename;
  /// Symbolic link target, empty when the file is not a symbolic link.
  std::string symlink_target;
  /// SHA-1 digest of file data.
  sha1_hash hash{};
  /// MD5 digest of file data, all zeros when absent.
  md5_hash hash_md5{};
  /// SHA-256 digest of file data, all zeros when absent.
  sha256_hash hash_sha256{};
  /// Combination of @ref file_flag values.
  std::uint8_t flags = FILE_FLAG_none;
  /// Install tags of the file. Empty list means that the file is always
  ///    installed.
  std::vector<std::string> install_tags;
  /// Total size of the reconstructed file, in bytes.
  std::int64_t file_size = 0;
  std::string mime_type;
  /// Chunk parts composing the file, ordered by `file_offset`.
  std::vector<chunk_part> chunk_parts;

  bool read_only() const noexcept { return flags & FILE_FLAG_read_only; }
  bool compressed() const noexcept { return flags & FILE_FLAG_compressed; }
  bool executable() const noexcept { return flags & FILE_FLAG_executable; }

  friend bool operator==(const file_manifest &,
                         const file_manifest &) = default;
};

/// File manifest list block.
struct file_manifest_list {
  /// Version of the block's own layout.
  std::uint8_t version = 0;
  /// Declared number of elements.
  std::uint32_t count = 0;
  std::vector<file_manifest> elements;

  friend bool operator==(const file_manifest_list &,
                         const file_manifest_list &) = default;
};

/// Content manifest.
struct manifest {
  /// Format revision (feature level) of the manifest.
  std::int32_t version = 18;
  /// Size of the binary header, in bytes.
  std::uint32_t header_size = 41;
  /// Value indicating whether binary manifest body is zlib-compressed.
  bool is_compressed = false;
  std::optional<manifest_meta> meta;
  std::optional<chunk_data_list> chunks;
  std::optional<file_manifest_list> files;
  std::optional<std::map<std::string, std::string>> custom_fields;

  friend bool operator==(const manifest &, const manifest &) = default;
};

/// Result of comparing two manifests of the same product.
struct manifest_comparison {
  /// Names of files present only in the new manifest.
  std::vector<std::string> added;
  /// Names of files present only in the old manifest.
  std::vector<std::string> removed;
  /// Names of files present in both manifests with different content.
  std::vector<std::string> modified;
  /// Names of files present in both manifests with identical content.
  std::vector<std::string> unchanged;
  /// GUIDs of new manifest's chunks referenced by added or modified files,
  ///    in chunk data list order.
  std::vector<chunk_guid> needed_chunks;
};

//===-- Chunk index -------------------------------------------------------===//

/// Lookup index over chunk entries of a manifest. Holds pointers into the
///    manifest, which must outlive the index.
class chunk_index {
public:
  [[gnu::GAMEDEPOT_API]] explicit chunk_index(const manifest &man);

  /// Find chunk entry by its GUID.
  ///
  /// @return Pointer to the chunk entry, or `nullptr` if not found.
  [[gnu::GAMEDEPOT_API]] const chunk_info *
  find(const chunk_guid &guid) const noexcept;
  /// Find chunk entry by canonical string form of its GUID, compared
  ///    case-insensitively.
  ///
  /// @return Pointer to the chunk entry, or `nullptr` if not found.
  [[gnu::GAMEDEPOT_API]] const chunk_info *
  find(std::string_view guid_str) const noexcept;
  /// Find chunk entry by its GUID as a 128-bit number.
  ///
  /// @return Pointer to the chunk entry, or `nullptr` if not found.
  [[gnu::GAMEDEPOT_API]] const chunk_info *
  find(__uint128_t guid_num) const noexcept;

  std::size_t size() const noexcept { return chunks.size(); }

private:
  std::unordered_map<chunk_guid, const chunk_info *, chunk_guid_hash> chunks;
};

//===-- Functions ---------------------------------------------------------===//

/// Get name of the server directory that stores chunks for specified manifest
///    version.
///
/// @param version
///    Manifest format revision.
/// @return "ChunksV4", "ChunksV3", "ChunksV2" or "Chunks".
[[gnu::GAMEDEPOT_API]] std::string_view
chunk_dir(std::int32_t version) noexcept;

/// Get path of a chunk file relative to the CDN base URL.
///
/// @param [in] chunk
///    The chunk entry to get path for.
/// @param dir
///    Chunk directory name, see @ref chunk_dir.
/// @return Path in "{dir}/{group:02}/{hash:016X}_{GUID}.chunk" form.
[[gnu::GAMEDEPOT_API]] std::string chunk_path(const chunk_info &chunk,
                                              std::string_view dir);

/// Get total download size of a manifest, that is the sum of its chunks'
///    file sizes.
[[gnu::GAMEDEPOT_API]] std::int64_t download_size(const manifest &man) noexcept;

/// Get total installed size of a manifest, that is the sum of its files'
///    sizes.
[[gnu::GAMEDEPOT_API]] std::int64_t
installed_size(const manifest &man) noexcept;

/// Get all files of a manifest that have @ref FILE_FLAG_executable set.
[[gnu::GAMEDEPOT_API]] std::vector<const file_manifest *>
executable_files(const manifest &man);

/// Find file entry by its path.
///
/// @param [in] man
///    The manifest to search in.
/// @param path
///    Path of the file, either '/' or '\\' separators are accepted.
/// @return Pointer to the file entry, or `nullptr` if not found.
[[gnu::GAMEDEPOT_API]] const file_manifest *find_file(const manifest &man,
                                                      std::string_view path);

/// Select files that should be installed for specified set of install tags.
///    Files with no tags are always selected.
[[gnu::GAMEDEPOT_API]] std::vector<const file_manifest *>
files_for_tags(const manifest &man, std::span<const std::string> tags);

/// Compare two manifests of the same product.
///
/// @param [in] old_man
///    The currently installed manifest.
/// @param [in] new_man
///    The manifest to update to.
/// @return Comparison result.
[[gnu::GAMEDEPOT_API]] manifest_comparison compare(const manifest &old_man,
                                                   const manifest &new_man);

/// Check that SHA-1 digest of raw manifest bytes matches the expected one.
///
/// @param data
///    Raw manifest bytes as downloaded.
/// @param expected_hex
///    Expected SHA-1 digest as a hexadecimal string, compared
///    case-insensitively.
/// @return Value indicating whether the digests match.
[[gnu::GAMEDEPOT_API]] bool
verify_manifest_hash(std::span<const unsigned char> data,
                     std::string_view expected_hex);

} // namespace gamedepot
