//===-- manifest_binary.cpp - binary manifest decoding and encoding -------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::decode_binary and
///    @ref gamedepot::encode_binary.
///
/// Binary manifests consist of a fixed header followed by an optionally
///    zlib-compressed body. The body is a sequence of size-prefixed blocks,
///    each with its own version byte, and every list in a block is stored
///    column-wise: all values of the first field for every element, then all
///    values of the second field, and so on. Block size prefixes let newer
///    block versions append fields that older readers skip.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/codec.hpp"

#include "common/error.hpp"
#include "gamedepot/error.hpp"
#include "gamedepot/manifest.hpp"
#include "utils.hpp"

#include <algorithm>
#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gamedepot {

namespace {

//===-- Private constants -------------------------------------------------===//

/// Size of the header that has no version field.
static constexpr std::uint32_t header_size_no_version = 37;
/// Size of the header with version field, as written by @ref encode_binary.
static constexpr std::uint32_t header_size_full = 41;
/// Feature level implied by the header without version field.
static constexpr std::int32_t implied_version = 9;
/// Size of a block prefix: size field and version byte.
static constexpr std::size_t block_prefix_size = 5;
/// Size of a serialized chunk part.
static constexpr std::uint32_t chunk_part_size = 28;

//===-- Private types -----------------------------------------------------===//

/// Bounded little-endian reader over a byte span.
class byte_reader {
public:
  explicit byte_reader(std::span<const unsigned char> data) : data(data) {}

  std::size_t pos() const noexcept { return cur; }
  std::size_t remaining() const noexcept { return data.size() - cur; }

  /// Read an integral value.
  template <typename T>
    requires std::integral<T>
  [[nodiscard]] bool read(T &val) noexcept {
    if (remaining() < sizeof val) {
      return false;
    }
    val = u_load_le<T>(&data[cur]);
    cur += sizeof val;
    return true;
  }

  /// Read raw bytes into a fixed-size buffer.
  [[nodiscard]] bool read_bytes(std::span<unsigned char> buf) noexcept {
    if (remaining() < buf.size()) {
      return false;
    }
    std::ranges::copy(data.subspan(cur, buf.size()), buf.begin());
    cur += buf.size();
    return true;
  }

  /// Move to specified offset from the beginning of the data.
  [[nodiscard]] bool seek(std::size_t offset) noexcept {
    if (offset > data.size()) {
      return false;
    }
    cur = offset;
    return true;
  }

  /// Get a reader over the next @p size bytes and skip them.
  [[nodiscard]] bool sub(std::size_t size, byte_reader &reader) noexcept {
    if (remaining() < size) {
      return false;
    }
    reader = byte_reader{data.subspan(cur, size)};
    cur += size;
    return true;
  }

  /// Read an FString.
  ///
  /// @param [out] str
  ///    String that receives the UTF-8 value.
  /// @return A @ref errc indicating the result of operation.
  errc read_fstring(std::string &str) {
    std::int32_t len;
    if (!read(len)) {
      return errc::truncated_input;
    }
    str.clear();
    if (len == 0) {
      return errc::ok;
    }
    if (len > 0) {
      if (remaining() < static_cast<std::size_t>(len)) {
        return errc::truncated_input;
      }
      const std::string_view view{
          reinterpret_cast<const char *>(&data[cur]),
          static_cast<std::size_t>(len)};
      cur += len;
      if (view.back() != '\0' || !u_utf8_valid(view.substr(0, len - 1))) {
        return errc::malformed_utf8;
      }
      str.assign(view.substr(0, len - 1));
      return errc::ok;
    }
    if (len == INT_MIN) {
      return errc::truncated_input;
    }
    const auto size{static_cast<std::size_t>(-len) * 2};
    if (remaining() < size) {
      return errc::truncated_input;
    }
    const auto units{data.subspan(cur, size)};
    cur += size;
    if (units[size - 2] || units[size - 1] ||
        !u_utf16le_to_utf8(units.first(size - 2), str)) {
      return errc::malformed_utf8;
    }
    return errc::ok;
  }

  /// Read a block prefix and get a reader over the block's data.
  ///
  /// @param [out] version
  ///    Variable that receives the block version.
  /// @param [out] block
  ///    Reader that receives the data that follows the prefix, up to the end
  ///    of the block.
  /// @return A @ref errc indicating the result of operation.
  errc read_block(std::uint8_t &version, byte_reader &block) noexcept {
    std::uint32_t size;
    if (!read(size) || !read(version)) {
      return errc::truncated_input;
    }
    if (size < block_prefix_size) {
      return errc::invalid_data;
    }
    return sub(size - block_prefix_size, block) ? errc::ok
                                                : errc::truncated_input;
  }

private:
  std::span<const unsigned char> data;
  std::size_t cur{};
};

/// Little-endian writer appending to a byte vector.
class byte_writer {
public:
  explicit byte_writer(std::vector<unsigned char> &buf) : buf(buf) {}

  template <typename T>
    requires std::integral<T>
  void write(T val) {
    const auto pos{buf.size()};
    buf.resize(pos + sizeof val);
    u_store_le(&buf[pos], val);
  }

  void write_bytes(std::span<const unsigned char> bytes) {
    buf.insert(buf.end(), bytes.begin(), bytes.end());
  }

  /// Write an FString. ASCII strings are written as single-byte ones, all
  ///    others as UTF-16.
  ///
  /// @return Value indicating whether @p str is well-formed UTF-8.
  [[nodiscard]] bool write_fstring(std::string_view str) {
    if (str.empty()) {
      write(std::int32_t{});
      return true;
    }
    if (u_is_ascii(str)) {
      write(static_cast<std::int32_t>(str.length() + 1));
      buf.insert(buf.end(), str.begin(), str.end());
      buf.push_back(0);
      return true;
    }
    if (!u_utf8_valid(str)) {
      return false;
    }
    const auto len_pos{buf.size()};
    write(std::int32_t{});
    const auto num_units{u_utf8_to_utf16le(str, buf) + 1};
    write(std::uint16_t{});
    const auto len{-static_cast<std::int32_t>(num_units)};
    u_store_le(&buf[len_pos], len);
    return true;
  }

  /// Begin a block, writing placeholder size and the version byte.
  /// @return Offset of the block start, to be passed to @ref end_block.
  std::size_t begin_block(std::uint8_t version) {
    const auto start{buf.size()};
    write(std::uint32_t{});
    write(version);
    return start;
  }

  /// Write final size of a block started at @p start.
  void end_block(std::size_t start) {
    const auto size{static_cast<std::uint32_t>(buf.size() - start)};
    u_store_le(&buf[start], size);
  }

private:
  std::vector<unsigned char> &buf;
};

//===-- Private functions -------------------------------------------------===//

/// Create a decoding @ref err for specified error code.
static err bin_decode_err(errc code) {
  return err_sub(errc::manifest_decode, code);
}

/// Create an encoding @ref err for specified error code.
static err bin_encode_err(errc code) {
  return err_sub(errc::manifest_encode, code);
}

/// Check that a list of @p count elements, each at least @p min_size bytes,
///    may fit into the remaining data of @p reader.
static bool count_fits(const byte_reader &reader, std::uint32_t count,
                       std::size_t min_size) noexcept {
  return static_cast<std::size_t>(count) * min_size <= reader.remaining();
}

/// Read a list of FStrings prefixed by its length.
static errc read_fstring_list(byte_reader &reader,
                              std::vector<std::string> &list) {
  std::uint32_t count;
  if (!reader.read(count) || !count_fits(reader, count, sizeof(std::int32_t))) {
    return errc::truncated_input;
  }
  list.resize(count);
  for (auto &str : list) {
    if (const auto res{reader.read_fstring(str)}; res != errc::ok) {
      return res;
    }
  }
  return errc::ok;
}

/// Decode the meta block.
static errc decode_meta(byte_reader &reader, manifest_meta &meta) {
  byte_reader block{{}};
  if (const auto res{reader.read_block(meta.data_version, block)};
      res != errc::ok) {
    return res;
  }
  std::uint8_t is_file_data;
  if (!block.read(meta.feature_level) || !block.read(is_file_data) ||
      !block.read(meta.app_id)) {
    return errc::truncated_input;
  }
  meta.is_file_data = is_file_data;
  for (auto str : {&meta.app_name, &meta.build_version, &meta.launch_exe,
                   &meta.launch_command}) {
    if (const auto res{block.read_fstring(*str)}; res != errc::ok) {
      return res;
    }
  }
  if (const auto res{read_fstring_list(block, meta.prereq_ids)};
      res != errc::ok) {
    return res;
  }
  for (auto str : {&meta.prereq_name, &meta.prereq_path, &meta.prereq_args}) {
    if (const auto res{block.read_fstring(*str)}; res != errc::ok) {
      return res;
    }
  }
  if (meta.data_version >= 1) {
    if (const auto res{block.read_fstring(meta.build_id)}; res != errc::ok) {
      return res;
    }
  }
  if (meta.data_version >= 2) {
    for (auto str : {&meta.uninstall_action_path,
                     &meta.uninstall_action_args}) {
      if (const auto res{block.read_fstring(*str)}; res != errc::ok) {
        return res;
      }
    }
  }
  return errc::ok;
}

/// Decode the chunk data list block.
static errc decode_chunks(byte_reader &reader, chunk_data_list &cdl) {
  byte_reader block{{}};
  if (const auto res{reader.read_block(cdl.version, block)}; res != errc::ok) {
    return res;
  }
  // GUID, hash, SHA-1, group, window size and file size
  static constexpr std::size_t chunk_size = 16 + 8 + 20 + 1 + 4 + 8;
  if (!block.read(cdl.count) || !count_fits(block, cdl.count, chunk_size)) {
    return errc::truncated_input;
  }
  cdl.elements.resize(cdl.count);
  // Columns are size-checked above, reads can't fail from here on
  bool ok{true};
  for (auto &chunk : cdl.elements) {
    for (auto &word : chunk.guid.words) {
      ok &= block.read(word);
    }
  }
  for (auto &chunk : cdl.elements) {
    ok &= block.read(chunk.hash);
  }
  for (auto &chunk : cdl.elements) {
    ok &= block.read_bytes(chunk.sha_hash);
  }
  for (auto &chunk : cdl.elements) {
    ok &= block.read(chunk.group_num);
  }
  for (auto &chunk : cdl.elements) {
    ok &= block.read(chunk.window_size);
  }
  for (auto &chunk : cdl.elements) {
    ok &= block.read(chunk.file_size);
  }
  return ok ? errc::ok : errc::truncated_input;
}

/// Decode the file manifest list block.
static errc decode_files(byte_reader &reader, file_manifest_list &fml) {
  byte_reader block{{}};
  if (const auto res{reader.read_block(fml.version, block)}; res != errc::ok) {
    return res;
  }
  // Name, symlink target, SHA-1, flags, tag count and part count
  static constexpr std::size_t min_file_size = 4 + 4 + 20 + 1 + 4 + 4;
  if (!block.read(fml.count) || !count_fits(block, fml.count, min_file_size)) {
    return errc::truncated_input;
  }
  fml.elements.resize(fml.count);
  for (auto &file : fml.elements) {
    if (const auto res{block.read_fstring(file.filename)}; res != errc::ok) {
      return res;
    }
    std::ranges::replace(file.filename, '\\', '/');
  }
  for (auto &file : fml.elements) {
    if (const auto res{block.read_fstring(file.symlink_target)};
        res != errc::ok) {
      return res;
    }
  }
  for (auto &file : fml.elements) {
    if (!block.read_bytes(file.hash)) {
      return errc::truncated_input;
    }
  }
  for (auto &file : fml.elements) {
    if (!block.read(file.flags)) {
      return errc::truncated_input;
    }
  }
  for (auto &file : fml.elements) {
    if (const auto res{read_fstring_list(block, file.install_tags)};
        res != errc::ok) {
      return res;
    }
  }
  for (auto &file : fml.elements) {
    std::uint32_t num_parts;
    if (!block.read(num_parts) ||
        !count_fits(block, num_parts, chunk_part_size)) {
      return errc::truncated_input;
    }
    file.chunk_parts.resize(num_parts);
    std::uint64_t file_offset{};
    for (auto &part : file.chunk_parts) {
      const auto start{block.pos()};
      std::uint32_t struct_size;
      if (!block.read(struct_size)) {
        return errc::truncated_input;
      }
      if (struct_size < chunk_part_size) {
        return errc::invalid_data;
      }
      bool ok{true};
      for (auto &word : part.guid.words) {
        ok &= block.read(word);
      }
      ok &= block.read(part.offset);
      ok &= block.read(part.size);
      if (!ok || !block.seek(start + struct_size)) {
        return errc::truncated_input;
      }
      part.file_offset = file_offset;
      file_offset += part.size;
    }
    file.file_size = static_cast<std::int64_t>(file_offset);
  }
  if (fml.version >= 1) {
    for (auto &file : fml.elements) {
      std::int32_t has_md5;
      if (!block.read(has_md5)) {
        return errc::truncated_input;
      }
      if (has_md5 && !block.read_bytes(file.hash_md5)) {
        return errc::truncated_input;
      }
    }
    for (auto &file : fml.elements) {
      if (const auto res{block.read_fstring(file.mime_type)};
          res != errc::ok) {
        return res;
      }
    }
  }
  if (fml.version >= 2) {
    for (auto &file : fml.elements) {
      if (!block.read_bytes(file.hash_sha256)) {
        return errc::truncated_input;
      }
    }
  }
  return errc::ok;
}

/// Decode the custom fields block.
static errc decode_custom_fields(byte_reader &reader,
                                 std::map<std::string, std::string> &fields) {
  std::uint8_t version;
  byte_reader block{{}};
  if (const auto res{reader.read_block(version, block)}; res != errc::ok) {
    return res;
  }
  std::uint32_t count;
  if (!block.read(count) || !count_fits(block, count, 8)) {
    return errc::truncated_input;
  }
  std::vector<std::string> keys(count);
  for (auto &key : keys) {
    if (const auto res{block.read_fstring(key)}; res != errc::ok) {
      return res;
    }
  }
  for (auto &key : keys) {
    std::string value;
    if (const auto res{block.read_fstring(value)}; res != errc::ok) {
      return res;
    }
    fields.insert_or_assign(std::move(key), std::move(value));
  }
  return errc::ok;
}

/// Check that block versions can carry all non-default fields of a manifest.
static bool fits_block_versions(const manifest &man) noexcept {
  if (man.meta) {
    const auto &meta{*man.meta};
    if (meta.data_version < 1 && !meta.build_id.empty()) {
      return false;
    }
    if (meta.data_version < 2 && (!meta.uninstall_action_path.empty() ||
                                  !meta.uninstall_action_args.empty())) {
      return false;
    }
  }
  if (man.files) {
    static constexpr md5_hash zero_md5{};
    static constexpr sha256_hash zero_sha256{};
    for (const auto &file : man.files->elements) {
      if (man.files->version < 1 &&
          (file.hash_md5 != zero_md5 || !file.mime_type.empty())) {
        return false;
      }
      if (man.files->version < 2 && file.hash_sha256 != zero_sha256) {
        return false;
      }
    }
  }
  return true;
}

/// Write the meta block.
static bool encode_meta(byte_writer &writer, const manifest_meta &meta) {
  const auto start{writer.begin_block(meta.data_version)};
  writer.write(meta.feature_level);
  writer.write(static_cast<std::uint8_t>(meta.is_file_data));
  writer.write(meta.app_id);
  bool ok{true};
  for (const auto str : {&meta.app_name, &meta.build_version,
                         &meta.launch_exe, &meta.launch_command}) {
    ok &= writer.write_fstring(*str);
  }
  writer.write(static_cast<std::uint32_t>(meta.prereq_ids.size()));
  for (const auto &id : meta.prereq_ids) {
    ok &= writer.write_fstring(id);
  }
  for (const auto str :
       {&meta.prereq_name, &meta.prereq_path, &meta.prereq_args}) {
    ok &= writer.write_fstring(*str);
  }
  if (meta.data_version >= 1) {
    ok &= writer.write_fstring(meta.build_id);
  }
  if (meta.data_version >= 2) {
    ok &= writer.write_fstring(meta.uninstall_action_path);
    ok &= writer.write_fstring(meta.uninstall_action_args);
  }
  writer.end_block(start);
  return ok;
}

/// Write the chunk data list block.
static void encode_chunks(byte_writer &writer, const chunk_data_list &cdl) {
  const auto start{writer.begin_block(cdl.version)};
  writer.write(static_cast<std::uint32_t>(cdl.elements.size()));
  for (const auto &chunk : cdl.elements) {
    for (const auto word : chunk.guid.words) {
      writer.write(word);
    }
  }
  for (const auto &chunk : cdl.elements) {
    writer.write(chunk.hash);
  }
  for (const auto &chunk : cdl.elements) {
    writer.write_bytes(chunk.sha_hash);
  }
  for (const auto &chunk : cdl.elements) {
    writer.write(chunk.group_num);
  }
  for (const auto &chunk : cdl.elements) {
    writer.write(chunk.window_size);
  }
  for (const auto &chunk : cdl.elements) {
    writer.write(chunk.file_size);
  }
  writer.end_block(start);
}

/// Write the file manifest list block.
static bool encode_files(byte_writer &writer, const file_manifest_list &fml) {
  const auto start{writer.begin_block(fml.version)};
  writer.write(static_cast<std::uint32_t>(fml.elements.size()));
  bool ok{true};
  for (const auto &file : fml.elements) {
    ok &= writer.write_fstring(file.filename);
  }
  for (const auto &file : fml.elements) {
    ok &= writer.write_fstring(file.symlink_target);
  }
  for (const auto &file : fml.elements) {
    writer.write_bytes(file.hash);
  }
  for (const auto &file : fml.elements) {
    writer.write(file.flags);
  }
  for (const auto &file : fml.elements) {
    writer.write(static_cast<std::uint32_t>(file.install_tags.size()));
    for (const auto &tag : file.install_tags) {
      ok &= writer.write_fstring(tag);
    }
  }
  // File offsets are implied by part order
  for (const auto &file : fml.elements) {
    writer.write(static_cast<std::uint32_t>(file.chunk_parts.size()));
    for (const auto &part : file.chunk_parts) {
      writer.write(chunk_part_size);
      for (const auto word : part.guid.words) {
        writer.write(word);
      }
      writer.write(part.offset);
      writer.write(part.size);
    }
  }
  if (fml.version >= 1) {
    static constexpr md5_hash zero_md5{};
    for (const auto &file : fml.elements) {
      const bool has_md5{file.hash_md5 != zero_md5};
      writer.write(static_cast<std::int32_t>(has_md5));
      if (has_md5) {
        writer.write_bytes(file.hash_md5);
      }
    }
    for (const auto &file : fml.elements) {
      ok &= writer.write_fstring(file.mime_type);
    }
  }
  if (fml.version >= 2) {
    for (const auto &file : fml.elements) {
      writer.write_bytes(file.hash_sha256);
    }
  }
  writer.end_block(start);
  return ok;
}

/// Write the custom fields block.
static bool
encode_custom_fields(byte_writer &writer,
                     const std::map<std::string, std::string> &fields) {
  const auto start{writer.begin_block(0)};
  writer.write(static_cast<std::uint32_t>(fields.size()));
  bool ok{true};
  for (const auto &key : fields | std::views::keys) {
    ok &= writer.write_fstring(key);
  }
  for (const auto &value : fields | std::views::values) {
    ok &= writer.write_fstring(value);
  }
  writer.end_block(start);
  return ok;
}

} // namespace

//===-- Public functions --------------------------------------------------===//

err decode_binary(std::span<const unsigned char> data, manifest &man) {
  byte_reader reader{data};
  std::uint32_t magic;
  if (!reader.read(magic)) {
    return bin_decode_err(errc::truncated_input);
  }
  if (magic != manifest_magic) {
    return bin_decode_err(errc::invalid_magic);
  }
  std::uint32_t header_size, size_uncompressed, size_compressed;
  sha1_hash body_sha;
  std::uint8_t stored_as;
  if (!reader.read(header_size) || !reader.read(size_uncompressed) ||
      !reader.read(size_compressed) || !reader.read_bytes(body_sha) ||
      !reader.read(stored_as)) {
    return bin_decode_err(errc::truncated_input);
  }
  // The version field is either absent or complete
  if (header_size < header_size_no_version ||
      (header_size > header_size_no_version &&
       header_size < header_size_full)) {
    return bin_decode_err(errc::invalid_data);
  }
  std::int32_t version{implied_version};
  if (header_size > header_size_no_version && !reader.read(version)) {
    return bin_decode_err(errc::truncated_input);
  }
  if (version < min_binary_version) {
    return bin_decode_err(errc::unsupported_version);
  }
  if (!reader.seek(header_size)) {
    return bin_decode_err(errc::truncated_input);
  }
  if (reader.remaining() < size_compressed) {
    return bin_decode_err(errc::truncated_input);
  }
  // Inflate the body if needed
  const auto stored_span{data.subspan(header_size, size_compressed)};
  std::vector<unsigned char> inflated;
  std::span<const unsigned char> body;
  const bool compressed{static_cast<bool>(stored_as & 1)};
  if (compressed) {
    if (!u_inflate(stored_span, size_uncompressed, inflated) ||
        inflated.size() != size_uncompressed) {
      return bin_decode_err(errc::decompression);
    }
    body = inflated;
  } else {
    body = stored_span;
  }
  sha1_hash actual_sha;
  if (!u_sha1(body, actual_sha)) {
    return bin_decode_err(errc::sha);
  }
  if (actual_sha != body_sha) {
    return bin_decode_err(errc::body_digest_mismatch);
  }
  // Parse blocks, a block is absent when the body ends before it
  manifest res{.version = version,
               .header_size = header_size,
               .is_compressed = compressed,
               .meta = {},
               .chunks = {},
               .files = {},
               .custom_fields = {}};
  byte_reader body_reader{body};
  errc res_code{errc::ok};
  if (body_reader.remaining()) {
    res_code = decode_meta(body_reader, res.meta.emplace());
  }
  if (res_code == errc::ok && body_reader.remaining()) {
    res_code = decode_chunks(body_reader, res.chunks.emplace());
  }
  if (res_code == errc::ok && body_reader.remaining()) {
    res_code = decode_files(body_reader, res.files.emplace());
  }
  if (res_code == errc::ok && body_reader.remaining()) {
    res_code = decode_custom_fields(body_reader, res.custom_fields.emplace());
  }
  if (res_code != errc::ok) {
    return bin_decode_err(res_code);
  }
  if (auto res_err{validate(res)}; !err_success(res_err)) {
    return err_wrap(errc::manifest_decode, std::move(res_err));
  }
  man = std::move(res);
  return err_ok();
}

err encode_binary(const manifest &man, std::vector<unsigned char> &data) {
  if (man.version < min_binary_version) {
    return bin_encode_err(errc::unsupported_version);
  }
  if (man.header_size < header_size_full) {
    return bin_encode_err(errc::invalid_data);
  }
  // Blocks are positional, only trailing ones may be omitted
  if ((!man.meta && (man.chunks || man.files || man.custom_fields)) ||
      (!man.chunks && (man.files || man.custom_fields)) ||
      (!man.files && man.custom_fields)) {
    return bin_encode_err(errc::invalid_data);
  }
  if (!fits_block_versions(man)) {
    return bin_encode_err(errc::invalid_data);
  }
  if (auto res{validate(man)}; !err_success(res)) {
    return err_wrap(errc::manifest_encode, std::move(res));
  }
  // Write the body
  std::vector<unsigned char> body;
  byte_writer body_writer{body};
  bool ok{true};
  if (man.meta) {
    ok &= encode_meta(body_writer, *man.meta);
  }
  if (man.chunks) {
    encode_chunks(body_writer, *man.chunks);
  }
  if (man.files) {
    ok &= encode_files(body_writer, *man.files);
  }
  if (man.custom_fields) {
    ok &= encode_custom_fields(body_writer, *man.custom_fields);
  }
  if (!ok) {
    return bin_encode_err(errc::malformed_utf8);
  }
  sha1_hash body_sha;
  if (!u_sha1(body, body_sha)) {
    return bin_encode_err(errc::sha);
  }
  std::vector<unsigned char> deflated;
  if (man.is_compressed && !u_deflate(body, deflated)) {
    return bin_encode_err(errc::compression);
  }
  const auto &stored{man.is_compressed ? deflated : body};
  // Write the header and the stored body
  data.clear();
  data.reserve(man.header_size + stored.size());
  byte_writer writer{data};
  writer.write(manifest_magic);
  writer.write(man.header_size);
  writer.write(static_cast<std::uint32_t>(body.size()));
  writer.write(static_cast<std::uint32_t>(stored.size()));
  writer.write_bytes(body_sha);
  writer.write(static_cast<std::uint8_t>(man.is_compressed));
  writer.write(man.version);
  data.resize(man.header_size);
  writer.write_bytes(stored);
  return err_ok();
}

} // namespace gamedepot
