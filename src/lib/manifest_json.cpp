//===-- manifest_json.cpp - JSON manifest decoding and encoding -----------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::decode_json and
///    @ref gamedepot::encode_json.
///
/// The JSON form mirrors the manifest model with camelCase member names.
///    Every member is optional and `null` is treated the same as an absent
///    member; 64-bit chunk hashes may be written as decimal strings because
///    not every JSON producer preserves 64-bit integers.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/codec.hpp"

#include "common/error.hpp"
#include "gamedepot/error.hpp"
#include "gamedepot/manifest.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <fmt/format.h>
#include <limits>
#include <map>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace gamedepot {

namespace {

using json_value = rapidjson::Value;
using json_writer = rapidjson::Writer<rapidjson::StringBuffer>;

//===-- Private functions -------------------------------------------------===//

//===--- Decoding ---------------------------------------------------------===//

/// Create a decoding @ref err for specified error code.
static err json_decode_err(errc code) {
  return err_sub(errc::manifest_decode, code);
}

/// Find member of an object.
///
/// @return Pointer to the member value, or `nullptr` if the member is absent
///    or `null`.
static const json_value *find(const json_value &obj, std::string_view name) {
  const auto it{obj.FindMember(
      rapidjson::StringRef(name.data(), static_cast<unsigned>(name.length())))};
  return it == obj.MemberEnd() || it->value.IsNull() ? nullptr : &it->value;
}

/// Get an integer member value, keeping @p out unchanged if absent.
///
/// @param allow_str
///    Value indicating whether the value may be a decimal string.
/// @return Value indicating whether the member is absent or holds a value
///    that fits into @p out.
template <typename T>
  requires std::integral<T>
static bool get_int(const json_value &obj, std::string_view name, T &out,
                    bool allow_str = false) {
  const auto val{find(obj, name)};
  if (!val) {
    return true;
  }
  if constexpr (std::is_same_v<T, bool>) {
    if (!val->IsBool()) {
      return false;
    }
    out = val->GetBool();
  } else {
    if (allow_str && val->IsString()) {
      const std::string_view str{val->GetString(), val->GetStringLength()};
      const auto end{str.data() + str.length()};
      T num;
      if (const auto res{std::from_chars(str.data(), end, num)};
          res.ec != std::errc{} || res.ptr != end) {
        return false;
      }
      out = num;
      return true;
    }
    if constexpr (std::is_signed_v<T>) {
      if (!val->IsInt64()) {
        return false;
      }
      const auto num{val->GetInt64()};
      if (num < std::numeric_limits<T>::min() ||
          num > std::numeric_limits<T>::max()) {
        return false;
      }
      out = static_cast<T>(num);
    } else {
      if (!val->IsUint64()) {
        return false;
      }
      const auto num{val->GetUint64()};
      if (num > std::numeric_limits<T>::max()) {
        return false;
      }
      out = static_cast<T>(num);
    }
  }
  return true;
}

/// Get a string member value, keeping @p out unchanged if absent.
static bool get_str(const json_value &obj, std::string_view name,
                    std::string &out) {
  const auto val{find(obj, name)};
  if (!val) {
    return true;
  }
  if (!val->IsString()) {
    return false;
  }
  out.assign(val->GetString(), val->GetStringLength());
  return true;
}

/// Get a hexadecimal member value. Absent members and empty strings leave
///    @p out zeroed.
static bool get_hex(const json_value &obj, std::string_view name,
                    std::span<unsigned char> out) {
  std::string str;
  if (!get_str(obj, name, str)) {
    return false;
  }
  if (str.empty()) {
    std::ranges::fill(out, 0);
    return true;
  }
  return u_hex_decode(str, out);
}

/// Get a string array member value.
static bool get_str_list(const json_value &obj, std::string_view name,
                         std::vector<std::string> &out) {
  const auto val{find(obj, name)};
  if (!val) {
    return true;
  }
  if (!val->IsArray()) {
    return false;
  }
  out.clear();
  out.reserve(val->Size());
  for (const auto &element : val->GetArray()) {
    if (!element.IsString()) {
      return false;
    }
    out.emplace_back(element.GetString(), element.GetStringLength());
  }
  return true;
}

/// Get the element array of a list object, stored either under `elements` or
///    under @p alt_name.
static const json_value *find_elements(const json_value &obj,
                                       std::string_view alt_name) {
  if (const auto val{find(obj, "elements")}; val) {
    return val;
  }
  return find(obj, alt_name);
}

/// Parse GUID of a chunk or a chunk part from its `guid` word array and/or
///    its `guidStr` string.
///
/// @param [in] obj
///    The object containing GUID members.
/// @param [out] guid
///    Variable that receives the GUID.
/// @return A @ref err indicating the result of operation.
static err parse_guid(const json_value &obj, chunk_guid &guid) {
  std::string guid_str;
  if (!get_str(obj, "guidStr", guid_str)) {
    return json_decode_err(errc::invalid_data);
  }
  const auto words{find(obj, "guid")};
  if (!words) {
    // Some producers only write the string form
    if (!chunk_guid::parse(guid_str, guid)) {
      return json_decode_err(errc::invalid_data);
    }
    return err_ok();
  }
  if (!words->IsArray() || words->Size() != guid.words.size()) {
    return json_decode_err(errc::invalid_data);
  }
  for (rapidjson::SizeType i{}; i < words->Size(); ++i) {
    const auto &word{(*words)[i]};
    if (!word.IsUint()) {
      return json_decode_err(errc::invalid_data);
    }
    guid.words[i] = word.GetUint();
  }
  if (!guid_str.empty()) {
    std::ranges::transform(guid_str, guid_str.begin(), [](char c) {
      return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
    });
    if (const auto canonical{guid.str()}; guid_str != canonical) {
      return err_wrap(errc::manifest_decode,
                      err_invariant(invariant::guid_mismatch,
                                    fmt::format("guid {} vs guidStr \"{}\"",
                                                canonical, guid_str)));
    }
  }
  return err_ok();
}

/// Parse the meta object.
static bool parse_meta(const json_value &obj, manifest_meta &meta) {
  if (!obj.IsObject()) {
    return false;
  }
  return get_int(obj, "dataVersion", meta.data_version) &&
         get_int(obj, "featureLevel", meta.feature_level) &&
         get_int(obj, "isFileData", meta.is_file_data) &&
         get_int(obj, "appId", meta.app_id, true) &&
         get_str(obj, "appName", meta.app_name) &&
         get_str(obj, "buildVersion", meta.build_version) &&
         get_str(obj, "launchExe", meta.launch_exe) &&
         get_str(obj, "launchCommand", meta.launch_command) &&
         get_str_list(obj, "prereqIds", meta.prereq_ids) &&
         get_str(obj, "prereqName", meta.prereq_name) &&
         get_str(obj, "prereqPath", meta.prereq_path) &&
         get_str(obj, "prereqArgs", meta.prereq_args) &&
         get_str(obj, "buildId", meta.build_id) &&
         get_str(obj, "uninstallActionPath", meta.uninstall_action_path) &&
         get_str(obj, "uninstallActionArgs", meta.uninstall_action_args);
}

/// Parse the chunk data list object.
static err parse_chunks(const json_value &obj, chunk_data_list &cdl) {
  if (!obj.IsObject() || !get_int(obj, "version", cdl.version)) {
    return json_decode_err(errc::invalid_data);
  }
  if (const auto elements{find_elements(obj, "chunks")}; elements) {
    if (!elements->IsArray()) {
      return json_decode_err(errc::invalid_data);
    }
    cdl.elements.reserve(elements->Size());
    for (const auto &element : elements->GetArray()) {
      if (!element.IsObject()) {
        return json_decode_err(errc::invalid_data);
      }
      auto &chunk{cdl.elements.emplace_back(chunk_info{.guid{},
                                                       .hash = 0,
                                                       .sha_hash{},
                                                       .group_num = 0,
                                                       .window_size = 0,
                                                       .file_size = 0})};
      if (auto res{parse_guid(element, chunk.guid)}; !err_success(res)) {
        return res;
      }
      if (!get_int(element, "hash", chunk.hash, true) ||
          !get_hex(element, "shaHash", chunk.sha_hash) ||
          !get_int(element, "groupNum", chunk.group_num) ||
          !get_int(element, "windowSize", chunk.window_size) ||
          !get_int(element, "fileSize", chunk.file_size)) {
        return json_decode_err(errc::invalid_data);
      }
    }
  }
  cdl.count = static_cast<std::uint32_t>(cdl.elements.size());
  if (!get_int(obj, "count", cdl.count)) {
    return json_decode_err(errc::invalid_data);
  }
  return err_ok();
}

/// Parse chunk parts of a file.
static err parse_parts(const json_value &parts, file_manifest &file) {
  if (!parts.IsArray()) {
    return json_decode_err(errc::invalid_data);
  }
  file.chunk_parts.reserve(parts.Size());
  std::uint64_t next_offset{};
  for (const auto &element : parts.GetArray()) {
    if (!element.IsObject()) {
      return json_decode_err(errc::invalid_data);
    }
    auto &part{file.chunk_parts.emplace_back(chunk_part{
        .guid{}, .offset = 0, .size = 0, .file_offset = next_offset})};
    if (auto res{parse_guid(element, part.guid)}; !err_success(res)) {
      return res;
    }
    if (!get_int(element, "offset", part.offset) ||
        !get_int(element, "size", part.size) ||
        !get_int(element, "fileOffset", part.file_offset)) {
      return json_decode_err(errc::invalid_data);
    }
    next_offset = part.file_offset + part.size;
  }
  std::ranges::stable_sort(file.chunk_parts, {}, &chunk_part::file_offset);
  return err_ok();
}

/// Parse the file manifest list object.
static err parse_files(const json_value &obj, file_manifest_list &fml) {
  if (!obj.IsObject() || !get_int(obj, "version", fml.version)) {
    return json_decode_err(errc::invalid_data);
  }
  if (const auto elements{find_elements(obj, "files")}; elements) {
    if (!elements->IsArray()) {
      return json_decode_err(errc::invalid_data);
    }
    fml.elements.reserve(elements->Size());
    for (const auto &element : elements->GetArray()) {
      if (!element.IsObject()) {
        return json_decode_err(errc::invalid_data);
      }
      auto &file{fml.elements.emplace_back()};
      if (!get_str(element, "filename", file.filename) ||
          !get_str(element, "symlinkTarget", file.symlink_target) ||
          !get_hex(element, "hash", file.hash) ||
          !get_hex(element, "hashMd5", file.hash_md5) ||
          !get_hex(element, "hashSha256", file.hash_sha256) ||
          !get_int(element, "flags", file.flags) ||
          !get_str_list(element, "installTags", file.install_tags) ||
          !get_str(element, "mimeType", file.mime_type)) {
        return json_decode_err(errc::invalid_data);
      }
      std::ranges::replace(file.filename, '\\', '/');
      if (const auto parts{find(element, "chunkParts")}; parts) {
        if (auto res{parse_parts(*parts, file)}; !err_success(res)) {
          return res;
        }
      }
      std::int64_t parts_size{};
      for (const auto &part : file.chunk_parts) {
        parts_size += part.size;
      }
      file.file_size = parts_size;
      if (!get_int(element, "fileSize", file.file_size)) {
        return json_decode_err(errc::invalid_data);
      }
    }
  }
  fml.count = static_cast<std::uint32_t>(fml.elements.size());
  if (!get_int(obj, "count", fml.count)) {
    return json_decode_err(errc::invalid_data);
  }
  return err_ok();
}

/// Parse the custom fields object.
static bool parse_custom_fields(const json_value &obj,
                                std::map<std::string, std::string> &fields) {
  if (!obj.IsObject()) {
    return false;
  }
  for (const auto &member : obj.GetObject()) {
    if (!member.value.IsString()) {
      return false;
    }
    fields.insert_or_assign(
        std::string{member.name.GetString(), member.name.GetStringLength()},
        std::string{member.value.GetString(), member.value.GetStringLength()});
  }
  return true;
}

//===--- Encoding ---------------------------------------------------------===//

static void write_str(json_writer &writer, std::string_view str) {
  writer.String(str.data(), static_cast<rapidjson::SizeType>(str.length()));
}

static void write_hex(json_writer &writer,
                      std::span<const unsigned char> data) {
  // All-zero digests are absent ones
  if (std::ranges::all_of(data, [](auto byte) { return byte == 0; })) {
    write_str(writer, "");
  } else {
    write_str(writer, u_hex_encode(data));
  }
}

static void write_guid(json_writer &writer, const chunk_guid &guid) {
  writer.Key("guid");
  writer.StartArray();
  for (const auto word : guid.words) {
    writer.Uint(word);
  }
  writer.EndArray();
  writer.Key("guidStr");
  write_str(writer, guid.str());
}

static void write_meta(json_writer &writer, const manifest_meta &meta) {
  writer.StartObject();
  writer.Key("dataVersion");
  writer.Uint(meta.data_version);
  writer.Key("featureLevel");
  writer.Int(meta.feature_level);
  writer.Key("isFileData");
  writer.Bool(meta.is_file_data);
  writer.Key("appId");
  writer.Uint(meta.app_id);
  for (const auto &[name, val] :
       {std::pair{"appName", &meta.app_name},
        std::pair{"buildVersion", &meta.build_version},
        std::pair{"launchExe", &meta.launch_exe},
        std::pair{"launchCommand", &meta.launch_command}}) {
    writer.Key(name);
    write_str(writer, *val);
  }
  writer.Key("prereqIds");
  writer.StartArray();
  for (const auto &id : meta.prereq_ids) {
    write_str(writer, id);
  }
  writer.EndArray();
  for (const auto &[name, val] :
       {std::pair{"prereqName", &meta.prereq_name},
        std::pair{"prereqPath", &meta.prereq_path},
        std::pair{"prereqArgs", &meta.prereq_args},
        std::pair{"buildId", &meta.build_id},
        std::pair{"uninstallActionPath", &meta.uninstall_action_path},
        std::pair{"uninstallActionArgs", &meta.uninstall_action_args}}) {
    writer.Key(name);
    write_str(writer, *val);
  }
  writer.EndObject();
}

static void write_chunks(json_writer &writer, const chunk_data_list &cdl) {
  writer.StartObject();
  writer.Key("version");
  writer.Uint(cdl.version);
  writer.Key("count");
  writer.Uint(cdl.count);
  writer.Key("chunks");
  writer.StartArray();
  for (const auto &chunk : cdl.elements) {
    writer.StartObject();
    write_guid(writer, chunk.guid);
    writer.Key("hash");
    write_str(writer, fmt::format("{}", chunk.hash));
    writer.Key("shaHash");
    write_hex(writer, chunk.sha_hash);
    writer.Key("groupNum");
    writer.Uint(chunk.group_num);
    writer.Key("windowSize");
    writer.Uint(chunk.window_size);
    writer.Key("fileSize");
    writer.Int64(chunk.file_size);
    writer.EndObject();
  }
  writer.EndArray();
  writer.EndObject();
}

static void write_files(json_writer &writer, const file_manifest_list &fml) {
  writer.StartObject();
  writer.Key("version");
  writer.Uint(fml.version);
  writer.Key("count");
  writer.Uint(fml.count);
  writer.Key("files");
  writer.StartArray();
  for (const auto &file : fml.elements) {
    writer.StartObject();
    writer.Key("filename");
    write_str(writer, file.filename);
    writer.Key("symlinkTarget");
    write_str(writer, file.symlink_target);
    writer.Key("hash");
    write_hex(writer, file.hash);
    writer.Key("flags");
    writer.Uint(file.flags);
    writer.Key("isReadOnly");
    writer.Bool(file.read_only());
    writer.Key("isCompressed");
    writer.Bool(file.compressed());
    writer.Key("isExecutable");
    writer.Bool(file.executable());
    writer.Key("installTags");
    writer.StartArray();
    for (const auto &tag : file.install_tags) {
      write_str(writer, tag);
    }
    writer.EndArray();
    writer.Key("fileSize");
    writer.Int64(file.file_size);
    writer.Key("hashMd5");
    write_hex(writer, file.hash_md5);
    writer.Key("mimeType");
    write_str(writer, file.mime_type);
    writer.Key("hashSha256");
    write_hex(writer, file.hash_sha256);
    writer.Key("chunkParts");
    writer.StartArray();
    for (const auto &part : file.chunk_parts) {
      writer.StartObject();
      write_guid(writer, part.guid);
      writer.Key("offset");
      writer.Uint(part.offset);
      writer.Key("size");
      writer.Uint(part.size);
      writer.Key("fileOffset");
      writer.Uint64(part.file_offset);
      writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
  }
  writer.EndArray();
  writer.EndObject();
}

} // namespace

//===-- Public functions --------------------------------------------------===//

err decode_json(std::span<const unsigned char> data, manifest &man) {
  if (data.empty()) {
    return json_decode_err(errc::invalid_data);
  }
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseValidateEncodingFlag>(
      reinterpret_cast<const char *>(data.data()), data.size());
  if (doc.HasParseError()) {
    return json_decode_err(doc.GetParseError() ==
                                   rapidjson::kParseErrorStringInvalidEncoding
                               ? errc::malformed_utf8
                               : errc::invalid_data);
  }
  if (!doc.IsObject()) {
    return json_decode_err(errc::invalid_data);
  }
  manifest res;
  if (!get_int(doc, "version", res.version) ||
      !get_int(doc, "headerSize", res.header_size) ||
      !get_int(doc, "isCompressed", res.is_compressed)) {
    return json_decode_err(errc::invalid_data);
  }
  if (const auto meta{find(doc, "meta")};
      meta && !parse_meta(*meta, res.meta.emplace())) {
    return json_decode_err(errc::invalid_data);
  }
  if (const auto cdl{find(doc, "chunkDataList")}; cdl) {
    if (auto res_err{parse_chunks(*cdl, res.chunks.emplace())};
        !err_success(res_err)) {
      return res_err;
    }
  }
  if (const auto fml{find(doc, "fileManifestList")}; fml) {
    if (auto res_err{parse_files(*fml, res.files.emplace())};
        !err_success(res_err)) {
      return res_err;
    }
  }
  if (const auto fields{find(doc, "customFields")};
      fields && !parse_custom_fields(*fields, res.custom_fields.emplace())) {
    return json_decode_err(errc::invalid_data);
  }
  if (auto res_err{validate(res)}; !err_success(res_err)) {
    return err_wrap(errc::manifest_decode, std::move(res_err));
  }
  man = std::move(res);
  return err_ok();
}

err encode_json(const manifest &man, std::string &json) {
  rapidjson::StringBuffer buf;
  json_writer writer{buf};
  writer.StartObject();
  writer.Key("version");
  writer.Int(man.version);
  writer.Key("headerSize");
  writer.Uint(man.header_size);
  writer.Key("isCompressed");
  writer.Bool(man.is_compressed);
  writer.Key("meta");
  if (man.meta) {
    write_meta(writer, *man.meta);
  } else {
    writer.Null();
  }
  writer.Key("chunkDataList");
  if (man.chunks) {
    write_chunks(writer, *man.chunks);
  } else {
    writer.Null();
  }
  writer.Key("fileManifestList");
  if (man.files) {
    write_files(writer, *man.files);
  } else {
    writer.Null();
  }
  writer.Key("customFields");
  if (man.custom_fields) {
    writer.StartObject();
    for (const auto &[key, value] : *man.custom_fields) {
      writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.length()));
      write_str(writer, value);
    }
    writer.EndObject();
  } else {
    writer.Null();
  }
  writer.EndObject();
  if (!writer.IsComplete()) {
    return err_sub(errc::manifest_encode, errc::invalid_data);
  }
  json.assign(buf.GetString(), buf.GetSize());
  return err_ok();
}

} // namespace gamedepot
