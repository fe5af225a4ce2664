//===-- fixtures.hpp - shared test fixtures -------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Sample manifests and a scripted HTTP client shared by tests.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "gamedepot/error.hpp"
#include "gamedepot/http.hpp"
#include "gamedepot/manifest.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace gamedepot::test {

/// HTTP client that answers requests with a user-provided handler and
///    records requested URLs.
class fake_http final : public http_client {
public:
  using handler_func = std::function<err(const std::string &, http_response &)>;

  explicit fake_http(handler_func handler) : handler(std::move(handler)) {}

  err get(const std::string &url, http_response &response) override {
    urls.emplace_back(url);
    return handler(url, response);
  }

  std::vector<std::string> urls;

private:
  handler_func handler;
};

/// Create a success response.
inline err respond(http_response &response, long status, std::string body) {
  response.status = status;
  response.body = std::move(body);
  return {.type = err_type::basic,
          .primary = errc::ok,
          .auxiliary = 0,
          .extra = 0,
          .context = {}};
}

inline constexpr chunk_guid guid_a{.words{0x11111111, 0x22222222, 0x33333333,
                                          0x44444444}};
inline constexpr chunk_guid guid_b{.words{0xAAAAAAAA, 0xBBBBBBBB, 0xCCCCCCCC,
                                          0xDDDDDDDD}};

/// Build a small manifest with all four blocks that passes validation.
inline manifest sample_manifest() {
  manifest man;
  man.meta.emplace();
  man.meta->data_version = 2;
  man.meta->app_id = 1207658924;
  man.meta->app_name = "Sample";
  man.meta->build_version = "1.0.3";
  man.meta->launch_exe = "bin/sample.exe";
  man.meta->launch_command = "-windowed";
  man.meta->prereq_ids = {"vcredist2019"};
  man.meta->prereq_name = "Visual C++ Runtime";
  man.meta->build_id = "53891537";
  man.meta->uninstall_action_path = "bin/uninstall.exe";
  man.chunks.emplace();
  man.chunks->version = 0;
  man.chunks->count = 2;
  man.chunks->elements = {
      {.guid = guid_a,
       .hash = 0x1122334455667788,
       .sha_hash{0x01, 0x02, 0x03},
       .group_num = 7,
       .window_size = 1048576,
       .file_size = 4000},
      {.guid = guid_b,
       .hash = 0x8877665544332211,
       .sha_hash{0xFE, 0xDC},
       .group_num = 42,
       .window_size = 2048,
       .file_size = 900}};
  man.files.emplace();
  man.files->version = 2;
  man.files->count = 3;
  auto &exe{man.files->elements.emplace_back()};
  exe.filename = "bin/sample.exe";
  exe.hash = {0xAB, 0xCD};
  exe.hash_md5 = {0x10, 0x20};
  exe.flags = FILE_FLAG_executable;
  exe.file_size = 6000;
  exe.chunk_parts = {
      {.guid = guid_a, .offset = 0, .size = 5000, .file_offset = 0},
      {.guid = guid_b, .offset = 0, .size = 1000, .file_offset = 5000}};
  auto &pak{man.files->elements.emplace_back()};
  pak.filename = "data/lang/de.pak";
  pak.hash = {0x12};
  pak.flags = FILE_FLAG_read_only;
  pak.install_tags = {"de"};
  pak.file_size = 1000;
  pak.chunk_parts = {
      {.guid = guid_b, .offset = 1000, .size = 1000, .file_offset = 0}};
  auto &readme{man.files->elements.emplace_back()};
  readme.filename = "readme.txt";
  readme.mime_type = "text/plain";
  man.custom_fields.emplace();
  man.custom_fields->emplace("BaseUrl", "https://cdn.example.com/builds");
  man.custom_fields->emplace("CloudSaveFolder", "{AppData}/Sample");
  return man;
}

} // namespace gamedepot::test
