//===-- manifest_validate.cpp - manifest structural validation ------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::validate.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/codec.hpp"

#include "common/error.hpp"
#include "gamedepot/error.hpp"
#include "gamedepot/manifest.hpp"

#include <cstdint>
#include <fmt/format.h>

namespace gamedepot {

err validate(const manifest &man) {
  if (man.chunks && man.chunks->count != man.chunks->elements.size()) {
    return err_invariant(
        invariant::count_mismatch,
        fmt::format("chunk data list: count {}, elements {}",
                    man.chunks->count, man.chunks->elements.size()));
  }
  if (!man.files) {
    return err_ok();
  }
  if (man.files->count != man.files->elements.size()) {
    return err_invariant(
        invariant::count_mismatch,
        fmt::format("file manifest list: count {}, elements {}",
                    man.files->count, man.files->elements.size()));
  }
  const chunk_index index{man};
  for (const auto &file : man.files->elements) {
    // Parts must be listed in file order and leave no gaps or overlaps
    std::uint64_t expected_offset{};
    for (const auto &part : file.chunk_parts) {
      const auto chunk{index.find(part.guid)};
      if (!chunk) {
        return err_invariant(invariant::dangling_reference,
                             fmt::format("file \"{}\", chunk {}",
                                         file.filename, part.guid.str()));
      }
      if (static_cast<std::uint64_t>(part.offset) + part.size >
          chunk->window_size) {
        return err_invariant(
            invariant::part_bounds,
            fmt::format("file \"{}\", chunk {}: offset {} + size {} > "
                        "window size {}",
                        file.filename, part.guid.str(), part.offset,
                        part.size, chunk->window_size));
      }
      if (part.file_offset != expected_offset) {
        return err_invariant(
            invariant::part_contiguity,
            fmt::format("file \"{}\": part at offset {}, expected {}",
                        file.filename, part.file_offset, expected_offset));
      }
      expected_offset += part.size;
    }
    if (file.file_size < 0 ||
        expected_offset != static_cast<std::uint64_t>(file.file_size)) {
      return err_invariant(
          invariant::part_contiguity,
          fmt::format("file \"{}\": parts cover {} bytes, file size {}",
                      file.filename, expected_offset, file.file_size));
    }
  }
  return err_ok();
}

} // namespace gamedepot
