//===-- build_resolver.cpp - build list parsing and resolution ------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref gamedepot::parse_builds and
///    @ref gamedepot::resolve.
///
//===----------------------------------------------------------------------===//
#include "gamedepot/build.hpp"

#include "common/error.hpp"
#include "gamedepot/error.hpp"
#include "log.hpp"

#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <rapidjson/document.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gamedepot {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Get an ID member that may be either a string or a number.
///
/// @return The ID string, or empty optional if the member is absent, `null`
///    or of another type.
static std::optional<std::string> get_id(const rapidjson::Value &obj,
                                         const char *name) {
  const auto it{obj.FindMember(name)};
  if (it == obj.MemberEnd()) {
    return {};
  }
  const auto &val{it->value};
  if (val.IsString()) {
    return std::string{val.GetString(), val.GetStringLength()};
  }
  if (val.IsUint64()) {
    return fmt::format("{}", val.GetUint64());
  }
  return {};
}

} // namespace

//===-- Public functions --------------------------------------------------===//

err parse_builds(std::string_view json, std::vector<build_descriptor> &builds) {
  rapidjson::Document doc;
  doc.Parse(json.data(), json.length());
  if (doc.HasParseError() || !doc.IsObject()) {
    return err_sub(errc::builds_fetch, errc::json_parse);
  }
  if (const auto total_count{doc.FindMember("total_count")};
      total_count != doc.MemberEnd() && total_count->value.IsInt64() &&
      total_count->value.GetInt64() == 0) {
    return err_basic(errc::no_builds);
  }
  const auto items{doc.FindMember("items")};
  if (items == doc.MemberEnd() || !items->value.IsArray()) {
    return err_basic(errc::no_builds);
  }
  builds.clear();
  builds.reserve(items->value.Size());
  for (const auto &item : items->value.GetArray()) {
    if (!item.IsObject()) {
      continue;
    }
    auto build_id{get_id(item, "build_id")};
    if (!build_id) {
      continue;
    }
    const auto generation{item.FindMember("generation")};
    if (generation == item.MemberEnd() || !generation->value.IsInt()) {
      continue;
    }
    auto &build{builds.emplace_back(build_descriptor{
        .build_id = std::move(*build_id),
        .branch = {},
        .generation = generation->value.GetInt(),
        .link = {},
        .legacy_build_id = get_id(item, "legacy_build_id")})};
    if (const auto branch{item.FindMember("branch")};
        branch != item.MemberEnd() && branch->value.IsString()) {
      build.branch.emplace(branch->value.GetString(),
                           branch->value.GetStringLength());
    }
    if (const auto link{item.FindMember("link")};
        link != item.MemberEnd() && link->value.IsString()) {
      build.link.assign(link->value.GetString(),
                        link->value.GetStringLength());
    }
  }
  if (builds.empty()) {
    return err_basic(errc::no_builds);
  }
  return err_ok();
}

err resolve(std::span<const build_descriptor> builds,
            const build_selector &selector, build_descriptor &result) {
  if (builds.empty()) {
    return err_sub(errc::build_resolve, errc::no_builds);
  }
  auto target{builds.begin()};
  if (const auto it{std::ranges::find_if(
          builds, [](const auto &build) { return !build.branch; })};
      it != builds.end()) {
    target = it;
  }
  // Without a requested branch this matches the default branch again
  if (const auto it{std::ranges::find(builds, selector.branch,
                                      &build_descriptor::branch)};
      it != builds.end()) {
    target = it;
  }
  if (selector.explicit_build_id) {
    if (const auto it{std::ranges::find(builds, *selector.explicit_build_id,
                                        &build_descriptor::build_id)};
        it != builds.end()) {
      target = it;
    } else {
      lib_log()->debug("Build {} not found, falling back to {}",
                       *selector.explicit_build_id, target->build_id);
    }
  }
  int generation{target->generation};
  if (selector.cached_generation_override) {
    lib_log()->debug("Overriding generation {} of build {} with cached {}",
                     generation, target->build_id,
                     *selector.cached_generation_override);
    generation = *selector.cached_generation_override;
  }
  if (generation != 1 && generation != 2) {
    return err_sub(errc::build_resolve, errc::unsupported_generation);
  }
  result = *target;
  result.generation = generation;
  lib_log()->info("Selected build {} on branch {}, generation {}",
                  result.build_id, result.branch.value_or("<default>"),
                  result.generation);
  return err_ok();
}

} // namespace gamedepot
