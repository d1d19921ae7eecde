// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "external-scene.hh"

#include <algorithm>
#include <vector>

#include "common-macros.inc"
#include "io-util.hh"
#include "str-util.hh"

namespace tinyescn {

std::string GetSceneSearchDir(const ExportSettings &settings) {
  switch (settings.material_search_paths) {
    case SearchPathMode::ProjectDir:
      if (settings.project_path_func) {
        return settings.project_path_func();
      }
      return std::string();
    case SearchPathMode::ExportDir:
      return io::GetBaseDir(settings.path);
    case SearchPathMode::Disabled:
      return std::string();
  }
  return std::string();
}

nonstd::optional<ExternalSceneInfo> FindSceneInSubtree(
    const std::string &search_dir, const std::string &scene_filename,
    std::string *warn) {
  std::vector<std::string> candidates;
  std::string walk_err;
  if (!io::FindFilesRecursive(search_dir, scene_filename, &candidates,
                              &walk_err)) {
    DCOUT("Search failed: " << walk_err);
    return nonstd::nullopt;
  }

  // Checks it is a scene.
  std::vector<ExternalSceneInfo> valid_candidates;
  for (const auto &candidate : candidates) {
    auto line = io::ReadFirstLine(candidate);
    if (!line) {
      DCOUT(line.error());
      continue;
    }

    if (contains(line.value(), kPackedSceneMarker)) {
      ExternalSceneInfo info;
      info.path = candidate;
      info.type = kPackedSceneType;
      valid_candidates.push_back(info);
    }
  }

  if (valid_candidates.empty()) {
    return nonstd::nullopt;
  }

  if (valid_candidates.size() > 1) {
    PUSH_WARN("Multiple scenes found for " << scene_filename);
    std::sort(valid_candidates.begin(), valid_candidates.end(),
              [](const ExternalSceneInfo &a, const ExternalSceneInfo &b) {
                return a.path < b.path;
              });
  }

  return valid_candidates[0];
}

nonstd::optional<ExternalSceneInfo> FindScene(
    const ExportSettings &settings, const std::string &scene_filename,
    std::string *warn) {
  std::string search_dir = GetSceneSearchDir(settings);
  if (search_dir.empty()) {
    DCOUT("Scene search is disabled("
          << to_string(settings.material_search_paths) << ")");
    return nonstd::nullopt;
  }

  return FindSceneInSubtree(search_dir, scene_filename, warn);
}

}  // namespace tinyescn
