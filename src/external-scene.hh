// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// Lookup of existing(packaged) scenes in the project tree.
//
#pragma once

#include <string>

#include "export-settings.hh"
#include "nonstd/optional.hpp"

namespace tinyescn {

// First line of a text scene file contains this token.
constexpr auto kPackedSceneMarker = "gd_scene";
constexpr auto kPackedSceneType = "PackedScene";

struct ExternalSceneInfo {
  std::string path;
  std::string type;  // e.g. "PackedScene"
};

///
/// Returns the directory to search for existing scenes, or empty string when
/// the search is disabled(or the directory cannot be determined).
///
std::string GetSceneSearchDir(const ExportSettings &settings);

///
/// Search `scene_filename` under `search_dir` recursively.
/// Only files whose first line contains `kPackedSceneMarker` are accepted.
/// When more than one file is found, a warning is reported and the
/// lexicographically smallest path is returned.
///
/// @param[in] search_dir Root directory of the search.
/// @param[in] scene_filename File name to find(matched verbatim).
/// @param[out] warn Warning message.
///
/// @return nullopt when not found.
///
nonstd::optional<ExternalSceneInfo> FindSceneInSubtree(
    const std::string &search_dir, const std::string &scene_filename,
    std::string *warn);

///
/// Search an existing scene `scene_filename` in the directory specified by
/// `settings`. Returns nullopt without touching the file system when the
/// search is disabled.
///
nonstd::optional<ExternalSceneInfo> FindScene(
    const ExportSettings &settings, const std::string &scene_filename,
    std::string *warn);

}  // namespace tinyescn
