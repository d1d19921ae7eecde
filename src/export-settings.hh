// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#pragma once

#include <functional>
#include <set>
#include <string>

namespace tinyescn {

///
/// Where to look for existing scenes/resources in the project.
///
enum class SearchPathMode {
  ProjectDir,  // "PROJECT_DIR"
  ExportDir,   // "EXPORT_DIR"
  Disabled,    // anything else
};

inline SearchPathMode ParseSearchPathMode(const std::string &s) {
  if (s == "PROJECT_DIR") {
    return SearchPathMode::ProjectDir;
  } else if (s == "EXPORT_DIR") {
    return SearchPathMode::ExportDir;
  }
  return SearchPathMode::Disabled;
}

inline std::string to_string(SearchPathMode mode) {
  switch (mode) {
    case SearchPathMode::ProjectDir:
      return "PROJECT_DIR";
    case SearchPathMode::ExportDir:
      return "EXPORT_DIR";
    case SearchPathMode::Disabled:
      return "DISABLED";
  }
  return "[[InvalidSearchPathMode]]";
}

///
/// Export settings. Read-only during an export pass.
///
struct ExportSettings {
  // Object types to export(e.g. "EMPTY", "CAMERA", "LIGHT")
  std::set<std::string> object_types{"EMPTY", "CAMERA", "LIGHT"};

  SearchPathMode material_search_paths{SearchPathMode::ProjectDir};

  // Returns the project root directory. Evaluated lazily(only when a project
  // directory search is required).
  std::function<std::string()> project_path_func;

  // Export target file path.
  std::string path;

  // Frames per second of the source scene. Used to convert key frames to
  // seconds.
  double fps{24.0};
};

}  // namespace tinyescn
