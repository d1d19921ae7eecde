// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "str-util.hh"

namespace tinyescn {

std::string escapeString(const std::string &str) {
  std::string s;
  s.reserve(str.size());

  for (size_t i = 0; i < str.size(); i++) {
    const char c = str[i];
    if (c == '\\') {
      s += "\\\\";
    } else if (c == '"') {
      s += "\\\"";
    } else if (c == '\n') {
      s += "\\n";
    } else if (c == '\r') {
      s += "\\r";
    } else if (c == '\t') {
      s += "\\t";
    } else {
      s += c;
    }
  }

  return s;
}

std::string findSceneFilenamePrefix(const std::string &str) {
  // ".tscn" or ".escn"
  constexpr size_t kSuffixLen = 5;

  if (str.size() < kSuffixLen) {
    return std::string();
  }

  // Greedy: pick the last occurrence.
  for (size_t i = str.size() - kSuffixLen + 1; i-- > 0;) {
    if ((str[i] == '.') && ((str[i + 1] == 't') || (str[i + 1] == 'e')) &&
        (str.compare(i + 2, 3, "scn") == 0)) {
      return str.substr(0, i + kSuffixLen);
    }
  }

  return std::string();
}

}  // namespace tinyescn
