// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace tinyescn {

inline bool contains(const std::string &str, const std::string &t) {
  return str.find(t) != std::string::npos;
}

inline std::string quote(const std::string &s,
                         const std::string &quote_str = "\"") {
  return quote_str + s + quote_str;
}

// Python like join  ", ".join(v)
template <typename It>
inline std::string join(const std::string &sep, const It &v) {
  std::ostringstream oss;
  if (!v.empty()) {
    typename It::const_iterator it = v.begin();
    oss << *it++;
    for (typename It::const_iterator e = v.end(); it != e; ++it)
      oss << sep << *it;
  }
  return oss.str();
}

///
/// Escape backslash, double quote and control characters so that the string
/// can be written as a double-quoted escn string.
///
std::string escapeString(const std::string &str);

///
/// Find the longest prefix of `str` which ends with `.` + [te] + `scn`.
/// e.g. "house.tscn.001" => "house.tscn"
///
/// Returns empty string when there is no such prefix.
///
std::string findSceneFilenamePrefix(const std::string &str);

}  // namespace tinyescn
