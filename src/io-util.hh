// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "nonstd/expected.hpp"

namespace tinyescn {
namespace io {

#ifdef _WIN32
std::wstring UTF8ToWchar(const std::string &str);
std::string WcharToUTF8(const std::wstring &wstr);
#endif

std::string GetBaseDir(const std::string &filepath);
std::string JoinPath(const std::string &dir, const std::string &filename);

bool IsDirectory(const std::string &path);

///
/// Read the first line of a text file(without the trailing newline).
/// At most `max_read_bytes` bytes are read.
///
nonstd::expected<std::string, std::string> ReadFirstLine(
    const std::string &filepath, uint32_t max_read_bytes = 4096);

///
/// Recursively walk `root_dir` and collect the paths of the files whose name
/// is exactly `filename`. Paths are appended in directory traversal order.
/// Symlinks to directories are not followed. Symlinks to files are
/// collected like regular files.
///
/// @param[in] root_dir Directory to search.
/// @param[in] filename File name to match(verbatim).
/// @param[out] paths Found paths.
/// @param[out] err Error message.
///
/// @return false when `root_dir` cannot be opened.
///
bool FindFilesRecursive(const std::string &root_dir,
                        const std::string &filename,
                        std::vector<std::string> *paths, std::string *err);

}  // namespace io
}  // namespace tinyescn
