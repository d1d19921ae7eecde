// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include <fstream>

#ifdef _WIN32

#ifdef _MSC_VER
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#include <windows.h>

#ifdef _MSC_VER
#undef NOMINMAX
#endif

#undef WIN32_LEAN_AND_MEAN

#else  // !_WIN32

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

#endif  // _WIN32

#include "common-macros.inc"
#include "io-util.hh"

namespace tinyescn {
namespace io {

// Directory nesting limit.
constexpr uint32_t kMaxDirectoryDepth = 64;

#ifdef _WIN32
std::wstring UTF8ToWchar(const std::string &str) {
  int wstr_size =
      MultiByteToWideChar(CP_UTF8, 0, str.data(), int(str.size()), nullptr, 0);
  std::wstring wstr(size_t(wstr_size), 0);
  MultiByteToWideChar(CP_UTF8, 0, str.data(), int(str.size()), &wstr[0],
                      int(wstr.size()));
  return wstr;
}

std::string WcharToUTF8(const std::wstring &wstr) {
  int str_size = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), int(wstr.size()),
                                     nullptr, 0, nullptr, nullptr);
  std::string str(size_t(str_size), 0);
  WideCharToMultiByte(CP_UTF8, 0, wstr.data(), int(wstr.size()), &str[0],
                      int(str.size()), nullptr, nullptr);
  return str;
}
#endif

std::string GetBaseDir(const std::string &filepath) {
  if (filepath.find_last_of("/\\") != std::string::npos)
    return filepath.substr(0, filepath.find_last_of("/\\"));
  return "";
}

std::string JoinPath(const std::string &dir, const std::string &filename) {
  if (dir.empty()) {
    return filename;
  } else {
    // check '/'
    char lastChar = *dir.rbegin();
    if (lastChar != '/') {
      return dir + std::string("/") + filename;
    } else {
      return dir + filename;
    }
  }
}

bool IsDirectory(const std::string &path) {
#ifdef _WIN32
  DWORD attrib = GetFileAttributesW(UTF8ToWchar(path).c_str());
  return (attrib != INVALID_FILE_ATTRIBUTES) &&
         (attrib & FILE_ATTRIBUTE_DIRECTORY);
#else
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
#endif
}

nonstd::expected<std::string, std::string> ReadFirstLine(
    const std::string &filepath, uint32_t max_read_bytes) {
#if defined(_WIN32) && (defined(_MSC_VER) || defined(_LIBCPP_VERSION))
  std::ifstream f(UTF8ToWchar(filepath).c_str(), std::ifstream::binary);
#else
  std::ifstream f(filepath.c_str(), std::ifstream::binary);
#endif
  if (!f) {
    return nonstd::make_unexpected("File open error : " + filepath);
  }

  std::string line;
  char c;
  while ((line.size() < max_read_bytes) && f.get(c)) {
    if ((c == '\n') || (c == '\r')) {
      break;
    }
    line += c;
  }

  if (f.bad()) {
    return nonstd::make_unexpected("File read error : " + filepath);
  }

  return line;
}

namespace {

#ifdef _WIN32
bool WalkDirectory(const std::string &dir, const std::string &filename,
                   uint32_t depth, std::vector<std::string> *paths,
                   std::string *err) {
  if (depth > kMaxDirectoryDepth) {
    DCOUT("Too deep: " << dir);
    return true;
  }

  WIN32_FIND_DATAW data;
  HANDLE h = FindFirstFileW(UTF8ToWchar(JoinPath(dir, "*")).c_str(), &data);
  if (h == INVALID_HANDLE_VALUE) {
    PUSH_ERROR_AND_RETURN("Failed to open directory : " << dir);
  }

  std::vector<std::string> subdirs;
  do {
    std::string name = WcharToUTF8(data.cFileName);
    if ((name == ".") || (name == "..")) {
      continue;
    }
    if (data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) {
      // Junctions and directory symlinks are not followed.
      if (!(data.dwFileAttributes & FILE_ATTRIBUTE_REPARSE_POINT)) {
        subdirs.push_back(JoinPath(dir, name));
      }
    } else if (name == filename) {
      paths->push_back(JoinPath(dir, name));
    }
  } while (FindNextFileW(h, &data));
  FindClose(h);

  for (const auto &subdir : subdirs) {
    // Unreadable sub directories are skipped.
    std::string local_err;
    if (!WalkDirectory(subdir, filename, depth + 1, paths, &local_err)) {
      DCOUT("Skip " << subdir << " : " << local_err);
    }
  }

  return true;
}
#else
bool WalkDirectory(const std::string &dir, const std::string &filename,
                   uint32_t depth, std::vector<std::string> *paths,
                   std::string *err) {
  if (depth > kMaxDirectoryDepth) {
    DCOUT("Too deep: " << dir);
    return true;
  }

  DIR *dp = opendir(dir.c_str());
  if (!dp) {
    PUSH_ERROR_AND_RETURN("Failed to open directory : " << dir);
  }

  // Files in the directory itself come first, then sub directories
  // (same order as os.walk).
  std::vector<std::string> subdirs;
  struct dirent *entry = nullptr;
  while ((entry = readdir(dp)) != nullptr) {
    std::string name(entry->d_name);
    if ((name == ".") || (name == "..")) {
      continue;
    }

    std::string fullpath = JoinPath(dir, name);

    struct stat st;
    if (lstat(fullpath.c_str(), &st) != 0) {
      DCOUT("lstat failed: " << fullpath);
      continue;
    }

    if (S_ISDIR(st.st_mode)) {
      subdirs.push_back(fullpath);
    } else if (S_ISLNK(st.st_mode) && IsDirectory(fullpath)) {
      // Symlinked directories are not followed.
      DCOUT("Skip symlink to directory: " << fullpath);
    } else if (name == filename) {
      paths->push_back(fullpath);
    }
  }
  closedir(dp);

  for (const auto &subdir : subdirs) {
    // Unreadable sub directories are skipped.
    std::string local_err;
    if (!WalkDirectory(subdir, filename, depth + 1, paths, &local_err)) {
      DCOUT("Skip " << subdir << " : " << local_err);
    }
  }

  return true;
}
#endif

}  // namespace

bool FindFilesRecursive(const std::string &root_dir,
                        const std::string &filename,
                        std::vector<std::string> *paths, std::string *err) {
  if (!paths) {
    PUSH_ERROR_AND_RETURN("`paths` arg is nullptr.");
  }

  if (!IsDirectory(root_dir)) {
    PUSH_ERROR_AND_RETURN("Not a directory : " << root_dir);
  }

  return WalkDirectory(root_dir, filename, 0, paths, err);
}

}  // namespace io
}  // namespace tinyescn
