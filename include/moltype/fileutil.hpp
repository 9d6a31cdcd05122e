// Copyright Global Phasing Ltd.
//
// File-related utilities.

#ifndef MOLTYPE_FILEUTIL_HPP_
#define MOLTYPE_FILEUTIL_HPP_

#include <cstdio>    // for FILE, fopen, fclose
#include <cstring>   // for strlen
#include <initializer_list>
#include <string>

namespace moltype {

// strip directory and suffixes from filename
inline std::string path_basename(const std::string& path,
                                 std::initializer_list<const char*> exts) {
  size_t pos = path.find_last_of("\\/");
  std::string basename = pos == std::string::npos ? path : path.substr(pos + 1);
  for (const char* ext : exts) {
    size_t len = std::strlen(ext);
    if (basename.size() > len &&
        basename.compare(basename.length() - len, len, ext, len) == 0)
      basename.resize(basename.length() - len);
  }
  return basename;
}

inline std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty())
    return name;
  char last = dir.back();
  return last == '/' || last == '\\' ? dir + name : dir + '/' + name;
}

// true if the file can be opened for reading
inline bool file_exists(const std::string& path) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (f == nullptr)
    return false;
  std::fclose(f);
  return true;
}

} // namespace moltype
#endif
