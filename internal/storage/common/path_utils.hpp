#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace slideshow::storage::common {

/*
  Store paths are relative, '/'-separated and may not escape the root.
*/
inline void ValidateStorePath(const std::string& path) {
  if (path.empty()) {
    throw util::InvalidArgument("store path must not be empty");
  }
  if (path.front() == '/' || path.find('\\') != std::string::npos || path.find('\0') != std::string::npos) {
    throw util::InvalidArgument("store path must be relative: " + path);
  }

  std::string_view rest = path;
  while (!rest.empty()) {
    auto             slash     = rest.find('/');
    std::string_view component = rest.substr(0, slash);
    if (component.empty() || component == "." || component == "..") {
      throw util::InvalidArgument("store path contains invalid component: " + path);
    }
    if (slash == std::string_view::npos) break;
    rest.remove_prefix(slash + 1);
    if (rest.empty()) {
      throw util::InvalidArgument("store path must not end with '/': " + path);
    }
  }
}

inline std::string JoinStorePath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

inline std::string ParentOf(const std::string& path) {
  auto slash = path.rfind('/');
  return slash == std::string::npos ? std::string{} : path.substr(0, slash);
}

inline std::string BaseName(const std::string& path) {
  auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace slideshow::storage::common
