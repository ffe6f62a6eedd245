#include "pathutils.hpp"

#include <system_error>

namespace fs = std::filesystem;

std::string normalizePath(const fs::path &path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec)
    absolute = path;

  std::string normalized = absolute.lexically_normal().string();
  while (normalized.size() > 1 && normalized.back() == '/')
    normalized.pop_back();
  return normalized;
}

std::string resolvePath(const fs::path &path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (ec)
    return normalizePath(path);
  return normalizePath(resolved);
}

bool isSameOrDescendant(const fs::path &candidate, const fs::path &base) {
  auto c = candidate.begin();
  for (auto b = base.begin(); b != base.end(); ++b, ++c) {
    // A trailing separator shows up as an empty component
    if (b->empty())
      continue;
    if (c == candidate.end() || *c != *b)
      return false;
  }
  return true;
}

std::string parentPath(const std::string &path) {
  fs::path p(path);
  if (p == p.root_path())
    return p.string();
  return normalizePath(p.parent_path());
}
