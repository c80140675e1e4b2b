#include "path_guard.h"

#include <system_error>

namespace msgate::gateway {

namespace {

constexpr const char kPrivateDirName[] = "private";

std::filesystem::path Resolve(const std::filesystem::path& path) {
  std::error_code ec;
  auto resolved = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    return CleanPath(path);
  }
  return CleanPath(resolved);
}

}  // namespace

std::filesystem::path CleanPath(const std::filesystem::path& path) {
  auto clean = path.lexically_normal();
  if (!clean.empty() && clean.filename().empty() && clean.has_parent_path() &&
      clean != clean.root_path()) {
    clean = clean.parent_path();
  }
  return clean;
}

bool IsWithin(const std::filesystem::path& root,
              const std::filesystem::path& path) {
  auto root_it = root.begin();
  auto path_it = path.begin();
  for (; root_it != root.end(); ++root_it) {
    if (root_it->empty()) {
      continue;
    }
    while (path_it != path.end() && path_it->empty()) {
      ++path_it;
    }
    if (path_it == path.end() || *path_it != *root_it) {
      return false;
    }
    ++path_it;
  }
  return true;
}

PathGuard::PathGuard(const StorageLayout& layout)
    : root_(CleanPath(layout.mount_point)),
      key_root_(CleanPath(layout.key_root)) {}

bool PathGuard::ResolveRequestPath(const std::string& request_path,
                                   std::filesystem::path& out,
                                   std::string& error) const {
  out.clear();
  if (request_path.empty()) {
    error = "empty path";
    return false;
  }
  if (request_path.find('\0') != std::string::npos) {
    error = "invalid path";
    return false;
  }
  std::filesystem::path rel(request_path);
  if (rel.has_root_path()) {
    rel = rel.relative_path();
  }
  const auto joined = CleanPath(root_ / rel);
  if (!IsWithin(root_, joined)) {
    error = "path traversal detected";
    return false;
  }
  out = joined;
  return true;
}

KeyPathInfo PathGuard::DetectKeyPath(const std::filesystem::path& path) const {
  KeyPathInfo info;
  const auto resolved = Resolve(path);
  const auto key_root = Resolve(key_root_);
  if (!IsWithin(key_root, resolved)) {
    return info;
  }
  info.in_key_path = true;
  const auto rel = resolved.lexically_relative(key_root);
  for (const auto& part : rel) {
    if (part == kPrivateDirName) {
      info.is_private = true;
      break;
    }
  }
  return info;
}

bool PathGuard::IsPrivateKeyPath(const std::filesystem::path& path) const {
  const KeyPathInfo info = DetectKeyPath(path);
  return info.in_key_path && info.is_private;
}

bool PathGuard::RelativeToRoot(const std::filesystem::path& path,
                               std::string& out) const {
  out.clear();
  const auto clean = CleanPath(path);
  if (!IsWithin(root_, clean)) {
    return false;
  }
  out = clean.lexically_relative(root_).generic_string();
  return !out.empty();
}

}  // namespace msgate::gateway
