#ifndef MSGATE_GATEWAY_PATH_GUARD_H
#define MSGATE_GATEWAY_PATH_GUARD_H

#include <filesystem>
#include <string>

#include "storage_layout.h"

namespace msgate::gateway {

// Lexically normalized path without a trailing separator.
std::filesystem::path CleanPath(const std::filesystem::path& path);

// True when `path` equals `root` or lies below it. Both must be clean.
bool IsWithin(const std::filesystem::path& root,
              const std::filesystem::path& path);

struct KeyPathInfo {
  bool in_key_path{false};
  bool is_private{false};
};

// Maps API request paths onto the storage root and classifies resolved
// paths against the key storage area.
class PathGuard {
 public:
  explicit PathGuard(const StorageLayout& layout);

  // `request_path` is relative to the storage root (a leading '/' is
  // accepted). Fails when the normalized result escapes the root.
  bool ResolveRequestPath(const std::string& request_path,
                          std::filesystem::path& out,
                          std::string& error) const;

  // Symlinks and ".." are resolved before classification.
  KeyPathInfo DetectKeyPath(const std::filesystem::path& path) const;
  bool IsPrivateKeyPath(const std::filesystem::path& path) const;

  bool RelativeToRoot(const std::filesystem::path& path,
                      std::string& out) const;

  const std::filesystem::path& root() const { return root_; }

 private:
  std::filesystem::path root_;
  std::filesystem::path key_root_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_PATH_GUARD_H
