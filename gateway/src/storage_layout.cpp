#include "storage_layout.h"

#include <cstdint>
#include <cstdio>

namespace msgate::gateway {

namespace {

constexpr std::uint32_t kLastResortKeyId = 0xFFFFFF;
constexpr const char kServiceDir[] = "textsecure";

}  // namespace

std::string LastResortKeyFileName() {
  char buf[16] = {};
  std::snprintf(buf, sizeof(buf), "%09u",
                static_cast<unsigned int>(kLastResortKeyId));
  return buf;
}

StorageLayout StorageLayout::ForMountPoint(
    const std::filesystem::path& mount_point, const std::string& key_path) {
  StorageLayout layout;
  layout.mount_point = mount_point.lexically_normal();
  layout.key_root = (layout.mount_point / key_path).lexically_normal();
  layout.private_dir = layout.key_root / kServiceDir / "private";
  layout.contacts_dir = layout.mount_point / kServiceDir / "contacts";
  layout.attachments_dir = layout.mount_point / kServiceDir / "attachments";
  layout.number_path = layout.private_dir / "number";
  layout.sentinel_path =
      layout.private_dir / "prekeys" / LastResortKeyFileName();
  layout.spool_dir = layout.mount_point / kServiceDir / "spool";
  return layout;
}

StorageLayout StorageLayout::FromConfig(const GatewayConfig& config) {
  StorageLayout layout =
      ForMountPoint(config.storage.mount_point, config.storage.key_path);
  layout.contact_ext = config.gateway.contact_ext;
  if (!config.transport.spool_dir.empty()) {
    layout.spool_dir =
        std::filesystem::path(config.transport.spool_dir).lexically_normal();
  }
  return layout;
}

}  // namespace msgate::gateway
