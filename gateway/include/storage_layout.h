#ifndef MSGATE_GATEWAY_STORAGE_LAYOUT_H
#define MSGATE_GATEWAY_STORAGE_LAYOUT_H

#include <filesystem>
#include <string>

#include "config.h"

namespace msgate::gateway {

// Directory layout under the encrypted volume's mount point.
//
//   <mount>/<key_path>/textsecure/private/            transport key material
//   <mount>/<key_path>/textsecure/private/number      registered number
//   <mount>/<key_path>/textsecure/private/prekeys/016777215   sentinel
//   <mount>/textsecure/contacts/<name> <number>.<ext>
//   <mount>/textsecure/attachments/<name> <number>/
struct StorageLayout {
  std::filesystem::path mount_point;
  std::filesystem::path key_root;
  std::filesystem::path private_dir;
  std::filesystem::path contacts_dir;
  std::filesystem::path attachments_dir;
  std::filesystem::path number_path;
  std::filesystem::path sentinel_path;
  std::filesystem::path spool_dir;
  std::string contact_ext{"textsecure"};

  static StorageLayout FromConfig(const GatewayConfig& config);
  static StorageLayout ForMountPoint(const std::filesystem::path& mount_point,
                                     const std::string& key_path = "keys");
};

// The last-resort prekey id (0xffffff) zero-padded to nine digits.
std::string LastResortKeyFileName();

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_STORAGE_LAYOUT_H
