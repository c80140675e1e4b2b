#ifndef MSGATE_GATEWAY_CONTACT_DIRECTORY_H
#define MSGATE_GATEWAY_CONTACT_DIRECTORY_H

#include <filesystem>
#include <string>
#include <string_view>

#include "gateway_error.h"
#include "storage_layout.h"

namespace msgate::gateway {

struct ContactRecord {
  std::string display_name;
  std::string number;
  std::filesystem::path history_path;
  std::filesystem::path attachment_dir;
};

constexpr const char kUnknownContactName[] = "Unknown";

// `^(\+|00)[0-9]+$`
bool IsCanonicalNumber(std::string_view number);

// Contact file naming: "<display_name> <number>.<ext>". The display name is
// everything before the last space and may not contain '/'.
std::string IdentityToFilename(const std::string& display_name,
                               const std::string& number,
                               const std::string& ext);
bool FilenameToIdentity(const std::string& filename, const std::string& ext,
                        std::string& display_name, std::string& number);

class ContactDirectory {
 public:
  ContactDirectory(std::filesystem::path contacts_root,
                   std::filesystem::path attachments_root, std::string ext);
  explicit ContactDirectory(const StorageLayout& layout);

  // Never creates files.
  bool ResolveByPath(const std::filesystem::path& path, ContactRecord& out,
                     GatewayError& error) const;

  // Creates the contacts root when absent. When no contact file carries
  // `number` an "Unknown <number>" record is returned; its history file is
  // created by the first append.
  bool ResolveByNumber(const std::string& number, ContactRecord& out,
                       GatewayError& error) const;

  const std::filesystem::path& contacts_root() const { return contacts_root_; }
  const std::string& ext() const { return ext_; }

 private:
  ContactRecord MakeRecord(const std::string& display_name,
                           const std::string& number,
                           const std::filesystem::path& history_path) const;

  std::filesystem::path contacts_root_;
  std::filesystem::path attachments_root_;
  std::string ext_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_CONTACT_DIRECTORY_H
