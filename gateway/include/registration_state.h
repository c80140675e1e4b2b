#ifndef MSGATE_GATEWAY_REGISTRATION_STATE_H
#define MSGATE_GATEWAY_REGISTRATION_STATE_H

#include <filesystem>
#include <optional>
#include <string>

#include "gateway_error.h"
#include "storage_layout.h"

namespace msgate::gateway {

// Process-wide registration state, persisted inside the encrypted volume's
// private key storage. Registration is one-shot: once the sentinel key file
// exists the state only changes when the storage directory is wiped by hand.
class RegistrationState {
 public:
  explicit RegistrationState(const StorageLayout& layout);

  // Re-reads the sentinel and the number file. A missing number file is
  // not an error.
  bool Load(GatewayError& error);

  bool EnsureStorageDir(GatewayError& error) const;

  // Write-temp-then-rename; the number is stored verbatim.
  bool SaveNumber(const std::string& number, GatewayError& error);

  bool provisioned() const { return provisioned_; }
  bool NeedsRegistration() const { return !provisioned_; }
  const std::optional<std::string>& registered_number() const {
    return number_;
  }

  const std::filesystem::path& storage_dir() const { return storage_dir_; }
  const std::filesystem::path& number_path() const { return number_path_; }
  const std::filesystem::path& sentinel_path() const { return sentinel_path_; }

 private:
  std::filesystem::path storage_dir_;
  std::filesystem::path number_path_;
  std::filesystem::path sentinel_path_;
  bool provisioned_{false};
  std::optional<std::string> number_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_REGISTRATION_STATE_H
