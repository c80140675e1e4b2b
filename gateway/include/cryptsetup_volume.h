#ifndef MSGATE_GATEWAY_CRYPTSETUP_VOLUME_H
#define MSGATE_GATEWAY_CRYPTSETUP_VOLUME_H

#include <filesystem>
#include <mutex>
#include <string>

#include "volume_manager.h"

namespace msgate::gateway {

// LUKS volume driven through cryptsetup(8) and mount(8). The password is
// handed to cryptsetup on stdin, never on the command line.
class CryptsetupVolume : public VolumeManager {
 public:
  CryptsetupVolume(std::filesystem::path volume_dir, std::string mapping_name,
                   std::filesystem::path mount_point);

  bool Unlock(const std::string& volume, const std::string& password,
              bool dispose, std::string& error) override;
  void Lock() override;

  bool unlocked() const;

 private:
  std::filesystem::path volume_dir_;
  std::string mapping_name_;
  std::filesystem::path mount_point_;
  mutable std::mutex mutex_;
  bool opened_{false};
  bool mounted_{false};
};

// Accepts [A-Za-z0-9._-] names other than "." and "..".
bool IsValidVolumeName(const std::string& name);

// POSIX shell single-quoting.
std::string ShellQuote(const std::string& arg);

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_CRYPTSETUP_VOLUME_H
