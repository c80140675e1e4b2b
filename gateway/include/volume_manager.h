#ifndef MSGATE_GATEWAY_VOLUME_MANAGER_H
#define MSGATE_GATEWAY_VOLUME_MANAGER_H

#include <string>

namespace msgate::gateway {

// Encrypted volume holding registration state and key material.
class VolumeManager {
 public:
  virtual ~VolumeManager() = default;

  // `dispose` removes the password from the volume's key slots once the
  // volume is open, so it cannot be used a second time.
  virtual bool Unlock(const std::string& volume, const std::string& password,
                      bool dispose, std::string& error) = 0;

  // Best effort: unmounts and closes, logging failures.
  virtual void Lock() = 0;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_VOLUME_MANAGER_H
