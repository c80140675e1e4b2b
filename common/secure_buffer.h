#ifndef MSGATE_SECURE_BUFFER_H
#define MSGATE_SECURE_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "monocypher.h"

namespace msgate::common {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  crypto_wipe(data, len);
}

inline void SecureWipe(std::string& text) {
  if (text.empty()) {
    return;
  }
  SecureWipe(&text[0], text.size());
  text.clear();
}

inline void SecureWipe(std::vector<std::uint8_t>& buf) {
  SecureWipe(buf.data(), buf.size());
}

// Wipes a secret string when the scope ends, whatever path leaves it.
class ScopedWipe {
 public:
  explicit ScopedWipe(std::string& text) : text_(&text) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() {
    if (text_) {
      SecureWipe(*text_);
    }
  }

  void Release() { text_ = nullptr; }

 private:
  std::string* text_{nullptr};
};

}  // namespace msgate::common

#endif  // MSGATE_SECURE_BUFFER_H
