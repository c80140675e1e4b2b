#include "platform_random.h"

#include <fcntl.h>
#include <unistd.h>

#include <vector>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace msgate::platform {

namespace {

bool ReadUrandom(std::uint8_t* out, std::size_t len) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  std::size_t done = 0;
  while (done < len) {
    const ssize_t got = ::read(fd, out + done, len - done);
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  ::close(fd);
  return done == len;
}

}  // namespace

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  if (!out || len == 0) {
    return false;
  }
#if defined(__linux__)
  std::size_t done = 0;
  while (done < len) {
    const ssize_t got = ::getrandom(out + done, len - done, 0);
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  if (done == len) {
    return true;
  }
#endif
  return ReadUrandom(out, len);
}

bool RandomHex(std::size_t byte_count, std::string& out) {
  out.clear();
  std::vector<std::uint8_t> bytes(byte_count);
  if (!RandomBytes(bytes.data(), bytes.size())) {
    return false;
  }
  static constexpr char kHex[] = "0123456789abcdef";
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[i * 2] = kHex[bytes[i] >> 4];
    out[i * 2 + 1] = kHex[bytes[i] & 0x0F];
  }
  return true;
}

}  // namespace msgate::platform
