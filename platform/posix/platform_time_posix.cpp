#include "platform_time.h"

#include <time.h>

#include <chrono>
#include <thread>

namespace msgate::platform {

std::uint64_t NowUnixSeconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto sec = std::chrono::duration_cast<std::chrono::seconds>(now).count();
  return sec <= 0 ? 0 : static_cast<std::uint64_t>(sec);
}

void SleepMs(std::uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string FormatLocalMinute(std::uint64_t unix_seconds) {
  const time_t t = static_cast<time_t>(unix_seconds);
  struct tm local {};
  if (::localtime_r(&t, &local) == nullptr) {
    return "Jan 01 00:00";
  }
  char buf[32] = {};
  const std::size_t n = ::strftime(buf, sizeof(buf), "%b %d %H:%M", &local);
  return std::string(buf, n);
}

}  // namespace msgate::platform
