#ifndef MSGATE_PLATFORM_TIME_H
#define MSGATE_PLATFORM_TIME_H

#include <cstdint>
#include <string>

namespace msgate::platform {

std::uint64_t NowUnixSeconds();
void SleepMs(std::uint32_t ms);

// Local time with minute resolution, e.g. "Jan 02 15:04".
std::string FormatLocalMinute(std::uint64_t unix_seconds);

}  // namespace msgate::platform

#endif  // MSGATE_PLATFORM_TIME_H
