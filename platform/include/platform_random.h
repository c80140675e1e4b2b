#ifndef MSGATE_PLATFORM_RANDOM_H
#define MSGATE_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace msgate::platform {

bool RandomBytes(std::uint8_t* out, std::size_t len);

// `byte_count` random bytes rendered as lowercase hex (2 chars per byte).
bool RandomHex(std::size_t byte_count, std::string& out);

}  // namespace msgate::platform

#endif  // MSGATE_PLATFORM_RANDOM_H
