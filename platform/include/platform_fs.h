#ifndef MSGATE_PLATFORM_FS_H
#define MSGATE_PLATFORM_FS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace msgate::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec);
// Creates every missing component with mode 0700.
bool CreatePrivateDirectories(const std::filesystem::path& path,
                              std::error_code& ec);
bool Remove(const std::filesystem::path& path, std::error_code& ec);
bool ListDir(const std::filesystem::path& path,
             std::vector<std::filesystem::path>& out,
             std::error_code& ec);
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);

// One write(2) on an O_APPEND descriptor, file created 0600 when absent.
// A short write is reported as io_error and never retried, so a record is
// either appended whole or reported as failed.
bool AppendAll(const std::filesystem::path& path,
               const std::uint8_t* data,
               std::size_t len,
               std::error_code& ec);

// O_CREAT|O_EXCL, mode 0600. Fails with file_exists when the name is taken.
bool CreateExclusive(const std::filesystem::path& path, std::error_code& ec);

}  // namespace msgate::platform::fs

#endif  // MSGATE_PLATFORM_FS_H
