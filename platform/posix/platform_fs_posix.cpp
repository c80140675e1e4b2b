#include "platform_fs.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <string>

namespace {

void SetErrno(std::error_code& ec) {
  ec = std::error_code(errno, std::generic_category());
}

bool WriteAllFd(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  std::size_t offset = 0;
  while (offset < len) {
    const std::size_t chunk = len - offset;
    const ssize_t rc =
        ::write(fd, data + offset, static_cast<size_t>(chunk));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      return false;
    }
    offset += static_cast<std::size_t>(rc);
  }
  return true;
}

std::filesystem::path BuildTempPath(const std::filesystem::path& target,
                                    int attempt) {
  std::filesystem::path dir =
      target.has_parent_path() ? target.parent_path() : std::filesystem::path{};
  std::string base = target.filename().string();
  if (base.empty()) {
    base = "tmp";
  }
  const int pid = static_cast<int>(::getpid());
  std::string name = base + ".tmp." + std::to_string(pid) + "." +
                     std::to_string(attempt);
  return dir.empty() ? std::filesystem::path{name} : (dir / name);
}

}  // namespace

namespace msgate::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec) {
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool CreatePrivateDirectories(const std::filesystem::path& path,
                              std::error_code& ec) {
  ec.clear();
  if (path.empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  std::filesystem::path current;
  for (const auto& part : path) {
    current /= part;
    if (::mkdir(current.c_str(), 0700) != 0 && errno != EEXIST) {
      SetErrno(ec);
      return false;
    }
  }
  if (!std::filesystem::is_directory(path, ec)) {
    if (!ec) {
      ec = std::make_error_code(std::errc::not_a_directory);
    }
    return false;
  }
  return true;
}

bool Remove(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::remove(path, ec);
}

bool ListDir(const std::filesystem::path& path,
             std::vector<std::filesystem::path>& out,
             std::error_code& ec) {
  out.clear();
  ec.clear();
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return false;
  }
  const std::filesystem::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      out.clear();
      return false;
    }
    out.push_back(it->path());
  }
  return true;
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  if (len > 0 && !data) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  for (int attempt = 0; attempt < 16; ++attempt) {
    const std::filesystem::path tmp = BuildTempPath(path, attempt);
    const int fd =
        ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC, 0600);
    if (fd < 0) {
      if (errno == EEXIST) {
        continue;
      }
      SetErrno(ec);
      return false;
    }

    if (len > 0 && !WriteAllFd(fd, data, len, ec)) {
      ::close(fd);
      std::error_code ignore_ec;
      std::filesystem::remove(tmp, ignore_ec);
      return false;
    }
    if (::fsync(fd) != 0) {
      SetErrno(ec);
      ::close(fd);
      std::error_code ignore_ec;
      std::filesystem::remove(tmp, ignore_ec);
      return false;
    }
    if (::close(fd) != 0) {
      SetErrno(ec);
      std::error_code ignore_ec;
      std::filesystem::remove(tmp, ignore_ec);
      return false;
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
      SetErrno(ec);
      std::error_code ignore_ec;
      std::filesystem::remove(tmp, ignore_ec);
      return false;
    }

    std::filesystem::path dir =
        path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    const int dfd = ::open(dir.c_str(), O_RDONLY);
    if (dfd >= 0) {
      (void)::fsync(dfd);
      (void)::close(dfd);
    }
    return true;
  }

  ec = std::make_error_code(std::errc::file_exists);
  return false;
}

bool AppendAll(const std::filesystem::path& path,
               const std::uint8_t* data,
               std::size_t len,
               std::error_code& ec) {
  ec.clear();
  if (path.empty() || (len > 0 && !data)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
  if (fd < 0) {
    SetErrno(ec);
    return false;
  }
  ssize_t rc = -1;
  do {
    rc = ::write(fd, data, len);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) {
    SetErrno(ec);
    ::close(fd);
    return false;
  }
  if (static_cast<std::size_t>(rc) != len) {
    ec = std::make_error_code(std::errc::io_error);
    ::close(fd);
    return false;
  }
  if (::close(fd) != 0) {
    SetErrno(ec);
    return false;
  }
  return true;
}

bool CreateExclusive(const std::filesystem::path& path, std::error_code& ec) {
  ec.clear();
  if (path.empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
  if (fd < 0) {
    SetErrno(ec);
    return false;
  }
  if (::close(fd) != 0) {
    SetErrno(ec);
    return false;
  }
  return true;
}

}  // namespace msgate::platform::fs
