#include "cryptsetup_volume.h"

#include <pthread.h>
#include <sys/wait.h>

#include <csignal>
#include <cstdio>
#include <ctime>
#include <utility>

#include "platform_log.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "volume";

// Runs `command` through /bin/sh with `input` on its stdin. SIGPIPE is
// blocked on the calling thread while the pipe is open, so a child that
// exits without reading stdin surfaces as EPIPE instead of killing us.
bool RunCommand(const std::string& command, const std::string& input,
                std::string& error) {
  sigset_t pipe_set;
  sigset_t old_set;
  ::sigemptyset(&pipe_set);
  ::sigaddset(&pipe_set, SIGPIPE);
  if (::pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set) != 0) {
    error = "signal mask failed";
    return false;
  }
  const bool pipe_was_blocked = ::sigismember(&old_set, SIGPIPE) == 1;

  FILE* pipe = ::popen(command.c_str(), "w");
  if (!pipe) {
    ::pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    error = "spawn failed";
    return false;
  }
  bool write_ok = true;
  if (!input.empty()) {
    write_ok = std::fwrite(input.data(), 1, input.size(), pipe) == input.size();
  }
  if (std::fflush(pipe) != 0) {
    write_ok = false;
  }
  const int status = ::pclose(pipe);

  if (!pipe_was_blocked) {
    sigset_t pending;
    ::sigemptyset(&pending);
    if (::sigpending(&pending) == 0 && ::sigismember(&pending, SIGPIPE) == 1) {
      const timespec no_wait{0, 0};
      ::sigtimedwait(&pipe_set, nullptr, &no_wait);
    }
  }
  ::pthread_sigmask(SIG_SETMASK, &old_set, nullptr);

  if (status == -1) {
    error = "wait failed";
    return false;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    error = "exit status " +
            std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
    return false;
  }
  if (!write_ok) {
    error = "stdin write failed";
    return false;
  }
  return true;
}

}  // namespace

bool IsValidVolumeName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  for (const char ch : name) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '.' || ch == '_' ||
                    ch == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::string ShellQuote(const std::string& arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out.push_back('\'');
  for (const char ch : arg) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

CryptsetupVolume::CryptsetupVolume(std::filesystem::path volume_dir,
                                   std::string mapping_name,
                                   std::filesystem::path mount_point)
    : volume_dir_(std::move(volume_dir)),
      mapping_name_(std::move(mapping_name)),
      mount_point_(std::move(mount_point)) {}

bool CryptsetupVolume::unlocked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return opened_ && mounted_;
}

bool CryptsetupVolume::Unlock(const std::string& volume,
                              const std::string& password, bool dispose,
                              std::string& error) {
  if (!IsValidVolumeName(volume)) {
    error = "invalid volume name";
    return false;
  }
  if (!IsValidVolumeName(mapping_name_)) {
    error = "invalid mapping name";
    return false;
  }
  if (password.empty()) {
    error = "empty password";
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string device = ShellQuote((volume_dir_ / volume).string());
  const std::string mapper =
      ShellQuote((std::filesystem::path("/dev/mapper") / mapping_name_)
                     .string());

  std::string cmd_error;
  if (!RunCommand("cryptsetup --key-file=- luksOpen " + device + " " +
                      ShellQuote(mapping_name_),
                  password, cmd_error)) {
    error = "luksOpen failed: " + cmd_error;
    return false;
  }
  opened_ = true;

  if (!RunCommand("mount " + mapper + " " +
                      ShellQuote(mount_point_.string()),
                  std::string(), cmd_error)) {
    error = "mount failed: " + cmd_error;
    return false;
  }
  mounted_ = true;

  if (dispose) {
    if (!RunCommand("cryptsetup --key-file=- luksRemoveKey " + device,
                    password, cmd_error)) {
      error = "password disposal failed: " + cmd_error;
      return false;
    }
    platform::log::Log(platform::log::Level::kInfo, kLogTag,
                       "volume password disposed", {{"volume", volume}});
  }
  platform::log::Log(platform::log::Level::kInfo, kLogTag, "volume unlocked",
                     {{"volume", volume},
                      {"mount_point", mount_point_.string()}});
  return true;
}

void CryptsetupVolume::Lock() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string cmd_error;
  if (!RunCommand("umount " + ShellQuote(mount_point_.string()), std::string(),
                  cmd_error)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag, "umount failed",
                       {{"error", cmd_error}});
  }
  mounted_ = false;
  if (!RunCommand("cryptsetup luksClose " + ShellQuote(mapping_name_),
                  std::string(), cmd_error)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "luksClose failed", {{"error", cmd_error}});
  }
  opened_ = false;
}

}  // namespace msgate::gateway
