#include "registration_state.h"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <utility>

#include "platform_fs.h"

namespace msgate::gateway {

namespace {

constexpr std::uint64_t kMaxNumberFileBytes = 256;

}  // namespace

RegistrationState::RegistrationState(const StorageLayout& layout)
    : storage_dir_(layout.private_dir),
      number_path_(layout.number_path),
      sentinel_path_(layout.sentinel_path) {}

bool RegistrationState::Load(GatewayError& error) {
  provisioned_ = false;
  number_.reset();

  std::error_code ec;
  provisioned_ = platform::fs::Exists(sentinel_path_, ec);
  if (ec) {
    error.Set(ErrorCode::kStorageFailure,
              "sentinel check failed: " + ec.message());
    return false;
  }

  const bool has_number = platform::fs::Exists(number_path_, ec);
  if (ec) {
    error.Set(ErrorCode::kStorageFailure,
              "number file check failed: " + ec.message());
    return false;
  }
  if (!has_number) {
    return true;
  }

  const std::uint64_t size = platform::fs::FileSize(number_path_, ec);
  if (ec || size > kMaxNumberFileBytes) {
    error.Set(ErrorCode::kStorageFailure, "number file invalid");
    return false;
  }
  std::ifstream ifs(number_path_, std::ios::binary);
  if (!ifs) {
    error.Set(ErrorCode::kStorageFailure, "number file read failed");
    return false;
  }
  std::string number((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    error.Set(ErrorCode::kStorageFailure, "number file read failed");
    return false;
  }
  if (!number.empty()) {
    number_ = std::move(number);
  }
  return true;
}

bool RegistrationState::EnsureStorageDir(GatewayError& error) const {
  std::error_code ec;
  if (!platform::fs::CreatePrivateDirectories(storage_dir_, ec)) {
    error.Set(ErrorCode::kStorageFailure,
              "key storage unavailable: " + ec.message());
    return false;
  }
  return true;
}

bool RegistrationState::SaveNumber(const std::string& number,
                                   GatewayError& error) {
  if (!EnsureStorageDir(error)) {
    return false;
  }
  std::error_code ec;
  if (!platform::fs::AtomicWrite(
          number_path_, reinterpret_cast<const std::uint8_t*>(number.data()),
          number.size(), ec)) {
    error.Set(ErrorCode::kStorageFailure,
              "failed to save number: " + ec.message());
    return false;
  }
  number_ = number;
  return true;
}

}  // namespace msgate::gateway
