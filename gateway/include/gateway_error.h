#ifndef MSGATE_GATEWAY_ERROR_H
#define MSGATE_GATEWAY_ERROR_H

#include <cstdint>
#include <string>
#include <utility>

namespace msgate::gateway {

enum class ErrorCode : std::uint8_t {
  kNone = 0,
  kInvalidRequest = 1,
  kInvalidContact = 2,
  kInvalidNumber = 3,
  kTransportFailure = 4,
  kStorageFailure = 5,
  kAlreadyRegistered = 6,
  kNotRegistered = 7,
  kNotFound = 8,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kInvalidRequest:
      return "invalid_request";
    case ErrorCode::kInvalidContact:
      return "invalid_contact";
    case ErrorCode::kInvalidNumber:
      return "invalid_number";
    case ErrorCode::kTransportFailure:
      return "transport_failure";
    case ErrorCode::kStorageFailure:
      return "storage_failure";
    case ErrorCode::kAlreadyRegistered:
      return "already_registered";
    case ErrorCode::kNotRegistered:
      return "not_registered";
    case ErrorCode::kNotFound:
      return "not_found";
  }
  return "unknown";
}

struct GatewayError {
  ErrorCode code{ErrorCode::kNone};
  std::string message;

  void Set(ErrorCode c, std::string msg) {
    code = c;
    message = std::move(msg);
  }

  void Clear() {
    code = ErrorCode::kNone;
    message.clear();
  }

  bool ok() const { return code == ErrorCode::kNone; }
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_ERROR_H
