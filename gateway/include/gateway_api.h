#ifndef MSGATE_GATEWAY_API_H
#define MSGATE_GATEWAY_API_H

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>

#include "gateway_error.h"
#include "message_relay.h"

namespace msgate::gateway {

constexpr const char kSendUri[] = "/api/textsecure/send";
constexpr const char kHistoryUri[] = "/api/textsecure/history";

// Request fields as parsed by the HTTP layer.
using RequestFields = std::unordered_map<std::string, std::string>;

struct ApiResponse {
  bool ok{false};
  std::optional<std::string> response;  // nullopt renders as null
  GatewayError error;

  const char* status() const { return ok ? "OK" : "KO"; }
};

bool ValidateRequest(const RequestFields& fields,
                     std::initializer_list<const char*> required,
                     GatewayError& error);

class GatewayApi {
 public:
  explicit GatewayApi(MessageRelay& relay);

  ApiResponse HandleRequest(const std::string& uri,
                            const RequestFields& fields);

 private:
  ApiResponse SendMessage(const RequestFields& fields);
  ApiResponse DownloadHistory(const RequestFields& fields);

  MessageRelay& relay_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_API_H
