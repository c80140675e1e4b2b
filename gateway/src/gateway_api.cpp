#include "gateway_api.h"

#include <utility>

#include "platform_log.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "api";

ApiResponse ErrorResponse(GatewayError error) {
  ApiResponse res;
  res.ok = false;
  res.error = std::move(error);
  res.response = res.error.message;
  return res;
}

ApiResponse OkResponse(std::optional<std::string> body) {
  ApiResponse res;
  res.ok = true;
  res.response = std::move(body);
  return res;
}

}  // namespace

bool ValidateRequest(const RequestFields& fields,
                     std::initializer_list<const char*> required,
                     GatewayError& error) {
  for (const char* key : required) {
    if (fields.find(key) == fields.end()) {
      error.Set(ErrorCode::kInvalidRequest,
                std::string("missing attribute: ") + key);
      return false;
    }
  }
  return true;
}

GatewayApi::GatewayApi(MessageRelay& relay) : relay_(relay) {}

ApiResponse GatewayApi::HandleRequest(const std::string& uri,
                                      const RequestFields& fields) {
  if (uri == kSendUri) {
    return SendMessage(fields);
  }
  if (uri == kHistoryUri) {
    return DownloadHistory(fields);
  }
  GatewayError error;
  error.Set(ErrorCode::kNotFound, "not found");
  return ErrorResponse(std::move(error));
}

ApiResponse GatewayApi::SendMessage(const RequestFields& fields) {
  GatewayError error;
  if (!ValidateRequest(fields, {"contact", "msg"}, error)) {
    return ErrorResponse(std::move(error));
  }
  SendRequest request;
  request.contact = fields.at("contact");
  request.msg = fields.at("msg");
  const auto attachment = fields.find("attachment");
  if (attachment != fields.end()) {
    request.attachment = attachment->second;
  }
  if (!relay_.Send(request, error)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag, "send failed",
                       {{"code", ErrorCodeName(error.code)},
                        {"error", error.message}});
    return ErrorResponse(std::move(error));
  }
  return OkResponse(std::nullopt);
}

ApiResponse GatewayApi::DownloadHistory(const RequestFields& fields) {
  GatewayError error;
  if (!ValidateRequest(fields, {"contact"}, error)) {
    return ErrorResponse(std::move(error));
  }
  std::string history;
  if (!relay_.History(fields.at("contact"), history, error)) {
    return ErrorResponse(std::move(error));
  }
  return OkResponse(std::move(history));
}

}  // namespace msgate::gateway
