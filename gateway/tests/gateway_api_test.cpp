#include "gateway_api.h"

#include <chrono>
#include <string>

#include "test_support.h"

using msgate::gateway::ApiResponse;
using msgate::gateway::AttachmentStore;
using msgate::gateway::ContactDirectory;
using msgate::gateway::ErrorCode;
using msgate::gateway::GatewayApi;
using msgate::gateway::GatewayError;
using msgate::gateway::HistoryStore;
using msgate::gateway::kHistoryUri;
using msgate::gateway::kSendUri;
using msgate::gateway::MessageRelay;
using msgate::gateway::NotificationBoard;
using msgate::gateway::PathGuard;
using msgate::gateway::RequestFields;
using msgate::gateway::StorageLayout;
using msgate::gateway::ValidateRequest;
using msgate::gateway::test::Check;
using msgate::gateway::test::EndsWith;
using msgate::gateway::test::FakeTransport;
using msgate::gateway::test::TempDir;
using msgate::gateway::test::WriteFile;

int main() {
  {
    RequestFields fields{{"contact", "x"}};
    GatewayError err;
    if (!Check(ValidateRequest(fields, {"contact"}, err) && err.ok())) {
      return 1;
    }
    if (!Check(!ValidateRequest(fields, {"contact", "msg"}, err) &&
               err.code == ErrorCode::kInvalidRequest &&
               err.message == "missing attribute: msg")) {
      return 1;
    }
  }

  const auto root = TempDir("msgate_api_test");
  const auto layout = StorageLayout::ForMountPoint(root);
  WriteFile(layout.contacts_dir / "Bob +15557777.textsecure", "");
  PathGuard guard(layout);
  ContactDirectory contacts(layout);
  HistoryStore history;
  AttachmentStore attachments(guard);
  NotificationBoard board;
  FakeTransport transport;
  MessageRelay relay(transport, guard, contacts, history, attachments, board,
                     std::chrono::milliseconds(10));
  GatewayApi api(relay);
  const std::string bob = "/textsecure/contacts/Bob +15557777.textsecure";

  {
    const ApiResponse res =
        api.HandleRequest(kSendUri, {{"contact", bob}, {"msg", "ping"}});
    if (!Check(res.ok && std::string(res.status()) == "OK" &&
               !res.response.has_value())) {
      return 1;
    }
  }

  {
    const ApiResponse res = api.HandleRequest(kSendUri, {{"contact", bob}});
    if (!Check(!res.ok && std::string(res.status()) == "KO" &&
               res.error.code == ErrorCode::kInvalidRequest &&
               res.response.has_value() &&
               *res.response == "missing attribute: msg")) {
      return 1;
    }
  }

  {
    const ApiResponse res = api.HandleRequest(kHistoryUri, {{"contact", bob}});
    if (!Check(res.ok && res.response.has_value() &&
               EndsWith(*res.response, " > ping\n"))) {
      return 1;
    }
  }

  {
    const ApiResponse res = api.HandleRequest(
        kHistoryUri,
        {{"contact", "/textsecure/contacts/Carol +15550000.textsecure"}});
    if (!Check(!res.ok && res.error.code == ErrorCode::kStorageFailure)) {
      return 1;
    }
  }

  {
    const ApiResponse res = api.HandleRequest(
        kSendUri, {{"contact", "/etc/passwd"}, {"msg", "x"}});
    if (!Check(!res.ok && res.error.code == ErrorCode::kInvalidContact)) {
      return 1;
    }
  }

  {
    const ApiResponse res = api.HandleRequest("/api/textsecure/other", {});
    if (!Check(!res.ok && res.error.code == ErrorCode::kNotFound &&
               std::string(res.status()) == "KO")) {
      return 1;
    }
  }

  if (!Check(transport.sent().size() == 1)) {
    return 1;
  }
  return 0;
}
