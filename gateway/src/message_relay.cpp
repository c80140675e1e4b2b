#include "message_relay.h"

#include <filesystem>
#include <fstream>

#include "platform_log.h"
#include "platform_time.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "relay";

using platform::log::Level;

}  // namespace

MessageRelay::MessageRelay(Transport& transport, const PathGuard& guard,
                           const ContactDirectory& contacts,
                           const HistoryStore& history,
                           const AttachmentStore& attachments,
                           NotificationBoard& board,
                           std::chrono::milliseconds notify_ttl)
    : transport_(transport),
      guard_(guard),
      contacts_(contacts),
      history_(history),
      attachments_(attachments),
      board_(board),
      notify_ttl_(notify_ttl) {}

bool MessageRelay::ResolveContact(const std::string& request_path,
                                  ContactRecord& out,
                                  GatewayError& error) const {
  std::filesystem::path path;
  std::string path_error;
  if (!guard_.ResolveRequestPath(request_path, path, path_error)) {
    error.Set(ErrorCode::kInvalidContact, path_error);
    return false;
  }
  return contacts_.ResolveByPath(path, out, error);
}

bool MessageRelay::Send(const SendRequest& request, GatewayError& error) {
  ContactRecord contact;
  if (!ResolveContact(request.contact, contact, error)) {
    return false;
  }

  HistoryEntry entry;
  entry.direction = Direction::kOutbound;

  if (request.attachment.has_value()) {
    std::filesystem::path attachment_path;
    std::string path_error;
    if (!guard_.ResolveRequestPath(*request.attachment, attachment_path,
                                   path_error)) {
      error.Set(ErrorCode::kInvalidContact, "attachment: " + path_error);
      return false;
    }
    if (guard_.IsPrivateKeyPath(attachment_path)) {
      platform::log::Log(Level::kWarn, kLogTag,
                         "refused attachment inside private key storage",
                         {{"path", attachment_path.string()}});
      error.Set(ErrorCode::kInvalidContact,
                "downloading private key(s) is not allowed");
      return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(attachment_path, ec)) {
      error.Set(ErrorCode::kInvalidRequest,
                "attachment is not a file: " + attachment_path.string());
      return false;
    }
    std::ifstream attachment(attachment_path, std::ios::binary);
    if (!attachment) {
      error.Set(ErrorCode::kStorageFailure,
                "attachment open failed: " + attachment_path.string());
      return false;
    }

    std::string send_error;
    if (!transport_.SendAttachment(contact.number, request.msg, attachment,
                                   send_error)) {
      error.Set(ErrorCode::kTransportFailure, send_error);
      return false;
    }
    entry.body = "[" + attachment_path.filename().string() + "]";
    if (!request.msg.empty()) {
      entry.body += " " + request.msg;
    }
  } else {
    std::string send_error;
    if (!transport_.Send(contact.number, request.msg, send_error)) {
      error.Set(ErrorCode::kTransportFailure, send_error);
      return false;
    }
    entry.body = request.msg;
  }

  entry.timestamp = platform::NowUnixSeconds();
  return history_.Append(contact, entry, error);
}

bool MessageRelay::History(const std::string& contact_path, std::string& out,
                           GatewayError& error) {
  ContactRecord contact;
  if (!ResolveContact(contact_path, contact, error)) {
    return false;
  }
  return history_.ReadTail(contact, out, error);
}

void MessageRelay::OnMessage(const InboundMessage& message) {
  platform::log::Log(Level::kInfo, kLogTag, "received message",
                     {{"from", message.source}});
  board_.NotifyFor(Level::kInfo, "received message from " + message.source,
                   notify_ttl_);

  ContactRecord contact;
  GatewayError error;
  if (!contacts_.ResolveByNumber(message.source, contact, error)) {
    platform::log::Log(Level::kError, kLogTag, "dropping inbound message",
                       {{"from", message.source},
                        {"error", error.message}});
    return;
  }

  const std::uint64_t timestamp =
      message.timestamp != 0 ? message.timestamp : platform::NowUnixSeconds();

  if (!message.body.empty()) {
    HistoryEntry entry;
    entry.timestamp = timestamp;
    entry.direction = Direction::kInbound;
    entry.body = message.body;
    if (!history_.Append(contact, entry, error)) {
      platform::log::Log(Level::kError, kLogTag, "history update failed",
                         {{"from", message.source},
                          {"error", error.message}});
    }
  }

  for (const auto& attachment : message.attachments) {
    if (!attachment.data) {
      platform::log::Log(Level::kError, kLogTag, "attachment without data",
                         {{"from", message.source}});
      continue;
    }
    std::string name;
    GatewayError save_error;
    if (!attachments_.Save(contact, *attachment.data, name, save_error)) {
      platform::log::Log(Level::kError, kLogTag, "attachment save failed",
                         {{"from", message.source},
                          {"error", save_error.message}});
      continue;
    }
    HistoryEntry entry;
    entry.timestamp = timestamp;
    entry.direction = Direction::kInbound;
    entry.body = "[" + name + "]";
    GatewayError append_error;
    if (!history_.Append(contact, entry, append_error)) {
      platform::log::Log(Level::kError, kLogTag, "history update failed",
                         {{"from", message.source},
                          {"error", append_error.message}});
    }
  }
}

}  // namespace msgate::gateway
