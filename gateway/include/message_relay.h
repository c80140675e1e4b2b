#ifndef MSGATE_GATEWAY_MESSAGE_RELAY_H
#define MSGATE_GATEWAY_MESSAGE_RELAY_H

#include <chrono>
#include <optional>
#include <string>

#include "attachment_store.h"
#include "contact_directory.h"
#include "gateway_error.h"
#include "history_store.h"
#include "notification_board.h"
#include "path_guard.h"
#include "transport.h"

namespace msgate::gateway {

struct SendRequest {
  std::string contact;  // contact file path, relative to the storage root
  std::string msg;
  std::optional<std::string> attachment;
};

// Outbound sends and history reads arrive on request threads; inbound
// messages arrive on the listener thread. Both paths meet in the contact
// directory and the two stores.
class MessageRelay {
 public:
  MessageRelay(Transport& transport, const PathGuard& guard,
               const ContactDirectory& contacts, const HistoryStore& history,
               const AttachmentStore& attachments, NotificationBoard& board,
               std::chrono::milliseconds notify_ttl);

  // No history is written unless the transport accepted the message.
  bool Send(const SendRequest& request, GatewayError& error);

  bool History(const std::string& contact, std::string& out,
               GatewayError& error);

  // Listener callback. Errors are logged; a failed attachment does not stop
  // the remaining ones.
  void OnMessage(const InboundMessage& message);

 private:
  bool ResolveContact(const std::string& request_path, ContactRecord& out,
                      GatewayError& error) const;

  Transport& transport_;
  const PathGuard& guard_;
  const ContactDirectory& contacts_;
  const HistoryStore& history_;
  const AttachmentStore& attachments_;
  NotificationBoard& board_;
  std::chrono::milliseconds notify_ttl_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_MESSAGE_RELAY_H
