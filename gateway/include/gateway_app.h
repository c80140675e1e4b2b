#ifndef MSGATE_GATEWAY_APP_H
#define MSGATE_GATEWAY_APP_H

#include <memory>
#include <string>

#include "activation.h"
#include "attachment_store.h"
#include "config.h"
#include "contact_directory.h"
#include "gateway_api.h"
#include "gateway_error.h"
#include "history_store.h"
#include "inbound_listener.h"
#include "message_relay.h"
#include "notification_board.h"
#include "operator_prompt.h"
#include "path_guard.h"
#include "registration_state.h"
#include "storage_layout.h"
#include "transport.h"
#include "volume_manager.h"

namespace msgate::gateway {

struct GatewayCollaborators {
  std::unique_ptr<Transport> transport;
  std::unique_ptr<VolumeManager> volume;
  std::unique_ptr<OperatorPrompt> prompt;
};

class GatewayApp {
 public:
  GatewayApp();
  ~GatewayApp();

  // Loads the config and wires the spool transport, cryptsetup volume and
  // console prompt.
  bool Init(const std::string& config_path, ActivationMode mode,
            std::string& error);
  bool Init(const GatewayConfig& config, ActivationMode mode,
            GatewayCollaborators collaborators, GatewayError& error);

  bool RunOnce(std::string& error);

  void Shutdown();

  // Registration finished; the process should exit so that the next start
  // picks the registration up.
  bool shutdown_requested() const { return shutdown_requested_; }
  ActivationState state() const { return state_; }

  const GatewayConfig& config() const { return config_; }
  const StorageLayout& layout() const { return layout_; }
  GatewayApi* api() { return api_.get(); }
  MessageRelay* relay() { return relay_.get(); }
  NotificationBoard* notifications() { return board_.get(); }
  InboundListener* listener() { return listener_.get(); }

 private:
  GatewayConfig config_;
  StorageLayout layout_;
  GatewayCollaborators collaborators_;
  std::unique_ptr<RegistrationState> registration_;
  std::unique_ptr<PathGuard> guard_;
  std::unique_ptr<ContactDirectory> contacts_;
  std::unique_ptr<HistoryStore> history_;
  std::unique_ptr<AttachmentStore> attachments_;
  std::unique_ptr<NotificationBoard> board_;
  std::unique_ptr<MessageRelay> relay_;
  std::unique_ptr<GatewayApi> api_;
  std::unique_ptr<InboundListener> listener_;
  ActivationState state_{ActivationState::kIdle};
  bool shutdown_requested_{false};
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_APP_H
