#include "gateway_app.h"

#include <chrono>
#include <utility>

#include "console_prompt.h"
#include "cryptsetup_volume.h"
#include "platform_log.h"
#include "spool_transport.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "gateway";

}  // namespace

GatewayApp::GatewayApp() = default;

GatewayApp::~GatewayApp() { Shutdown(); }

bool GatewayApp::Init(const std::string& config_path, ActivationMode mode,
                      std::string& error) {
  GatewayConfig config;
  if (!LoadConfig(config_path, config, error)) {
    return false;
  }
  const StorageLayout layout = StorageLayout::FromConfig(config);

  GatewayCollaborators collaborators;
  collaborators.transport = std::make_unique<SpoolTransport>(
      layout.spool_dir, config.transport.poll_interval_ms);
  collaborators.volume = std::make_unique<CryptsetupVolume>(
      config.storage.volume_dir, config.storage.mapping_name,
      layout.mount_point);
  collaborators.prompt = std::make_unique<ConsolePrompt>();

  GatewayError gateway_error;
  if (!Init(config, mode, std::move(collaborators), gateway_error)) {
    error = gateway_error.message;
    return false;
  }
  return true;
}

bool GatewayApp::Init(const GatewayConfig& config, ActivationMode mode,
                      GatewayCollaborators collaborators,
                      GatewayError& error) {
  if (!collaborators.transport || !collaborators.volume ||
      !collaborators.prompt) {
    error.Set(ErrorCode::kInvalidRequest, "gateway collaborators missing");
    return false;
  }
  config_ = config;
  collaborators_ = std::move(collaborators);
  if (config_.gateway.debug_log) {
    platform::log::SetMinLevel(platform::log::Level::kDebug);
  }

  layout_ = StorageLayout::FromConfig(config_);
  registration_ = std::make_unique<RegistrationState>(layout_);
  guard_ = std::make_unique<PathGuard>(layout_);
  contacts_ = std::make_unique<ContactDirectory>(layout_);
  history_ = std::make_unique<HistoryStore>(config_.gateway.history_limit);
  attachments_ = std::make_unique<AttachmentStore>(*guard_);
  board_ = std::make_unique<NotificationBoard>();
  relay_ = std::make_unique<MessageRelay>(
      *collaborators_.transport, *guard_, *contacts_, *history_,
      *attachments_, *board_,
      std::chrono::seconds(config_.gateway.notify_seconds));
  api_ = std::make_unique<GatewayApi>(*relay_);

  RestartPolicy policy;
  policy.initial_backoff =
      std::chrono::milliseconds(config_.listener.restart_initial_ms);
  policy.max_backoff =
      std::chrono::milliseconds(config_.listener.restart_max_ms);
  MessageRelay* relay = relay_.get();
  listener_ = std::make_unique<InboundListener>(
      *collaborators_.transport,
      [relay](const InboundMessage& message) { relay->OnMessage(message); },
      policy);

  ActivationOptions options;
  options.mode = mode;
  options.skip_volume = config_.storage.test_mode;
  options.debug_log = config_.gateway.debug_log;
  InboundListener* listener = listener_.get();
  options.start_listener = [listener](std::string& listener_error) {
    return listener->Start(listener_error);
  };

  Activation activation(std::move(options), *registration_,
                        *collaborators_.transport, *collaborators_.volume,
                        *collaborators_.prompt);
  state_ = activation.Run(error);
  if (state_ == ActivationState::kFatal) {
    return false;
  }
  shutdown_requested_ = state_ == ActivationState::kShutdown;
  platform::log::Log(platform::log::Level::kInfo, kLogTag,
                     "gateway initialized",
                     {{"state", ActivationStateName(state_)}});
  return true;
}

bool GatewayApp::RunOnce(std::string& error) {
  if (!relay_ || !listener_) {
    error = "gateway not initialized";
    return false;
  }
  if (state_ == ActivationState::kListenerRunning && !listener_->running()) {
    error = "message listener stopped";
    return false;
  }
  return true;
}

void GatewayApp::Shutdown() {
  if (listener_) {
    listener_->Stop();
  }
}

}  // namespace msgate::gateway
