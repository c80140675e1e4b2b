#include "gateway_app.h"

#include <deque>
#include <memory>
#include <string>

#include "test_support.h"

using msgate::gateway::ActivationMode;
using msgate::gateway::ActivationState;
using msgate::gateway::ErrorCode;
using msgate::gateway::GatewayApp;
using msgate::gateway::GatewayCollaborators;
using msgate::gateway::GatewayConfig;
using msgate::gateway::GatewayError;
using msgate::gateway::kHistoryUri;
using msgate::gateway::kSendUri;
using msgate::gateway::test::Check;
using msgate::gateway::test::EndsWith;
using msgate::gateway::test::FakePrompt;
using msgate::gateway::test::FakeTransport;
using msgate::gateway::test::FakeVolume;
using msgate::gateway::test::TempDir;
using msgate::gateway::test::WriteFile;

namespace {

GatewayCollaborators MakeCollaborators(FakeTransport*& transport,
                                       std::deque<std::string> lines) {
  GatewayCollaborators collaborators;
  auto owned = std::make_unique<FakeTransport>();
  transport = owned.get();
  collaborators.transport = std::move(owned);
  collaborators.volume = std::make_unique<FakeVolume>();
  collaborators.prompt =
      std::make_unique<FakePrompt>(std::move(lines), std::deque<std::string>{});
  return collaborators;
}

}  // namespace

int main() {
  const auto root = TempDir("msgate_app_test");
  GatewayConfig config;
  config.storage.mount_point = root.string();
  config.storage.test_mode = true;
  config.listener.restart_initial_ms = 10;
  config.listener.restart_max_ms = 20;

  {
    GatewayApp app;
    GatewayError err;
    if (!Check(!app.Init(config, ActivationMode::kRegister,
                         GatewayCollaborators{}, err) &&
               err.code == ErrorCode::kInvalidRequest)) {
      return 1;
    }
  }

  {
    FakeTransport* transport = nullptr;
    GatewayApp app;
    GatewayError err;
    if (!Check(!app.Init(config, ActivationMode::kSteadyState,
                         MakeCollaborators(transport, {}), err) &&
               err.code == ErrorCode::kNotRegistered)) {
      return 1;
    }
  }

  {
    FakeTransport* transport = nullptr;
    GatewayApp app;
    GatewayError err;
    if (!Check(app.Init(config, ActivationMode::kRegister,
                        MakeCollaborators(transport,
                                          {"secure", "no", "+15551234", "777"}),
                        err) &&
               app.shutdown_requested() &&
               app.state() == ActivationState::kShutdown &&
               transport->last_code == "777")) {
      return 1;
    }
  }

  {
    WriteFile(root / "textsecure" / "contacts" / "Alice +15551234.textsecure",
              "");
    FakeTransport* transport = nullptr;
    GatewayApp app;
    GatewayError err;
    if (!Check(app.Init(config, ActivationMode::kSteadyState,
                        MakeCollaborators(transport, {}), err) &&
               !app.shutdown_requested() &&
               app.state() == ActivationState::kListenerRunning)) {
      return 1;
    }
    std::string tick_error;
    if (!Check(app.RunOnce(tick_error) && app.listener()->running())) {
      return 1;
    }
    const std::string alice =
        "/textsecure/contacts/Alice +15551234.textsecure";
    const auto sent =
        app.api()->HandleRequest(kSendUri, {{"contact", alice}, {"msg", "yo"}});
    const auto history =
        app.api()->HandleRequest(kHistoryUri, {{"contact", alice}});
    if (!Check(sent.ok && history.ok && history.response.has_value() &&
               EndsWith(*history.response, " > yo\n") &&
               transport->sent().size() == 1)) {
      return 1;
    }
    app.Shutdown();
    if (!Check(!app.listener()->running())) {
      return 1;
    }
  }

  return 0;
}
