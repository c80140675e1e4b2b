#include "activation.h"

#include <string>

#include "test_support.h"

using msgate::gateway::Activation;
using msgate::gateway::ActivationMode;
using msgate::gateway::ActivationOptions;
using msgate::gateway::ActivationState;
using msgate::gateway::ErrorCode;
using msgate::gateway::GatewayError;
using msgate::gateway::RegistrationState;
using msgate::gateway::StorageLayout;
using msgate::gateway::test::Check;
using msgate::gateway::test::FakePrompt;
using msgate::gateway::test::FakeTransport;
using msgate::gateway::test::FakeVolume;
using msgate::gateway::test::Provision;
using msgate::gateway::test::ReadFile;
using msgate::gateway::test::TempDir;
using msgate::gateway::test::WriteFile;

namespace {

ActivationOptions RegisterOptions() {
  ActivationOptions options;
  options.mode = ActivationMode::kRegister;
  return options;
}

}  // namespace

int main() {
  {
    // Already registered: refuse and lock the volume again.
    const auto root = TempDir("msgate_activation_registered");
    const auto layout = StorageLayout::ForMountPoint(root);
    Provision(layout);
    WriteFile(layout.number_path, "+15551234");
    RegistrationState registration(layout);
    FakeTransport transport;
    FakeVolume volume;
    FakePrompt prompt({"secure", "no"}, {"hunter2"});
    Activation activation(RegisterOptions(), registration, transport, volume,
                          prompt);
    GatewayError err;
    const auto state = activation.Run(err);
    if (!Check(state == ActivationState::kFatal &&
               err.code == ErrorCode::kAlreadyRegistered)) {
      return 1;
    }
    if (!Check(err.message.find("+15551234") != std::string::npos &&
               err.message.find(layout.private_dir.string()) !=
                   std::string::npos)) {
      return 1;
    }
    if (!Check(volume.unlock_calls == 1 && volume.lock_calls == 1 &&
               volume.last_volume == "secure" && !volume.last_dispose &&
               volume.last_password == "hunter2" &&
               transport.setup_calls == 0)) {
      return 1;
    }
  }

  {
    // Steady state without a registered number.
    const auto root = TempDir("msgate_activation_unregistered");
    const auto layout = StorageLayout::ForMountPoint(root);
    RegistrationState registration(layout);
    FakeTransport transport;
    FakeVolume volume;
    FakePrompt prompt;
    Activation activation(ActivationOptions{}, registration, transport, volume,
                          prompt);
    GatewayError err;
    if (!Check(activation.Run(err) == ActivationState::kFatal &&
               err.code == ErrorCode::kNotRegistered &&
               err.message.find("-r flag") != std::string::npos)) {
      return 1;
    }
    if (!Check(transport.setup_calls == 0 && volume.unlock_calls == 0 &&
               volume.lock_calls == 0 && prompt.prompts.empty())) {
      return 1;
    }
  }

  {
    // Fresh registration with password disposal.
    const auto root = TempDir("msgate_activation_register");
    const auto layout = StorageLayout::ForMountPoint(root);
    RegistrationState registration(layout);
    FakeTransport transport;
    FakeVolume volume;
    FakePrompt prompt({"secure", "YES", "+15551234", "424242"}, {"hunter2"});
    Activation activation(RegisterOptions(), registration, transport, volume,
                          prompt);
    GatewayError err;
    if (!Check(activation.Run(err) == ActivationState::kShutdown)) {
      return 1;
    }
    if (!Check(volume.last_dispose && volume.lock_calls == 1 &&
               prompt.printed.find("WARNING") != std::string::npos)) {
      return 1;
    }
    if (!Check(ReadFile(layout.number_path) == "+15551234" &&
               transport.last_code == "424242" &&
               transport.last_config.tel == "+15551234" &&
               transport.last_config.verification_type == "sms" &&
               transport.last_config.storage_dir == layout.private_dir &&
               activation.number() == "+15551234")) {
      return 1;
    }
    std::error_code ec;
    if (!Check(std::filesystem::exists(layout.sentinel_path, ec))) {
      return 1;
    }

    // The next steady-state start picks the registration up.
    RegistrationState next(layout);
    FakeTransport next_transport;
    int started = 0;
    ActivationOptions options;
    options.start_listener = [&started](std::string&) {
      ++started;
      return true;
    };
    FakePrompt silent;
    Activation steady(std::move(options), next, next_transport, volume,
                      silent);
    GatewayError steady_err;
    if (!Check(steady.Run(steady_err) == ActivationState::kListenerRunning &&
               started == 1 && next_transport.last_code.empty() &&
               silent.prompts.empty())) {
      return 1;
    }
  }

  {
    // Malformed numbers are re-prompted.
    const auto root = TempDir("msgate_activation_reprompt");
    const auto layout = StorageLayout::ForMountPoint(root);
    RegistrationState registration(layout);
    FakeTransport transport;
    FakeVolume volume;
    FakePrompt prompt({"secure", "no", "5551234", "+15551234", "1"},
                      {"hunter2"});
    Activation activation(RegisterOptions(), registration, transport, volume,
                          prompt);
    GatewayError err;
    if (!Check(activation.Run(err) == ActivationState::kShutdown &&
               ReadFile(layout.number_path) == "+15551234" &&
               prompt.printed.find("invalid number") != std::string::npos)) {
      return 1;
    }
  }

  {
    const auto root = TempDir("msgate_activation_bad_number");
    const auto layout = StorageLayout::ForMountPoint(root);
    RegistrationState registration(layout);
    FakeTransport transport;
    FakeVolume volume;
    FakePrompt prompt({"secure", "no", "a", "b", "c"}, {"hunter2"});
    Activation activation(RegisterOptions(), registration, transport, volume,
                          prompt);
    GatewayError err;
    std::error_code ec;
    if (!Check(activation.Run(err) == ActivationState::kFatal &&
               err.code == ErrorCode::kInvalidNumber &&
               volume.lock_calls == 1 &&
               !std::filesystem::exists(layout.number_path, ec))) {
      return 1;
    }
  }

  {
    const auto root = TempDir("msgate_activation_unlock_fail");
    const auto layout = StorageLayout::ForMountPoint(root);
    RegistrationState registration(layout);
    FakeTransport transport;
    FakeVolume volume;
    volume.unlock_ok = false;
    FakePrompt prompt({"secure", "no"}, {"wrong"});
    Activation activation(RegisterOptions(), registration, transport, volume,
                          prompt);
    GatewayError err;
    if (!Check(activation.Run(err) == ActivationState::kFatal &&
               err.code == ErrorCode::kStorageFailure &&
               volume.lock_calls == 1 && transport.setup_calls == 0)) {
      return 1;
    }
  }

  {
    const auto root = TempDir("msgate_activation_setup_fail");
    const auto layout = StorageLayout::ForMountPoint(root);
    Provision(layout);
    WriteFile(layout.number_path, "+15551234");
    RegistrationState registration(layout);
    FakeTransport transport;
    transport.setup_ok = false;
    transport.setup_error = "server rejected";
    FakeVolume volume;
    FakePrompt prompt;
    Activation activation(ActivationOptions{}, registration, transport, volume,
                          prompt);
    GatewayError err;
    if (!Check(activation.Run(err) == ActivationState::kFatal &&
               err.code == ErrorCode::kTransportFailure &&
               err.message == "failed to enable transport: server rejected")) {
      return 1;
    }
  }

  {
    // A listener that fails to start leaves the gateway ready.
    const auto root = TempDir("msgate_activation_listener_fail");
    const auto layout = StorageLayout::ForMountPoint(root);
    Provision(layout);
    WriteFile(layout.number_path, "+15551234");
    RegistrationState registration(layout);
    FakeTransport transport;
    FakeVolume volume;
    FakePrompt prompt;
    ActivationOptions options;
    options.start_listener = [](std::string& error) {
      error = "no thread";
      return false;
    };
    Activation activation(std::move(options), registration, transport, volume,
                          prompt);
    GatewayError err;
    if (!Check(activation.Run(err) == ActivationState::kReady && err.ok())) {
      return 1;
    }
  }

  {
    // Test mode registration still asks for the volume, but never unlocks.
    const auto root = TempDir("msgate_activation_skip_volume");
    const auto layout = StorageLayout::ForMountPoint(root);
    RegistrationState registration(layout);
    FakeTransport transport;
    FakeVolume volume;
    FakePrompt prompt({"secure", "YES", "+15551234", "111"}, {"unused"});
    ActivationOptions options = RegisterOptions();
    options.skip_volume = true;
    Activation activation(std::move(options), registration, transport, volume,
                          prompt);
    GatewayError err;
    if (!Check(activation.Run(err) == ActivationState::kShutdown &&
               volume.unlock_calls == 0 && volume.lock_calls == 0 &&
               prompt.password_reads == 0 &&
               ReadFile(layout.number_path) == "+15551234" &&
               transport.last_code == "111")) {
      return 1;
    }
    if (!Check(prompt.prompts.size() == 4 &&
               prompt.prompts[0].find("volume name") != std::string::npos &&
               prompt.prompts[1].find("YES") != std::string::npos &&
               prompt.printed.find("WARNING") != std::string::npos)) {
      return 1;
    }
  }

  return 0;
}
