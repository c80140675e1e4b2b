#ifndef MSGATE_GATEWAY_ACTIVATION_H
#define MSGATE_GATEWAY_ACTIVATION_H

#include <cstdint>
#include <functional>
#include <string>

#include "gateway_error.h"
#include "operator_prompt.h"
#include "registration_state.h"
#include "transport.h"
#include "volume_manager.h"

namespace msgate::gateway {

enum class ActivationState : std::uint8_t {
  kIdle = 0,
  kVolumeUnlocked = 1,
  kRegistrationChecked = 2,
  kAwaitingNumber = 3,
  kAwaitingVerification = 4,
  kReady = 5,
  kListenerRunning = 6,
  kShutdown = 7,  // registration done, restart required
  kFatal = 8,
};

const char* ActivationStateName(ActivationState state);

enum class ActivationMode : std::uint8_t { kSteadyState = 0, kRegister = 1 };

struct ActivationOptions {
  ActivationMode mode{ActivationMode::kSteadyState};
  // Test mode: the volume name and dispose prompts are still shown, the
  // password prompt and unlock/lock are skipped.
  bool skip_volume{false};
  bool debug_log{false};
  int max_number_attempts{3};
  // Invoked on kReady in steady state. A failure is logged, not escalated.
  std::function<bool(std::string& error)> start_listener;
};

// Drives first-run registration (volume unlock, registration check, number
// capture, verification, client setup) and steady-state activation (client
// setup, listener start).
class Activation : private TransportHooks {
 public:
  Activation(ActivationOptions options, RegistrationState& registration,
             Transport& transport, VolumeManager& volume,
             OperatorPrompt& prompt);

  // Returns kListenerRunning/kReady in steady state, kShutdown after a
  // successful registration, kFatal with `error` set otherwise.
  ActivationState Run(GatewayError& error);

  ActivationState state() const { return state_; }
  const std::string& number() const { return number_; }

 private:
  bool UnlockVolume(GatewayError& error);
  bool CheckRegistration(GatewayError& error);
  bool CaptureNumber(GatewayError& error);
  bool SetupClient(GatewayError& error);
  ActivationState Fail(bool lock_volume);
  void LockVolume();
  void Transition(ActivationState next);

  std::string VerificationCode() override;
  std::string StoragePassword() override;
  void RegistrationDone() override;

  ActivationOptions options_;
  RegistrationState& registration_;
  Transport& transport_;
  VolumeManager& volume_;
  OperatorPrompt& prompt_;
  ActivationState state_{ActivationState::kIdle};
  std::string number_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_ACTIVATION_H
