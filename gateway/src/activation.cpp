#include "activation.h"

#include <utility>

#include "contact_directory.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "activation";

using platform::log::Level;

std::string TrimLine(const std::string& input) {
  const auto begin = input.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = input.find_last_not_of(" \t\r\n");
  return input.substr(begin, end - begin + 1);
}

}  // namespace

const char* ActivationStateName(ActivationState state) {
  switch (state) {
    case ActivationState::kIdle:
      return "idle";
    case ActivationState::kVolumeUnlocked:
      return "volume_unlocked";
    case ActivationState::kRegistrationChecked:
      return "registration_checked";
    case ActivationState::kAwaitingNumber:
      return "awaiting_number";
    case ActivationState::kAwaitingVerification:
      return "awaiting_verification";
    case ActivationState::kReady:
      return "ready";
    case ActivationState::kListenerRunning:
      return "listener_running";
    case ActivationState::kShutdown:
      return "shutdown";
    case ActivationState::kFatal:
      return "fatal";
  }
  return "unknown";
}

Activation::Activation(ActivationOptions options,
                       RegistrationState& registration, Transport& transport,
                       VolumeManager& volume, OperatorPrompt& prompt)
    : options_(std::move(options)),
      registration_(registration),
      transport_(transport),
      volume_(volume),
      prompt_(prompt) {}

void Activation::Transition(ActivationState next) {
  platform::log::Log(Level::kDebug, kLogTag, "state change",
                     {{"from", ActivationStateName(state_)},
                      {"to", ActivationStateName(next)}});
  state_ = next;
}

void Activation::LockVolume() {
  if (!options_.skip_volume) {
    volume_.Lock();
  }
}

ActivationState Activation::Fail(bool lock_volume) {
  if (lock_volume) {
    LockVolume();
  }
  Transition(ActivationState::kFatal);
  return state_;
}

ActivationState Activation::Run(GatewayError& error) {
  state_ = ActivationState::kIdle;
  number_.clear();
  const bool registering = options_.mode == ActivationMode::kRegister;

  if (registering) {
    if (!UnlockVolume(error)) {
      return Fail(true);
    }
    Transition(ActivationState::kVolumeUnlocked);

    if (!CheckRegistration(error)) {
      return Fail(true);
    }
    Transition(ActivationState::kRegistrationChecked);

    Transition(ActivationState::kAwaitingNumber);
    if (!CaptureNumber(error)) {
      return Fail(true);
    }
  }

  if (!registration_.EnsureStorageDir(error)) {
    return Fail(registering);
  }
  if (!registration_.Load(error)) {
    return Fail(registering);
  }
  if (!registration_.registered_number().has_value()) {
    error.Set(ErrorCode::kNotRegistered,
              "transport enabled but not registered, please restart with -r "
              "flag for registration");
    return Fail(registering);
  }
  number_ = *registration_.registered_number();

  Transition(ActivationState::kAwaitingVerification);
  if (!SetupClient(error)) {
    return Fail(registering);
  }
  Transition(ActivationState::kReady);

  if (registering) {
    platform::log::Log(Level::kInfo, kLogTag,
                       "registration successful, locking volume and shutting "
                       "down, restart to apply registration",
                       {{"number", number_}});
    LockVolume();
    Transition(ActivationState::kShutdown);
    return state_;
  }

  platform::log::Log(Level::kInfo, kLogTag, "enabling message listener",
                     {{"number", number_}});
  if (options_.start_listener) {
    std::string listener_error;
    if (options_.start_listener(listener_error)) {
      Transition(ActivationState::kListenerRunning);
    } else {
      platform::log::Log(Level::kError, kLogTag,
                         "failed to enable message listener",
                         {{"error", listener_error}});
    }
  }
  return state_;
}

bool Activation::UnlockVolume(GatewayError& error) {
  const std::string volume = TrimLine(prompt_.ReadLine(
      "\nPlease enter encrypted volume name for key storage: "));
  const std::string dispose_answer = TrimLine(prompt_.ReadLine(
      "\nIf you would like to have the password disposed of after use enter "
      "YES all\nuppercase: "));
  const bool dispose = dispose_answer == "YES";
  if (dispose) {
    prompt_.Print(
        "\nWARNING: password will be destroyed after its use!\n(quit now if "
        "this is undesired)\n");
  }

  if (options_.skip_volume) {
    return true;
  }

  std::string password =
      prompt_.ReadPassword("Please enter volume password (will not echo): ");
  common::ScopedWipe wipe(password);

  std::string unlock_error;
  if (!volume_.Unlock(volume, password, dispose, unlock_error)) {
    error.Set(ErrorCode::kStorageFailure,
              "volume unlock failed: " + unlock_error);
    return false;
  }
  return true;
}

bool Activation::CheckRegistration(GatewayError& error) {
  if (!registration_.Load(error)) {
    return false;
  }
  if (registration_.NeedsRegistration()) {
    return true;
  }
  const std::string number =
      registration_.registered_number().value_or("<unknown>");
  error.Set(ErrorCode::kAlreadyRegistered,
            "registration already present for number " + number +
                ", delete " + registration_.storage_dir().string() +
                " contents to reset");
  return false;
}

bool Activation::CaptureNumber(GatewayError& error) {
  const int attempts =
      options_.max_number_attempts > 0 ? options_.max_number_attempts : 1;
  for (int i = 0; i < attempts; ++i) {
    const std::string number = TrimLine(prompt_.ReadLine(
        "\nPlease enter the mobile number to be used for registration: "));
    if (IsCanonicalNumber(number)) {
      return registration_.SaveNumber(number, error);
    }
    prompt_.Print("invalid number, use international format (+<digits> or "
                  "00<digits>)\n");
  }
  error.Set(ErrorCode::kInvalidNumber, "no valid registration number entered");
  return false;
}

bool Activation::SetupClient(GatewayError& error) {
  TransportConfig config;
  config.tel = number_;
  config.verification_type = "sms";
  config.storage_dir = registration_.storage_dir();
  config.log_level = options_.debug_log ? "debug" : "error";

  std::string setup_error;
  if (!transport_.Setup(config, *this, setup_error)) {
    error.Set(ErrorCode::kTransportFailure,
              "failed to enable transport: " + setup_error);
    return false;
  }
  return true;
}

std::string Activation::VerificationCode() {
  return TrimLine(prompt_.ReadLine(
      "Please enter the verification code received over SMS: "));
}

std::string Activation::StoragePassword() { return {}; }

void Activation::RegistrationDone() {
  platform::log::Log(Level::kInfo, kLogTag, "registration complete",
                     {{"number", number_}});
}

}  // namespace msgate::gateway
