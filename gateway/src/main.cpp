#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#include "gateway_app.h"
#include "platform_time.h"

namespace {

volatile std::sig_atomic_t g_stop = 0;

void OnSignal(int) { g_stop = 1; }

void LogError(const std::string& msg) {
  std::cerr << "[msgate] " << msg << "\n";
}

void PrintUsage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [-r] [-c config.ini]\n"
            << "  -r  register the transport number and exit\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config.ini";
  auto mode = msgate::gateway::ActivationMode::kSteadyState;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-r") == 0) {
      mode = msgate::gateway::ActivationMode::kRegister;
    } else if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      PrintUsage(argv[0]);
      return 1;
    }
  }

  std::signal(SIGINT, OnSignal);
  std::signal(SIGTERM, OnSignal);
  std::signal(SIGPIPE, SIG_IGN);

  std::string error;
  msgate::gateway::GatewayApp app;
  if (!app.Init(config_path, mode, error)) {
    LogError(error);
    return 1;
  }
  if (app.shutdown_requested()) {
    return 0;
  }

  while (g_stop == 0) {
    std::string tick_error;
    if (!app.RunOnce(tick_error) && !tick_error.empty()) {
      LogError(tick_error);
    }
    msgate::platform::SleepMs(1000);
  }
  app.Shutdown();
  return 0;
}
