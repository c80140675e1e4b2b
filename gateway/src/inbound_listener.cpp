#include "inbound_listener.h"

#include <algorithm>
#include <utility>

#include "platform_log.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "listener";

using platform::log::Level;

}  // namespace

InboundListener::InboundListener(Transport& transport, InboundHandler handler,
                                 RestartPolicy policy)
    : transport_(transport), handler_(std::move(handler)), policy_(policy) {
  if (policy_.initial_backoff.count() <= 0) {
    policy_.initial_backoff = std::chrono::milliseconds(1);
  }
  if (policy_.max_backoff < policy_.initial_backoff) {
    policy_.max_backoff = policy_.initial_backoff;
  }
}

InboundListener::~InboundListener() { Stop(); }

bool InboundListener::Start(std::string& error) {
  error.clear();
  if (running_.load()) {
    return true;
  }
  if (!handler_) {
    error = "listener has no message handler";
    return false;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  stop_.store(false);
  running_.store(true);
  worker_ = std::thread(&InboundListener::Run, this);
  return true;
}

void InboundListener::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_.store(true);
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  running_.store(false);
}

bool InboundListener::WaitBackoff(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, delay, [this]() { return stop_.load(); });
}

void InboundListener::Run() {
  auto backoff = policy_.initial_backoff;
  while (!stop_.load()) {
    const auto started = std::chrono::steady_clock::now();
    std::string error;
    const bool ok = transport_.Listen(handler_, stop_, error);
    if (stop_.load()) {
      break;
    }
    const auto lasted = std::chrono::steady_clock::now() - started;
    if (lasted > policy_.max_backoff) {
      backoff = policy_.initial_backoff;
    }
    if (ok) {
      platform::log::Log(Level::kWarn, kLogTag, "message listener ended",
                         {{"retry_ms", std::to_string(backoff.count())}});
    } else {
      platform::log::Log(Level::kError, kLogTag, "message listener failed",
                         {{"error", error},
                          {"retry_ms", std::to_string(backoff.count())}});
    }
    if (!WaitBackoff(backoff)) {
      break;
    }
    backoff = std::min(backoff * 2, policy_.max_backoff);
    restarts_.fetch_add(1);
  }
  running_.store(false);
}

}  // namespace msgate::gateway
