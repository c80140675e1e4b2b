#ifndef MSGATE_GATEWAY_INBOUND_LISTENER_H
#define MSGATE_GATEWAY_INBOUND_LISTENER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "transport.h"

namespace msgate::gateway {

struct RestartPolicy {
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{60000};
};

// Supervises Transport::Listen on a worker thread. A failed or ended
// listen session is logged and restarted after an exponential backoff; a
// session that outlived the max backoff resets it.
class InboundListener {
 public:
  InboundListener(Transport& transport, InboundHandler handler,
                  RestartPolicy policy);
  ~InboundListener();

  InboundListener(const InboundListener&) = delete;
  InboundListener& operator=(const InboundListener&) = delete;

  bool Start(std::string& error);
  void Stop();

  bool running() const { return running_.load(); }
  std::uint32_t restarts() const { return restarts_.load(); }

 private:
  void Run();
  // False when Stop() interrupted the wait.
  bool WaitBackoff(std::chrono::milliseconds delay);

  Transport& transport_;
  InboundHandler handler_;
  RestartPolicy policy_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_{false};
  std::atomic<std::uint32_t> restarts_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread worker_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_INBOUND_LISTENER_H
