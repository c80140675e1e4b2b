#ifndef MSGATE_GATEWAY_NOTIFICATION_BOARD_H
#define MSGATE_GATEWAY_NOTIFICATION_BOARD_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "platform_log.h"

namespace msgate::gateway {

struct Notification {
  std::uint64_t id{0};
  platform::log::Level level{platform::log::Level::kInfo};
  std::string text;
  std::uint64_t created_at{0};  // unix seconds
};

// Transient operator-facing notifications. Expiring entries get their own
// timer thread so that posting never blocks the caller.
class NotificationBoard {
 public:
  NotificationBoard();
  ~NotificationBoard();

  NotificationBoard(const NotificationBoard&) = delete;
  NotificationBoard& operator=(const NotificationBoard&) = delete;

  std::uint64_t Notify(platform::log::Level level, std::string text);
  std::uint64_t NotifyFor(platform::log::Level level, std::string text,
                          std::chrono::milliseconds ttl);
  bool Remove(std::uint64_t id);

  std::vector<Notification> Snapshot() const;
  std::size_t size() const;

 private:
  struct Timer {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  std::uint64_t AddLocked(platform::log::Level level, std::string text);
  bool RemoveLocked(std::uint64_t id);
  void ReapTimers();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_{false};
  std::uint64_t next_id_{1};
  std::vector<Notification> items_;

  std::mutex timers_mutex_;
  std::list<Timer> timers_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_NOTIFICATION_BOARD_H
