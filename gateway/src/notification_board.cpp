#include "notification_board.h"

#include <algorithm>
#include <utility>

#include "platform_time.h"

namespace msgate::gateway {

NotificationBoard::NotificationBoard() = default;

NotificationBoard::~NotificationBoard() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  std::lock_guard<std::mutex> lock(timers_mutex_);
  for (auto& timer : timers_) {
    if (timer.thread.joinable()) {
      timer.thread.join();
    }
  }
  timers_.clear();
}

std::uint64_t NotificationBoard::AddLocked(platform::log::Level level,
                                           std::string text) {
  Notification item;
  item.id = next_id_++;
  item.level = level;
  item.text = std::move(text);
  item.created_at = platform::NowUnixSeconds();
  items_.push_back(std::move(item));
  return items_.back().id;
}

bool NotificationBoard::RemoveLocked(std::uint64_t id) {
  const auto it =
      std::find_if(items_.begin(), items_.end(),
                   [id](const Notification& n) { return n.id == id; });
  if (it == items_.end()) {
    return false;
  }
  items_.erase(it);
  return true;
}

std::uint64_t NotificationBoard::Notify(platform::log::Level level,
                                        std::string text) {
  std::lock_guard<std::mutex> lock(mutex_);
  return AddLocked(level, std::move(text));
}

std::uint64_t NotificationBoard::NotifyFor(platform::log::Level level,
                                           std::string text,
                                           std::chrono::milliseconds ttl) {
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = AddLocked(level, std::move(text));
  }

  ReapTimers();

  auto done = std::make_shared<std::atomic<bool>>(false);
  Timer timer;
  timer.done = done;
  timer.thread = std::thread([this, id, ttl, done]() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, ttl, [this]() { return stopping_; });
    RemoveLocked(id);
    lock.unlock();
    done->store(true);
  });
  std::lock_guard<std::mutex> lock(timers_mutex_);
  timers_.push_back(std::move(timer));
  return id;
}

bool NotificationBoard::Remove(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return RemoveLocked(id);
}

std::vector<Notification> NotificationBoard::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_;
}

std::size_t NotificationBoard::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

void NotificationBoard::ReapTimers() {
  std::lock_guard<std::mutex> lock(timers_mutex_);
  for (auto it = timers_.begin(); it != timers_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = timers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace msgate::gateway
