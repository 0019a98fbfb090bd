#include "timer_queue.hpp"

#include "internal/observability/logging.hpp"

namespace relay::util {

TimerQueue::TimerQueue() = default;

TimerQueue::~TimerQueue() {
  Stop();
}

void TimerQueue::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = false;
  }
  thread_ = std::thread(&TimerQueue::Run, this);
}

void TimerQueue::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

TimerQueue::TimerId TimerQueue::Schedule(std::chrono::milliseconds delay, Callback callback) {
  const auto deadline = SteadyClock::now() + delay;

  TimerId id;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    entries_.emplace(id, Entry{deadline, std::move(callback)});
    deadlines_.emplace(deadline, id);
  }
  cv_.notify_one();
  return id;
}

bool TimerQueue::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(id);
  if (it == entries_.end()) return false;

  auto [begin, end] = deadlines_.equal_range(it->second.deadline);
  for (auto d = begin; d != end; ++d) {
    if (d->second == id) {
      deadlines_.erase(d);
      break;
    }
  }
  entries_.erase(it);
  return true;
}

std::size_t TimerQueue::Armed() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void TimerQueue::Run() {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    if (deadlines_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !deadlines_.empty(); });
      continue;
    }

    const auto next = deadlines_.begin()->first;
    if (SteadyClock::now() < next) {
      cv_.wait_until(lock, next);
      continue;
    }

    const TimerId id = deadlines_.begin()->second;
    deadlines_.erase(deadlines_.begin());

    auto it       = entries_.find(id);
    auto callback = std::move(it->second.callback);
    entries_.erase(it);

    lock.unlock();
    try {
      callback();
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("Timer callback failed", {relay::observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace relay::util
