#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace relay::util {

/*
  Single background thread that fires callbacks at deadlines.

  - Callbacks run on the timer thread, never under the queue lock.
  - Cancel() after the callback was dequeued returns false; callers
    must tolerate a concurrently running callback.
*/
class TimerQueue {
 public:
  using TimerId  = uint64_t;
  using Callback = std::function<void()>;
  using SteadyClock = std::chrono::steady_clock;

  TimerQueue();
  ~TimerQueue();

  TimerQueue(const TimerQueue&)            = delete;
  TimerQueue& operator=(const TimerQueue&) = delete;

  void Start();
  void Stop();

  TimerId Schedule(std::chrono::milliseconds delay, Callback callback);

  // true if the timer was still armed.
  bool Cancel(TimerId id);

  std::size_t Armed() const;

 private:
  void Run();

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  std::multimap<SteadyClock::time_point, TimerId> deadlines_;
  struct Entry {
    SteadyClock::time_point deadline;
    Callback                callback;
  };
  std::unordered_map<TimerId, Entry> entries_;

  TimerId           next_id_ = 1;
  bool              shutdown_ = false;
  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace relay::util
