#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace relay::util {

/*
  Bounded set of worker threads.

  Finished workers are joined on the next Spawn(), so a long-lived owner
  never accumulates dead threads. At most max_workers run at once.
*/
class WorkerSet {
 public:
  explicit WorkerSet(std::size_t max_workers);
  ~WorkerSet();

  WorkerSet(const WorkerSet&)            = delete;
  WorkerSet& operator=(const WorkerSet&) = delete;

  // false when max_workers are busy or no thread could be started.
  bool Spawn(std::function<void()> task);

  void JoinAll();

  // Threads started and not yet joined, finished or not.
  std::size_t Live() const;

 private:
  struct Worker {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void ReapLocked();

  const std::size_t  max_workers_;
  mutable std::mutex mutex_;
  std::list<Worker>  workers_;
};

} // namespace relay::util
