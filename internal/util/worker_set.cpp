#include "internal/util/worker_set.hpp"

#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"

namespace relay::util {

WorkerSet::WorkerSet(std::size_t max_workers) : max_workers_(max_workers == 0 ? 1 : max_workers) {}

WorkerSet::~WorkerSet() { JoinAll(); }

bool WorkerSet::Spawn(std::function<void()> task) {
  std::lock_guard lock(mutex_);
  ReapLocked();
  if (workers_.size() >= max_workers_) {
    return false;
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  try {
    std::thread thread([task = std::move(task), done] {
      task();
      done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
  } catch (const std::system_error& e) {
    RELAY_LOG_ERROR("worker thread not started", {relay::observability::StringField("error", e.what())});
    return false;
  }
  return true;
}

void WorkerSet::JoinAll() {
  std::list<Worker> pending;
  {
    std::lock_guard lock(mutex_);
    pending.swap(workers_);
  }
  for (auto& w : pending) {
    if (w.thread.joinable()) w.thread.join();
  }
}

std::size_t WorkerSet::Live() const {
  std::lock_guard lock(mutex_);
  return workers_.size();
}

void WorkerSet::ReapLocked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace relay::util
