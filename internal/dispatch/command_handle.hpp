#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace relay::dispatch {

enum class CommandOutcome {
  kPending,
  kCompleted,
  kFailed,
  kTimedOut,
  kDisconnected,
};

const char* ToString(CommandOutcome outcome);

class CommandHandle;

/*
  Set-once completion shared by the dispatcher and the caller.

  The first Try*() wins; later attempts return false and change nothing.
  Callbacks run once, on the resolving thread, outside the state lock.
  Always owned by a shared_ptr.
*/
class CommandState : public std::enable_shared_from_this<CommandState> {
 public:
  using Callback = std::function<void(const CommandHandle&)>;

  CommandState(std::string command_id, std::string agent_id);

  bool TryComplete(google::protobuf::Value result);
  bool TryFail(CommandOutcome outcome, std::string error);

 private:
  friend class CommandHandle;

  bool Resolve(CommandOutcome outcome, google::protobuf::Value result, std::string error);

  const std::string command_id_;
  const std::string agent_id_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  CommandOutcome                  outcome_ = CommandOutcome::kPending;
  google::protobuf::Value         result_;
  std::string                     error_;
  std::vector<Callback>           callbacks_;
};

/*
  Caller view of an in-flight command. Cheap to copy.
*/
class CommandHandle {
 public:
  CommandHandle() = default;
  explicit CommandHandle(std::shared_ptr<CommandState> state);

  const std::string& CommandId() const;
  const std::string& AgentId() const;

  bool           Done() const;
  CommandOutcome Outcome() const;

  void Wait() const;
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // Waits, then returns the result or throws CommandFailed,
  // CommandTimeout or AgentDisconnected.
  google::protobuf::Value Get() const;

  std::string Error() const;

  // Runs immediately when already resolved.
  void OnComplete(CommandState::Callback callback) const;

 private:
  std::shared_ptr<CommandState> state_;
};

} // namespace relay::dispatch
