#include "command_handle.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace relay::dispatch {

const char* ToString(CommandOutcome outcome) {
  switch (outcome) {
    case CommandOutcome::kPending:
      return "pending";
    case CommandOutcome::kCompleted:
      return "completed";
    case CommandOutcome::kFailed:
      return "failed";
    case CommandOutcome::kTimedOut:
      return "timed_out";
    case CommandOutcome::kDisconnected:
      return "disconnected";
  }
  return "unknown";
}

// ------------------------------------------------------------------
// CommandState
// ------------------------------------------------------------------

CommandState::CommandState(std::string command_id, std::string agent_id)
    : command_id_(std::move(command_id)), agent_id_(std::move(agent_id)) {
}

bool CommandState::TryComplete(google::protobuf::Value result) {
  return Resolve(CommandOutcome::kCompleted, std::move(result), {});
}

bool CommandState::TryFail(CommandOutcome outcome, std::string error) {
  if (outcome == CommandOutcome::kPending || outcome == CommandOutcome::kCompleted) {
    throw std::invalid_argument("TryFail requires a failure outcome");
  }
  return Resolve(outcome, google::protobuf::Value{}, std::move(error));
}

bool CommandState::Resolve(CommandOutcome outcome, google::protobuf::Value result, std::string error) {
  std::vector<Callback> callbacks;
  {
    std::lock_guard lock(mutex_);
    if (outcome_ != CommandOutcome::kPending) return false;

    outcome_ = outcome;
    result_  = std::move(result);
    error_   = std::move(error);
    callbacks.swap(callbacks_);
  }
  cv_.notify_all();

  const CommandHandle self(shared_from_this());
  for (auto& cb : callbacks) cb(self);
  return true;
}

// ------------------------------------------------------------------
// CommandHandle
// ------------------------------------------------------------------

CommandHandle::CommandHandle(std::shared_ptr<CommandState> state) : state_(std::move(state)) {
}

const std::string& CommandHandle::CommandId() const {
  return state_->command_id_;
}

const std::string& CommandHandle::AgentId() const {
  return state_->agent_id_;
}

bool CommandHandle::Done() const {
  return Outcome() != CommandOutcome::kPending;
}

CommandOutcome CommandHandle::Outcome() const {
  std::lock_guard lock(state_->mutex_);
  return state_->outcome_;
}

void CommandHandle::Wait() const {
  std::unique_lock lock(state_->mutex_);
  state_->cv_.wait(lock, [this] { return state_->outcome_ != CommandOutcome::kPending; });
}

bool CommandHandle::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(state_->mutex_);
  return state_->cv_.wait_for(lock, timeout, [this] { return state_->outcome_ != CommandOutcome::kPending; });
}

google::protobuf::Value CommandHandle::Get() const {
  Wait();

  std::lock_guard lock(state_->mutex_);
  switch (state_->outcome_) {
    case CommandOutcome::kCompleted:
      return state_->result_;
    case CommandOutcome::kFailed:
      throw util::CommandFailed(state_->error_);
    case CommandOutcome::kTimedOut:
      throw util::CommandTimeout(state_->error_);
    case CommandOutcome::kDisconnected:
      throw util::AgentDisconnected(state_->error_);
    case CommandOutcome::kPending:
      break;
  }
  throw std::logic_error("command still pending after wait");
}

std::string CommandHandle::Error() const {
  std::lock_guard lock(state_->mutex_);
  return state_->error_;
}

void CommandHandle::OnComplete(CommandState::Callback callback) const {
  {
    std::lock_guard lock(state_->mutex_);
    if (state_->outcome_ == CommandOutcome::kPending) {
      state_->callbacks_.push_back(std::move(callback));
      return;
    }
  }
  callback(*this);
}

} // namespace relay::dispatch
