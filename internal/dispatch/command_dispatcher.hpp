#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <google/protobuf/struct.pb.h>

#include "internal/agent/agent_connection.hpp"
#include "internal/dispatch/command_handle.hpp"
#include "internal/util/time.hpp"
#include "internal/util/timer_queue.hpp"

namespace relay::agent {
class AgentRegistry;
}

namespace relay::dispatch {

/*
  Request/response correlation over agent connections.

  CRITICAL GUARANTEES:

  - Every handle returned by Send() resolves exactly once: response,
    agent error, timeout or disconnect of the session it was sent on.
  - A pending entry and its timer are removed together.
  - Replies for unknown or already resolved ids are logged and dropped.
  - Send() never queues: no live connection means AgentUnavailable.
  - With a required tenant, the binding is checked on the same route the
    command is written to. An agent bound to another tenant gets
    nothing; an unbound agent is accepted.

  The timer queue must be stopped before the dispatcher is destroyed.
*/
class CommandDispatcher final : public agent::AgentObserver {
 public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{60000};

  struct Counters {
    uint64_t completed = 0;
    uint64_t failed    = 0;
    uint64_t timed_out = 0;
  };

  CommandDispatcher(std::shared_ptr<agent::AgentRegistry> registry,
                    std::shared_ptr<util::TimerQueue>     timers,
                    std::chrono::milliseconds             default_timeout = kDefaultTimeout);
  ~CommandDispatcher() override;

  CommandDispatcher(const CommandDispatcher&)            = delete;
  CommandDispatcher& operator=(const CommandDispatcher&) = delete;

  CommandHandle Send(const std::string&                       agent_id,
                     const std::string&                       type,
                     google::protobuf::Value                  payload,
                     std::optional<std::chrono::milliseconds> timeout         = std::nullopt,
                     const std::string*                       required_tenant = nullptr);

  // ---------------------------------------------------------------------
  // Container commands
  // ---------------------------------------------------------------------

  CommandHandle CreateContainer(const std::string& agent_id, const google::protobuf::Struct& options);
  CommandHandle StartContainer(const std::string& agent_id, const std::string& container_id);
  CommandHandle StopContainer(const std::string& agent_id, const std::string& container_id);
  CommandHandle RemoveContainer(const std::string& agent_id, const std::string& container_id);
  CommandHandle ListContainers(const std::string& agent_id);
  CommandHandle ExecInContainer(const std::string& agent_id, const std::string& container_id, const std::string& command);
  CommandHandle ContainerLogs(const std::string& agent_id, const std::string& container_id, uint32_t tail = 100);
  CommandHandle InspectContainer(const std::string& agent_id, const std::string& container_id);

  std::size_t PendingCount() const;
  Counters    Stats() const;

  // Rejects everything still pending.
  void Shutdown();

  // AgentObserver
  void OnCommandResponse(const std::string& agent_id, const relay::v1::CommandResponse& response) override;
  void OnCommandError(const std::string& agent_id, const relay::v1::CommandError& error) override;
  void OnAgentDisconnected(const std::string& agent_id, uint64_t session) override;

 private:
  struct Pending {
    std::shared_ptr<CommandState> state;
    std::string                   agent_id;
    std::string                   type;
    uint64_t                      session = 0;
    util::TimePoint               issued_at;
    util::TimerQueue::TimerId     timer = 0;
  };

  // Removes the entry when it exists and belongs to agent_id (if given).
  std::optional<Pending> Take(const std::string& command_id, const std::string* agent_id);

  void OnTimeout(const std::string& command_id, std::chrono::milliseconds window);

  CommandHandle SendContainer(const std::string& agent_id, const std::string& type, google::protobuf::Struct payload);

  std::shared_ptr<agent::AgentRegistry> registry_;
  std::shared_ptr<util::TimerQueue>     timers_;
  std::chrono::milliseconds             default_timeout_;

  mutable std::mutex                       mutex_;
  std::unordered_map<std::string, Pending> pending_;

  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> timed_out_{0};
};

} // namespace relay::dispatch
