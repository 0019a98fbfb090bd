#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "internal/executor/command_executor.hpp"
#include "relay/v1.hpp"

namespace relay::executor {

struct AgentClientOptions {
  std::string agent_id;
  std::string secret;

  std::string executor_version = "1.0.0";

  std::chrono::milliseconds heartbeat_interval{30000};
  std::chrono::milliseconds reconnect_delay{5000};

  // Commands beyond this many in flight are answered with an error.
  std::size_t max_concurrent_commands = 16;
};

/*
  Long-lived agent session against the relay gateway.

  One session = one Connect stream. Commands are executed on a worker
  thread each so heartbeats and further commands keep flowing while a
  script runs. Finished workers are reaped as new commands arrive. When the stream ends the client waits reconnect_delay
  and dials again until Stop().
*/
class AgentClient {
 public:
  AgentClient(std::shared_ptr<grpc::Channel> channel, AgentClientOptions options, std::shared_ptr<const CommandExecutor> executor);

  void Run();
  void Stop();

  // hostname, platform, executorVersion
  google::protobuf::Struct HelloMetadata() const;

 private:
  void RunSession();

  std::unique_ptr<relay::v1::AgentGateway::Stub> stub_;
  AgentClientOptions                             options_;
  std::shared_ptr<const CommandExecutor>         executor_;

  std::atomic<bool>       running_{true};
  std::mutex              mutex_;
  std::condition_variable cv_;
  grpc::ClientContext*    active_ctx_ = nullptr;
};

} // namespace relay::executor
