#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace relay::db { class Repository; }
namespace relay::util { class TimerQueue; }
namespace relay::agent { class AgentRegistry; }
namespace relay::dispatch { class CommandDispatcher; }

namespace relay::factory {

/*
  Application

  Owns everything that must outlive the gRPC server.
  Shutdown() stops the timer thread, then rejects whatever is still pending.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<relay::util::TimerQueue> timers;
  std::shared_ptr<relay::agent::AgentRegistry> agents;
  std::shared_ptr<relay::dispatch::CommandDispatcher> dispatcher;

  void Shutdown();
};

/*
  Composition root. The ONLY place that knows concrete DB and driver types.
*/
std::shared_ptr<relay::db::Repository> BuildRepository(const relay::runtime::config::RuntimeConfig& config);

Application Build(const relay::runtime::config::RuntimeConfig& config);

}
