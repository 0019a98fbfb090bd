#pragma once

#include <memory>

namespace relay::db { class Repository; }
namespace relay::keystore { class KeyStore; }
namespace relay::payload { class ToolRegistry; class PayloadBuilder; }
namespace relay::agent { class AgentRegistry; }
namespace relay::dispatch { class CommandDispatcher; }
namespace relay::network { class NetworkAllocator; }

namespace relay::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<relay::db::Repository> repository;
  std::shared_ptr<relay::keystore::KeyStore> key_store;
  std::shared_ptr<relay::payload::ToolRegistry> tools;
  std::shared_ptr<relay::payload::PayloadBuilder> builder;
  std::shared_ptr<relay::agent::AgentRegistry> agents;
  std::shared_ptr<relay::dispatch::CommandDispatcher> dispatcher;
  std::shared_ptr<relay::network::NetworkAllocator> networks;
};

} // namespace relay::service
