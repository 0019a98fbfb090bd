#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "relay/services/v1/agent_gateway.grpc.pb.h"

namespace relay::agent { class AgentRegistry; }
namespace relay::keystore { class KeyStore; }

namespace relay::grpc {

/*
  Executor streams.

  The first message must be a hello. When credentials are required the
  stream's bearer secret binds the agent to its tenant; a secret that is
  present but not required binds it as well.
*/
class AgentGatewayServer final : public relay::services::v1::AgentGateway::CallbackService {
public:
  AgentGatewayServer(std::shared_ptr<relay::agent::AgentRegistry> registry,
                     std::shared_ptr<relay::keystore::KeyStore>   key_store,
                     bool                                         require_credential);

  ::grpc::ServerBidiReactor<relay::agent::v1::AgentMessage, relay::agent::v1::RelayMessage>*
  Connect(::grpc::CallbackServerContext* ctx) override;

private:
  std::shared_ptr<relay::agent::AgentRegistry> registry_;
  std::shared_ptr<relay::keystore::KeyStore>   key_store_;
  bool                                         require_credential_;
};

} // namespace relay::grpc
