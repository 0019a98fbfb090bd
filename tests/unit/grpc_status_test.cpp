#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/network_server.hpp"
#include "internal/grpc/tool_server.hpp"
#include "internal/keystore/key_store.hpp"
#include "internal/network/memory_network_driver.hpp"
#include "internal/network/network_allocator.hpp"
#include "internal/payload/tool_registry.hpp"
#include "internal/service/network_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/tool_service.hpp"
#include "internal/util/errors.hpp"
#include "relay/v1.hpp"

namespace {

using relay::grpc::ToStatus;

relay::service::ServiceContext BuildServiceContext() {
  relay::service::ServiceContext ctx;
  ctx.repository = std::make_shared<relay::db::memory::MemoryRepository>();
  ctx.key_store  = std::make_shared<relay::keystore::KeyStore>(ctx.repository);
  ctx.tools      = std::make_shared<relay::payload::ToolRegistry>();

  relay::network::NetworkOptions options;
  options.pools           = {"10.40.0.0/24"};
  options.relay_container = "tools-relay";
  ctx.networks = std::make_shared<relay::network::NetworkAllocator>(ctx.repository, std::make_shared<relay::network::MemoryNetworkDriver>(),
                                                                    options);
  return ctx;
}

void TestExceptionMapping() {
  using namespace relay::util;
  using ::grpc::StatusCode;

  assert(ToStatus(AuthError(AuthError::Reason::kMissingCredential, "x")).error_code() == StatusCode::UNAUTHENTICATED);
  assert(ToStatus(PermissionDenied("x")).error_code() == StatusCode::PERMISSION_DENIED);
  assert(ToStatus(InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(ToStatus(InvalidState("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(ResourceExhausted("x")).error_code() == StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(AgentUnavailable("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(ToStatus(AgentDisconnected("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(ToStatus(CommandTimeout("x")).error_code() == StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(CommandFailed("x")).error_code() == StatusCode::ABORTED);
  assert(ToStatus(DecryptionError("x")).error_code() == StatusCode::DATA_LOSS);
  assert(ToStatus(std::runtime_error("boom")).error_code() == StatusCode::INTERNAL);

  const auto status = ToStatus(AgentUnavailable("Agent a1 not connected"));
  assert(status.error_message() == "Agent a1 not connected");
}

void TestMissingBearerReturnsUnauthenticated() {
  auto ctx = BuildServiceContext();
  relay::grpc::ToolServer server(std::make_shared<relay::service::ToolService>(ctx));

  relay::v1::ListToolsRequest  req;
  relay::v1::ListToolsResponse resp;
  ::grpc::ServerContext        grpc_ctx;

  const auto status = server.ListTools(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(resp.tools_size() == 0);

  relay::v1::HealthRequest  health_req;
  relay::v1::HealthResponse health;
  assert(server.Health(&grpc_ctx, &health_req, &health).ok());
  assert(health.status() == "ok");
}

void TestNetworkServerStatuses() {
  auto ctx = BuildServiceContext();
  relay::grpc::NetworkServer server(std::make_shared<relay::service::NetworkService>(ctx));

  relay::v1::TenantNetworkRequest req;
  relay::v1::NetworkAllocation    resp;

  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.Allocate(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  req.set_tenant_id("00000000-aaaa");
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.GetAllocation(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.Allocate(&grpc_ctx, &req, &resp).ok());
    assert(resp.subnet_cidr() == "10.40.0.0/24");
  }
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.ConfirmTeardown(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }

  // The single block is taken.
  relay::v1::TenantNetworkRequest other;
  other.set_tenant_id("00000001-bbbb");
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.Allocate(&grpc_ctx, &other, &resp).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  }
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMissingBearerReturnsUnauthenticated();
  TestNetworkServerStatuses();

  std::cout << "relay_unit_grpc_status: pass\n";
  return 0;
}
