#include "network_service.hpp"

#include "internal/network/network_allocator.hpp"
#include "internal/util/errors.hpp"

namespace relay::service {

using namespace relay::v1;
using relay::network::NetworkAllocator;

namespace {

const std::string& TenantOf(const TenantNetworkRequest& req) {
  if (req.tenant_id().empty()) {
    throw util::InvalidArgument("tenant_id is required");
  }
  return req.tenant_id();
}

} // namespace

NetworkService::NetworkService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

NetworkAllocation NetworkService::Allocate(const TenantNetworkRequest& req) {
  return NetworkAllocator::ToProto(ctx_.networks->Allocate(TenantOf(req)));
}

NetworkAllocation NetworkService::AttachRelay(const TenantNetworkRequest& req) {
  return NetworkAllocator::ToProto(ctx_.networks->AttachRelay(TenantOf(req)));
}

NetworkAllocation NetworkService::Release(const TenantNetworkRequest& req) {
  return NetworkAllocator::ToProto(ctx_.networks->Release(TenantOf(req)));
}

NetworkAllocation NetworkService::ConfirmTeardown(const TenantNetworkRequest& req) {
  return NetworkAllocator::ToProto(ctx_.networks->ConfirmTeardown(TenantOf(req)));
}

NetworkAllocation NetworkService::GetAllocation(const TenantNetworkRequest& req) {
  return NetworkAllocator::ToProto(ctx_.networks->Get(TenantOf(req)));
}

ListAllocationsResponse NetworkService::ListAllocations() {
  ListAllocationsResponse resp;
  for (const auto& r : ctx_.networks->List()) {
    *resp.add_allocations() = NetworkAllocator::ToProto(r);
  }
  return resp;
}

} // namespace relay::service
