#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/model/network_allocation_record.hpp"
#include "internal/network/ipv4.hpp"
#include "internal/network/network_driver.hpp"
#include "internal/network/subnet_plan.hpp"
#include "internal/util/time.hpp"
#include "relay/v1.hpp"

namespace relay::db {
class Repository;
}

namespace relay::network {

struct NetworkOptions {
  std::vector<std::string> pools;
  std::vector<std::string> control_plane_cidrs;
  std::string              relay_container;
};

/*
  One isolated /24 per tenant.

  CRITICAL GUARANTEES:

  - A chosen block is disjoint from every control-plane CIDR and every
    recorded allocation, and the subnet the driver reports must equal it.
  - Host roles are fixed offsets: gateway .1, file share .2, vm .3,
    relay .4 (retried at +10, +20, +30 when taken).
  - A block stays reserved from Allocate() until ConfirmTeardown().
  - Calls are serialized; driver and repository never see two
    allocator operations interleave.
  - No repository transaction is open while the driver runs. Allocate()
    commits the reservation first and deletes it if the driver fails.
*/
class NetworkAllocator {
 public:
  static constexpr uint32_t kGatewayOffset   = 1;
  static constexpr uint32_t kFileShareOffset = 2;
  static constexpr uint32_t kVmOffset        = 3;
  static constexpr uint32_t kRelayOffset     = 4;
  static constexpr uint32_t kRelayRetryStep  = 10;
  static constexpr int      kRelayAttempts   = 4;

  NetworkAllocator(std::shared_ptr<db::Repository>  repository,
                   std::shared_ptr<NetworkDriver>   driver,
                   NetworkOptions                   options,
                   util::ClockFn                    clock = util::Now);

  db::model::NetworkAllocationRecord Allocate(const std::string& tenant_id);
  db::model::NetworkAllocationRecord AttachRelay(const std::string& tenant_id);
  db::model::NetworkAllocationRecord Release(const std::string& tenant_id);

  // Returns the record as it was just before deletion.
  db::model::NetworkAllocationRecord ConfirmTeardown(const std::string& tenant_id);

  db::model::NetworkAllocationRecord              Get(const std::string& tenant_id);
  std::vector<db::model::NetworkAllocationRecord> List();

  static std::string NetworkName(const std::string& tenant_id);

  static relay::v1::NetworkAllocation ToProto(const db::model::NetworkAllocationRecord& record);

 private:
  db::model::NetworkAllocationRecord Load(const std::string& tenant_id);
  void                               Store(const db::model::NetworkAllocationRecord& record);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<NetworkDriver>  driver_;
  NetworkOptions                  options_;
  util::ClockFn                   clock_;
  SubnetPlan                      plan_;
  std::vector<Cidr>               control_plane_;

  std::mutex mutex_;
};

} // namespace relay::network
