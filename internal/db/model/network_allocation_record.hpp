#pragma once

#include <cstdint>
#include <string>

namespace relay::db::model {

enum class AllocationState : int {
  kActive          = 1,
  kPendingTeardown = 2,
};

struct NetworkAllocationRecord {
  std::string tenant_id;
  std::string network_name;

  // Index of the /24 block in the configured pools. Unique across live records.
  uint32_t block_index = 0;

  std::string subnet_cidr;
  std::string gateway_address;
  std::string vm_address;
  std::string file_share_address;
  std::string relay_address;

  bool            relay_attached = false;
  AllocationState state          = AllocationState::kActive;
  uint64_t        created_at_ms  = 0;
};

} // namespace relay::db::model
