#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/network/ipv4.hpp"

namespace relay::network {

/*
  Enumerates /24 blocks across the configured pools, in pool order.

  The same tenant id always maps to the same preferred index for a
  given pool list.
*/
class SubnetPlan {
 public:
  static constexpr uint8_t kBlockPrefix = 24;

  explicit SubnetPlan(const std::vector<std::string>& pools);

  uint64_t BlockCount() const {
    return total_;
  }

  Cidr BlockAt(uint64_t index) const;

  // First 8 characters as hex when they are hex, otherwise FNV-1a of
  // the whole id; modulo BlockCount().
  uint64_t PreferredIndex(const std::string& tenant_id) const;

 private:
  struct Pool {
    Cidr     cidr;
    uint64_t blocks = 0;
  };

  std::vector<Pool> pools_;
  uint64_t          total_ = 0;
};

uint32_t Fnv1a32(const std::string& data);

} // namespace relay::network
