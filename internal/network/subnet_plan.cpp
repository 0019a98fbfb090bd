#include "subnet_plan.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace relay::network {

SubnetPlan::SubnetPlan(const std::vector<std::string>& pools) {
  for (const auto& text : pools) {
    const auto cidr = ParseCidr(text);
    if (cidr.prefix > kBlockPrefix) {
      throw util::InvalidArgument("address pool smaller than a /24: " + text);
    }
    Pool p;
    p.cidr   = cidr;
    p.blocks = uint64_t{1} << (kBlockPrefix - cidr.prefix);
    total_ += p.blocks;
    pools_.push_back(p);
  }

  if (total_ == 0) {
    throw util::InvalidArgument("at least one address pool is required");
  }
}

Cidr SubnetPlan::BlockAt(uint64_t index) const {
  for (const auto& p : pools_) {
    if (index < p.blocks) {
      Cidr c;
      c.prefix = kBlockPrefix;
      c.base   = p.cidr.First() + static_cast<uint32_t>(index << (32 - kBlockPrefix));
      return c;
    }
    index -= p.blocks;
  }
  throw util::InvalidArgument("block index out of range");
}

uint64_t SubnetPlan::PreferredIndex(const std::string& tenant_id) const {
  bool hex = tenant_id.size() >= 8;
  for (std::size_t i = 0; hex && i < 8; ++i) {
    hex = std::isxdigit(static_cast<unsigned char>(tenant_id[i])) != 0;
  }

  const uint64_t seed = hex ? std::stoul(tenant_id.substr(0, 8), nullptr, 16) : Fnv1a32(tenant_id);
  return seed % total_;
}

uint32_t Fnv1a32(const std::string& data) {
  uint32_t hash = 2166136261u;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 16777619u;
  }
  return hash;
}

} // namespace relay::network
