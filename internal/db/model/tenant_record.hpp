#pragma once

#include <cstdint>
#include <string>

namespace relay::db::model {

struct TenantRecord {
  std::string tenant_id;
  std::string name;

  // SHA-256 of the bearer secret, hex. The raw secret is never stored.
  std::string secret_digest;

  // Container or VM the tenant's tools run in.
  std::string resource_name;

  // 32 bytes hex; empty until first authenticated request.
  std::string encryption_key;

  uint64_t created_at_ms = 0;
};

} // namespace relay::db::model
