#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace relay::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Tenants
// ------------------------------------------------------------------

Result MemoryRepository::InsertTenant(Transaction& t, const model::TenantRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tenants.contains(r.tenant_id)) return Result::Err(ErrorCode::AlreadyExists, "tenant exists");
  if (!r.secret_digest.empty() && s.tenant_by_digest.contains(r.secret_digest))
    return Result::Err(ErrorCode::ConstraintViolation, "secret digest not unique");

  s.tenants[r.tenant_id] = r;
  if (!r.secret_digest.empty()) s.tenant_by_digest[r.secret_digest] = r.tenant_id;
  return Result::Ok();
}

std::optional<model::TenantRecord> MemoryRepository::GetTenant(Transaction& t, const std::string& tenant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tenants.find(tenant_id);
  if (it == s.tenants.end()) return std::nullopt;
  return it->second;
}

std::optional<model::TenantRecord> MemoryRepository::FindTenantBySecretDigest(Transaction& t, const std::string& secret_digest) {
  const auto& s  = TX(t).View();
  auto        it = s.tenant_by_digest.find(secret_digest);
  if (it == s.tenant_by_digest.end()) return std::nullopt;
  return s.tenants.at(it->second);
}

std::vector<model::TenantRecord> MemoryRepository::ListTenants(Transaction& t) {
  std::vector<model::TenantRecord> out;
  for (const auto& [_, record] : TX(t).View().tenants) out.push_back(record);
  return out;
}

Result MemoryRepository::SetEncryptionKeyIfAbsent(Transaction& t, const std::string& tenant_id, const std::string& key_hex) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tenants.find(tenant_id);
  if (it == s.tenants.end()) return Result::Err(ErrorCode::NotFound, "tenant not found");
  if (it->second.encryption_key.empty()) it->second.encryption_key = key_hex;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Networks
// ------------------------------------------------------------------

Result MemoryRepository::InsertNetwork(Transaction& t, const model::NetworkAllocationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.networks.contains(r.tenant_id)) return Result::Err(ErrorCode::AlreadyExists, "tenant already has a network");
  for (const auto& [_, existing] : s.networks) {
    if (existing.block_index == r.block_index)
      return Result::Err(ErrorCode::ConstraintViolation, "block index in use");
  }
  s.networks[r.tenant_id] = r;
  return Result::Ok();
}

std::optional<model::NetworkAllocationRecord> MemoryRepository::GetNetwork(Transaction& t, const std::string& tenant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.networks.find(tenant_id);
  if (it == s.networks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::NetworkAllocationRecord> MemoryRepository::ListNetworks(Transaction& t) {
  std::vector<model::NetworkAllocationRecord> out;
  for (const auto& [_, record] : TX(t).View().networks) out.push_back(record);
  return out;
}

Result MemoryRepository::UpdateNetwork(Transaction& t, const model::NetworkAllocationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.networks.contains(r.tenant_id)) return Result::Err(ErrorCode::NotFound);
  s.networks[r.tenant_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteNetwork(Transaction& t, const std::string& tenant_id) {
  TX(t).Mutable().networks.erase(tenant_id);
  return Result::Ok();
}

} // namespace relay::db::memory
