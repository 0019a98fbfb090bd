#include "pg_repository.hpp"

#include <optional>

namespace relay::db::postgres {

namespace {

std::optional<std::string> Nullable(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

model::TenantRecord ReadTenant(const pqxx::row& row) {
  model::TenantRecord r;
  r.tenant_id      = row[0].c_str();
  r.name           = row[1].c_str();
  r.secret_digest  = row[2].is_null() ? "" : row[2].c_str();
  r.resource_name  = row[3].c_str();
  r.encryption_key = row[4].is_null() ? "" : row[4].c_str();
  r.created_at_ms  = row[5].as<uint64_t>();
  return r;
}

model::NetworkAllocationRecord ReadNetwork(const pqxx::row& row) {
  model::NetworkAllocationRecord r;
  r.tenant_id          = row[0].c_str();
  r.network_name       = row[1].c_str();
  r.block_index        = row[2].as<uint32_t>();
  r.subnet_cidr        = row[3].c_str();
  r.gateway_address    = row[4].c_str();
  r.vm_address         = row[5].c_str();
  r.file_share_address = row[6].c_str();
  r.relay_address      = row[7].c_str();
  r.relay_attached     = row[8].as<bool>();
  r.state              = static_cast<model::AllocationState>(row[9].as<int>());
  r.created_at_ms      = row[10].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Tenants
// ------------------------------------------------------------------

Result PgRepository::InsertTenant(Transaction& t, const model::TenantRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tenants(tenant_id,name,secret_digest,resource_name,encryption_key,created_at_ms) VALUES($1,$2,$3,$4,$5,$6);",
        r.tenant_id, r.name, Nullable(r.secret_digest), r.resource_name, Nullable(r.encryption_key), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TenantRecord> PgRepository::GetTenant(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_prepared("get_tenant", tenant_id);
  if (res.empty()) return std::nullopt;
  return ReadTenant(res[0]);
}

std::optional<model::TenantRecord> PgRepository::FindTenantBySecretDigest(Transaction& t, const std::string& secret_digest) {
  auto res = TX(t).Work().exec_prepared("find_tenant_by_digest", secret_digest);
  if (res.empty()) return std::nullopt;
  return ReadTenant(res[0]);
}

std::vector<model::TenantRecord> PgRepository::ListTenants(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT tenant_id,name,secret_digest,resource_name,encryption_key,created_at_ms FROM tenants ORDER BY tenant_id;");

  std::vector<model::TenantRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadTenant(row));
  return out;
}

Result PgRepository::SetEncryptionKeyIfAbsent(Transaction& t, const std::string& tenant_id, const std::string& key_hex) {
  try {
    auto res = TX(t).Work().exec_prepared("set_key_if_absent", tenant_id, key_hex);
    if (res.affected_rows() == 0 && !GetTenant(t, tenant_id)) {
      return Result::Err(ErrorCode::NotFound, "tenant not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Networks
// ------------------------------------------------------------------

Result PgRepository::InsertNetwork(Transaction& t, const model::NetworkAllocationRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tenant_networks(tenant_id,network_name,block_index,subnet_cidr,gateway_address,vm_address,"
        "file_share_address,relay_address,relay_attached,state,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11);",
        r.tenant_id, r.network_name, r.block_index, r.subnet_cidr, r.gateway_address, r.vm_address, r.file_share_address,
        r.relay_address, r.relay_attached, static_cast<int>(r.state), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::NetworkAllocationRecord> PgRepository::GetNetwork(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_prepared("get_network", tenant_id);
  if (res.empty()) return std::nullopt;
  return ReadNetwork(res[0]);
}

std::vector<model::NetworkAllocationRecord> PgRepository::ListNetworks(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT tenant_id,network_name,block_index,subnet_cidr,gateway_address,vm_address,file_share_address,relay_address,"
      "relay_attached,state,created_at_ms FROM tenant_networks ORDER BY block_index;");

  std::vector<model::NetworkAllocationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadNetwork(row));
  return out;
}

Result PgRepository::UpdateNetwork(Transaction& t, const model::NetworkAllocationRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE tenant_networks SET relay_address=$2,relay_attached=$3,state=$4 WHERE tenant_id=$1;",
                                        r.tenant_id, r.relay_address, r.relay_attached, static_cast<int>(r.state));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteNetwork(Transaction& t, const std::string& tenant_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM tenant_networks WHERE tenant_id=$1;", tenant_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace relay::db::postgres
