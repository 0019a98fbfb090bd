#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/network_allocation_record.hpp"
#include "internal/db/model/tenant_record.hpp"

namespace relay::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Transactions are write-serialized (SQLite BEGIN IMMEDIATE,
    memory writer lock, Postgres row locks via SELECT ... FOR UPDATE)
  - SetEncryptionKeyIfAbsent never overwrites an existing key

  The DB is the source of truth for:
    tenant credentials and keys
    network allocations
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tenants
  // ---------------------------------------------------------------------

  virtual Result InsertTenant(Transaction&, const model::TenantRecord&) = 0;

  virtual std::optional<model::TenantRecord> GetTenant(Transaction&, const std::string& tenant_id) = 0;

  virtual std::optional<model::TenantRecord> FindTenantBySecretDigest(Transaction&, const std::string& secret_digest) = 0;

  virtual std::vector<model::TenantRecord> ListTenants(Transaction&) = 0;

  // Conditional write. OK when the key was stored or one already existed;
  // callers re-read to learn which key won.
  virtual Result SetEncryptionKeyIfAbsent(Transaction&, const std::string& tenant_id, const std::string& key_hex) = 0;

  // ---------------------------------------------------------------------
  // Network allocations (one per tenant)
  // ---------------------------------------------------------------------

  virtual Result InsertNetwork(Transaction&, const model::NetworkAllocationRecord&) = 0;

  virtual std::optional<model::NetworkAllocationRecord> GetNetwork(Transaction&, const std::string& tenant_id) = 0;

  virtual std::vector<model::NetworkAllocationRecord> ListNetworks(Transaction&) = 0;

  virtual Result UpdateNetwork(Transaction&, const model::NetworkAllocationRecord&) = 0;

  virtual Result DeleteNetwork(Transaction&, const std::string& tenant_id) = 0;
};

} // namespace relay::db
