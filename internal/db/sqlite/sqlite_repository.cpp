#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace relay::db::sqlite {

using relay::db::ErrorCode;
using relay::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kTenantColumns = "tenant_id,name,secret_digest,resource_name,encryption_key,created_at_ms";

model::TenantRecord ReadTenant(sqlite3_stmt* st) {
  model::TenantRecord r;
  r.tenant_id      = ColText(st, 0);
  r.name           = ColText(st, 1);
  r.secret_digest  = ColText(st, 2);
  r.resource_name  = ColText(st, 3);
  r.encryption_key = ColText(st, 4);
  r.created_at_ms  = ColU64(st, 5);
  return r;
}

constexpr const char* kNetworkColumns =
    "tenant_id,network_name,block_index,subnet_cidr,gateway_address,vm_address,file_share_address,relay_address,"
    "relay_attached,state,created_at_ms";

model::NetworkAllocationRecord ReadNetwork(sqlite3_stmt* st) {
  model::NetworkAllocationRecord r;
  r.tenant_id          = ColText(st, 0);
  r.network_name       = ColText(st, 1);
  r.block_index        = static_cast<uint32_t>(ColU64(st, 2));
  r.subnet_cidr        = ColText(st, 3);
  r.gateway_address    = ColText(st, 4);
  r.vm_address         = ColText(st, 5);
  r.file_share_address = ColText(st, 6);
  r.relay_address      = ColText(st, 7);
  r.relay_attached     = ColI32(st, 8) != 0;
  r.state              = static_cast<model::AllocationState>(ColI32(st, 9));
  r.created_at_ms      = ColU64(st, 10);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Tenants
// ------------------------------------------------------------------

Result SqliteRepository::InsertTenant(Transaction& t, const model::TenantRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO tenants(tenant_id,name,secret_digest,resource_name,encryption_key,created_at_ms) "
        "VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.tenant_id);
    BindText(st.get(), 2, r.name);
    BindOptionalText(st.get(), 3, r.secret_digest);
    BindText(st.get(), 4, r.resource_name);
    BindOptionalText(st.get(), 5, r.encryption_key);
    BindU64(st.get(), 6, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TenantRecord>
SqliteRepository::GetTenant(Transaction& t, const std::string& tenant_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kTenantColumns + " FROM tenants WHERE tenant_id=?;";
    auto st = Prepare(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, tenant_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadTenant(st.get());
}

std::optional<model::TenantRecord>
SqliteRepository::FindTenantBySecretDigest(Transaction& t, const std::string& secret_digest) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kTenantColumns + " FROM tenants WHERE secret_digest=? LIMIT 1;";
    auto st = Prepare(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, secret_digest);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadTenant(st.get());
}

std::vector<model::TenantRecord> SqliteRepository::ListTenants(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::TenantRecord> out;
    const std::string sql = std::string("SELECT ") + kTenantColumns + " FROM tenants ORDER BY tenant_id;";
    auto st = Prepare(db, sql.c_str());
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadTenant(st.get()));
    return out;
}

Result SqliteRepository::SetEncryptionKeyIfAbsent(Transaction& t, const std::string& tenant_id, const std::string& key_hex) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE tenants SET encryption_key=? WHERE tenant_id=? AND encryption_key IS NULL;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, key_hex);
    BindText(st.get(), 2, tenant_id);
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE || sqlite3_changes(db) > 0) return Translate(db, rc);

    // No row changed: either a key already exists or the tenant does not.
    if (!GetTenant(t, tenant_id)) return Result::Err(ErrorCode::NotFound, "tenant not found");
    return Result::Ok();
}

// ------------------------------------------------------------------
// Networks
// ------------------------------------------------------------------

Result SqliteRepository::InsertNetwork(Transaction& t, const model::NetworkAllocationRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO tenant_networks(") + kNetworkColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";
    auto st = Prepare(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.tenant_id);
    BindText(st.get(), 2, r.network_name);
    BindU64(st.get(), 3, r.block_index);
    BindText(st.get(), 4, r.subnet_cidr);
    BindText(st.get(), 5, r.gateway_address);
    BindText(st.get(), 6, r.vm_address);
    BindText(st.get(), 7, r.file_share_address);
    BindText(st.get(), 8, r.relay_address);
    BindI32(st.get(), 9, r.relay_attached ? 1 : 0);
    BindI32(st.get(), 10, static_cast<int>(r.state));
    BindU64(st.get(), 11, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::NetworkAllocationRecord>
SqliteRepository::GetNetwork(Transaction& t, const std::string& tenant_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kNetworkColumns + " FROM tenant_networks WHERE tenant_id=?;";
    auto st = Prepare(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, tenant_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadNetwork(st.get());
}

std::vector<model::NetworkAllocationRecord> SqliteRepository::ListNetworks(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::NetworkAllocationRecord> out;
    const std::string sql = std::string("SELECT ") + kNetworkColumns + " FROM tenant_networks ORDER BY block_index;";
    auto st = Prepare(db, sql.c_str());
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadNetwork(st.get()));
    return out;
}

Result SqliteRepository::UpdateNetwork(Transaction& t, const model::NetworkAllocationRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE tenant_networks SET relay_address=?,relay_attached=?,state=? WHERE tenant_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.relay_address);
    BindI32(st.get(), 2, r.relay_attached ? 1 : 0);
    BindI32(st.get(), 3, static_cast<int>(r.state));
    BindText(st.get(), 4, r.tenant_id);

    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteNetwork(Transaction& t, const std::string& tenant_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM tenant_networks WHERE tenant_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, tenant_id);
    return Translate(db, sqlite3_step(st.get()));
}

} // namespace relay::db::sqlite
