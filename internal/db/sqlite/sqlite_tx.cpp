#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace relay::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->Lock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    RELAY_LOG_WARN("sqlite rollback failed", {relay::observability::StringField("db", db_->Path()),
                                              relay::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Finish(const char* sql) {
  db_->Exec(sql);
  finished_ = true;
  lock_.unlock();
}

void SqliteTransaction::Commit() {
  Finish("COMMIT;");
}

void SqliteTransaction::Rollback() {
  Finish("ROLLBACK;");
}

} // namespace relay::db::sqlite
