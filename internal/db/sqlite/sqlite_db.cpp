#include "sqlite_db.hpp"

#include <stdexcept>

namespace relay::db::sqlite {

SqliteDB::SqliteDB(std::string path, bool wal_mode, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open sqlite database " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode, busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("sqlite: " + msg);
  }
}

void SqliteDB::Configure(bool wal_mode, std::chrono::milliseconds busy_timeout) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // Another process may hold the file (relayctl against a shared db).
  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw std::runtime_error("sqlite busy_timeout: " + std::string(sqlite3_errmsg(db_)));
  }

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace relay::db::sqlite
