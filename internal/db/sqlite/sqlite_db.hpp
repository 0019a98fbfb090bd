#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

namespace relay::db::sqlite {

/*
  One serialized sqlite3 connection.

  The connection is shared by every transaction of the repository, so
  transactions take Lock() for their whole lifetime. SQLite cannot nest
  BEGIN on one handle; the lock turns concurrent callers into a queue.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::unique_lock<std::mutex> Lock() {
    return std::unique_lock<std::mutex>(mutex_);
  }

  // Pragmas and schema statements. Throws std::runtime_error.
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode, std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace relay::db::sqlite
