#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace settle::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection shared by the whole process. SQLite transactions are
  per connection, so transactions take turns via AcquireTransactionLock().
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Like Exec but returns the sqlite result code instead of throwing.
  int TryExec(const std::string& sql, std::string* error_message = nullptr);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  const std::string& Path() const {
    return path_;
  }

  std::unique_lock<std::mutex> AcquireTransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace settle::db::sqlite
