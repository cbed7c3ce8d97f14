#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace settle::db::sqlite {

/*
  SQLite transaction wrapper.

  Writers use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y lock upgrades later
  Readers use BEGIN DEFERRED and never block writers under WAL.

  Commit maps SQLITE_BUSY/SQLITE_LOCKED to util::Conflict.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace settle::db::sqlite
