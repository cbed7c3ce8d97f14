#include "sqlite_tx.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace settle::db::sqlite {

namespace {

void ThrowForCode(int rc, const std::string& what, const std::string& message) {
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::Conflict(what + ": " + message, true);
  }
  throw std::runtime_error(what + ": " + message);
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only) : db_(std::move(db)), lock_(db_->AcquireTransactionLock()) {
  std::string msg;
  const int   rc = db_->TryExec(read_only ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;", &msg);
  if (rc != SQLITE_OK) {
    ThrowForCode(rc, "sqlite begin", msg);
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    // Nothing useful to do with a failed rollback during unwinding; sqlite
    // rolls back on its own when the connection closes.
    (void)db_->TryExec("ROLLBACK;");
  }
}

void SqliteTransaction::Commit() {
  std::string msg;
  const int   rc = db_->TryExec("COMMIT;", &msg);
  if (rc != SQLITE_OK) {
    ThrowForCode(rc, "sqlite commit", msg);
  }
  committed_ = true;
  finished_  = true;
  if (lock_.owns_lock()) lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace settle::db::sqlite
