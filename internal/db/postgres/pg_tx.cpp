#include "pg_tx.hpp"

#include "internal/util/errors.hpp"

namespace settle::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, bool read_only) : conn_(pool->Acquire()) {
  if (read_only) {
    tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
  } else {
    tx_ = std::make_unique<pqxx::transaction<pqxx::isolation_level::serializable>>(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    // abort() on a broken connection throws; the server discards the
    // transaction either way.
    try {
      tx_->abort();
    } catch (const std::exception&) {
    }
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::transaction_rollback& e) {
    // serialization failure or deadlock
    throw util::Conflict(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace settle::db::postgres
