#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace settle::db::postgres {

/*
  Writers run at SERIALIZABLE so that two settlement runs over the same
  window cannot both pass the overlap check. Readers get a read-only
  transaction.
*/
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(std::shared_ptr<PgPool> pool, bool read_only);
  ~PgTransaction() override;

  pqxx::transaction_base& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection>       conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  bool                                    committed_ = false;
  bool                                    finished_  = false;
};

} // namespace settle::db::postgres
