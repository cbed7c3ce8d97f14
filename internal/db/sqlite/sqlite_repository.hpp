#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace settle::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result                                  InsertParticipant(Transaction&, model::ParticipantRecord&) override;
  std::optional<model::ParticipantRecord> GetParticipant(Transaction&, std::int64_t id) override;
  std::optional<model::ParticipantRecord> GetParticipantByExternalId(Transaction&, const std::string& external_id) override;
  std::vector<model::ParticipantRecord>   ListParticipants(Transaction&) override;

  Result                               InsertEvent(Transaction&, model::UsageEventRecord&) override;
  std::vector<model::UsageEventRecord> ListEventsInWindow(Transaction&, std::int64_t start_ms, std::int64_t end_ms) override;

  Result                             InsertPolicy(Transaction&, model::PolicyRecord&) override;
  std::optional<model::PolicyRecord> GetPolicy(Transaction&, std::int64_t id) override;

  Result                                      InsertBatch(Transaction&, model::SettlementBatchRecord&) override;
  std::optional<model::SettlementBatchRecord> GetBatch(Transaction&, std::int64_t id) override;
  std::vector<model::SettlementBatchRecord>   ListOverlappingBatches(Transaction&, const std::string& use_case, std::int64_t start_ms,
                                                                     std::int64_t end_ms) override;

  Result                                   InsertLine(Transaction&, model::SettlementLineRecord&) override;
  std::vector<model::SettlementLineRecord> ListLines(Transaction&, std::int64_t batch_id) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace settle::db::sqlite
