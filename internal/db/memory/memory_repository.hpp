#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace settle::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::int64_t, model::ParticipantRecord>     participants;
    std::unordered_map<std::string, std::int64_t>        participant_by_external_id;
    std::map<std::int64_t, model::UsageEventRecord>      events;
    std::map<std::int64_t, model::PolicyRecord>          policies;
    std::map<std::int64_t, model::SettlementBatchRecord> batches;
    std::map<std::int64_t, model::SettlementLineRecord>  lines;

    std::int64_t next_participant_id = 1;
    std::int64_t next_event_id       = 1;
    std::int64_t next_policy_id      = 1;
    std::int64_t next_batch_id       = 1;
    std::int64_t next_line_id        = 1;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace settle::db::memory
