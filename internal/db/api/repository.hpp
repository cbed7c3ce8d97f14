#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/participant_record.hpp"
#include "internal/db/model/policy_record.hpp"
#include "internal/db/model/settlement_batch_record.hpp"
#include "internal/db/model/settlement_line_record.hpp"
#include "internal/db/model/usage_event_record.hpp"

namespace settle::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Insert* assigns the row id and writes it back into the record
  - Batches, lines, events and policies are append-only: there is no
    update or delete for them

  The DB is the source of truth for:
    participants and their roles
    usage events
    settlement batches, lines and the policies they were computed with
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Snapshot for readers (audit). Backends without a cheaper mode fall back
  // to Begin().
  virtual std::unique_ptr<Transaction> BeginRead() {
    return Begin();
  }

  // ---------------------------------------------------------------------
  // Participants
  // ---------------------------------------------------------------------

  // AlreadyExists when external_id is taken.
  virtual Result InsertParticipant(Transaction&, model::ParticipantRecord&) = 0;

  virtual std::optional<model::ParticipantRecord> GetParticipant(Transaction&, std::int64_t id) = 0;

  virtual std::optional<model::ParticipantRecord> GetParticipantByExternalId(Transaction&, const std::string& external_id) = 0;

  // Ordered by id.
  virtual std::vector<model::ParticipantRecord> ListParticipants(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Usage events
  // ---------------------------------------------------------------------

  virtual Result InsertEvent(Transaction&, model::UsageEventRecord&) = 0;

  // start_ms <= timestamp_ms < end_ms, ordered by (timestamp_ms, id).
  virtual std::vector<model::UsageEventRecord> ListEventsInWindow(Transaction&, std::int64_t start_ms, std::int64_t end_ms) = 0;

  // ---------------------------------------------------------------------
  // Policies
  // ---------------------------------------------------------------------

  virtual Result InsertPolicy(Transaction&, model::PolicyRecord&) = 0;

  virtual std::optional<model::PolicyRecord> GetPolicy(Transaction&, std::int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Settlement batches and lines
  // ---------------------------------------------------------------------

  virtual Result InsertBatch(Transaction&, model::SettlementBatchRecord&) = 0;

  virtual std::optional<model::SettlementBatchRecord> GetBatch(Transaction&, std::int64_t id) = 0;

  // Batches of `use_case` whose window intersects [start_ms, end_ms).
  virtual std::vector<model::SettlementBatchRecord> ListOverlappingBatches(Transaction&, const std::string& use_case, std::int64_t start_ms,
                                                                           std::int64_t end_ms) = 0;

  virtual Result InsertLine(Transaction&, model::SettlementLineRecord&) = 0;

  // Ordered by line id.
  virtual std::vector<model::SettlementLineRecord> ListLines(Transaction&, std::int64_t batch_id) = 0;
};

} // namespace settle::db
