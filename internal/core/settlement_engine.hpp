#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/aggregate/participant_directory.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/settlement.hpp"
#include "internal/netting/netting_engine.hpp"
#include "internal/policy/policy.hpp"

namespace settle::core {

// One event as submitted for ingestion. The participant is referenced by
// external id and created on first sight.
struct EventInput {
  std::string           participant_external_id;
  std::string           participant_name; // defaults to the external id
  model::Role           participant_role = model::Role::kUnspecified;
  model::EventKind      kind             = model::EventKind::kUnspecified;
  double                quantity         = 0.0;
  model::Unit           unit             = model::Unit::kUnspecified;
  util::TimePoint       timestamp{};
  std::string           source;
  std::optional<double> price_per_unit;
};

struct IngestResult {
  std::size_t events_ingested      = 0;
  std::size_t participants_created = 0;
};

struct SettlementComputation {
  std::vector<model::Posting>                        postings;
  std::map<model::ParticipantId, model::Balance>     balances;
  std::map<model::ParticipantId, model::Participant> participants; // everyone with a balance
  netting::NettingResult                             netting;

  std::size_t events_considered   = 0;
  std::size_t unpriced_events     = 0;
  std::size_t unclassified_events = 0;
};

struct SettlementOutcome {
  model::SettlementBatch             batch;
  std::vector<model::SettlementLine> lines;
  SettlementComputation              computation;
};

/*
  Events of one window -> postings -> balances -> netting.

  Pure apart from provisional synthetic counterparties the evaluator registers
  in `directory`. Events outside the window are ignored.
*/
SettlementComputation ComputeSettlement(const policy::Policy& policy, aggregate::ParticipantDirectory& directory, const model::TimeWindow& window,
                                        std::vector<model::UsageEvent> events);

/*
  SettlementEngine

  Owns the unit-of-work boundaries around the pure settlement pipeline:

    Ingest   one write transaction for all events of a request
    Preview  one read transaction, nothing persisted
    Execute  one write transaction: synthetic counterparties, policy, batch
             and lines are committed together or not at all

  Errors are util::SettlementError subclasses; repository results are
  translated with ThrowIfDbError.
*/
class SettlementEngine {
 public:
  explicit SettlementEngine(std::shared_ptr<db::Repository> repository);

  IngestResult Ingest(const std::vector<EventInput>& events);

  SettlementComputation Preview(const policy::Policy& policy, const model::TimeWindow& window);

  SettlementOutcome Execute(const policy::Policy& policy, const model::TimeWindow& window);

 private:
  aggregate::ParticipantDirectory LoadDirectory(db::Transaction& tx);
  std::vector<model::UsageEvent>  LoadEvents(db::Transaction& tx, const model::TimeWindow& window);

  // Persists provisional synthetic participants. Returns true if any were created.
  bool MaterializeSynthetics(db::Transaction& tx, const aggregate::ParticipantDirectory& directory);

  void WarnOnOverlap(db::Transaction& tx, const std::string& use_case, const model::TimeWindow& window);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace settle::core
