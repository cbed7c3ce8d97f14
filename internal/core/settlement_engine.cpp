#include "settlement_engine.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <stdexcept>
#include <utility>

#include "internal/aggregate/event_aggregator.hpp"
#include "internal/core/record_mapping.hpp"
#include "internal/ledger/proof_hash.hpp"
#include "internal/observability/logging.hpp"
#include "internal/policy/policy_evaluator.hpp"
#include "internal/policy/policy_loader.hpp"
#include "internal/util/errors.hpp"

namespace settle::core {

namespace {

// Events are stored at millisecond resolution, so both ends are floored once
// and the same window is used for loading, filtering and the batch record.
model::TimeWindow NormalizeWindow(const model::TimeWindow& window) {
  if (!(window.start < window.end)) {
    throw util::ValidationError(fmt::format("window start {} is not before end {}", util::FormatUtc(window.start), util::FormatUtc(window.end)));
  }
  model::TimeWindow normalized{util::FloorToMillis(window.start), util::FloorToMillis(window.end)};
  if (!(normalized.start < normalized.end)) {
    throw util::ValidationError(fmt::format("window {} .. {} is shorter than one millisecond", util::FormatUtc(window.start), util::FormatUtc(window.end)));
  }
  return normalized;
}

void ValidateInput(const EventInput& input, std::size_t index) {
  if (input.participant_external_id.empty()) {
    throw util::ValidationError(fmt::format("event #{}: participant external id is empty", index));
  }
  if (input.kind == model::EventKind::kUnspecified) {
    throw util::ValidationError(fmt::format("event #{} of '{}': kind is unspecified", index, input.participant_external_id));
  }
  if (input.unit == model::Unit::kUnspecified) {
    throw util::ValidationError(fmt::format("event #{} of '{}': unit is unspecified", index, input.participant_external_id));
  }
  if (!std::isfinite(input.quantity) || input.quantity < 0.0) {
    throw util::ValidationError(fmt::format("event #{} of '{}': quantity {} must be finite and non-negative", index, input.participant_external_id,
                                            input.quantity));
  }
  if (input.price_per_unit && (!std::isfinite(*input.price_per_unit) || *input.price_per_unit < 0.0)) {
    throw util::ValidationError(fmt::format("event #{} of '{}': price {} must be finite and non-negative", index, input.participant_external_id,
                                            *input.price_per_unit));
  }
}

netting::NettingOptions NettingOptionsFor(const policy::Policy& policy, const aggregate::ParticipantDirectory& directory) {
  netting::NettingOptions options;
  options.rounding_mode = policy.netting.rounding_mode;
  options.zero_epsilon  = policy.netting.zero_epsilon;
  options.min_payout    = [&policy, &directory](model::ParticipantId id) {
    const auto* participant = directory.Find(id);
    return participant ? policy.netting.MinPayoutFor(participant->role) : policy.netting.min_payout_eur;
  };
  return options;
}

// Lines must carry exactly the rounded positions minus what the threshold removed.
void CheckConservation(const netting::NettingResult& netting, model::Cents line_total) {
  const auto expected = netting.RoundedTotal() - netting.SuppressedTotal();
  if (line_total != expected || netting.FinalTotal() != expected) {
    throw util::ConsistencyError(fmt::format("conservation check failed: lines sum to {} cents, rounded positions minus suppressed give {} cents",
                                             line_total, expected));
  }
}

} // namespace

// ---------------------------------------------------------------------------
// Pure pipeline
// ---------------------------------------------------------------------------

SettlementComputation ComputeSettlement(const policy::Policy& policy, aggregate::ParticipantDirectory& directory, const model::TimeWindow& window,
                                        std::vector<model::UsageEvent> events) {
  aggregate::EventAggregator aggregator(directory, window);
  const auto                 aggregation = aggregator.Aggregate(std::move(events));

  SettlementComputation   result;
  policy::PolicyEvaluator evaluator(policy, directory);

  result.events_considered = aggregation.events.size();
  for (const auto& classified : aggregation.events) {
    auto evaluation = evaluator.Evaluate(classified);
    if (evaluation.unclassified) {
      ++result.unclassified_events;
    }
    if (!evaluation.matched) {
      ++result.unpriced_events;
      SETTLE_LOG_DEBUG("event not priced by policy",
                       {observability::IntField("event_id", classified.event.id),
                        observability::IntField("participant_id", classified.event.participant_id),
                        observability::StringField("kind", model::ToString(classified.event.kind)),
                        observability::StringField("role", model::ToString(classified.role))});
      continue;
    }

    for (auto& posting : evaluation.postings) {
      result.balances[posting.debit_participant].debit += posting.amount;
      result.balances[posting.credit_participant].credit += posting.amount;
      result.postings.push_back(std::move(posting));
    }
  }

  if (result.unclassified_events > 0 && policy.unclassified_source == policy::UnclassifiedSource::kGrid) {
    SETTLE_LOG_WARN("unclassified event sources treated as grid supply",
                    {observability::IntField("events", static_cast<std::int64_t>(result.unclassified_events)),
                     observability::StringField("use_case", policy::ToString(policy.use_case))});
  }

  for (const auto& [id, _] : result.balances) {
    if (const auto* participant = directory.Find(id)) {
      result.participants.emplace(id, *participant);
    }
  }

  netting::NettingEngine engine(NettingOptionsFor(policy, directory));
  result.netting = engine.Net(result.balances);
  return result;
}

// ---------------------------------------------------------------------------
// SettlementEngine
// ---------------------------------------------------------------------------

SettlementEngine::SettlementEngine(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("SettlementEngine requires a repository");
  }
}

IngestResult SettlementEngine::Ingest(const std::vector<EventInput>& events) {
  for (std::size_t i = 0; i < events.size(); ++i) {
    ValidateInput(events[i], i);
  }

  IngestResult result;
  auto         tx = repository_->Begin();

  for (const auto& input : events) {
    auto participant = repository_->GetParticipantByExternalId(*tx, input.participant_external_id);
    if (!participant) {
      if (input.participant_role == model::Role::kUnspecified) {
        throw util::ValidationError(fmt::format("participant '{}' does not exist and no role was given", input.participant_external_id));
      }
      db::model::ParticipantRecord record;
      record.external_id = input.participant_external_id;
      record.name        = input.participant_name.empty() ? input.participant_external_id : input.participant_name;
      record.role        = input.participant_role;
      ThrowIfDbError(repository_->InsertParticipant(*tx, record), "insert participant " + record.external_id);
      participant = record;
      ++result.participants_created;
    } else if (input.participant_role != model::Role::kUnspecified && input.participant_role != participant->role) {
      throw util::ValidationError(fmt::format("participant '{}' has role {}, event claims {}", participant->external_id, model::ToString(participant->role),
                                              model::ToString(input.participant_role)));
    }

    db::model::UsageEventRecord event;
    event.participant_id = participant->id;
    event.kind           = input.kind;
    event.quantity       = input.quantity;
    event.unit           = input.unit;
    event.timestamp_ms   = util::ToUnixMillis(input.timestamp);
    event.source         = input.source;
    event.price_per_unit = input.price_per_unit;
    ThrowIfDbError(repository_->InsertEvent(*tx, event), "insert event of " + participant->external_id);
    ++result.events_ingested;
  }

  tx->Commit();

  SETTLE_LOG_INFO("events ingested", {observability::IntField("events", static_cast<std::int64_t>(result.events_ingested)),
                                      observability::IntField("participants_created", static_cast<std::int64_t>(result.participants_created))});
  return result;
}

SettlementComputation SettlementEngine::Preview(const policy::Policy& policy, const model::TimeWindow& requested) {
  const auto window = NormalizeWindow(requested);

  auto tx        = repository_->BeginRead();
  auto directory = LoadDirectory(*tx);
  auto events    = LoadEvents(*tx, window);
  tx->Commit();

  return ComputeSettlement(policy, directory, window, std::move(events));
}

SettlementOutcome SettlementEngine::Execute(const policy::Policy& policy, const model::TimeWindow& requested) {
  const auto window = NormalizeWindow(requested);

  const std::string use_case(policy::ToString(policy.use_case));
  auto              tx     = repository_->Begin();
  const auto        events = LoadEvents(*tx, window);

  auto directory   = LoadDirectory(*tx);
  auto computation = ComputeSettlement(policy, directory, window, events);

  // Synthetic counterparties first get provisional ids; once persisted the
  // run is recomputed so that lines and transfers reference real rows.
  if (MaterializeSynthetics(*tx, directory)) {
    directory   = LoadDirectory(*tx);
    computation = ComputeSettlement(policy, directory, window, events);
  }

  WarnOnOverlap(*tx, use_case, window);

  const auto now = util::Now();

  db::model::PolicyRecord policy_record;
  policy_record.use_case      = use_case;
  policy_record.body_json     = policy::ToCanonicalJson(policy);
  policy_record.created_at_ms = util::ToUnixMillis(now);
  ThrowIfDbError(repository_->InsertPolicy(*tx, policy_record), "insert policy");

  SettlementOutcome outcome;
  outcome.batch.use_case   = use_case;
  outcome.batch.window     = window;
  outcome.batch.created_at = util::FromUnixMillis(util::ToUnixMillis(now));
  outcome.batch.policy_id  = policy_record.id;

  auto batch_record = ToRecord(outcome.batch);
  ThrowIfDbError(repository_->InsertBatch(*tx, batch_record), "insert settlement batch");
  outcome.batch.id = batch_record.id;

  model::Cents line_total = 0;
  for (const auto& [participant_id, position] : computation.netting.positions) {
    if (position.final_amount == 0) {
      continue;
    }

    model::SettlementLine line;
    line.batch_id       = outcome.batch.id;
    line.participant_id = participant_id;
    line.amount         = position.final_amount;
    line.description    = ledger::DescribeLine(use_case, line.amount);
    line.proof_hash     = ledger::ComputeProofHash(ledger::FieldsOf(line));

    auto line_record = ToRecord(line);
    ThrowIfDbError(repository_->InsertLine(*tx, line_record), fmt::format("insert settlement line for participant {}", participant_id));
    line.id = line_record.id;

    line_total += line.amount;
    outcome.lines.push_back(std::move(line));
  }

  CheckConservation(computation.netting, line_total);

  tx->Commit();

  const auto& stats = computation.netting.stats;
  SETTLE_LOG_INFO("settlement batch committed", {observability::IntField("batch_id", outcome.batch.id), observability::StringField("use_case", use_case),
                                                 observability::IntField("lines", static_cast<std::int64_t>(outcome.lines.size())),
                                                 observability::IntField("transfers", static_cast<std::int64_t>(stats.transfer_count)),
                                                 observability::DoubleField("netting_efficiency", stats.netting_efficiency),
                                                 observability::IntField("suppressed", static_cast<std::int64_t>(stats.suppressed_count)),
                                                 observability::EurField("suppressed_eur", computation.netting.SuppressedTotal())});

  outcome.computation = std::move(computation);
  return outcome;
}

aggregate::ParticipantDirectory SettlementEngine::LoadDirectory(db::Transaction& tx) {
  std::vector<model::Participant> participants;
  for (const auto& record : repository_->ListParticipants(tx)) {
    participants.push_back(ToModel(record));
  }
  return aggregate::ParticipantDirectory(participants);
}

std::vector<model::UsageEvent> SettlementEngine::LoadEvents(db::Transaction& tx, const model::TimeWindow& window) {
  std::vector<model::UsageEvent> events;
  for (const auto& record : repository_->ListEventsInWindow(tx, util::ToUnixMillis(window.start), util::ToUnixMillis(window.end))) {
    events.push_back(ToModel(record));
  }
  return events;
}

bool SettlementEngine::MaterializeSynthetics(db::Transaction& tx, const aggregate::ParticipantDirectory& directory) {
  bool created = false;
  for (const auto& provisional : directory.Provisional()) {
    if (auto existing = repository_->GetParticipantByExternalId(tx, provisional.external_id)) {
      // Reserved external id taken by a participant of another role.
      throw util::ValidationError(fmt::format("cannot create {} participant: external id '{}' belongs to participant {} with role {}",
                                              model::ToString(provisional.role), provisional.external_id, existing->id,
                                              model::ToString(existing->role)));
    }

    auto record = ToRecord(provisional);
    record.id   = 0;
    ThrowIfDbError(repository_->InsertParticipant(tx, record), "create synthetic participant " + provisional.external_id);
    created = true;

    SETTLE_LOG_INFO("synthetic participant created", {observability::IntField("participant_id", record.id),
                                                      observability::StringField("role", model::ToString(record.role))});
  }
  return created;
}

void SettlementEngine::WarnOnOverlap(db::Transaction& tx, const std::string& use_case, const model::TimeWindow& window) {
  const auto overlapping = repository_->ListOverlappingBatches(tx, use_case, util::ToUnixMillis(window.start), util::ToUnixMillis(window.end));
  for (const auto& batch : overlapping) {
    SETTLE_LOG_WARN("settlement window overlaps an existing batch",
                    {observability::IntField("existing_batch_id", batch.id), observability::StringField("use_case", use_case),
                     observability::StringField("start", util::FormatUtc(window.start)),
                     observability::StringField("end", util::FormatUtc(window.end))});
  }
}

} // namespace settle::core
