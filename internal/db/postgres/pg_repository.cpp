#include "pg_repository.hpp"

namespace settle::db::postgres {

namespace {

model::ParticipantRecord ReadParticipant(const pqxx::row& row) {
  model::ParticipantRecord r;
  r.id          = row[0].as<std::int64_t>();
  r.external_id = row[1].c_str();
  r.name        = row[2].c_str();
  r.role        = settle::model::ParseRole(row[3].c_str()).value_or(settle::model::Role::kUnspecified);
  return r;
}

model::UsageEventRecord ReadEvent(const pqxx::row& row) {
  model::UsageEventRecord r;
  r.id             = row[0].as<std::int64_t>();
  r.participant_id = row[1].as<std::int64_t>();
  r.kind           = settle::model::ParseEventKind(row[2].c_str()).value_or(settle::model::EventKind::kUnspecified);
  r.quantity       = row[3].as<double>();
  r.unit           = settle::model::ParseUnit(row[4].c_str()).value_or(settle::model::Unit::kUnspecified);
  r.timestamp_ms   = row[5].as<std::int64_t>();
  r.source         = row[6].c_str();
  if (!row[7].is_null()) {
    r.price_per_unit = row[7].as<double>();
  }
  return r;
}

model::SettlementBatchRecord ReadBatch(const pqxx::row& row) {
  model::SettlementBatchRecord r;
  r.id            = row[0].as<std::int64_t>();
  r.use_case      = row[1].c_str();
  r.start_ms      = row[2].as<std::int64_t>();
  r.end_ms        = row[3].as<std::int64_t>();
  r.created_at_ms = row[4].as<std::int64_t>();
  r.policy_id     = row[5].as<std::int64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, false);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, true);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Participants
// ------------------------------------------------------------------

Result PgRepository::InsertParticipant(Transaction& t, model::ParticipantRecord& r) {
  try {
    auto row = TX(t).Work().exec_prepared1("insert_participant", r.external_id, r.name, std::string(settle::model::ToString(r.role)));
    r.id     = row[0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ParticipantRecord> PgRepository::GetParticipant(Transaction& t, std::int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_participant", id);
  if (res.empty()) return std::nullopt;
  return ReadParticipant(res[0]);
}

std::optional<model::ParticipantRecord> PgRepository::GetParticipantByExternalId(Transaction& t, const std::string& external_id) {
  auto res = TX(t).Work().exec_prepared("get_participant_by_external_id", external_id);
  if (res.empty()) return std::nullopt;
  return ReadParticipant(res[0]);
}

std::vector<model::ParticipantRecord> PgRepository::ListParticipants(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_participants");

  std::vector<model::ParticipantRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadParticipant(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Usage events
// ------------------------------------------------------------------

Result PgRepository::InsertEvent(Transaction& t, model::UsageEventRecord& r) {
  try {
    auto row = TX(t).Work().exec_prepared1("insert_event", r.participant_id, std::string(settle::model::ToString(r.kind)), r.quantity,
                                           std::string(settle::model::ToString(r.unit)), r.timestamp_ms, r.source, r.price_per_unit);
    r.id     = row[0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UsageEventRecord> PgRepository::ListEventsInWindow(Transaction& t, std::int64_t start_ms, std::int64_t end_ms) {
  auto res = TX(t).Work().exec_prepared("list_events_in_window", start_ms, end_ms);

  std::vector<model::UsageEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEvent(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Policies
// ------------------------------------------------------------------

Result PgRepository::InsertPolicy(Transaction& t, model::PolicyRecord& r) {
  try {
    auto row = TX(t).Work().exec_prepared1("insert_policy", r.use_case, r.body_json, r.created_at_ms);
    r.id     = row[0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PolicyRecord> PgRepository::GetPolicy(Transaction& t, std::int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_policy", id);
  if (res.empty()) return std::nullopt;

  model::PolicyRecord r;
  r.id            = res[0][0].as<std::int64_t>();
  r.use_case      = res[0][1].c_str();
  r.body_json     = res[0][2].c_str();
  r.created_at_ms = res[0][3].as<std::int64_t>();
  return r;
}

// ------------------------------------------------------------------
// Settlement batches and lines
// ------------------------------------------------------------------

Result PgRepository::InsertBatch(Transaction& t, model::SettlementBatchRecord& r) {
  try {
    auto row = TX(t).Work().exec_prepared1("insert_batch", r.use_case, r.start_ms, r.end_ms, r.created_at_ms, r.policy_id);
    r.id     = row[0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SettlementBatchRecord> PgRepository::GetBatch(Transaction& t, std::int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_batch", id);
  if (res.empty()) return std::nullopt;
  return ReadBatch(res[0]);
}

std::vector<model::SettlementBatchRecord> PgRepository::ListOverlappingBatches(Transaction& t, const std::string& use_case, std::int64_t start_ms,
                                                                              std::int64_t end_ms) {
  auto res = TX(t).Work().exec_prepared("list_overlapping_batches", use_case, end_ms, start_ms);

  std::vector<model::SettlementBatchRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadBatch(row));
  }
  return out;
}

Result PgRepository::InsertLine(Transaction& t, model::SettlementLineRecord& r) {
  try {
    auto row = TX(t).Work().exec_prepared1("insert_line", r.batch_id, r.participant_id, r.amount_cents, r.description, r.proof_hash);
    r.id     = row[0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SettlementLineRecord> PgRepository::ListLines(Transaction& t, std::int64_t batch_id) {
  auto res = TX(t).Work().exec_prepared("list_lines", batch_id);

  std::vector<model::SettlementLineRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SettlementLineRecord r;
    r.id             = row[0].as<std::int64_t>();
    r.batch_id       = row[1].as<std::int64_t>();
    r.participant_id = row[2].as<std::int64_t>();
    r.amount_cents   = row[3].as<std::int64_t>();
    r.description    = row[4].c_str();
    r.proof_hash     = row[5].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace settle::db::postgres
