#include "internal/core/record_mapping.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace settle::core {

void ThrowIfDbError(const db::Result& result, std::string_view context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? std::string(context) : std::string(context) + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::ValidationError(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    case db::ErrorCode::Busy:
      throw util::Conflict(message, true);
    case db::ErrorCode::Corruption:
      throw util::ConsistencyError(message);
    case db::ErrorCode::IOError:
    case db::ErrorCode::InternalError:
    default:
      throw std::runtime_error(message + " (" + std::string(db::ToString(result.code)) + ")");
  }
}

// Roles are validated on ingest; a stored role that no longer parses is corrupt data.
model::Participant ToModel(const db::model::ParticipantRecord& record) {
  if (record.role == model::Role::kUnspecified) {
    throw util::ConsistencyError("participant " + std::to_string(record.id) + " has an unknown stored role");
  }
  return model::Participant{record.id, record.external_id, record.name, record.role};
}

model::UsageEvent ToModel(const db::model::UsageEventRecord& record) {
  model::UsageEvent event;
  event.id             = record.id;
  event.participant_id = record.participant_id;
  event.kind           = record.kind;
  event.quantity       = record.quantity;
  event.unit           = record.unit;
  event.timestamp      = util::FromUnixMillis(record.timestamp_ms);
  event.source         = record.source;
  event.price_per_unit = record.price_per_unit;
  return event;
}

model::SettlementBatch ToModel(const db::model::SettlementBatchRecord& record) {
  model::SettlementBatch batch;
  batch.id         = record.id;
  batch.use_case   = record.use_case;
  batch.window     = {util::FromUnixMillis(record.start_ms), util::FromUnixMillis(record.end_ms)};
  batch.created_at = util::FromUnixMillis(record.created_at_ms);
  batch.policy_id  = record.policy_id;
  return batch;
}

model::SettlementLine ToModel(const db::model::SettlementLineRecord& record) {
  return model::SettlementLine{record.id, record.batch_id, record.participant_id, record.amount_cents, record.description, record.proof_hash};
}

db::model::ParticipantRecord ToRecord(const model::Participant& participant) {
  return db::model::ParticipantRecord{participant.id, participant.external_id, participant.name, participant.role};
}

db::model::UsageEventRecord ToRecord(const model::UsageEvent& event) {
  db::model::UsageEventRecord record;
  record.id             = event.id;
  record.participant_id = event.participant_id;
  record.kind           = event.kind;
  record.quantity       = event.quantity;
  record.unit           = event.unit;
  record.timestamp_ms   = util::ToUnixMillis(event.timestamp);
  record.source         = event.source;
  record.price_per_unit = event.price_per_unit;
  return record;
}

db::model::SettlementBatchRecord ToRecord(const model::SettlementBatch& batch) {
  db::model::SettlementBatchRecord record;
  record.id            = batch.id;
  record.use_case      = batch.use_case;
  record.start_ms      = util::ToUnixMillis(batch.window.start);
  record.end_ms        = util::ToUnixMillis(batch.window.end);
  record.created_at_ms = util::ToUnixMillis(batch.created_at);
  record.policy_id     = batch.policy_id;
  return record;
}

db::model::SettlementLineRecord ToRecord(const model::SettlementLine& line) {
  return db::model::SettlementLineRecord{line.id, line.batch_id, line.participant_id, line.amount, line.description, line.proof_hash};
}

} // namespace settle::core
