#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace settle::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Participants
// ------------------------------------------------------------------

Result MemoryRepository::InsertParticipant(Transaction& t, model::ParticipantRecord& r) {
  if (TX(t).View().participant_by_external_id.contains(r.external_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "participant external_id already exists: " + r.external_id);
  }
  auto& s = TX(t).Mutable();
  r.id    = s.next_participant_id++;
  s.participants[r.id]                        = r;
  s.participant_by_external_id[r.external_id] = r.id;
  return Result::Ok();
}

std::optional<model::ParticipantRecord> MemoryRepository::GetParticipant(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.participants.find(id);
  if (it == s.participants.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ParticipantRecord> MemoryRepository::GetParticipantByExternalId(Transaction& t, const std::string& external_id) {
  const auto& s  = TX(t).View();
  auto        it = s.participant_by_external_id.find(external_id);
  if (it == s.participant_by_external_id.end()) return std::nullopt;
  return s.participants.at(it->second);
}

std::vector<model::ParticipantRecord> MemoryRepository::ListParticipants(Transaction& t) {
  const auto&                           s = TX(t).View();
  std::vector<model::ParticipantRecord> records;
  records.reserve(s.participants.size());
  for (const auto& [_, record] : s.participants) {
    records.push_back(record);
  }
  return records;
}

// ------------------------------------------------------------------
// Usage events
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::UsageEventRecord& r) {
  if (!TX(t).View().participants.contains(r.participant_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "event references unknown participant " + std::to_string(r.participant_id));
  }
  auto& s = TX(t).Mutable();
  r.id    = s.next_event_id++;
  s.events[r.id] = r;
  return Result::Ok();
}

std::vector<model::UsageEventRecord> MemoryRepository::ListEventsInWindow(Transaction& t, std::int64_t start_ms, std::int64_t end_ms) {
  const auto&                          s = TX(t).View();
  std::vector<model::UsageEventRecord> out;
  for (const auto& [_, record] : s.events) {
    if (record.timestamp_ms >= start_ms && record.timestamp_ms < end_ms) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
    return a.id < b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Policies
// ------------------------------------------------------------------

Result MemoryRepository::InsertPolicy(Transaction& t, model::PolicyRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_policy_id++;
  s.policies[r.id] = r;
  return Result::Ok();
}

std::optional<model::PolicyRecord> MemoryRepository::GetPolicy(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.policies.find(id);
  if (it == s.policies.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Settlement batches and lines
// ------------------------------------------------------------------

Result MemoryRepository::InsertBatch(Transaction& t, model::SettlementBatchRecord& r) {
  if (!TX(t).View().policies.contains(r.policy_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "batch references unknown policy " + std::to_string(r.policy_id));
  }
  auto& s = TX(t).Mutable();
  r.id    = s.next_batch_id++;
  s.batches[r.id] = r;
  return Result::Ok();
}

std::optional<model::SettlementBatchRecord> MemoryRepository::GetBatch(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.batches.find(id);
  if (it == s.batches.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SettlementBatchRecord> MemoryRepository::ListOverlappingBatches(Transaction& t, const std::string& use_case, std::int64_t start_ms,
                                                                                  std::int64_t end_ms) {
  const auto&                               s = TX(t).View();
  std::vector<model::SettlementBatchRecord> out;
  for (const auto& [_, record] : s.batches) {
    if (record.use_case == use_case && record.start_ms < end_ms && start_ms < record.end_ms) {
      out.push_back(record);
    }
  }
  return out;
}

Result MemoryRepository::InsertLine(Transaction& t, model::SettlementLineRecord& r) {
  if (!TX(t).View().batches.contains(r.batch_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "line references unknown batch " + std::to_string(r.batch_id));
  }
  auto& s = TX(t).Mutable();
  r.id    = s.next_line_id++;
  s.lines[r.id] = r;
  return Result::Ok();
}

std::vector<model::SettlementLineRecord> MemoryRepository::ListLines(Transaction& t, std::int64_t batch_id) {
  const auto&                              s = TX(t).View();
  std::vector<model::SettlementLineRecord> out;
  for (const auto& [_, record] : s.lines) {
    if (record.batch_id == batch_id) {
      out.push_back(record);
    }
  }
  return out;
}

} // namespace settle::db::memory
