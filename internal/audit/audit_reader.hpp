#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/settlement.hpp"

namespace settle::audit {

// Name reported for a line whose participant no longer resolves.
inline constexpr const char* kUnknownParticipant = "unknown";

struct LineAudit {
  model::SettlementLine      line;
  std::string                participant_name;
  std::optional<model::Role> participant_role; // unset when unresolved
  bool                       is_verified = false;
  std::optional<std::string> explanation;
};

struct AuditReport {
  model::SettlementBatch batch;
  std::vector<LineAudit> lines; // by line id
  std::size_t            verified_lines = 0;
  model::Cents           total_amount   = 0; // sum of line amounts
};

/*
  Read-only verification of a persisted batch.

  Recomputes every line's proof hash from its stored fields. A mismatch is a
  result (is_verified = false), not an error. Runs in its own read
  transaction.
*/
class AuditReader {
 public:
  explicit AuditReader(std::shared_ptr<db::Repository> repository);

  // nullopt when the batch does not exist.
  std::optional<AuditReport> Load(std::int64_t batch_id, bool explain) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace settle::audit
