#include "audit_reader.hpp"

#include <map>
#include <stdexcept>

#include "internal/audit/explanation.hpp"
#include "internal/core/record_mapping.hpp"
#include "internal/ledger/proof_hash.hpp"
#include "internal/observability/logging.hpp"

namespace settle::audit {

AuditReader::AuditReader(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("AuditReader requires a repository");
  }
}

std::optional<AuditReport> AuditReader::Load(std::int64_t batch_id, bool explain) const {
  auto tx = repository_->BeginRead();

  const auto batch_record = repository_->GetBatch(*tx, batch_id);
  if (!batch_record) {
    return std::nullopt;
  }

  AuditReport report;
  report.batch = core::ToModel(*batch_record);

  std::map<model::ParticipantId, model::Participant> participants;
  for (const auto& record : repository_->ListParticipants(*tx)) {
    participants.emplace(record.id, core::ToModel(record));
  }

  std::vector<model::UsageEvent> events;
  if (explain) {
    for (const auto& record : repository_->ListEventsInWindow(*tx, batch_record->start_ms, batch_record->end_ms)) {
      events.push_back(core::ToModel(record));
    }
  }

  for (const auto& record : repository_->ListLines(*tx, batch_id)) {
    LineAudit audit;
    audit.line        = core::ToModel(record);
    audit.is_verified = ledger::VerifyProofHash(ledger::FieldsOf(audit.line), audit.line.proof_hash);

    auto it = participants.find(audit.line.participant_id);
    if (it != participants.end()) {
      audit.participant_name = it->second.name;
      audit.participant_role = it->second.role;
    } else {
      audit.participant_name = kUnknownParticipant;
    }

    if (explain) {
      const auto role   = audit.participant_role.value_or(model::Role::kUnspecified);
      audit.explanation = Explain(audit.participant_name, role, audit.line.amount, Summarize(events, audit.line.participant_id));
    }

    if (audit.is_verified) {
      ++report.verified_lines;
    } else {
      SETTLE_LOG_WARN("settlement line failed proof verification",
                      {observability::IntField("batch_id", batch_id), observability::IntField("line_id", audit.line.id)});
    }
    report.total_amount += audit.line.amount;
    report.lines.push_back(std::move(audit));
  }

  tx->Commit();
  return report;
}

} // namespace settle::audit
