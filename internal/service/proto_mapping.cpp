#include "proto_mapping.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace settle::service {

using namespace settle::v1;

// ---------------------------------------------------------------------------
// Policies
// ---------------------------------------------------------------------------

policy::RawPolicy FromProto(const PolicySpec& spec) {
  policy::RawPolicy raw;
  raw.use_case = spec.use_case();
  for (const auto& [key, value] : spec.parameters()) {
    switch (value.kind_case()) {
      case PolicyValue::kNumberValue:
        raw.parameters.emplace(key, value.number_value());
        break;
      case PolicyValue::kStringValue:
        raw.parameters.emplace(key, value.string_value());
        break;
      case PolicyValue::KIND_NOT_SET:
      default:
        throw util::ValidationError(fmt::format("policy parameter '{}' has no value", key));
    }
  }
  return raw;
}

PolicySpec ToProto(const policy::RawPolicy& raw) {
  PolicySpec spec;
  spec.set_use_case(raw.use_case);
  auto& parameters = *spec.mutable_parameters();
  for (const auto& [key, value] : raw.parameters) {
    if (const auto* number = std::get_if<double>(&value)) {
      parameters[key].set_number_value(*number);
    } else {
      parameters[key].set_string_value(std::get<std::string>(value));
    }
  }
  return spec;
}

// ---------------------------------------------------------------------------
// Enums share numbering with the model
// ---------------------------------------------------------------------------

model::Role FromProto(ParticipantRole role) {
  if (!ParticipantRole_IsValid(role)) {
    throw util::ValidationError(fmt::format("unknown participant role {}", static_cast<int>(role)));
  }
  return static_cast<model::Role>(role);
}

model::EventKind FromProto(EventKind kind) {
  if (!EventKind_IsValid(kind) || kind == EVENT_KIND_UNSPECIFIED) {
    throw util::ValidationError(fmt::format("invalid event kind {}", static_cast<int>(kind)));
  }
  return static_cast<model::EventKind>(kind);
}

model::Unit FromProto(Unit unit) {
  if (!Unit_IsValid(unit) || unit == UNIT_UNSPECIFIED) {
    throw util::ValidationError(fmt::format("invalid unit {}", static_cast<int>(unit)));
  }
  return static_cast<model::Unit>(unit);
}

core::EventInput FromProto(const UsageEventInput& input) {
  if (!input.has_timestamp()) {
    throw util::ValidationError(fmt::format("event of '{}' has no timestamp", input.participant_external_id()));
  }

  core::EventInput out;
  out.participant_external_id = input.participant_external_id();
  out.participant_name        = input.participant_name();
  out.participant_role        = FromProto(input.participant_role());
  out.kind                    = FromProto(input.kind());
  out.quantity                = input.quantity();
  out.unit                    = FromProto(input.unit());
  out.timestamp               = util::FromProto(input.timestamp());
  out.source                  = input.source();
  if (input.has_price_per_unit()) {
    out.price_per_unit = input.price_per_unit();
  }
  return out;
}

model::TimeWindow FromProto(const settle::v1::TimeWindow& window, bool present, const model::TimeWindow& fallback) {
  if (!present) {
    return fallback;
  }
  if (!window.has_start() || !window.has_end()) {
    throw util::ValidationError("window needs both start and end");
  }
  return model::TimeWindow{util::FromProto(window.start()), util::FromProto(window.end())};
}

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

void FillStats(const core::SettlementComputation& computation, NettingStats* out) {
  const auto& stats = computation.netting.stats;
  out->set_transfer_count(stats.transfer_count);
  out->set_gross_volume(stats.gross_volume);
  out->set_net_volume(stats.net_volume);
  out->set_netting_efficiency(stats.netting_efficiency);
  out->set_rounding_residual(stats.rounding_residual);
  out->set_suppressed_count(stats.suppressed_count);
  out->set_suppressed_volume(stats.suppressed_volume);
  out->set_unmatched_volume(stats.unmatched_volume);
  out->set_events_considered(computation.events_considered);
  out->set_unpriced_events(computation.unpriced_events);
  out->set_unclassified_events(computation.unclassified_events);
}

void FillBalances(const core::SettlementComputation& computation, google::protobuf::RepeatedPtrField<settle::v1::Balance>* out) {
  for (const auto& [id, balance] : computation.balances) {
    auto* entry = out->Add();
    entry->set_participant_id(id);
    if (auto it = computation.participants.find(id); it != computation.participants.end()) {
      entry->set_external_id(it->second.external_id);
    }
    entry->set_credit_eur(balance.credit);
    entry->set_debit_eur(balance.debit);
    if (auto it = computation.netting.positions.find(id); it != computation.netting.positions.end()) {
      entry->set_net_cents(it->second.rounded);
      entry->set_unmatched_cents(it->second.unmatched);
    }
  }
}

void FillTransfers(const std::vector<model::Transfer>& transfers, google::protobuf::RepeatedPtrField<settle::v1::Transfer>* out) {
  for (const auto& transfer : transfers) {
    auto* entry = out->Add();
    entry->set_debtor_id(transfer.debtor_id);
    entry->set_creditor_id(transfer.creditor_id);
    entry->set_amount_cents(transfer.amount);
  }
}

SettlementBatch ToProto(const model::SettlementBatch& batch) {
  SettlementBatch out;
  out.set_id(batch.id);
  out.set_use_case(batch.use_case);
  *out.mutable_start()      = util::ToProto(batch.window.start);
  *out.mutable_end()        = util::ToProto(batch.window.end);
  *out.mutable_created_at() = util::ToProto(batch.created_at);
  out.set_policy_id(batch.policy_id);
  return out;
}

SettlementLine ToProto(const model::SettlementLine& line) {
  SettlementLine out;
  out.set_id(line.id);
  out.set_batch_id(line.batch_id);
  out.set_participant_id(line.participant_id);
  out.set_amount_cents(line.amount);
  out.set_amount_eur(model::ToEur(line.amount));
  out.set_description(line.description);
  out.set_proof_hash(line.proof_hash);
  return out;
}

AuditReport ToProto(const audit::AuditReport& report) {
  AuditReport out;
  out.set_batch_id(report.batch.id);
  out.set_use_case(report.batch.use_case);
  *out.mutable_created_at() = util::ToProto(report.batch.created_at);
  *out.mutable_start()      = util::ToProto(report.batch.window.start);
  *out.mutable_end()        = util::ToProto(report.batch.window.end);
  out.set_policy_id(report.batch.policy_id);

  for (const auto& audit : report.lines) {
    auto* line = out.add_lines();
    line->set_line_id(audit.line.id);
    line->set_participant_id(audit.line.participant_id);
    line->set_participant_name(audit.participant_name);
    line->set_participant_role(audit.participant_role ? std::string(model::ToString(*audit.participant_role)) : audit::kUnknownParticipant);
    line->set_amount_cents(audit.line.amount);
    line->set_amount_eur(model::ToEur(audit.line.amount));
    line->set_description(audit.line.description);
    line->set_proof_hash(audit.line.proof_hash);
    line->set_is_verified(audit.is_verified);
    if (audit.explanation) {
      line->set_explanation(*audit.explanation);
    }
  }

  out.set_verified_lines(report.verified_lines);
  out.set_total_lines(report.lines.size());
  out.set_total_amount_cents(report.total_amount);
  return out;
}

} // namespace settle::service
