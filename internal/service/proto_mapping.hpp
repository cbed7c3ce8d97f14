#pragma once

#include "internal/audit/audit_reader.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/policy/policy.hpp"
#include "settle/v1.hpp"

namespace settle::service {

/*
  Protobuf <-> engine types. Invalid enum values and missing required fields
  throw util::ValidationError.
*/

policy::RawPolicy    FromProto(const settle::v1::PolicySpec& spec);
settle::v1::PolicySpec ToProto(const policy::RawPolicy& raw);

core::EventInput FromProto(const settle::v1::UsageEventInput& input);

model::Role      FromProto(settle::v1::ParticipantRole role);
model::EventKind FromProto(settle::v1::EventKind kind);
model::Unit      FromProto(settle::v1::Unit unit);

// `fallback` is used when the request carries no window at all.
model::TimeWindow FromProto(const settle::v1::TimeWindow& window, bool present, const model::TimeWindow& fallback);

void FillStats(const core::SettlementComputation& computation, settle::v1::NettingStats* out);
void FillBalances(const core::SettlementComputation& computation, google::protobuf::RepeatedPtrField<settle::v1::Balance>* out);
void FillTransfers(const std::vector<model::Transfer>& transfers, google::protobuf::RepeatedPtrField<settle::v1::Transfer>* out);

settle::v1::SettlementBatch ToProto(const model::SettlementBatch& batch);
settle::v1::SettlementLine  ToProto(const model::SettlementLine& line);
settle::v1::AuditReport     ToProto(const audit::AuditReport& report);

} // namespace settle::service
