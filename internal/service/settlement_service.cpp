#include "settlement_service.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/audit/audit_reader.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/policy/policy_loader.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/errors.hpp"

namespace settle::service {

using namespace settle::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  settle::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn(span);
    settle::observability::Metrics::Instance().RecordRequest(route, "ok", ElapsedMs(started_at));
    return result;
  } catch (const util::SettlementError& ex) {
    const auto error_class = util::ToString(ex.Class());
    span.RecordError(error_class, ex.what());
    // Caller errors are expected traffic; everything else is ours.
    if (ex.Class() == util::ErrorClass::kCallerError) {
      SETTLE_LOG_WARN("RPC rejected", {settle::observability::StringField("route", route), settle::observability::StringField("error", ex.what())});
    } else {
      SETTLE_LOG_ERROR("RPC failed", {settle::observability::StringField("route", route), settle::observability::StringField("error", ex.what()),
                                      settle::observability::StringField("error_class", error_class)});
    }
    settle::observability::Metrics::Instance().RecordRequest(route, error_class, ElapsedMs(started_at));
    throw;
  } catch (const std::exception& ex) {
    span.RecordError("internal", ex.what());
    SETTLE_LOG_ERROR("RPC failed", {settle::observability::StringField("route", route), settle::observability::StringField("error", ex.what())});
    settle::observability::Metrics::Instance().RecordRequest(route, "internal", ElapsedMs(started_at));
    throw;
  }
}

settle::observability::RunSample SampleOf(std::string_view use_case, const core::SettlementComputation& computation) {
  const auto& netting = computation.netting;

  settle::observability::RunSample run;
  run.use_case           = use_case;
  run.events_considered  = computation.events_considered;
  run.unpriced_events    = computation.unpriced_events;
  run.transfers          = netting.transfers.size();
  run.netting_efficiency = netting.stats.netting_efficiency;
  run.suppressed_eur     = netting.stats.suppressed_volume;
  for (const auto& [id, position] : netting.positions) {
    if (position.final_amount != 0) {
      ++run.lines;
    }
  }
  return run;
}

} // namespace

SettlementService::SettlementService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.engine || !ctx_.audit) {
    throw std::invalid_argument("SettlementService requires an engine and an audit reader");
  }
}

model::TimeWindow SettlementService::DefaultWindow() const {
  const auto hours = ctx_.settlement.default_lookback_hours() > 0 ? ctx_.settlement.default_lookback_hours() : 48u;
  // Millisecond precision, matching what the repository stores.
  const auto now = util::FromUnixMillis(util::ToUnixMillis(util::Now()));
  return model::TimeWindow{now - std::chrono::hours(hours), now};
}

IngestEventsResponse SettlementService::IngestEvents(const IngestEventsRequest& req) {
  return ObserveRpc("SettlementService.IngestEvents", [&](settle::observability::SpanScope& span) {
    span.SetAttribute("events", static_cast<std::int64_t>(req.events_size()));

    std::vector<core::EventInput> inputs;
    inputs.reserve(req.events_size());
    for (const auto& event : req.events()) {
      inputs.push_back(FromProto(event));
    }

    const auto result = ctx_.engine->Ingest(inputs);

    IngestEventsResponse resp;
    resp.set_events_ingested(result.events_ingested);
    resp.set_participants_created(result.participants_created);
    return resp;
  });
}

GetDefaultPolicyResponse SettlementService::GetDefaultPolicy(const GetDefaultPolicyRequest& req) {
  return ObserveRpc("SettlementService.GetDefaultPolicy", [&](settle::observability::SpanScope& span) {
    span.SetAttribute("use_case", req.use_case());

    const auto use_case = policy::ParseUseCase(req.use_case());
    if (!use_case) {
      throw util::ValidationError("unknown use case '" + req.use_case() + "'");
    }

    GetDefaultPolicyResponse resp;
    *resp.mutable_policy() = ToProto(policy::DefaultPolicy(*use_case));
    resp.set_title(std::string(policy::Title(*use_case)));
    return resp;
  });
}

PreviewNettingResponse SettlementService::PreviewNetting(const PreviewNettingRequest& req) {
  return ObserveRpc("SettlementService.PreviewNetting", [&](settle::observability::SpanScope& span) {
    const auto loaded = policy::LoadPolicy(FromProto(req.policy()));
    const auto window = FromProto(req.window(), req.has_window(), DefaultWindow());
    span.SetAttribute("use_case", policy::ToString(loaded.use_case));

    const auto computation = ctx_.engine->Preview(loaded, window);

    const auto run = SampleOf(policy::ToString(loaded.use_case), computation);
    span.RecordRun(run);
    settle::observability::Metrics::Instance().ObserveRun(run);

    PreviewNettingResponse resp;
    FillBalances(computation, resp.mutable_balances());
    FillTransfers(computation.netting.transfers, resp.mutable_transfers());
    FillStats(computation, resp.mutable_stats());
    return resp;
  });
}

ExecuteSettlementResponse SettlementService::ExecuteSettlement(const ExecuteSettlementRequest& req) {
  return ObserveRpc("SettlementService.ExecuteSettlement", [&](settle::observability::SpanScope& span) {
    const auto loaded = policy::LoadPolicy(FromProto(req.policy()));
    const auto window = FromProto(req.window(), req.has_window(), DefaultWindow());
    span.SetAttribute("use_case", policy::ToString(loaded.use_case));

    const auto outcome = ctx_.engine->Execute(loaded, window);

    auto run      = SampleOf(outcome.batch.use_case, outcome.computation);
    run.committed = true;
    run.batch_id  = outcome.batch.id;
    run.lines     = outcome.lines.size();
    span.RecordRun(run);
    settle::observability::Metrics::Instance().ObserveRun(run);

    ExecuteSettlementResponse resp;
    *resp.mutable_batch() = ToProto(outcome.batch);
    for (const auto& line : outcome.lines) {
      *resp.add_lines() = ToProto(line);
    }
    FillTransfers(outcome.computation.netting.transfers, resp.mutable_transfers());
    FillStats(outcome.computation, resp.mutable_stats());
    return resp;
  });
}

GetAuditReportResponse SettlementService::GetAuditReport(const GetAuditReportRequest& req) {
  return ObserveRpc("SettlementService.GetAuditReport", [&](settle::observability::SpanScope& span) {
    span.SetAttribute("batch_id", static_cast<std::int64_t>(req.batch_id()));

    const bool explain = req.has_explain() ? req.explain() : ctx_.settlement.explain_by_default();
    const auto report  = ctx_.audit->Load(req.batch_id(), explain);
    if (!report) {
      throw util::NotFound("settlement batch " + std::to_string(req.batch_id()) + " not found");
    }

    GetAuditReportResponse resp;
    *resp.mutable_report() = ToProto(*report);
    return resp;
  });
}

} // namespace settle::service
