#pragma once

#include "internal/model/settlement.hpp"
#include "service_context.hpp"
#include "settle/v1.hpp"

namespace settle::service {

/*
  Request-level orchestration of the settlement engine. Every call runs inside
  a span, is counted in request metrics and logs failures before rethrowing
  them to the transport.
*/
class SettlementService {
 public:
  explicit SettlementService(ServiceContext ctx);

  settle::v1::IngestEventsResponse IngestEvents(const settle::v1::IngestEventsRequest& req);

  settle::v1::GetDefaultPolicyResponse GetDefaultPolicy(const settle::v1::GetDefaultPolicyRequest& req);

  settle::v1::PreviewNettingResponse PreviewNetting(const settle::v1::PreviewNettingRequest& req);

  settle::v1::ExecuteSettlementResponse ExecuteSettlement(const settle::v1::ExecuteSettlementRequest& req);

  // util::NotFound for an unknown batch.
  settle::v1::GetAuditReportResponse GetAuditReport(const settle::v1::GetAuditReportRequest& req);

 private:
  model::TimeWindow DefaultWindow() const;

  ServiceContext ctx_;
};

} // namespace settle::service
