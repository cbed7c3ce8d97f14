#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/settlement_service.hpp"
#include "settle/v1.hpp"

namespace settle::grpc {

class SettlementServer final : public settle::v1::SettlementService::Service {
 public:
  explicit SettlementServer(std::shared_ptr<settle::service::SettlementService> svc);

  ::grpc::Status IngestEvents(::grpc::ServerContext*, const settle::v1::IngestEventsRequest*, settle::v1::IngestEventsResponse*) override;

  ::grpc::Status GetDefaultPolicy(::grpc::ServerContext*, const settle::v1::GetDefaultPolicyRequest*, settle::v1::GetDefaultPolicyResponse*) override;

  ::grpc::Status PreviewNetting(::grpc::ServerContext*, const settle::v1::PreviewNettingRequest*, settle::v1::PreviewNettingResponse*) override;

  ::grpc::Status ExecuteSettlement(::grpc::ServerContext*, const settle::v1::ExecuteSettlementRequest*,
                                   settle::v1::ExecuteSettlementResponse*) override;

  ::grpc::Status GetAuditReport(::grpc::ServerContext*, const settle::v1::GetAuditReportRequest*, settle::v1::GetAuditReportResponse*) override;

 private:
  std::shared_ptr<settle::service::SettlementService> service_;
};

} // namespace settle::grpc
