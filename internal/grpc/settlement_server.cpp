#include "settlement_server.hpp"

#include "grpc_error.hpp"

namespace settle::grpc {

SettlementServer::SettlementServer(std::shared_ptr<settle::service::SettlementService> svc) : service_(std::move(svc)) {
}

::grpc::Status SettlementServer::IngestEvents(::grpc::ServerContext*, const settle::v1::IngestEventsRequest* req,
                                              settle::v1::IngestEventsResponse* resp) {
  try {
    *resp = service_->IngestEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SettlementServer::GetDefaultPolicy(::grpc::ServerContext*, const settle::v1::GetDefaultPolicyRequest* req,
                                                  settle::v1::GetDefaultPolicyResponse* resp) {
  try {
    *resp = service_->GetDefaultPolicy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SettlementServer::PreviewNetting(::grpc::ServerContext*, const settle::v1::PreviewNettingRequest* req,
                                                settle::v1::PreviewNettingResponse* resp) {
  try {
    *resp = service_->PreviewNetting(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SettlementServer::ExecuteSettlement(::grpc::ServerContext*, const settle::v1::ExecuteSettlementRequest* req,
                                                   settle::v1::ExecuteSettlementResponse* resp) {
  try {
    *resp = service_->ExecuteSettlement(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SettlementServer::GetAuditReport(::grpc::ServerContext*, const settle::v1::GetAuditReportRequest* req,
                                                settle::v1::GetAuditReportResponse* resp) {
  try {
    *resp = service_->GetAuditReport(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace settle::grpc
