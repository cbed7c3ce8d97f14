#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace settle::core {
class SettlementEngine;
}
namespace settle::service {
class SettlementService;
}

namespace settle::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<core::SettlementEngine>       engine;
  std::shared_ptr<service::SettlementService>   settlement_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The ONLY place allowed to know concrete DB types.

  Opens the configured backend, applies the schema and wires engine, audit
  reader, service and gRPC adapters. An empty database section selects the
  in-memory backend.
*/
Application Build(const settle::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const settle::runtime::config::DatabaseConfig& database);

} // namespace settle::factory
