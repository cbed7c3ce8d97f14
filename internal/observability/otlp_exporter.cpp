#include "internal/observability/otlp_exporter.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace settle::observability {

namespace {

using settle::runtime::config::DatabaseConfig;

const char* LedgerBackend(const DatabaseConfig& database) {
  switch (database.backend_case()) {
    case DatabaseConfig::kSqlite:
      return "sqlite";
    case DatabaseConfig::kPostgres:
      return "postgres";
    case DatabaseConfig::kMemory:
    case DatabaseConfig::BACKEND_NOT_SET:
      break;
  }
  return "memory";
}

} // namespace

std::string ResolveCollectorEndpoint(const settle::runtime::config::RuntimeConfig& config, const std::string& signal) {
  if (!config.observability().otlp_endpoint().empty()) {
    return config.observability().otlp_endpoint();
  }

  const auto per_signal = "OTEL_EXPORTER_OTLP_" + signal + "_ENDPOINT";
  if (const char* endpoint = std::getenv(per_signal.c_str())) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return "localhost:4317";
}

opentelemetry::sdk::resource::Resource BuildResource(const settle::runtime::config::RuntimeConfig& config) {
  const auto& environment = config.observability().environment();

  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", std::string(kInstrumentationName)},
      {"service.version", std::string(kInstrumentationVersion)},
      {"settle.ledger.backend", std::string(LedgerBackend(config.database()))},
  };
  if (!environment.empty()) {
    attrs.SetAttribute("deployment.environment", environment);
  }
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace settle::observability

#endif
