#pragma once

#ifdef ENABLE_OTEL

#include <string>

#include <opentelemetry/sdk/resource/resource.h>

namespace settle::runtime::config {
class RuntimeConfig;
}

namespace settle::observability {

inline constexpr const char* kInstrumentationName    = "settlement-engine";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

/*
  OTLP/gRPC collector for one signal ("TRACES", "METRICS"), first match wins:
    observability.otlp_endpoint
    OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT
    OTEL_EXPORTER_OTLP_ENDPOINT
    localhost:4317
*/
std::string ResolveCollectorEndpoint(const settle::runtime::config::RuntimeConfig& config, const std::string& signal);

// service.name, deployment.environment and settle.ledger.backend.
opentelemetry::sdk::resource::Resource BuildResource(const settle::runtime::config::RuntimeConfig& config);

} // namespace settle::observability

#endif
