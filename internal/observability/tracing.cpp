#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_exporter.hpp"

namespace settle::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;
} // namespace

bool InitializeTracing(const settle::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = ResolveCollectorEndpoint(config, "TRACES");
  options.use_ssl_credentials = false;

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(otlp::OtlpGrpcExporterFactory::Create(options), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), BuildResource(config));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

// Without an installed provider spans go to the API's no-op tracer.
SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = g_tracer ? g_tracer : trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);

  impl_->span  = tracer->StartSpan(std::string(name), {{"rpc.system", "grpc"}, {"rpc.service", "settle.v1.SettlementService"}});
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::RecordRun(const RunSample& run) {
  if (!impl_ || !impl_->span) {
    return;
  }

  auto& span = *impl_->span;
  span.SetAttribute("settle.use_case", std::string(run.use_case));
  span.SetAttribute("settle.mode", run.committed ? "execute" : "preview");
  if (run.committed) {
    span.SetAttribute("settle.batch_id", run.batch_id);
  }
  span.SetAttribute("settle.events.considered", static_cast<std::int64_t>(run.events_considered));
  span.SetAttribute("settle.events.unpriced", static_cast<std::int64_t>(run.unpriced_events));
  span.SetAttribute("settle.lines", static_cast<std::int64_t>(run.lines));
  span.SetAttribute("settle.transfers", static_cast<std::int64_t>(run.transfers));
  span.SetAttribute("settle.netting.efficiency", run.netting_efficiency);
  span.SetAttribute("settle.netting.suppressed_eur", run.suppressed_eur);
}

void SpanScope::RecordError(std::string_view error_class, std::string_view message) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(message)}, {"settle.error_class", std::string(error_class)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(message));
  }
}

} // namespace settle::observability

#endif
