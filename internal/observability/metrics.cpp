#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define SETTLE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define SETTLE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp_exporter.hpp"

namespace settle::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr std::uint32_t kDefaultExportIntervalMs = 10000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Attribute values are views; the caller's strings outlive the recording call.
opentelemetry::nostd::string_view View(std::string_view value) {
  return opentelemetry::nostd::string_view(value.data(), value.size());
}

// SDK releases differ in how readers attach and whether a context is taken.
template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

bool InitializeMetrics(const settle::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = ResolveCollectorEndpoint(config, "METRICS");
  options.use_ssl_credentials = false;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs);
#ifdef SETTLE_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(otlp::OtlpGrpcMetricExporterFactory::Create(options), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(otlp::OtlpGrpcMetricExporterFactory::Create(options), reader_options);
#endif

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), BuildResource(config));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>   requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>        request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<std::uint64_t>> run_lines;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<std::uint64_t>> run_transfers;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>        netting_efficiency;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<double>>          suppressed_eur;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>   unpriced_events;
};

// Instruments bind to the provider installed at first Instance() call; the
// daemon initializes metrics before serving, tests get the no-op provider.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->requests           = impl_->meter->CreateUInt64Counter("settle.rpc.requests", "1", "Service requests by route and outcome");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("settle.rpc.latency_ms", "ms", "End-to-end request latency");
  impl_->run_lines          = impl_->meter->CreateUInt64Histogram("settle.run.lines", "1", "Non-zero settlement lines per run");
  impl_->run_transfers      = impl_->meter->CreateUInt64Histogram("settle.run.transfers", "1", "Bilateral transfers per run");
  impl_->netting_efficiency = impl_->meter->CreateDoubleHistogram("settle.netting.efficiency", "1", "1 - net volume / gross volume");
  impl_->suppressed_eur     = impl_->meter->CreateDoubleCounter("settle.netting.suppressed", "EUR", "Amounts held back by minimum payout");
  impl_->unpriced_events    = impl_->meter->CreateUInt64Counter("settle.events.unpriced", "1", "Events in a run that matched no policy rule");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, std::string_view outcome, double latency_ms) {
  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}, {"outcome", View(outcome)}};
  AddWithAttributes(impl_->requests, static_cast<std::uint64_t>(1), attributes);
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::ObserveRun(const RunSample& run) {
  const std::initializer_list<AttributePair> attributes = {{"use_case", View(run.use_case)},
                                                           {"mode", View(run.committed ? "execute" : "preview")}};
  RecordWithAttributes(impl_->run_lines, run.lines, attributes);
  RecordWithAttributes(impl_->run_transfers, run.transfers, attributes);
  RecordWithAttributes(impl_->netting_efficiency, run.netting_efficiency, attributes);
  if (run.suppressed_eur > 0.0) {
    AddWithAttributes(impl_->suppressed_eur, run.suppressed_eur, attributes);
  }
  if (run.unpriced_events > 0) {
    AddWithAttributes(impl_->unpriced_events, run.unpriced_events, attributes);
  }
}

} // namespace settle::observability

#endif
