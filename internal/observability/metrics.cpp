#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

#include "config/config.pb.h"

namespace storykb::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

using storykb::runtime::config::ObservabilityConfig;

namespace {
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string MetricsEndpoint(const ObservabilityConfig& config, bool http) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) return env;
  if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return env;
  return http ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const ObservabilityConfig& config) {
  const bool http = config.transport() == storykb::runtime::config::OTLP_TRANSPORT_HTTP;
  if (http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricsEndpoint(config, true);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricsEndpoint(config, false);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

// Must run before the first Metrics::Instance() call, which binds the
// instruments to whichever provider is global at that point.
bool InitializeMetrics(const storykb::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : 1000);

  const std::string service = observability.service_name().empty() ? "storykb" : observability.service_name();
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           opentelemetry::sdk::resource::Resource::Create({{"service.name", service}}));
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(observability), reader_options));

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
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transaction_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      phase_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reconciliations;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("storykb");

  impl_->transaction_outcomes = meter->CreateUInt64Counter("storykb.transaction.outcome", "Dual-store transactions by final outcome", "1");
  impl_->phase_latency_ms     = meter->CreateDoubleHistogram("storykb.transaction.phase_latency_ms", "Coordinator phase latency", "ms");
  impl_->reconciliations      = meter->CreateUInt64Counter("storykb.reconciliation.count", "Reconciliation attempts by result", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordTransactionOutcome(std::string_view outcome) {
  impl_->transaction_outcomes->Add(1, {{"outcome", std::string(outcome)}}, opentelemetry::context::Context{});
}

void Metrics::ObservePhaseLatencyMs(std::string_view phase, double latency_ms) {
  impl_->phase_latency_ms->Record(latency_ms, {{"phase", std::string(phase)}}, opentelemetry::context::Context{});
}

void Metrics::RecordReconciliation(std::string_view result) {
  impl_->reconciliations->Add(1, {{"result", std::string(result)}}, opentelemetry::context::Context{});
}

} // namespace storykb::observability

#endif
