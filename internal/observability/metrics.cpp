#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace collab::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using Attribute = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr auto        kExportInterval = std::chrono::milliseconds(5000);
constexpr const char* kServiceName    = "collabgraph";

std::shared_ptr<sdkmetrics::MeterProvider> g_meter_provider;

// explicit config wins, then the metrics specific env var, then the generic one
std::string MetricsEndpoint(const collab::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  for (const char* name : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) return value;
  }
  return config.transport() == collab::runtime::config::OTLP_TRANSPORT_HTTP ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const collab::runtime::config::ObservabilityConfig& config) {
  const auto endpoint = MetricsEndpoint(config);
  if (config.transport() == collab::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = endpoint.rfind("https://", 0) == 0;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

const char* OpName(PopulationOp op) {
  switch (op) {
    case PopulationOp::kApply:
      return "apply";
    case PopulationOp::kRebuild:
      return "rebuild";
    case PopulationOp::kTrendRefresh:
      return "trend_refresh";
  }
  return "unknown";
}

// SDK releases differ on whether Add/Record take an explicit context.
template <typename Instrument, typename Value>
void Count(const opentelemetry::nostd::shared_ptr<Instrument>& counter, Value value, std::initializer_list<Attribute> attributes) {
  if (!counter) return;
  if constexpr (requires { counter->Add(value, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Observe(const opentelemetry::nostd::shared_ptr<Instrument>& histogram, Value value, std::initializer_list<Attribute> attributes) {
  if (!histogram) return;
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      population_duration;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> path_lookups;
};

bool InitializeMetrics(const collab::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = kExportInterval;

  resource::ResourceAttributes attrs = {{"service.name", kServiceName}};
  g_meter_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                                 resource::Resource::Create(attrs));
  g_meter_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(observability), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_meter_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_meter_provider) return;
  g_meter_provider->ForceFlush();
  g_meter_provider->Shutdown();
  g_meter_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName, "0.1.0");

  impl_->requests        = impl_->meter->CreateUInt64Counter("collab.request.count", "Graph service requests by route and outcome", "1");
  impl_->request_latency = impl_->meter->CreateDoubleHistogram("collab.request.latency_ms", "Graph service request latency", "ms");
  impl_->population_duration =
      impl_->meter->CreateDoubleHistogram("collab.population.duration_ms", "Apply, rebuild and trend refresh durations", "ms");
  impl_->path_lookups = impl_->meter->CreateUInt64Counter("collab.path.lookups", "Shortest path lookups by cache outcome", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string name(route);
  Count(impl_->requests, static_cast<std::uint64_t>(1), {{"route", opentelemetry::nostd::string_view(name)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::string name(route);
  Observe(impl_->request_latency, latency_ms, {{"route", opentelemetry::nostd::string_view(name)}});
}

void Metrics::ObservePopulationDurationMs(PopulationOp op, double duration_ms) {
  Observe(impl_->population_duration, duration_ms, {{"op", OpName(op)}});
}

void Metrics::RecordPathLookup(bool cache_hit) {
  Count(impl_->path_lookups, static_cast<std::uint64_t>(1), {{"cache", cache_hit ? "hit" : "miss"}});
}

} // namespace collab::observability

#endif
