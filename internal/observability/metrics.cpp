#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define OFFLINE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define OFFLINE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace offline::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

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

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lookup_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> write_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> eviction_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> drain_item_count;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   occupancy_gauge;

  std::atomic<std::int64_t> occupancy_bytes{0};
};

bool InitializeMetrics(const offline::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == offline::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.collection_interval_ms() > 0) {
    otlp_config.collection_interval_ms = observability.collection_interval_ms();
  }

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.collection_interval_ms);
#ifdef OFFLINE_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           BuildResource(otlp_config));
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

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("offline-cache", "0.1.0");

  impl_->lookup_count     = impl_->meter->CreateUInt64Counter("offline.cache.lookup.count", "1", "Cache lookups by outcome");
  impl_->write_count      = impl_->meter->CreateUInt64Counter("offline.cache.write.count", "1", "Cache writes by result");
  impl_->eviction_count   = impl_->meter->CreateUInt64Counter("offline.cache.eviction.count", "1", "Records removed by quota eviction");
  impl_->drain_item_count = impl_->meter->CreateUInt64Counter("offline.sync.drain.items", "1", "Sync queue items processed by outcome");
  impl_->occupancy_gauge  = impl_->meter->CreateInt64ObservableGauge("offline.cache.occupancy_bytes", "Live cached bytes", "By");
  impl_->occupancy_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->occupancy_bytes.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordLookup(LookupOutcome outcome) {
  if (!impl_ || !impl_->lookup_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(ToString(outcome))}};
  AddWithAttributes(impl_->lookup_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordWrite(bool success) {
  if (!impl_ || !impl_->write_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->write_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordEvictions(std::uint64_t records) {
  if (!impl_ || !impl_->eviction_count || records == 0) {
    return;
  }

  AddWithAttributes(impl_->eviction_count, records, std::initializer_list<AttributePair>{});
}

void Metrics::RecordDrain(std::uint64_t succeeded, std::uint64_t retried, std::uint64_t failed) {
  if (!impl_ || !impl_->drain_item_count) {
    return;
  }

  const std::initializer_list<AttributePair> ok_attrs     = {{"outcome", "succeeded"}};
  const std::initializer_list<AttributePair> retry_attrs  = {{"outcome", "retried"}};
  const std::initializer_list<AttributePair> failed_attrs = {{"outcome", "permanently_failed"}};
  AddWithAttributes(impl_->drain_item_count, succeeded, ok_attrs);
  AddWithAttributes(impl_->drain_item_count, retried, retry_attrs);
  AddWithAttributes(impl_->drain_item_count, failed, failed_attrs);
}

void Metrics::SetCacheOccupancyBytes(std::uint64_t bytes) {
  if (!impl_) {
    return;
  }
  impl_->occupancy_bytes.store(static_cast<std::int64_t>(bytes));
}

} // namespace offline::observability

#endif
