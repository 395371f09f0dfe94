#include "internal/observability/spans.hpp"

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
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define TRANSCRIPTION_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define TRANSCRIPTION_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace transcription::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool provider_metrics_enabled{true};
  bool job_metrics_enabled{true};
  bool route_labels_enabled{true};
};

MetricsOptions g_metrics_options;

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
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

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      provider_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> submission_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_outcome_count;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::atomic<std::int64_t> queue_depth{0};
};

namespace {

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(std::unique_ptr<sdkmetrics::PushMetricExporter> exporter,
                                                     const transcription::runtime::config::ObservabilityConfig::MetricsConfig& metric_config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms                = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }
#ifdef TRANSCRIPTION_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif
}

} // namespace

bool InitializeMetrics(const transcription::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto  settings      = ResolveOtlpSettings(config, OtlpSignal::kMetrics);
  const auto& metric_config = observability.metrics();
  resource::ResourceAttributes attributes = {{"service.name", settings.service_name}, {"service.version", kInstrumentationVersion}};
  const auto                   service    = resource::Resource::Create(attributes);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), service);
  ConfigureResource(*g_provider, service);
  AddMetricReaderCompat(g_provider, MakeReader(MakeMetricExporter(settings), metric_config));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  // no metrics block: every instrument on
  if (observability.has_metrics()) {
    g_metrics_options.request_metrics_enabled  = metric_config.request_metrics_enabled();
    g_metrics_options.provider_metrics_enabled = metric_config.provider_metrics_enabled();
    g_metrics_options.job_metrics_enabled      = metric_config.job_metrics_enabled();
    g_metrics_options.route_labels_enabled     = metric_config.route_labels_enabled();
  }
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
  impl_->meter  = provider->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->request_count       = impl_->meter->CreateUInt64Counter("transcription.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("transcription.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->provider_latency_ms = impl_->meter->CreateDoubleHistogram("transcription.provider.latency_ms", "ms", "Provider call latency in milliseconds");
  impl_->submission_count    = impl_->meter->CreateUInt64Counter("transcription.submission.count", "1", "Submissions by disposition");
  impl_->job_outcome_count   = impl_->meter->CreateUInt64Counter("transcription.job.outcome.count", "1", "Terminal job outcomes");
  impl_->queue_depth_gauge   = impl_->meter->CreateInt64ObservableGauge("transcription.job.queue_depth", "Jobs waiting for a worker", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->queue_depth.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
    AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->request_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::ObserveProviderLatencyMs(std::string_view provider, bool success, double latency_ms) {
  if (!impl_ || !impl_->provider_latency_ms || !g_metrics_options.provider_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"provider", std::string(provider)}, {"success", success}};
  RecordWithAttributes(impl_->provider_latency_ms, latency_ms, attributes);
}

void Metrics::RecordSubmission(std::string_view disposition) {
  if (!impl_ || !impl_->submission_count || !g_metrics_options.job_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"disposition", std::string(disposition)}};
  AddWithAttributes(impl_->submission_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordJobOutcome(std::string_view provider, std::string_view status) {
  if (!impl_ || !impl_->job_outcome_count || !g_metrics_options.job_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"provider", std::string(provider)}, {"status", std::string(status)}};
  AddWithAttributes(impl_->job_outcome_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetQueueDepth(std::uint64_t depth) {
  if (!impl_) {
    return;
  }
  impl_->queue_depth.store(static_cast<std::int64_t>(depth));
}

} // namespace transcription::observability

#endif
