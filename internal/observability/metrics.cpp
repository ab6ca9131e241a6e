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

#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define VKYC_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define VKYC_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_settings.hpp"

namespace vkyc::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpSettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
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
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> session_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> biometric_dropped;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> registry_unavailable;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> recording_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      external_call_ms;
};

bool InitializeMetrics(const vkyc::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = ResolveOtlpSettings(config, OtlpSignal::kMetrics);
  auto       exporter = MakeMetricExporter(settings);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(settings.export_interval_ms);
#ifdef VKYC_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto res = resource::Resource::Create(
      {{"service.name", settings.service_name}, {"service.namespace", "vkyc"}, {"service.version", kInstrumentationVersion}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  VKYC_LOG_INFO("metrics enabled", {StringField("endpoint", settings.endpoint), IntField("interval_ms", settings.export_interval_ms)});
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

  impl_->request_count       = impl_->meter->CreateUInt64Counter("vkyc.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("vkyc.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->session_transitions = impl_->meter->CreateUInt64Counter("vkyc.session.transitions", "1", "Session state transitions");
  impl_->biometric_dropped   = impl_->meter->CreateUInt64Counter("vkyc.biometric.dropped", "1", "Biometric events dropped on queue overflow");
  impl_->registry_unavailable =
      impl_->meter->CreateUInt64Counter("vkyc.registry.unavailable", "1", "Verifications that exhausted registry retries");
  impl_->recording_failures = impl_->meter->CreateUInt64Counter("vkyc.recording.failures", "1", "Recording buffering or finalize failures");
  impl_->external_call_ms   = impl_->meter->CreateDoubleHistogram("vkyc.external.latency_ms", "ms", "OCR and registry call latency");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordSessionTransition(std::string_view state, std::string_view reason) {
  if (!impl_ || !impl_->session_transitions) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"state", std::string(state)}, {"reason", std::string(reason)}};
  AddWithAttributes(impl_->session_transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordBiometricDropped(std::uint64_t count) {
  if (!impl_ || !impl_->biometric_dropped) {
    return;
  }
  AddWithAttributes(impl_->biometric_dropped, count, std::initializer_list<AttributePair>{});
}

void Metrics::RecordRegistryUnavailable(std::string_view document_type) {
  if (!impl_ || !impl_->registry_unavailable) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"document_type", std::string(document_type)}};
  AddWithAttributes(impl_->registry_unavailable, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRecordingFailure(std::string_view phase) {
  if (!impl_ || !impl_->recording_failures) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"phase", std::string(phase)}};
  AddWithAttributes(impl_->recording_failures, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveExternalCallMs(std::string_view capability, double duration_ms) {
  if (!impl_ || !impl_->external_call_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"capability", std::string(capability)}};
  RecordWithAttributes(impl_->external_call_ms, duration_ms, attributes);
}

} // namespace vkyc::observability

#endif
