#include <cassert>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_settings.hpp"

namespace {

using vkyc::observability::OtlpSignal;
using vkyc::observability::OtlpTransport;
using vkyc::observability::RedactedField;
using vkyc::observability::ResolveOtlpSettings;

void TestRedactedFieldKeepsLastFour() {
  const auto token = RedactedField("token", "AB12CD34EF56GH78");
  assert(token.key == "token");
  assert(token.value == "************GH78");

  assert(RedactedField("token", "ABCD").value == "****");
  assert(RedactedField("token", "").value.empty());
}

void TestSessionFieldKey() {
  const auto field = vkyc::observability::SessionField("s-1");
  assert(field.key == "session_id");
  assert(field.value == "s-1");
}

void TestEndpointPrecedence() {
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");

  vkyc::config::RuntimeConfig config;
  assert(ResolveOtlpSettings(config, OtlpSignal::kTraces).endpoint == "localhost:4317");

  config.mutable_observability()->set_transport(vkyc::config::OTLP_TRANSPORT_HTTP);
  const auto http = ResolveOtlpSettings(config, OtlpSignal::kMetrics);
  assert(http.transport == OtlpTransport::kHttpProtobuf);
  assert(http.endpoint == "http://localhost:4318/v1/metrics");

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318", 1);
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "http://traces:4318/v1/traces", 1);
  assert(ResolveOtlpSettings(config, OtlpSignal::kTraces).endpoint == "http://traces:4318/v1/traces");
  assert(ResolveOtlpSettings(config, OtlpSignal::kMetrics).endpoint == "http://collector:4318");

  config.mutable_observability()->set_otlp_endpoint("https://otel.example.com:4317");
  const auto configured = ResolveOtlpSettings(config, OtlpSignal::kTraces);
  assert(configured.endpoint == "https://otel.example.com:4317");
  assert(!configured.insecure);

  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
}

void TestSettingsDefaults() {
  vkyc::config::RuntimeConfig config;
  auto                        settings = ResolveOtlpSettings(config, OtlpSignal::kTraces);
  assert(settings.service_name == "vkyc-orchestrator");
  assert(settings.trace_sample_ratio == 1.0);
  assert(settings.export_interval_ms == 1000);
  assert(settings.insecure);

  config.mutable_observability()->set_service_name("vkyc-staging");
  config.mutable_observability()->set_trace_sample_ratio(0.1);
  config.mutable_observability()->set_metrics_interval_ms(5000);
  settings = ResolveOtlpSettings(config, OtlpSignal::kMetrics);
  assert(settings.service_name == "vkyc-staging");
  assert(settings.trace_sample_ratio == 0.1);
  assert(settings.export_interval_ms == 5000);
}

} // namespace

int main() {
  TestRedactedFieldKeepsLastFour();
  TestSessionFieldKey();
  TestEndpointPrecedence();
  TestSettingsDefaults();

  std::cout << "vkyc_unit_observability: pass\n";
  return 0;
}
