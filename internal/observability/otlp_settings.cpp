#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace vkyc::observability {
namespace {

const char* SignalEndpointVariable(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultEndpoint(OtlpTransport transport, OtlpSignal signal) {
  if (transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpSettings ResolveOtlpSettings(const vkyc::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  if (!observability.service_name().empty()) {
    settings.service_name = observability.service_name();
  }
  settings.transport = observability.transport() == vkyc::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_interval_ms() > 0) {
    settings.export_interval_ms = observability.metrics_interval_ms();
  }
  if (observability.trace_sample_ratio() > 0.0) {
    settings.trace_sample_ratio = observability.trace_sample_ratio();
  }

  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEndpointVariable(signal))) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else {
    settings.endpoint = DefaultEndpoint(settings.transport, signal);
  }

  settings.insecure = settings.endpoint.rfind("https://", 0) != 0;
  return settings;
}

} // namespace vkyc::observability
