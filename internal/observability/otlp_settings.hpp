#pragma once

#include <cstdint>
#include <string>

namespace vkyc::config {
class RuntimeConfig;
}

namespace vkyc::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

inline constexpr const char* kInstrumentationName    = "vkyc-orchestrator";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

struct OtlpSettings {
  std::string   service_name{kInstrumentationName};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
  double        trace_sample_ratio{1.0};
};

/*
  Endpoint precedence: observability.otlp_endpoint, then the per-signal
  OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT variable, then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
  An https:// endpoint turns TLS on for the gRPC exporter.
*/
OtlpSettings ResolveOtlpSettings(const vkyc::config::RuntimeConfig& config, OtlpSignal signal);

} // namespace vkyc::observability
