#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace vkyc::observability {
namespace {

std::string ResolveLevel(const vkyc::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("VKYC_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const vkyc::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("VKYC_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

bool ResolveTraceContextEnabled(const vkyc::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("VKYC_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\\' || c == '\n' || c == '\t') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields, const std::string& trace_fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    AppendValue(line, field.value);
  }
  if (!trace_fields.empty()) {
    line.push_back(' ');
    line += trace_fields;
  }
  return line;
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField SessionField(std::string_view session_id) {
  return {"session_id", std::string(session_id)};
}

LogField RedactedField(std::string_view key, std::string_view secret) {
  constexpr std::size_t kVisible = 4;
  if (secret.size() <= kVisible) {
    return {std::string(key), std::string(secret.size(), '*')};
  }
  std::string masked(secret.size() - kVisible, '*');
  masked.append(secret.substr(secret.size() - kVisible));
  return {std::string(key), std::move(masked)};
}

void InitializeLogging(const vkyc::config::RuntimeConfig& config) {
  auto logger = spdlog::get("vkyc-orchestrator");
  if (!logger) {
    logger = spdlog::stdout_color_mt("vkyc-orchestrator");
  }
  logger->set_pattern(ResolvePattern(config));
  const auto level_name = ResolveLevel(config);
  auto       level      = spdlog::level::from_str(level_name);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && level_name != "off") {
    level = spdlog::level::info;
  }
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  spdlog::log(level, "{}", FormatLine(message, fields, TraceContextFields()));
}

} // namespace vkyc::observability
