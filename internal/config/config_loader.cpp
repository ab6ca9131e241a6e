#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>

#include "internal/model/names.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace vkyc::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

namespace {

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

void SetDefault(google::protobuf::Duration* d, std::chrono::milliseconds value) {
  if (!IsUnset(*d)) return;
  d->set_seconds(value.count() / 1000);
  d->set_nanos(static_cast<int32_t>((value.count() % 1000) * 1000000));
}

void RequirePositive(const google::protobuf::Duration& d, const std::string& field) {
  if (util::ToMillis(d).count() <= 0) {
    throw util::InvalidArgument("config: " + field + " must be positive");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  if (!yaml.IsNull()) {
    YamlToProtoValue(yaml, &json_value);
  } else {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  using namespace std::chrono_literals;

  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  if (config.database().backend_case() == DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* links = config.mutable_links();
  if (links->base_url().empty()) links->set_base_url("http://localhost:3000");
  if (links->token_length() == 0) links->set_token_length(16);
  SetDefault(links->mutable_link_ttl(), 24h);
  SetDefault(links->mutable_scheduled_link_ttl(), 24h);

  auto* verification = config.mutable_verification();
  if (verification->required_documents().empty()) {
    verification->add_required_documents("PAN");
    verification->add_required_documents("AADHAAR");
  }
  if (verification->confidence_threshold() == 0.0) verification->set_confidence_threshold(0.6);
  if (verification->max_attempts() == 0) verification->set_max_attempts(3);
  if (verification->max_retries() == 0) verification->set_max_retries(3);
  if (verification->worker_threads() == 0) verification->set_worker_threads(4);
  SetDefault(verification->mutable_ocr_timeout(), 30s);
  SetDefault(verification->mutable_registry_timeout(), 10s);
  SetDefault(verification->mutable_initial_backoff(), 500ms);
  SetDefault(verification->mutable_max_backoff(), 8s);

  auto* signaling = config.mutable_signaling();
  SetDefault(signaling->mutable_disconnect_grace(), 30s);
  if (signaling->max_frame_bytes() == 0) signaling->set_max_frame_bytes(8ull * 1024 * 1024);
  if (signaling->mailbox_capacity() == 0) signaling->set_mailbox_capacity(256);

  auto* recording = config.mutable_recording();
  SetDefault(recording->mutable_max_duration(), 600s);
  if (recording->codec().empty()) recording->set_codec("zstd");
  if (recording->storage_uri().empty()) recording->set_storage_uri("recordings");

  auto* biometrics = config.mutable_biometrics();
  if (biometrics->queue_capacity() == 0) biometrics->set_queue_capacity(1024);
  SetDefault(biometrics->mutable_flush_interval(), 500ms);
  if (biometrics->min_blink_count() == 0) biometrics->set_min_blink_count(1);
  if (!biometrics->has_require_head_pose()) biometrics->set_require_head_pose(true);

  SetDefault(config.mutable_scheduler()->mutable_sweep_interval(), 1s);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("vkyc-orchestrator");
  if (observability->metrics_interval_ms() == 0) observability->set_metrics_interval_ms(1000);
  if (observability->trace_sample_ratio() == 0.0) observability->set_trace_sample_ratio(1.0);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  using namespace std::chrono_literals;

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::InvalidArgument("config: database.sqlite.path is required");
  }

  const auto& links = config.links();
  if (links.token_length() < 8 || links.token_length() > 64) {
    throw util::InvalidArgument("config: links.token_length must be within [8, 64]");
  }
  RequirePositive(links.link_ttl(), "links.link_ttl");
  RequirePositive(links.scheduled_link_ttl(), "links.scheduled_link_ttl");

  const auto& verification = config.verification();
  for (const auto& document : verification.required_documents()) {
    if (!model::ParseDocumentType(document)) {
      throw util::InvalidArgument("config: verification.required_documents has unknown document type: " + document);
    }
  }
  if (verification.confidence_threshold() <= 0.0 || verification.confidence_threshold() > 1.0) {
    throw util::InvalidArgument("config: verification.confidence_threshold must be within (0, 1]");
  }
  RequirePositive(verification.ocr_timeout(), "verification.ocr_timeout");
  RequirePositive(verification.registry_timeout(), "verification.registry_timeout");
  RequirePositive(verification.initial_backoff(), "verification.initial_backoff");
  if (util::ToMillis(verification.max_backoff()) < util::ToMillis(verification.initial_backoff())) {
    throw util::InvalidArgument("config: verification.max_backoff must not be below initial_backoff");
  }

  RequirePositive(config.signaling().disconnect_grace(), "signaling.disconnect_grace");

  const auto max_duration = util::ToMillis(config.recording().max_duration());
  if (max_duration.count() <= 0 || max_duration > std::chrono::milliseconds(600s)) {
    throw util::InvalidArgument("config: recording.max_duration must be within (0s, 600s]");
  }

  RequirePositive(config.biometrics().flush_interval(), "biometrics.flush_interval");
  RequirePositive(config.scheduler().sweep_interval(), "scheduler.sweep_interval");

  const double sample_ratio = config.observability().trace_sample_ratio();
  if (sample_ratio <= 0.0 || sample_ratio > 1.0) {
    throw util::InvalidArgument("config: observability.trace_sample_ratio must be within (0, 1]");
  }
}

} // namespace vkyc::config
