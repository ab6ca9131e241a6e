#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "vkyc_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Error>
bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)vkyc::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "/tmp/vkyc.db"
    wal_mode: true
links:
  base_url: "https://kyc.example.com"
  token_length: 20
  link_ttl: "3600s"
verification:
  required_documents: [PAN]
  confidence_threshold: 0.75
  max_retries: 5
  initial_backoff: "0.25s"
  registry:
    url: "https://registry.example.com/verify"
    bearer_token: "secret"
signaling:
  disconnect_grace: "45s"
recording:
  max_duration: "300s"
  codec: "none"
)");

  const auto config = vkyc::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "/tmp/vkyc.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.links().token_length() == 20);
  assert(vkyc::util::ToMillis(config.links().link_ttl()).count() == 3'600'000);
  assert(config.verification().required_documents_size() == 1);
  assert(config.verification().confidence_threshold() == 0.75);
  assert(config.verification().max_retries() == 5);
  assert(vkyc::util::ToMillis(config.verification().initial_backoff()).count() == 250);
  assert(config.verification().registry().bearer_token() == "secret");
  assert(vkyc::util::ToMillis(config.signaling().disconnect_grace()).count() == 45'000);
  assert(vkyc::util::ToMillis(config.recording().max_duration()).count() == 300'000);
  assert(config.recording().codec() == "none");

  // Unset fields still get their defaults.
  assert(config.verification().max_attempts() == 3);
  assert(vkyc::util::ToMillis(config.links().scheduled_link_ttl()).count() == 24 * 3'600'000);
}

void TestEmptyFileGetsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");
  const auto config    = vkyc::config::ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());
  assert(config.links().token_length() == 16);
  assert(config.verification().required_documents_size() == 2);
  assert(config.verification().confidence_threshold() == 0.6);
  assert(config.verification().max_retries() == 3);
  assert(vkyc::util::ToMillis(config.signaling().disconnect_grace()).count() == 30'000);
  assert(vkyc::util::ToMillis(config.recording().max_duration()).count() == 600'000);
  assert(config.recording().codec() == "zstd");
  assert(config.biometrics().require_head_pose());
  assert(config.observability().service_name() == "vkyc-orchestrator");
  assert(config.observability().trace_sample_ratio() == 1.0);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\vkyc\\\"quoted\"\\db.sqlite"
links:
  base_url: "line1\nline2☃"
)");

  const auto config = vkyc::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\vkyc\\\"quoted\"\\db.sqlite");
  assert(config.links().base_url() == std::string("line1\nline2☃"));
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(verification:
  registry:
    bearer_token: "12345"
)");

  const auto config = vkyc::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.verification().registry().bearer_token() == "12345");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects<std::runtime_error>("unknown_field",
                                     R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)"));
  assert(Rejects<std::runtime_error>("unknown_nested",
                                     R"(recording:
  max_seconds: 600
)"));
}

void TestOutOfRangeValuesAreRejected() {
  assert(Rejects<vkyc::util::InvalidArgument>("short_token", "links:\n  token_length: 4\n"));
  assert(Rejects<vkyc::util::InvalidArgument>("long_recording", "recording:\n  max_duration: \"601s\"\n"));
  assert(Rejects<vkyc::util::InvalidArgument>("bad_threshold", "verification:\n  confidence_threshold: 1.5\n"));
  assert(Rejects<vkyc::util::InvalidArgument>("bad_document", "verification:\n  required_documents: [PASSPORT]\n"));
  assert(Rejects<vkyc::util::InvalidArgument>("backoff_order",
                                              "verification:\n  initial_backoff: \"10s\"\n  max_backoff: \"1s\"\n"));
  assert(Rejects<vkyc::util::InvalidArgument>("sample_ratio", "observability:\n  trace_sample_ratio: 2\n"));
  assert(Rejects<vkyc::util::InvalidArgument>("sqlite_path", "database:\n  sqlite:\n    wal_mode: true\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)vkyc::config::ConfigLoader::LoadFromYaml("/nonexistent/vkyc.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyFileGetsDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "vkyc_unit_config_loader: pass\n";
  return 0;
}
