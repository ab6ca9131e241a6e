#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"
#include "vkyc/v1/types.pb.h"

namespace vkyc::verification {

// Transient; the image is dropped once the attempt is processed.
struct CaptureFrame {
  std::string            session_id;
  vkyc::v1::DocumentType document_type = vkyc::v1::DOCUMENT_TYPE_UNSPECIFIED;
  std::string            image;
  util::TimePoint        captured_at{};
};

struct OcrResult {
  bool                               ok = false;
  std::map<std::string, std::string> fields;
  double                             confidence = 0.0;
  std::string                        error;
};

enum class RegistryOutcome {
  kMatched,
  kMismatched,
  kUnavailable,
  kTimeout,
  kTransportError,
  // The registry refused the request itself (bad input or credentials).
  kRejected,
};

struct RegistryResponse {
  RegistryOutcome outcome = RegistryOutcome::kTransportError;
  std::string     message;
};

// kMismatched and kRejected are definitive; the rest are retried.
constexpr bool IsTransient(RegistryOutcome outcome) {
  return outcome == RegistryOutcome::kUnavailable || outcome == RegistryOutcome::kTimeout || outcome == RegistryOutcome::kTransportError;
}

enum class VerificationOutcome {
  kRecaptureRequested,
  kMatched,
  kMismatched,
  kUnavailable,
  kLowConfidence,
  kOcrError,
};

std::string_view OutcomeName(VerificationOutcome outcome);

struct VerificationReport {
  VerificationOutcome          outcome = VerificationOutcome::kUnavailable;
  vkyc::v1::VerificationResult result;
};

struct VerificationPolicy {
  double                    confidence_threshold{0.6};
  uint32_t                  max_attempts{3};
  std::chrono::milliseconds ocr_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds registry_timeout{std::chrono::seconds(10)};
  uint32_t                  max_retries{3};
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{std::chrono::seconds(8)};
  std::size_t               worker_threads{4};
};

} // namespace vkyc::verification
