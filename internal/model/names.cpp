#include "names.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace vkyc::model {

using namespace vkyc::v1;

namespace {

constexpr std::array<std::pair<TerminationReason, std::string_view>, 13> kReasons = {{
    {TERMINATION_REASON_COMPLETED, "completed"},
    {TERMINATION_REASON_LINK_EXPIRED, "link_expired"},
    {TERMINATION_REASON_DISCONNECT_TIMEOUT, "disconnect_timeout"},
    {TERMINATION_REASON_PEER_LEFT, "peer_left"},
    {TERMINATION_REASON_VERIFICATION_FAILED_LOW_CONFIDENCE, "verification_failed_low_confidence"},
    {TERMINATION_REASON_VERIFICATION_FAILED_OCR_ERROR, "verification_failed_ocr_error"},
    {TERMINATION_REASON_REGISTRY_MISMATCH, "registry_mismatch"},
    {TERMINATION_REASON_VERIFICATION_INCOMPLETE, "verification_incomplete"},
    {TERMINATION_REASON_MANUAL_REVIEW_REQUIRED, "manual_review_required"},
    {TERMINATION_REASON_RECORDING_FAILURE, "recording_failure"},
    {TERMINATION_REASON_PROCESS_RESTART, "process_restart"},
    {TERMINATION_REASON_AGENT_REPORTED_ERROR, "agent_reported_error"},
    {TERMINATION_REASON_AGENT_DECLINED, "agent_declined"},
}};

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string_view StateName(SessionState state) {
  switch (state) {
    case SESSION_STATE_CREATED:
      return "created";
    case SESSION_STATE_SCHEDULED:
      return "scheduled";
    case SESSION_STATE_READY_TO_START:
      return "ready_to_start";
    case SESSION_STATE_IN_PROGRESS:
      return "in_progress";
    case SESSION_STATE_VERIFYING:
      return "verifying";
    case SESSION_STATE_COMPLETED:
      return "completed";
    case SESSION_STATE_FAILED:
      return "failed";
    case SESSION_STATE_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

std::string_view ReasonName(TerminationReason reason) {
  for (const auto& [value, name] : kReasons) {
    if (value == reason) return name;
  }
  return "unspecified";
}

std::string_view DocumentName(DocumentType type) {
  switch (type) {
    case DOCUMENT_TYPE_PAN:
      return "pan";
    case DOCUMENT_TYPE_AADHAAR:
      return "aadhaar";
    default:
      return "unspecified";
  }
}

std::string_view RoleName(PeerRole role) {
  switch (role) {
    case PEER_ROLE_USER:
      return "user";
    case PEER_ROLE_AGENT:
      return "agent";
    default:
      return "unspecified";
  }
}

std::string_view RegistryStatusName(RegistryStatus status) {
  switch (status) {
    case REGISTRY_STATUS_PENDING:
      return "pending";
    case REGISTRY_STATUS_MATCHED:
      return "matched";
    case REGISTRY_STATUS_MISMATCHED:
      return "mismatched";
    case REGISTRY_STATUS_UNAVAILABLE:
      return "unavailable";
    default:
      return "none";
  }
}

std::optional<DocumentType> ParseDocumentType(std::string_view value) {
  const auto lowered = Lower(value);
  if (lowered == "pan") return DOCUMENT_TYPE_PAN;
  if (lowered == "aadhaar") return DOCUMENT_TYPE_AADHAAR;
  return std::nullopt;
}

std::optional<TerminationReason> ParseReason(std::string_view value) {
  const auto lowered = Lower(value);
  for (const auto& [reason, name] : kReasons) {
    if (name == lowered) return reason;
  }
  return std::nullopt;
}

EndCategory EndCategoryFor(SessionState state, TerminationReason reason) {
  switch (state) {
    case SESSION_STATE_COMPLETED:
      return END_CATEGORY_COMPLETED;
    case SESSION_STATE_EXPIRED:
      return END_CATEGORY_EXPIRED;
    case SESSION_STATE_FAILED:
      break;
    default:
      return END_CATEGORY_UNSPECIFIED;
  }

  switch (reason) {
    case TERMINATION_REASON_LINK_EXPIRED:
      return END_CATEGORY_EXPIRED;
    case TERMINATION_REASON_DISCONNECT_TIMEOUT:
    case TERMINATION_REASON_PEER_LEFT:
    case TERMINATION_REASON_PROCESS_RESTART:
    case TERMINATION_REASON_RECORDING_FAILURE:
    case TERMINATION_REASON_AGENT_REPORTED_ERROR:
    case TERMINATION_REASON_AGENT_DECLINED:
      return END_CATEGORY_DISCONNECTED;
    default:
      return END_CATEGORY_VERIFICATION_FAILED;
  }
}

} // namespace vkyc::model
