#include "signal_validation.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <string>

#include "internal/model/names.hpp"
#include "internal/util/errors.hpp"

namespace vkyc::signaling {

using namespace vkyc::v1;

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw util::InvalidMessage(message);
  }
}

bool IsDocument(DocumentType type) {
  return type == DOCUMENT_TYPE_PAN || type == DOCUMENT_TYPE_AADHAAR;
}

void RequireRole(PeerRole sender, PeerRole expected, const char* variant) {
  Require(sender == expected, std::string(variant) + " is only accepted from the " + std::string(model::RoleName(expected)));
}

} // namespace

void ValidateInbound(const SignalEnvelope& envelope, PeerRole sender, const ValidationLimits& limits) {
  Require(sender == PEER_ROLE_USER || sender == PEER_ROLE_AGENT, "unknown sender role");

  switch (envelope.body_case()) {
    case SignalEnvelope::kCallSetup:
      Require(envelope.call_setup().kind() != CALL_SETUP_KIND_UNSPECIFIED, "call_setup.kind is required");
      Require(envelope.call_setup().payload().size() <= limits.max_payload_bytes, "call_setup.payload too large");
      return;

    case SignalEnvelope::kCaptureCommand:
      RequireRole(sender, PEER_ROLE_AGENT, "capture_command");
      Require(IsDocument(envelope.capture_command().document_type()), "capture_command.document_type is required");
      return;

    case SignalEnvelope::kCaptureSubmission: {
      RequireRole(sender, PEER_ROLE_USER, "capture_submission");
      const auto& submission = envelope.capture_submission();
      Require(IsDocument(submission.document_type()), "capture_submission.document_type is required");
      Require(!submission.image().empty(), "capture_submission.image is empty");
      Require(submission.image().size() <= limits.max_frame_bytes, "capture_submission.image exceeds max_frame_bytes");
      return;
    }

    case SignalEnvelope::kLivenessEvent: {
      RequireRole(sender, PEER_ROLE_USER, "liveness_event");
      const auto& event = envelope.liveness_event();
      Require(event.kind() != BIOMETRIC_KIND_UNSPECIFIED, "liveness_event.kind is required");
      Require(event.payload_json().size() <= limits.max_payload_bytes, "liveness_event.payload_json too large");
      if (!event.payload_json().empty()) {
        google::protobuf::Struct payload;
        Require(google::protobuf::util::JsonStringToMessage(event.payload_json(), &payload).ok(),
                "liveness_event.payload_json must be a JSON object");
      }
      return;
    }

    case SignalEnvelope::kHeartbeat:
    case SignalEnvelope::kLeave:
      return;

    case SignalEnvelope::kHello:
      throw util::InvalidMessage("hello is only valid as the first message");

    case SignalEnvelope::kNotice:
      throw util::InvalidMessage("notices are server generated");

    case SignalEnvelope::BODY_NOT_SET:
      break;
  }
  throw util::InvalidMessage("message body is empty");
}

} // namespace vkyc::signaling
