#include "grpc_error.hpp"

#include <string>

namespace vkyc::grpc {
namespace {

template <typename T>
bool Is(const std::exception& e) {
  return dynamic_cast<const T*>(&e) != nullptr;
}

} // namespace

// Most specific types first: LinkExpired before LinkError, VerificationBusy
// before VerificationError.
std::string_view ErrorKind(const std::exception& e) {
  using namespace vkyc::util;

  if (Is<NotFound>(e)) return "not_found";
  if (Is<InvalidMessage>(e)) return "invalid_message";
  if (Is<InvalidArgument>(e)) return "invalid_argument";
  if (Is<LinkExpired>(e)) return "link_expired";
  if (Is<LinkConsumed>(e)) return "link_consumed";
  if (Is<LinkError>(e)) return "link_error";
  if (Is<AgentUnavailable>(e)) return "agent_unavailable";
  if (Is<InvalidTransition>(e)) return "invalid_transition";
  if (Is<TransitionError>(e)) return "transition_error";
  if (Is<SessionNotActive>(e)) return "session_not_active";
  if (Is<AgentNotAssigned>(e)) return "agent_not_assigned";
  if (Is<ChannelError>(e)) return "channel_error";
  if (Is<VerificationBusy>(e)) return "verification_busy";
  if (Is<VerificationError>(e)) return "verification_error";
  if (Is<RecordingError>(e)) return "recording_error";
  if (Is<TimeoutError>(e)) return "timeout";
  if (Is<ResourceExhausted>(e)) return "resource_exhausted";
  return "internal";
}

::grpc::Status ToStatus(const std::exception& e) {
  using namespace vkyc::util;

  ::grpc::StatusCode code = ::grpc::StatusCode::INTERNAL;
  if (Is<NotFound>(e)) {
    code = ::grpc::StatusCode::NOT_FOUND;
  } else if (Is<InvalidArgument>(e) || Is<InvalidMessage>(e)) {
    code = ::grpc::StatusCode::INVALID_ARGUMENT;
  } else if (Is<LinkError>(e) || Is<TransitionError>(e) || Is<SessionNotActive>(e)) {
    code = ::grpc::StatusCode::FAILED_PRECONDITION;
  } else if (Is<AgentNotAssigned>(e)) {
    code = ::grpc::StatusCode::PERMISSION_DENIED;
  } else if (Is<VerificationBusy>(e)) {
    code = ::grpc::StatusCode::ABORTED;
  } else if (Is<ResourceExhausted>(e)) {
    code = ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  } else if (Is<TimeoutError>(e)) {
    code = ::grpc::StatusCode::DEADLINE_EXCEEDED;
  } else if (Is<VerificationError>(e) || Is<RecordingError>(e)) {
    code = ::grpc::StatusCode::UNAVAILABLE;
  }

  return ::grpc::Status(code, e.what(), std::string(ErrorKind(e)));
}

} // namespace vkyc::grpc
