#include "signaling_hub.hpp"

#include <vector>

#include "internal/biometrics/biometric_logger.hpp"
#include "internal/core/session_manager.hpp"
#include "internal/model/names.hpp"
#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vkyc::signaling {

using namespace vkyc::v1;
using observability::SessionField;
using observability::StringField;

namespace {

PeerRole Other(PeerRole role) {
  return role == PEER_ROLE_USER ? PEER_ROLE_AGENT : PEER_ROLE_USER;
}

SignalEnvelope DocumentNotice(NoticeKind kind, DocumentType document_type, const std::string& message) {
  auto envelope = MakeNotice(kind, message);
  envelope.mutable_notice()->set_document_type(document_type);
  return envelope;
}

} // namespace

SignalingHub::SignalingHub(std::shared_ptr<core::SessionManager> manager, std::shared_ptr<biometrics::BiometricLogger> logger,
                           std::shared_ptr<util::TimeSource> clock, SignalingPolicy policy)
    : manager_(std::move(manager)), logger_(std::move(logger)), clock_(std::move(clock)), policy_(policy) {
  if (!manager_ || !logger_ || !clock_) {
    throw std::invalid_argument("SignalingHub: manager, logger and clock are required");
  }
  limits_.max_frame_bytes = policy_.max_frame_bytes;
}

std::shared_ptr<SignalingChannel> SignalingHub::Channel(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  const auto      it = channels_.find(session_id);
  return it == channels_.end() ? nullptr : it->second;
}

std::shared_ptr<SignalingChannel> SignalingHub::RequireActive(const std::string& session_id, Session* snapshot) const {
  Session session;
  try {
    session = manager_->GetSession(session_id);
  } catch (const util::NotFound&) {
    throw util::SessionNotActive("unknown session " + session_id);
  }
  if (!model::IsActive(session.state())) {
    throw util::SessionNotActive("session " + session_id + " is " + std::string(model::StateName(session.state())));
  }

  auto channel = Channel(session_id);
  if (!channel || channel->Closed()) {
    throw util::SessionNotActive("no signaling channel for session " + session_id);
  }
  if (snapshot) {
    *snapshot = std::move(session);
  }
  return channel;
}

void SignalingHub::Attach(const std::string& session_id, PeerRole role, std::shared_ptr<PeerSink> sink, const std::string& agent_id) {
  if (role != PEER_ROLE_USER && role != PEER_ROLE_AGENT) {
    throw util::InvalidMessage("hello.role is required");
  }
  if (!sink) {
    throw std::invalid_argument("SignalingHub::Attach: sink is required");
  }
  Session session;
  auto    channel = RequireActive(session_id, &session);
  if (role == PEER_ROLE_AGENT) {
    if (session.agent_id().empty()) {
      throw util::AgentNotAssigned("no agent has accepted session " + session_id);
    }
    if (agent_id != session.agent_id()) {
      VKYC_LOG_WARN("agent attach refused", {SessionField(session_id), StringField("agent_id", agent_id)});
      throw util::AgentNotAssigned("session " + session_id + " is assigned to another agent");
    }
  }
  channel->Attach(role, std::move(sink), clock_->Now());
}

void SignalingHub::Detach(const std::string& session_id, PeerRole role, const PeerSink* sink, bool expected) {
  if (auto channel = Channel(session_id)) {
    channel->Detach(role, sink, expected, clock_->Now());
  }
}

void SignalingHub::Deliver(const std::string& session_id, PeerRole from, const SignalEnvelope& envelope) {
  auto channel = RequireActive(session_id);
  try {
    ValidateInbound(envelope, from, limits_);
  } catch (const util::InvalidMessage& e) {
    VKYC_LOG_WARN("signaling message rejected", {SessionField(session_id), StringField("role", model::RoleName(from)),
                                                 StringField("error", e.what())});
    throw;
  }

  const auto now = clock_->Now();
  switch (envelope.body_case()) {
    case SignalEnvelope::kCallSetup:
      channel->Send(Other(from), envelope, now);
      break;

    case SignalEnvelope::kCaptureCommand:
      if (envelope.capture_command().cancel()) {
        channel->CancelCapture(envelope.capture_command().document_type());
      }
      channel->Send(PEER_ROLE_USER, envelope, now);
      break;

    case SignalEnvelope::kCaptureSubmission:
      HandleSubmission(*channel, envelope.capture_submission());
      break;

    case SignalEnvelope::kLivenessEvent: {
      const auto& event = envelope.liveness_event();
      logger_->Append(session_id, event.kind(), event.payload_json(), event.client_time_ms());
      channel->Send(PEER_ROLE_AGENT, envelope, now);
      break;
    }

    case SignalEnvelope::kLeave:
      if (from == PEER_ROLE_USER) {
        const auto& reason = envelope.leave().reason();
        manager_->FailSession(session_id, TERMINATION_REASON_PEER_LEFT, reason.empty() ? "user left the session" : reason);
      } else {
        channel->Send(PEER_ROLE_USER, MakeNotice(NOTICE_KIND_PEER_DISCONNECTED, "agent"), now);
      }
      break;

    default:
      // Heartbeats only prove liveness of the stream.
      break;
  }
}

void SignalingHub::HandleSubmission(SignalingChannel& channel, const CaptureSubmission& submission) {
  const auto document_type = submission.document_type();
  if (!channel.ConsumeCapture(document_type)) {
    throw util::InvalidMessage("no capture command outstanding for " + std::string(model::DocumentName(document_type)));
  }

  verification::CaptureFrame frame;
  frame.session_id    = channel.SessionId();
  frame.document_type = document_type;
  frame.image         = submission.image();
  frame.captured_at   = submission.captured_at_ms() > 0 ? util::FromUnixMillis(submission.captured_at_ms()) : clock_->Now();

  try {
    manager_->RequestVerification(std::move(frame));
  } catch (const std::exception&) {
    channel.RestoreCapture(document_type);
    throw;
  }

  const auto notice = DocumentNotice(NOTICE_KIND_CAPTURE_RECEIVED, document_type, "capture received");
  const auto now    = clock_->Now();
  channel.Send(PEER_ROLE_USER, notice, now);
  channel.Send(PEER_ROLE_AGENT, notice, now);
}

std::size_t SignalingHub::SweepDisconnected() {
  const auto now = clock_->Now();

  std::vector<std::pair<std::string, PeerRole>> expired;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [session_id, channel] : channels_) {
      if (auto role = channel->GraceExpired(now)) {
        expired.emplace_back(session_id, *role);
      }
    }
  }

  std::size_t failed = 0;
  for (const auto& [session_id, role] : expired) {
    try {
      manager_->FailSession(session_id, TERMINATION_REASON_DISCONNECT_TIMEOUT, std::string(model::RoleName(role)) + " did not reconnect");
      ++failed;
    } catch (const std::exception& e) {
      VKYC_LOG_WARN("disconnect timeout not applied", {SessionField(session_id), StringField("error", e.what())});
    }
  }
  return failed;
}

void SignalingHub::OnSessionStarted(const Session& session) {
  auto channel = std::make_shared<SignalingChannel>(session.session_id(), policy_.disconnect_grace, policy_.mailbox_capacity);
  {
    std::lock_guard lock(mutex_);
    channels_[session.session_id()] = channel;
  }

  auto notice = MakeNotice(NOTICE_KIND_SESSION_STARTED, "session started");
  notice.mutable_notice()->set_state(session.state());
  const auto now = clock_->Now();
  channel->Send(PEER_ROLE_USER, notice, now);
  channel->Send(PEER_ROLE_AGENT, notice, now);
}

void SignalingHub::OnSessionEnded(const Session& session) {
  std::shared_ptr<SignalingChannel> channel;
  {
    std::lock_guard lock(mutex_);
    auto            it = channels_.find(session.session_id());
    if (it == channels_.end()) {
      return;
    }
    channel = it->second;
    channels_.erase(it);
  }

  auto  notice  = MakeNotice(NOTICE_KIND_SESSION_ENDED, "session ended");
  auto* payload = notice.mutable_notice();
  payload->set_state(session.state());
  payload->set_end_category(model::EndCategoryFor(session.state(), session.termination_reason()));
  channel->Close(notice);
}

void SignalingHub::OnAgentAssigned(const Session& session) {
  if (auto channel = Channel(session.session_id())) {
    auto notice = MakeNotice(NOTICE_KIND_AGENT_ASSIGNED, "agent assigned");
    notice.mutable_notice()->set_state(session.state());
    channel->Send(PEER_ROLE_USER, notice, clock_->Now());
  }
}

void SignalingHub::OnVerificationUpdate(const Session& session, const verification::VerificationReport& report) {
  auto channel = Channel(session.session_id());
  if (!channel) {
    return;
  }

  const auto  document_type = report.result.document_type();
  const auto  now           = clock_->Now();
  const auto  outcome       = std::string(verification::OutcomeName(report.outcome));

  if (report.outcome == verification::VerificationOutcome::kRecaptureRequested) {
    const auto notice = DocumentNotice(NOTICE_KIND_RECAPTURE_REQUESTED, document_type, report.result.detail());
    channel->Send(PEER_ROLE_AGENT, notice, now);
    channel->Send(PEER_ROLE_USER, notice, now);

    SignalEnvelope command;
    command.mutable_capture_command()->set_document_type(document_type);
    command.mutable_capture_command()->set_prompt("please capture the document again");
    channel->Send(PEER_ROLE_USER, command, now);
    return;
  }

  auto agent_notice = DocumentNotice(NOTICE_KIND_VERIFICATION_RESULT, document_type, outcome);
  *agent_notice.mutable_notice()->mutable_result() = report.result;
  agent_notice.mutable_notice()->set_state(session.state());
  channel->Send(PEER_ROLE_AGENT, agent_notice, now);

  auto user_notice = DocumentNotice(NOTICE_KIND_VERIFICATION_RESULT, document_type, outcome);
  user_notice.mutable_notice()->set_state(session.state());
  channel->Send(PEER_ROLE_USER, user_notice, now);
}

} // namespace vkyc::signaling
