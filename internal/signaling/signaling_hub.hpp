#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/core/session_observer.hpp"
#include "internal/util/time.hpp"
#include "signal_validation.hpp"
#include "signaling_channel.hpp"

namespace vkyc::biometrics {
class BiometricLogger;
}

namespace vkyc::core {
class SessionManager;
}

namespace vkyc::signaling {

struct SignalingPolicy {
  std::chrono::milliseconds disconnect_grace{std::chrono::seconds(30)};
  uint64_t                  max_frame_bytes{8 * 1024 * 1024};
  std::size_t               mailbox_capacity{256};
};

/*
  Routes signaling traffic for all live sessions.

  A channel exists from BeginSession until the session ends. Every inbound
  message is checked against the session snapshot (in-progress or
  verifying) and validated before it can touch any state; rejected messages
  throw ChannelError and change nothing. Only the agent that accepted the
  session may attach as its agent.
*/
class SignalingHub final : public core::SessionObserver {
 public:
  SignalingHub(std::shared_ptr<core::SessionManager> manager, std::shared_ptr<biometrics::BiometricLogger> logger,
               std::shared_ptr<util::TimeSource> clock, SignalingPolicy policy);

  // agent_id is checked for PEER_ROLE_AGENT and ignored for users.
  void Attach(const std::string& session_id, vkyc::v1::PeerRole role, std::shared_ptr<PeerSink> sink, const std::string& agent_id = {});
  void Detach(const std::string& session_id, vkyc::v1::PeerRole role, const PeerSink* sink, bool expected);

  void Deliver(const std::string& session_id, vkyc::v1::PeerRole from, const vkyc::v1::SignalEnvelope& envelope);

  // Fails sessions whose disconnect grace elapsed; returns how many.
  std::size_t SweepDisconnected();

  void OnSessionStarted(const vkyc::v1::Session& session) override;
  void OnSessionEnded(const vkyc::v1::Session& session) override;
  void OnVerificationUpdate(const vkyc::v1::Session& session, const verification::VerificationReport& report) override;
  void OnAgentAssigned(const vkyc::v1::Session& session) override;

  std::shared_ptr<SignalingChannel> Channel(const std::string& session_id) const;

 private:
  std::shared_ptr<SignalingChannel> RequireActive(const std::string& session_id, vkyc::v1::Session* snapshot = nullptr) const;

  void HandleSubmission(SignalingChannel& channel, const vkyc::v1::CaptureSubmission& submission);

  std::shared_ptr<core::SessionManager>        manager_;
  std::shared_ptr<biometrics::BiometricLogger> logger_;
  std::shared_ptr<util::TimeSource>            clock_;
  SignalingPolicy                              policy_;
  ValidationLimits                             limits_;

  mutable std::mutex                                                 mutex_;
  std::unordered_map<std::string, std::shared_ptr<SignalingChannel>> channels_;
};

} // namespace vkyc::signaling
