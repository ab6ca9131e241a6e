#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/signaling/signaling_hub.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using namespace vkyc::v1;
using vkyc::testing::CapturingSink;
using vkyc::testing::SessionHarness;
using vkyc::testing::StallingSink;
using vkyc::testing::WaitFor;

struct HubFixture {
  SessionHarness                                 h;
  std::shared_ptr<vkyc::signaling::SignalingHub> hub;
  std::shared_ptr<CapturingSink>                 user  = std::make_shared<CapturingSink>();
  std::shared_ptr<CapturingSink>                 agent = std::make_shared<CapturingSink>();
  std::string                                    id;

  HubFixture() {
    hub = std::make_shared<vkyc::signaling::SignalingHub>(h.sessions, h.biometrics, h.clock, vkyc::signaling::SignalingPolicy{});
    h.sessions->AddObserver(hub);
    id = h.StartImmediate().session_id();
    h.sessions->AcceptSession(id, "agent-1");
    hub->Attach(id, PEER_ROLE_USER, user);
    hub->Attach(id, PEER_ROLE_AGENT, agent, "agent-1");
  }
};

SignalEnvelope Capture(DocumentType document_type, bool cancel = false) {
  SignalEnvelope envelope;
  envelope.mutable_capture_command()->set_document_type(document_type);
  envelope.mutable_capture_command()->set_cancel(cancel);
  return envelope;
}

SignalEnvelope Submission(DocumentType document_type) {
  SignalEnvelope envelope;
  envelope.mutable_capture_submission()->set_document_type(document_type);
  envelope.mutable_capture_submission()->set_image("jpeg");
  envelope.mutable_capture_submission()->set_captured_at_ms(1'700'000'000'000);
  return envelope;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestAttachRequiresLiveSession() {
  SessionHarness h;
  auto hub = std::make_shared<vkyc::signaling::SignalingHub>(h.sessions, h.biometrics, h.clock, vkyc::signaling::SignalingPolicy{});
  h.sessions->AddObserver(hub);

  const auto link    = h.links->Issue("cust-1");
  const auto created = h.sessions->CreateSession(link.token());
  auto       sink    = std::make_shared<CapturingSink>();

  assert(Throws<vkyc::util::SessionNotActive>([&] { hub->Attach(created.session_id(), PEER_ROLE_USER, sink); }));
  assert(Throws<vkyc::util::SessionNotActive>([&] { hub->Attach("unknown", PEER_ROLE_USER, sink); }));
  assert(Throws<vkyc::util::InvalidMessage>([&] { hub->Attach(created.session_id(), PEER_ROLE_UNSPECIFIED, sink); }));
}

void TestPeersReceiveSessionStarted() {
  HubFixture f;
  assert(f.user->CountNotices(NOTICE_KIND_SESSION_STARTED) == 1);
  assert(f.agent->CountNotices(NOTICE_KIND_SESSION_STARTED) == 1);
}

void TestCallSetupIsForwardedToOtherPeer() {
  HubFixture     f;
  SignalEnvelope answer;
  answer.mutable_call_setup()->set_kind(CALL_SETUP_KIND_ANSWER);
  answer.mutable_call_setup()->set_payload("sdp");
  f.hub->Deliver(f.id, PEER_ROLE_USER, answer);

  const auto received = f.agent->Received();
  assert(received.back().has_call_setup());
  assert(received.back().call_setup().payload() == "sdp");
}

void TestCaptureRoundTripVerifiesDocument() {
  HubFixture f;

  // A submission without a delivered command is rejected and changes nothing.
  assert(Throws<vkyc::util::InvalidMessage>([&] { f.hub->Deliver(f.id, PEER_ROLE_USER, Submission(DOCUMENT_TYPE_PAN)); }));
  assert(f.h.sessions->GetSession(f.id).state() == SESSION_STATE_IN_PROGRESS);

  f.hub->Deliver(f.id, PEER_ROLE_AGENT, Capture(DOCUMENT_TYPE_PAN));
  assert(f.user->Received().back().has_capture_command());

  f.hub->Deliver(f.id, PEER_ROLE_USER, Submission(DOCUMENT_TYPE_PAN));
  assert(f.h.sessions->GetSession(f.id).state() == SESSION_STATE_VERIFYING);
  assert(f.user->CountNotices(NOTICE_KIND_CAPTURE_RECEIVED) == 1);
  assert(f.agent->CountNotices(NOTICE_KIND_CAPTURE_RECEIVED) == 1);

  // The command was used up by the first submission.
  assert(Throws<vkyc::util::InvalidMessage>([&] { f.hub->Deliver(f.id, PEER_ROLE_USER, Submission(DOCUMENT_TYPE_PAN)); }));

  assert(WaitFor([&] { return f.agent->CountNotices(NOTICE_KIND_VERIFICATION_RESULT) == 1; }));
  assert(WaitFor([&] { return f.user->CountNotices(NOTICE_KIND_VERIFICATION_RESULT) == 1; }));
  for (const auto& envelope : f.agent->Received()) {
    if (envelope.has_notice() && envelope.notice().kind() == NOTICE_KIND_VERIFICATION_RESULT) {
      assert(envelope.notice().result().registry_status() == REGISTRY_STATUS_MATCHED);
    }
  }
  for (const auto& envelope : f.user->Received()) {
    if (envelope.has_notice() && envelope.notice().kind() == NOTICE_KIND_VERIFICATION_RESULT) {
      assert(!envelope.notice().has_result());
    }
  }
}

void TestCancelledCaptureRejectsSubmission() {
  HubFixture f;
  f.hub->Deliver(f.id, PEER_ROLE_AGENT, Capture(DOCUMENT_TYPE_AADHAAR));
  f.hub->Deliver(f.id, PEER_ROLE_AGENT, Capture(DOCUMENT_TYPE_AADHAAR, true));
  assert(Throws<vkyc::util::InvalidMessage>([&] { f.hub->Deliver(f.id, PEER_ROLE_USER, Submission(DOCUMENT_TYPE_AADHAAR)); }));
}

void TestRecaptureRearmsCommand() {
  HubFixture f;
  f.h.ocr->Push(vkyc::testing::ScriptedOcr::Confident(0.3));
  f.h.ocr->Push(vkyc::testing::ScriptedOcr::Confident(0.9));

  f.hub->Deliver(f.id, PEER_ROLE_AGENT, Capture(DOCUMENT_TYPE_PAN));
  f.hub->Deliver(f.id, PEER_ROLE_USER, Submission(DOCUMENT_TYPE_PAN));

  assert(WaitFor([&] { return f.user->CountNotices(NOTICE_KIND_RECAPTURE_REQUESTED) == 1; }));
  assert(WaitFor([&] { return f.user->Received().back().has_capture_command(); }));
  assert(f.agent->CountNotices(NOTICE_KIND_RECAPTURE_REQUESTED) == 1);

  assert(vkyc::testing::RetryWhileBusy([&] { f.hub->Deliver(f.id, PEER_ROLE_USER, Submission(DOCUMENT_TYPE_PAN)); }));
  assert(f.h.WaitForStatus(f.id, DOCUMENT_TYPE_PAN, REGISTRY_STATUS_MATCHED));
}

void TestLivenessIsLoggedAndForwarded() {
  HubFixture     f;
  SignalEnvelope blink;
  blink.mutable_liveness_event()->set_kind(BIOMETRIC_KIND_BLINK);
  blink.mutable_liveness_event()->set_payload_json(R"({"count":3})");
  f.hub->Deliver(f.id, PEER_ROLE_USER, blink);

  assert(f.h.biometrics->Summary(f.id).blink_count == 1);
  assert(f.agent->Received().back().has_liveness_event());

  // Only the user reports liveness.
  assert(Throws<vkyc::util::InvalidMessage>([&] { f.hub->Deliver(f.id, PEER_ROLE_AGENT, blink); }));
  assert(f.h.biometrics->Summary(f.id).blink_count == 1);
}

void TestUserLeaveFailsSession() {
  HubFixture     f;
  SignalEnvelope leave;
  leave.mutable_leave()->set_reason("changed my mind");
  f.hub->Deliver(f.id, PEER_ROLE_USER, leave);

  const auto failed = f.h.sessions->GetSession(f.id);
  assert(failed.state() == SESSION_STATE_FAILED);
  assert(failed.termination_reason() == TERMINATION_REASON_PEER_LEFT);
  assert(failed.termination_detail() == "changed my mind");

  for (const auto& sink : {f.user, f.agent}) {
    const auto last = sink->Received().back();
    assert(last.has_notice());
    assert(last.notice().kind() == NOTICE_KIND_SESSION_ENDED);
    assert(last.notice().end_category() == END_CATEGORY_DISCONNECTED);
    assert(sink->Closed());
  }

  SignalEnvelope heartbeat;
  heartbeat.mutable_heartbeat();
  assert(Throws<vkyc::util::SessionNotActive>([&] { f.hub->Deliver(f.id, PEER_ROLE_AGENT, heartbeat); }));
}

void TestOnlyAssignedAgentMayAttach() {
  SessionHarness h;
  auto hub = std::make_shared<vkyc::signaling::SignalingHub>(h.sessions, h.biometrics, h.clock, vkyc::signaling::SignalingPolicy{});
  h.sessions->AddObserver(hub);
  const auto id   = h.StartImmediate().session_id();
  auto       user = std::make_shared<CapturingSink>();
  hub->Attach(id, PEER_ROLE_USER, user);

  auto agent = std::make_shared<CapturingSink>();
  assert(Throws<vkyc::util::AgentNotAssigned>([&] { hub->Attach(id, PEER_ROLE_AGENT, agent, "agent-1"); }));

  h.sessions->AcceptSession(id, "agent-1");
  assert(user->CountNotices(NOTICE_KIND_AGENT_ASSIGNED) == 1);
  assert(Throws<vkyc::util::AgentNotAssigned>([&] { hub->Attach(id, PEER_ROLE_AGENT, agent, "agent-2"); }));
  assert(Throws<vkyc::util::AgentNotAssigned>([&] { hub->Attach(id, PEER_ROLE_AGENT, agent); }));

  hub->Attach(id, PEER_ROLE_AGENT, agent, "agent-1");
  assert(agent->CountNotices(NOTICE_KIND_SESSION_STARTED) == 1);
}

// The user stops reading while the agent keeps sending.
void TestStalledUserDoesNotBlockAgentOrFailSession() {
  SessionHarness h;
  auto hub = std::make_shared<vkyc::signaling::SignalingHub>(h.sessions, h.biometrics, h.clock, vkyc::signaling::SignalingPolicy{});
  h.sessions->AddObserver(hub);
  const auto id = h.StartImmediate().session_id();
  h.sessions->AcceptSession(id, "agent-1");

  auto agent = std::make_shared<CapturingSink>();
  auto user  = std::make_shared<StallingSink>();
  hub->Attach(id, PEER_ROLE_AGENT, agent, "agent-1");
  std::thread attach([&] { hub->Attach(id, PEER_ROLE_USER, user); });
  assert(WaitFor([&] { return user->Stalled(); }));

  SignalEnvelope offer;
  offer.mutable_call_setup()->set_kind(CALL_SETUP_KIND_OFFER);
  offer.mutable_call_setup()->set_payload("sdp");
  auto failed = std::async(std::launch::async, [&] {
    hub->Deliver(id, PEER_ROLE_AGENT, offer);
    return h.sessions->FailSession(id, TERMINATION_REASON_AGENT_REPORTED_ERROR, "user froze");
  });
  assert(failed.wait_for(2s) == std::future_status::ready);
  assert(failed.get().state() == SESSION_STATE_FAILED);
  assert(agent->CountNotices(NOTICE_KIND_SESSION_ENDED) == 1);
  assert(agent->Closed());

  // Once the user reads again everything arrives in order, then the close.
  user->Release();
  attach.join();
  assert(WaitFor([&] { return user->Closed(); }));
  const auto received = user->Received();
  assert(received.back().notice().kind() == NOTICE_KIND_SESSION_ENDED);
  bool saw_offer = false;
  for (const auto& envelope : received) {
    saw_offer = saw_offer || (envelope.has_call_setup() && envelope.call_setup().payload() == "sdp");
  }
  assert(saw_offer);
}

void TestAgentLeaveOnlyNotifiesUser() {
  HubFixture     f;
  SignalEnvelope leave;
  leave.mutable_leave();
  f.hub->Deliver(f.id, PEER_ROLE_AGENT, leave);

  assert(f.h.sessions->GetSession(f.id).state() == SESSION_STATE_IN_PROGRESS);
  assert(f.user->CountNotices(NOTICE_KIND_PEER_DISCONNECTED) == 1);
}

} // namespace

int main() {
  TestAttachRequiresLiveSession();
  TestPeersReceiveSessionStarted();
  TestCallSetupIsForwardedToOtherPeer();
  TestCaptureRoundTripVerifiesDocument();
  TestCancelledCaptureRejectsSubmission();
  TestRecaptureRearmsCommand();
  TestLivenessIsLoggedAndForwarded();
  TestUserLeaveFailsSession();
  TestAgentLeaveOnlyNotifiesUser();
  TestOnlyAssignedAgentMayAttach();
  TestStalledUserDoesNotBlockAgentOrFailSession();

  std::cout << "vkyc_unit_signaling_hub: pass\n";
  return 0;
}
