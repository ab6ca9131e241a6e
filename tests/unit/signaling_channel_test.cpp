#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/signaling/signal_validation.hpp"
#include "internal/signaling/signaling_channel.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using namespace vkyc::v1;
using vkyc::signaling::SignalingChannel;
using vkyc::testing::CapturingSink;
using vkyc::testing::StallingSink;
using vkyc::testing::WaitFor;

SignalEnvelope Offer(const std::string& payload) {
  SignalEnvelope envelope;
  envelope.mutable_call_setup()->set_kind(CALL_SETUP_KIND_OFFER);
  envelope.mutable_call_setup()->set_payload(payload);
  return envelope;
}

SignalEnvelope Capture(DocumentType document_type, bool cancel = false) {
  SignalEnvelope envelope;
  envelope.mutable_capture_command()->set_document_type(document_type);
  envelope.mutable_capture_command()->set_cancel(cancel);
  return envelope;
}

vkyc::util::TimePoint T0() {
  return vkyc::util::FromUnixMillis(1'700'000'000'000);
}

void TestMailboxFlushesInOrderOnAttach() {
  SignalingChannel channel("s1", 30s, 16);
  channel.Send(PEER_ROLE_AGENT, Offer("1"), T0());
  channel.Send(PEER_ROLE_AGENT, Offer("2"), T0());
  channel.Send(PEER_ROLE_AGENT, Offer("3"), T0());
  assert(channel.MailboxDepth(PEER_ROLE_AGENT) == 3);

  auto agent = std::make_shared<CapturingSink>();
  assert(!channel.Attach(PEER_ROLE_AGENT, agent, T0()));
  channel.Send(PEER_ROLE_AGENT, Offer("4"), T0());

  const auto received = agent->Received();
  assert(received.size() == 4);
  for (std::size_t i = 0; i < received.size(); ++i) {
    assert(received[i].call_setup().payload() == std::to_string(i + 1));
  }
  assert(channel.MailboxDepth(PEER_ROLE_AGENT) == 0);
}

void TestBrokenSinkKeepsMessagesForRedelivery() {
  SignalingChannel channel("s1", 30s, 16);
  auto             agent = std::make_shared<CapturingSink>();
  channel.Attach(PEER_ROLE_AGENT, agent, T0());

  agent->Break();
  channel.Send(PEER_ROLE_AGENT, Offer("lost-link"), T0());
  assert(!channel.IsConnected(PEER_ROLE_AGENT));
  assert(channel.MailboxDepth(PEER_ROLE_AGENT) == 1);

  auto again = std::make_shared<CapturingSink>();
  assert(channel.Attach(PEER_ROLE_AGENT, again, T0() + 1s));
  assert(again->Received().size() == 1);
  assert(again->Received()[0].call_setup().payload() == "lost-link");
}

void TestMailboxDropsOldestWhenFull() {
  SignalingChannel channel("s1", 30s, 2);
  channel.Send(PEER_ROLE_USER, Offer("a"), T0());
  channel.Send(PEER_ROLE_USER, Offer("b"), T0());
  channel.Send(PEER_ROLE_USER, Offer("c"), T0());
  assert(channel.MailboxDepth(PEER_ROLE_USER) == 2);

  auto user = std::make_shared<CapturingSink>();
  channel.Attach(PEER_ROLE_USER, user, T0());
  const auto received = user->Received();
  assert(received[0].call_setup().payload() == "b");
  assert(received[1].call_setup().payload() == "c");
}

void TestCaptureArmedOnlyAfterDelivery() {
  SignalingChannel channel("s1", 30s, 16);
  channel.Send(PEER_ROLE_USER, Capture(DOCUMENT_TYPE_PAN), T0());
  // Still in the mailbox: the user never saw it.
  assert(!channel.ConsumeCapture(DOCUMENT_TYPE_PAN));

  auto user = std::make_shared<CapturingSink>();
  channel.Attach(PEER_ROLE_USER, user, T0());
  assert(channel.ConsumeCapture(DOCUMENT_TYPE_PAN));
  assert(!channel.ConsumeCapture(DOCUMENT_TYPE_PAN));

  channel.RestoreCapture(DOCUMENT_TYPE_PAN);
  assert(channel.ConsumeCapture(DOCUMENT_TYPE_PAN));
}

void TestCancelDropsQueuedCommand() {
  SignalingChannel channel("s1", 30s, 16);
  channel.Send(PEER_ROLE_USER, Capture(DOCUMENT_TYPE_AADHAAR), T0());
  channel.CancelCapture(DOCUMENT_TYPE_AADHAAR);
  assert(channel.MailboxDepth(PEER_ROLE_USER) == 0);

  auto user = std::make_shared<CapturingSink>();
  channel.Attach(PEER_ROLE_USER, user, T0());
  channel.Send(PEER_ROLE_USER, Capture(DOCUMENT_TYPE_AADHAAR), T0());
  channel.CancelCapture(DOCUMENT_TYPE_AADHAAR);
  assert(!channel.ConsumeCapture(DOCUMENT_TYPE_AADHAAR));
}

void TestGracePeriodTracksUnexpectedDetach() {
  SignalingChannel channel("s1", 30s, 16);
  auto             user  = std::make_shared<CapturingSink>();
  auto             agent = std::make_shared<CapturingSink>();
  channel.Attach(PEER_ROLE_USER, user, T0());
  channel.Attach(PEER_ROLE_AGENT, agent, T0());

  // A stale sink cannot detach the current one.
  CapturingSink stranger;
  channel.Detach(PEER_ROLE_USER, &stranger, false, T0());
  assert(channel.IsConnected(PEER_ROLE_USER));

  channel.Detach(PEER_ROLE_USER, user.get(), false, T0());
  assert(agent->CountNotices(NOTICE_KIND_PEER_DISCONNECTED) == 1);
  assert(!channel.GraceExpired(T0() + 29s).has_value());
  assert(channel.GraceExpired(T0() + 30s) == PEER_ROLE_USER);

  channel.Attach(PEER_ROLE_USER, std::make_shared<CapturingSink>(), T0() + 5s);
  assert(!channel.GraceExpired(T0() + 1h).has_value());

  // Expected detach never starts a grace period.
  channel.Detach(PEER_ROLE_AGENT, agent.get(), true, T0());
  assert(!channel.GraceExpired(T0() + 1h).has_value());
}

void TestCloseSendsFinalNoticeAndRejectsAttach() {
  SignalingChannel channel("s1", 30s, 16);
  auto             user = std::make_shared<CapturingSink>();
  channel.Attach(PEER_ROLE_USER, user, T0());

  channel.Close(vkyc::signaling::MakeNotice(NOTICE_KIND_SESSION_ENDED, "done"));
  assert(channel.Closed());
  assert(user->Closed());
  assert(user->CountNotices(NOTICE_KIND_SESSION_ENDED) == 1);

  channel.Send(PEER_ROLE_USER, Offer("late"), T0());
  assert(user->Received().size() == 1);

  bool rejected = false;
  try {
    channel.Attach(PEER_ROLE_AGENT, std::make_shared<CapturingSink>(), T0());
  } catch (const vkyc::util::SessionNotActive&) {
    rejected = true;
  }
  assert(rejected);
}

void TestStalledPeerHoldsUpOnlyItsOwnDirection() {
  SignalingChannel channel("s1", 30s, 16);
  auto             user  = std::make_shared<StallingSink>();
  auto             agent = std::make_shared<CapturingSink>();
  channel.Attach(PEER_ROLE_USER, user, T0());
  channel.Attach(PEER_ROLE_AGENT, agent, T0());

  std::thread sender([&] { channel.Send(PEER_ROLE_USER, Offer("1"), T0()); });
  assert(WaitFor([&] { return user->Stalled(); }));

  // Queued behind the stalled write instead of waiting for it.
  channel.Send(PEER_ROLE_USER, Offer("2"), T0());
  assert(channel.MailboxDepth(PEER_ROLE_USER) == 1);

  channel.Send(PEER_ROLE_AGENT, Offer("to-agent"), T0());
  assert(agent->Received().size() == 1);

  channel.Close(vkyc::signaling::MakeNotice(NOTICE_KIND_SESSION_ENDED, "done"));
  assert(agent->Closed());
  assert(!user->Closed());

  user->Release();
  sender.join();
  const auto received = user->Received();
  assert(received.size() == 3);
  assert(received[0].call_setup().payload() == "1");
  assert(received[1].call_setup().payload() == "2");
  assert(received[2].notice().kind() == NOTICE_KIND_SESSION_ENDED);
  assert(user->Closed());
}

void TestValidationRejectsMalformedVariants() {
  const vkyc::signaling::ValidationLimits limits{16, 8};
  auto rejects = [&](const SignalEnvelope& envelope, PeerRole sender) {
    try {
      vkyc::signaling::ValidateInbound(envelope, sender, limits);
    } catch (const vkyc::util::InvalidMessage&) {
      return true;
    }
    return false;
  };

  assert(rejects(SignalEnvelope{}, PEER_ROLE_USER));
  assert(rejects(Capture(DOCUMENT_TYPE_PAN), PEER_ROLE_USER));
  assert(!rejects(Capture(DOCUMENT_TYPE_PAN), PEER_ROLE_AGENT));
  assert(rejects(Capture(DOCUMENT_TYPE_UNSPECIFIED), PEER_ROLE_AGENT));
  assert(rejects(Offer("way-too-long-payload"), PEER_ROLE_AGENT));
  assert(rejects(vkyc::signaling::MakeNotice(NOTICE_KIND_ERROR, "x"), PEER_ROLE_AGENT));

  SignalEnvelope submission;
  submission.mutable_capture_submission()->set_document_type(DOCUMENT_TYPE_PAN);
  assert(rejects(submission, PEER_ROLE_USER));
  submission.mutable_capture_submission()->set_image("img");
  assert(!rejects(submission, PEER_ROLE_USER));
  assert(rejects(submission, PEER_ROLE_AGENT));
  submission.mutable_capture_submission()->set_image(std::string(17, 'x'));
  assert(rejects(submission, PEER_ROLE_USER));

  SignalEnvelope liveness;
  liveness.mutable_liveness_event()->set_kind(BIOMETRIC_KIND_BLINK);
  liveness.mutable_liveness_event()->set_payload_json("[1]");
  assert(rejects(liveness, PEER_ROLE_USER));
  liveness.mutable_liveness_event()->set_payload_json("{}");
  assert(!rejects(liveness, PEER_ROLE_USER));

  SignalEnvelope heartbeat;
  heartbeat.mutable_heartbeat();
  assert(!rejects(heartbeat, PEER_ROLE_USER));
  assert(rejects(heartbeat, PEER_ROLE_UNSPECIFIED));
}

} // namespace

int main() {
  TestMailboxFlushesInOrderOnAttach();
  TestBrokenSinkKeepsMessagesForRedelivery();
  TestMailboxDropsOldestWhenFull();
  TestCaptureArmedOnlyAfterDelivery();
  TestCancelDropsQueuedCommand();
  TestGracePeriodTracksUnexpectedDetach();
  TestCloseSendsFinalNoticeAndRejectsAttach();
  TestStalledPeerHoldsUpOnlyItsOwnDirection();
  TestValidationRejectsMalformedVariants();

  std::cout << "vkyc_unit_signaling_channel: pass\n";
  return 0;
}
