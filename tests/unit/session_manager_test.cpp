#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using namespace vkyc::v1;
using vkyc::testing::SessionHarness;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestImmediateFlowStartsOnceAndConsumesLink() {
  SessionHarness h;
  const auto     link    = h.links->Issue("cust-1");
  const auto     created = h.sessions->CreateSession(link.token());
  assert(created.state() == SESSION_STATE_CREATED);
  assert(created.version() == 1);
  assert(created.customer_id() == "cust-1");

  const auto chosen = h.sessions->ChooseMode(created.session_id(), SESSION_MODE_IMMEDIATE, std::nullopt);
  assert(chosen.session.state() == SESSION_STATE_READY_TO_START);
  assert(!chosen.scheduled_link.has_value());

  const auto started = h.sessions->BeginSession(created.session_id());
  assert(started.state() == SESSION_STATE_IN_PROGRESS);
  assert(started.has_started_at());
  assert(!started.has_ended_at());

  h.clock->Advance(5s);
  const auto again = h.sessions->BeginSession(created.session_id());
  assert(again.version() == started.version());
  assert(again.started_at().seconds() == started.started_at().seconds());
  assert(h.observer->StartedCount() == 1);

  assert(Throws<vkyc::util::LinkConsumed>([&] { h.sessions->CreateSession(link.token()); }));
  assert(Throws<vkyc::util::LinkConsumed>([&] { h.links->Resolve(link.token()); }));
}

void TestCreateSessionIsIdempotentPerLink() {
  SessionHarness h;
  const auto     link   = h.links->Issue("cust-1");
  const auto     first  = h.sessions->CreateSession(link.token());
  const auto     second = h.sessions->CreateSession(link.token());
  assert(first.session_id() == second.session_id());

  const auto resolved = h.links->Resolve(link.token());
  assert(resolved.session_id() == first.session_id());
  assert(resolved.mode_options_size() == 2);

  h.sessions->ChooseMode(first.session_id(), SESSION_MODE_IMMEDIATE, std::nullopt);
  assert(h.links->Resolve(link.token()).mode_options_size() == 0);
}

void TestModeCanOnlyBeChosenOnce() {
  SessionHarness h;
  const auto     link    = h.links->Issue("cust-1");
  const auto     created = h.sessions->CreateSession(link.token());

  h.sessions->ChooseMode(created.session_id(), SESSION_MODE_IMMEDIATE, std::nullopt);
  // Same choice again is a no-op.
  const auto repeat = h.sessions->ChooseMode(created.session_id(), SESSION_MODE_IMMEDIATE, std::nullopt);
  assert(repeat.session.state() == SESSION_STATE_READY_TO_START);

  assert(Throws<vkyc::util::InvalidTransition>(
      [&] { h.sessions->ChooseMode(created.session_id(), SESSION_MODE_SCHEDULED, h.clock->Now() + 1h); }));
  assert(Throws<vkyc::util::InvalidArgument>(
      [&] { h.sessions->ChooseMode(created.session_id(), SESSION_MODE_UNSPECIFIED, std::nullopt); }));
}

void TestScheduledModeReissuesLinkAndActivatesWhenDue() {
  SessionHarness h;
  const auto     link    = h.links->Issue("cust-1");
  const auto     created = h.sessions->CreateSession(link.token());

  assert(Throws<vkyc::util::InvalidArgument>(
      [&] { h.sessions->ChooseMode(created.session_id(), SESSION_MODE_SCHEDULED, h.clock->Now() - 1s); }));

  const auto when      = h.clock->Now() + 2h;
  const auto scheduled = h.sessions->ChooseMode(created.session_id(), SESSION_MODE_SCHEDULED, when);
  assert(scheduled.session.state() == SESSION_STATE_SCHEDULED);
  assert(scheduled.scheduled_link.has_value());
  assert(scheduled.scheduled_link->token() != link.token());
  assert(scheduled.scheduled_link->session_id() == created.session_id());
  assert(scheduled.session.link_token() == scheduled.scheduled_link->token());

  // The original link is superseded.
  assert(Throws<vkyc::util::LinkConsumed>([&] { h.links->Resolve(link.token()); }));

  assert(Throws<vkyc::util::InvalidTransition>([&] { h.sessions->ActivateScheduled(created.session_id()); }));
  assert(Throws<vkyc::util::InvalidTransition>([&] { h.sessions->BeginSession(created.session_id()); }));

  h.clock->Advance(2h);
  assert(h.sessions->SweepExpired() == 1);
  assert(h.sessions->GetSession(created.session_id()).state() == SESSION_STATE_READY_TO_START);

  const auto started = h.sessions->BeginSession(created.session_id());
  assert(started.state() == SESSION_STATE_IN_PROGRESS);
}

void TestScheduledLinkActivatesOnCreate() {
  SessionHarness h;
  const auto     link      = h.links->Issue("cust-1");
  const auto     created   = h.sessions->CreateSession(link.token());
  const auto     scheduled = h.sessions->ChooseMode(created.session_id(), SESSION_MODE_SCHEDULED, h.clock->Now() + 1h);

  h.clock->Advance(1h);
  const auto resumed = h.sessions->CreateSession(scheduled.scheduled_link->token());
  assert(resumed.session_id() == created.session_id());
  assert(resumed.state() == SESSION_STATE_READY_TO_START);
}

void TestSweepExpiresSessionsWhoseLinkLapsed() {
  SessionHarness h;
  const auto     link    = h.links->Issue("cust-1", std::chrono::milliseconds(60'000));
  const auto     created = h.sessions->CreateSession(link.token());

  assert(Throws<vkyc::util::InvalidTransition>([&] { h.sessions->ExpireSession(created.session_id()); }));
  assert(h.sessions->SweepExpired() == 0);

  h.clock->Advance(61s);
  assert(h.sessions->SweepExpired() == 1);

  const auto expired = h.sessions->GetSession(created.session_id());
  assert(expired.state() == SESSION_STATE_EXPIRED);
  assert(expired.termination_reason() == TERMINATION_REASON_LINK_EXPIRED);
  assert(expired.has_ended_at());
  assert(h.observer->Ended().size() == 1);

  // Terminal states never change.
  assert(Throws<vkyc::util::InvalidTransition>(
      [&] { h.sessions->FailSession(created.session_id(), TERMINATION_REASON_AGENT_REPORTED_ERROR); }));
  assert(h.sessions->SweepExpired() == 0);
}

void TestBeginAfterLinkExpiryExpiresSession() {
  SessionHarness h;
  const auto     link    = h.links->Issue("cust-1", std::chrono::milliseconds(10'000));
  const auto     created = h.sessions->CreateSession(link.token());
  h.sessions->ChooseMode(created.session_id(), SESSION_MODE_IMMEDIATE, std::nullopt);

  h.clock->Advance(10s);
  assert(Throws<vkyc::util::LinkExpired>([&] { h.sessions->BeginSession(created.session_id()); }));
  assert(h.sessions->GetSession(created.session_id()).state() == SESSION_STATE_EXPIRED);
}

void TestFailSessionRules() {
  SessionHarness h;
  const auto     session = h.StartImmediate();

  assert(Throws<vkyc::util::InvalidArgument>(
      [&] { h.sessions->FailSession(session.session_id(), TERMINATION_REASON_UNSPECIFIED); }));
  assert(Throws<vkyc::util::InvalidArgument>(
      [&] { h.sessions->FailSession(session.session_id(), TERMINATION_REASON_COMPLETED); }));

  const auto failed = h.sessions->FailSession(session.session_id(), TERMINATION_REASON_AGENT_REPORTED_ERROR, "camera broken");
  assert(failed.state() == SESSION_STATE_FAILED);
  assert(failed.termination_detail() == "camera broken");
  assert(failed.has_ended_at());

  h.clock->Advance(1s);
  const auto again = h.sessions->FailSession(session.session_id(), TERMINATION_REASON_PEER_LEFT);
  assert(again.version() == failed.version());
  assert(again.termination_reason() == TERMINATION_REASON_AGENT_REPORTED_ERROR);
  assert(again.ended_at().seconds() == failed.ended_at().seconds());
  assert(h.observer->Ended().size() == 1);

  assert(Throws<vkyc::util::NotFound>([&] { h.sessions->GetSession("no-such-session"); }));
}

void TestCompletionRequiresDocumentsAndLiveness() {
  SessionHarness h;
  const auto     session = h.StartImmediate();
  const auto&    id      = session.session_id();

  assert(Throws<vkyc::util::InvalidTransition>([&] { h.sessions->CompleteSession(id); }));

  const auto verifying = h.sessions->RequestVerification(h.Frame(id, DOCUMENT_TYPE_PAN));
  assert(verifying.state() == SESSION_STATE_VERIFYING);
  assert(h.WaitForStatus(id, DOCUMENT_TYPE_PAN, REGISTRY_STATUS_MATCHED));

  assert(Throws<vkyc::util::InvalidArgument>([&] { h.sessions->RequestVerification(h.Frame(id, DOCUMENT_TYPE_PAN)); }));

  h.sessions->RequestVerification(h.Frame(id, DOCUMENT_TYPE_AADHAAR));
  assert(h.WaitForStatus(id, DOCUMENT_TYPE_AADHAAR, REGISTRY_STATUS_MATCHED));

  // Documents are matched but no liveness was observed.
  assert(Throws<vkyc::util::InvalidTransition>([&] { h.sessions->CompleteSession(id); }));

  h.RecordLiveness(id);
  const auto completed = h.sessions->CompleteSession(id);
  assert(completed.state() == SESSION_STATE_COMPLETED);
  assert(completed.termination_reason() == TERMINATION_REASON_COMPLETED);
  assert(completed.has_ended_at());
  assert(!completed.manual_review());

  const auto results = h.sessions->ListVerificationResults(id);
  assert(results.size() == 2);
  for (const auto& result : results) {
    assert(result.fields().at("number") == "ABCDE1234F");
    assert(result.registry_attempts() == 1);
  }

  // Idempotent once completed.
  assert(h.sessions->CompleteSession(id).version() == completed.version());
}

void TestVerificationNeedsLiveSession() {
  SessionHarness h;
  const auto     link    = h.links->Issue("cust-1");
  const auto     created = h.sessions->CreateSession(link.token());
  assert(Throws<vkyc::util::InvalidTransition>(
      [&] { h.sessions->RequestVerification(h.Frame(created.session_id(), DOCUMENT_TYPE_PAN)); }));
}

void TestRegistryMismatchFailsSession() {
  SessionHarness h;
  h.registry->Push(vkyc::verification::RegistryOutcome::kMismatched);
  const auto session = h.StartImmediate();

  h.sessions->RequestVerification(h.Frame(session.session_id(), DOCUMENT_TYPE_PAN));
  assert(h.WaitForState(session.session_id(), SESSION_STATE_FAILED));

  const auto failed = h.sessions->GetSession(session.session_id());
  assert(failed.termination_reason() == TERMINATION_REASON_REGISTRY_MISMATCH);
  assert(h.registry->Calls() == 1);
  assert(h.StatusOf(session.session_id(), DOCUMENT_TYPE_PAN) == REGISTRY_STATUS_MISMATCHED);
}

void TestCapReachedCompletesWhenEverythingIsMet() {
  SessionHarness h;
  const auto     session = h.StartImmediate();
  const auto&    id      = session.session_id();

  h.sessions->RequestVerification(h.Frame(id, DOCUMENT_TYPE_PAN));
  assert(h.WaitForStatus(id, DOCUMENT_TYPE_PAN, REGISTRY_STATUS_MATCHED));
  h.sessions->RequestVerification(h.Frame(id, DOCUMENT_TYPE_AADHAAR));
  assert(h.WaitForStatus(id, DOCUMENT_TYPE_AADHAAR, REGISTRY_STATUS_MATCHED));
  h.RecordLiveness(id);

  h.sessions->OnCapReached(id);
  assert(h.sessions->GetSession(id).state() == SESSION_STATE_COMPLETED);

  // A second cap event for an ended session changes nothing.
  h.sessions->OnCapReached(id);
  assert(h.sessions->GetSession(id).state() == SESSION_STATE_COMPLETED);
}

void TestRecordingFailureOnlyFailsWhileBuffering() {
  SessionHarness h;
  const auto     session = h.StartImmediate();

  h.sessions->OnRecordingFailed(session.session_id(), "compression failed", false);
  assert(h.sessions->GetSession(session.session_id()).state() == SESSION_STATE_IN_PROGRESS);

  h.sessions->OnRecordingFailed(session.session_id(), "media stream lost", true);
  const auto failed = h.sessions->GetSession(session.session_id());
  assert(failed.state() == SESSION_STATE_FAILED);
  assert(failed.termination_reason() == TERMINATION_REASON_RECORDING_FAILURE);
}

void TestRestartFailsOrphanedLiveSessions() {
  SessionHarness h;
  const auto     live    = h.StartImmediate("cust-live");
  const auto     link    = h.links->Issue("cust-waiting");
  const auto     waiting = h.sessions->CreateSession(link.token());

  // A new process over the same store.
  auto restarted = std::make_shared<vkyc::core::SessionManager>(h.repository, h.links, h.biometrics, h.pipeline, h.clock,
                                                                vkyc::core::SessionPolicy{});
  assert(restarted->RecoverAfterRestart() == 1);

  const auto failed = restarted->GetSession(live.session_id());
  assert(failed.state() == SESSION_STATE_FAILED);
  assert(failed.termination_reason() == TERMINATION_REASON_PROCESS_RESTART);
  assert(restarted->GetSession(waiting.session_id()).state() == SESSION_STATE_CREATED);
}

void TestEndedSessionsLeaveTheCache() {
  SessionHarness           h;
  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    ids.push_back(h.StartImmediate("cust-" + std::to_string(i)).session_id());
  }
  assert(h.sessions->TrackedSessions() == 3);

  for (const auto& id : ids) {
    h.sessions->FailSession(id, TERMINATION_REASON_AGENT_REPORTED_ERROR);
  }
  assert(h.sessions->TrackedSessions() == 0);
  // Still readable from the store.
  assert(h.sessions->GetSession(ids.front()).state() == SESSION_STATE_FAILED);
  assert(h.sessions->TrackedSessions() == 0);
}

void TestAgentAcceptsOneSessionAtATime() {
  SessionHarness h;
  const auto     first = h.StartImmediate("cust-1").session_id();
  h.clock->Advance(1s);
  const auto second = h.StartImmediate("cust-2").session_id();

  auto waiting = h.sessions->ListWaitingSessions();
  assert(waiting.size() == 2);
  assert(waiting[0].session_id() == first);

  const auto accepted = h.sessions->AcceptSession(first, "agent-1");
  assert(accepted.agent_id() == "agent-1");
  assert(accepted.has_agent_assigned_at());
  assert(h.sessions->AcceptSession(first, "agent-1").version() == accepted.version());

  assert(Throws<vkyc::util::AgentUnavailable>([&] { h.sessions->AcceptSession(first, "agent-2"); }));
  assert(Throws<vkyc::util::AgentUnavailable>([&] { h.sessions->AcceptSession(second, "agent-1"); }));
  assert(Throws<vkyc::util::InvalidArgument>([&] { h.sessions->AcceptSession(second, ""); }));

  waiting = h.sessions->ListWaitingSessions();
  assert(waiting.size() == 1);
  assert(waiting[0].session_id() == second);

  // Free again once the first session ends.
  h.sessions->FailSession(first, TERMINATION_REASON_AGENT_REPORTED_ERROR);
  assert(h.sessions->AcceptSession(second, "agent-1").agent_id() == "agent-1");
  assert(h.sessions->ListWaitingSessions().empty());
}

void TestDeclineEndsWaitingSession() {
  SessionHarness h;
  const auto     waiting = h.StartImmediate("cust-1").session_id();
  const auto     served  = h.StartImmediate("cust-2").session_id();
  h.sessions->AcceptSession(served, "agent-1");

  const auto declined = h.sessions->DeclineSession(waiting, "agent-2");
  assert(declined.state() == SESSION_STATE_FAILED);
  assert(declined.termination_reason() == TERMINATION_REASON_AGENT_DECLINED);
  assert(h.sessions->DeclineSession(waiting, "agent-2").version() == declined.version());
  const auto ended = h.observer->Ended();
  assert(std::count_if(ended.begin(), ended.end(), [&](const Session& s) { return s.session_id() == waiting; }) == 1);

  assert(Throws<vkyc::util::AgentUnavailable>([&] { h.sessions->DeclineSession(served, "agent-2"); }));
  assert(Throws<vkyc::util::InvalidTransition>([&] { h.sessions->AcceptSession(waiting, "agent-3"); }));
}

} // namespace

int main() {
  TestImmediateFlowStartsOnceAndConsumesLink();
  TestCreateSessionIsIdempotentPerLink();
  TestModeCanOnlyBeChosenOnce();
  TestScheduledModeReissuesLinkAndActivatesWhenDue();
  TestScheduledLinkActivatesOnCreate();
  TestSweepExpiresSessionsWhoseLinkLapsed();
  TestBeginAfterLinkExpiryExpiresSession();
  TestFailSessionRules();
  TestCompletionRequiresDocumentsAndLiveness();
  TestVerificationNeedsLiveSession();
  TestRegistryMismatchFailsSession();
  TestCapReachedCompletesWhenEverythingIsMet();
  TestRecordingFailureOnlyFailsWhileBuffering();
  TestRestartFailsOrphanedLiveSessions();
  TestEndedSessionsLeaveTheCache();
  TestAgentAcceptsOneSessionAtATime();
  TestDeclineEndsWaitingSession();

  std::cout << "vkyc_unit_session_manager: pass\n";
  return 0;
}
