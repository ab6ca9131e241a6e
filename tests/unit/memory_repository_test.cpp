#include "internal/db/memory/memory_repository.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using namespace vkyc::v1;
using vkyc::db::ErrorCode;
using vkyc::db::memory::MemoryRepository;
namespace model = vkyc::db::model;

model::SessionRecord Session(const std::string& id, SessionState state) {
  model::SessionRecord record;
  record.id            = id;
  record.link_token    = "TOKEN" + id;
  record.customer_id   = "cust-" + id;
  record.state         = state;
  record.created_at_ms = 1'700'000'000'000;
  record.version       = 1;
  return record;
}

model::BiometricEventRecord Event(const std::string& session_id, uint64_t sequence) {
  model::BiometricEventRecord event;
  event.session_id     = session_id;
  event.sequence       = sequence;
  event.kind           = BIOMETRIC_KIND_BLINK;
  event.payload_json   = "{}";
  event.recorded_at_us = static_cast<int64_t>(sequence);
  return event;
}

void TestCommitMakesWritesVisible() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, Session("s1", SESSION_STATE_CREATED)));
    // Reads inside the transaction see its writes.
    assert(repo.GetSession(*tx, "s1").has_value());
    tx->Commit();
    assert(tx->IsCommitted());
  }

  auto tx = repo.Begin();
  assert(repo.GetSession(*tx, "s1")->customer_id == "cust-s1");
  assert(repo.InsertSession(*tx, Session("s1", SESSION_STATE_CREATED)).code == ErrorCode::AlreadyExists);
}

void TestUncommittedWritesAreDiscarded() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    repo.InsertSession(*tx, Session("s1", SESSION_STATE_CREATED));
  }
  {
    auto tx = repo.Begin();
    repo.InsertSession(*tx, Session("s2", SESSION_STATE_CREATED));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetSession(*tx, "s1").has_value());
  assert(!repo.GetSession(*tx, "s2").has_value());
}

void TestUpdateSessionIsCompareAndSet() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    repo.InsertSession(*tx, Session("s1", SESSION_STATE_CREATED));
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto current = *repo.GetSession(*tx, "s1");
  auto next    = current;
  next.state   = SESSION_STATE_IN_PROGRESS;
  next.version = current.version + 1;
  assert(repo.UpdateSession(*tx, next, current.version));

  // A writer holding the old version loses.
  auto stale  = current;
  stale.state = SESSION_STATE_EXPIRED;
  assert(repo.UpdateSession(*tx, stale, current.version).code == ErrorCode::Conflict);
  assert(repo.UpdateSession(*tx, Session("missing", SESSION_STATE_CREATED), 1).code == ErrorCode::NotFound);
  tx->Commit();

  auto check = repo.Begin();
  assert(repo.GetSession(*check, "s1")->state == SESSION_STATE_IN_PROGRESS);
  assert(repo.GetSession(*check, "s1")->version == 2);
}

void TestListSessionsInStates() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  repo.InsertSession(*tx, Session("a", SESSION_STATE_SCHEDULED));
  repo.InsertSession(*tx, Session("b", SESSION_STATE_IN_PROGRESS));
  repo.InsertSession(*tx, Session("c", SESSION_STATE_COMPLETED));
  repo.InsertSession(*tx, Session("d", SESSION_STATE_VERIFYING));

  assert(repo.ListSessions(*tx).size() == 4);
  const auto live = repo.ListSessionsInStates(*tx, {SESSION_STATE_IN_PROGRESS, SESSION_STATE_VERIFYING});
  assert(live.size() == 2);
  for (const auto& record : live) {
    assert(record.id == "b" || record.id == "d");
  }
}

void TestBiometricEventsAreOrderedAndAppendOnly() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.AppendBiometricEvents(*tx, {Event("s1", 3), Event("s1", 1), Event("s2", 1), Event("s1", 2)}));
    tx->Commit();
  }
  {
    // One duplicate fails the whole batch.
    auto tx = repo.Begin();
    assert(repo.AppendBiometricEvents(*tx, {Event("s1", 4), Event("s1", 2)}).code == ErrorCode::ConstraintViolation);
  }

  auto       tx     = repo.Begin();
  const auto events = repo.ListBiometricEvents(*tx, "s1");
  assert(events.size() == 3);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence == i + 1);
  }
  assert(repo.ListBiometricEvents(*tx, "none").empty());
}

void TestVerificationAndRecordingUpserts() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  model::VerificationRecord pan;
  pan.session_id      = "s1";
  pan.document_type   = DOCUMENT_TYPE_PAN;
  pan.registry_status = REGISTRY_STATUS_PENDING;
  repo.UpsertVerification(*tx, pan);
  pan.registry_status = REGISTRY_STATUS_MATCHED;
  repo.UpsertVerification(*tx, pan);

  model::VerificationRecord aadhaar = pan;
  aadhaar.document_type             = DOCUMENT_TYPE_AADHAAR;
  repo.UpsertVerification(*tx, aadhaar);

  assert(repo.ListVerifications(*tx, "s1").size() == 2);
  assert(repo.GetVerification(*tx, "s1", DOCUMENT_TYPE_PAN)->registry_status == REGISTRY_STATUS_MATCHED);
  assert(!repo.GetVerification(*tx, "s2", DOCUMENT_TYPE_PAN).has_value());

  model::RecordingRecord recording;
  recording.session_id = "s1";
  recording.state      = RECORDING_STATE_BUFFERING;
  repo.UpsertRecording(*tx, recording);
  recording.state = RECORDING_STATE_FINALIZING;
  repo.UpsertRecording(*tx, recording);

  assert(repo.ListRecordingsInState(*tx, RECORDING_STATE_BUFFERING).empty());
  assert(repo.ListRecordingsInState(*tx, RECORDING_STATE_FINALIZING).size() == 1);
}

void TestTransactionsAreSerialized() {
  MemoryRepository  repo;
  std::atomic<bool> second_began{false};

  auto        first = repo.Begin();
  std::thread other([&] {
    auto tx = repo.Begin();
    second_began = true;
    // The first commit is visible once this one starts.
    assert(repo.GetSession(*tx, "s1").has_value());
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!second_began);
  repo.InsertSession(*first, Session("s1", SESSION_STATE_CREATED));
  first->Commit();

  other.join();
  assert(second_began);
}

} // namespace

int main() {
  TestCommitMakesWritesVisible();
  TestUncommittedWritesAreDiscarded();
  TestUpdateSessionIsCompareAndSet();
  TestListSessionsInStates();
  TestBiometricEventsAreOrderedAndAppendOnly();
  TestVerificationAndRecordingUpserts();
  TestTransactionsAreSerialized();

  std::cout << "vkyc_unit_memory_repository: pass\n";
  return 0;
}
