#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace vkyc::db::memory {

namespace {

std::string VerificationKey(const std::string& session_id, vkyc::v1::DocumentType document_type) {
  return session_id + "#" + std::to_string(static_cast<int>(document_type));
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result MemoryRepository::InsertLink(Transaction& t, const model::LinkRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.links.contains(r.token)) return Result::Err(ErrorCode::AlreadyExists, "link token exists");
  s.links[r.token] = r;
  return Result::Ok();
}

std::optional<model::LinkRecord> MemoryRepository::GetLink(Transaction& t, const std::string& token) {
  const auto& s  = TX(t).View();
  auto        it = s.links.find(token);
  if (it == s.links.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateLink(Transaction& t, const model::LinkRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.links.contains(r.token)) return Result::Err(ErrorCode::NotFound, "link not found");
  s.links[r.token] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "session exists");
  s.sessions[r.id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.id);
  if (it == s.sessions.end()) return Result::Err(ErrorCode::NotFound, "session not found");
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "session version changed");
  it->second = r;
  return Result::Ok();
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  records.reserve(s.sessions.size());
  for (const auto& [_, record] : s.sessions) {
    records.push_back(record);
  }
  return records;
}

std::vector<model::SessionRecord> MemoryRepository::ListSessionsInStates(Transaction& t, const std::vector<vkyc::v1::SessionState>& states) {
  std::vector<model::SessionRecord> records;
  for (const auto& [_, record] : TX(t).View().sessions) {
    if (std::find(states.begin(), states.end(), record.state) != states.end()) {
      records.push_back(record);
    }
  }
  return records;
}

// ------------------------------------------------------------------
// Verification results
// ------------------------------------------------------------------

Result MemoryRepository::UpsertVerification(Transaction& t, const model::VerificationRecord& r) {
  TX(t).Mutable().verifications[VerificationKey(r.session_id, r.document_type)] = r;
  return Result::Ok();
}

std::optional<model::VerificationRecord> MemoryRepository::GetVerification(Transaction& t, const std::string& session_id,
                                                                          vkyc::v1::DocumentType document_type) {
  const auto& s  = TX(t).View();
  auto        it = s.verifications.find(VerificationKey(session_id, document_type));
  if (it == s.verifications.end()) return std::nullopt;
  return it->second;
}

std::vector<model::VerificationRecord> MemoryRepository::ListVerifications(Transaction& t, const std::string& session_id) {
  std::vector<model::VerificationRecord> out;
  for (const auto& [_, record] : TX(t).View().verifications) {
    if (record.session_id == session_id) out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Biometric events
// ------------------------------------------------------------------

Result MemoryRepository::AppendBiometricEvents(Transaction& t, const std::vector<model::BiometricEventRecord>& events) {
  auto& s = TX(t).Mutable();
  for (const auto& event : events) {
    auto& per_session = s.biometric_events[event.session_id];
    if (per_session.contains(event.sequence)) {
      return Result::Err(ErrorCode::ConstraintViolation, "duplicate biometric event sequence");
    }
    per_session.emplace(event.sequence, event);
  }
  return Result::Ok();
}

std::vector<model::BiometricEventRecord> MemoryRepository::ListBiometricEvents(Transaction& t, const std::string& session_id) {
  std::vector<model::BiometricEventRecord> out;
  const auto&                              s  = TX(t).View();
  auto                                     it = s.biometric_events.find(session_id);
  if (it == s.biometric_events.end()) return out;
  out.reserve(it->second.size());
  for (const auto& [_, event] : it->second) {
    out.push_back(event);
  }
  return out;
}

// ------------------------------------------------------------------
// Recordings
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRecording(Transaction& t, const model::RecordingRecord& r) {
  TX(t).Mutable().recordings[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::RecordingRecord> MemoryRepository::GetRecording(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.recordings.find(session_id);
  if (it == s.recordings.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RecordingRecord> MemoryRepository::ListRecordingsInState(Transaction& t, vkyc::v1::RecordingState state) {
  std::vector<model::RecordingRecord> out;
  for (const auto& [_, record] : TX(t).View().recordings) {
    if (record.state == state) out.push_back(record);
  }
  return out;
}

} // namespace vkyc::db::memory
