#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vkyc::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertLink(Transaction&, const model::LinkRecord&) override;
  std::optional<model::LinkRecord> GetLink(Transaction&, const std::string&) override;
  Result                           UpdateLink(Transaction&, const model::LinkRecord&) override;

  Result                              InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  Result                              UpdateSession(Transaction&, const model::SessionRecord&, uint64_t expected_version) override;
  std::vector<model::SessionRecord>   ListSessions(Transaction&) override;
  std::vector<model::SessionRecord>   ListSessionsInStates(Transaction&, const std::vector<vkyc::v1::SessionState>&) override;

  Result                                   UpsertVerification(Transaction&, const model::VerificationRecord&) override;
  std::optional<model::VerificationRecord> GetVerification(Transaction&, const std::string&, vkyc::v1::DocumentType) override;
  std::vector<model::VerificationRecord>   ListVerifications(Transaction&, const std::string&) override;

  Result                                   AppendBiometricEvents(Transaction&, const std::vector<model::BiometricEventRecord>&) override;
  std::vector<model::BiometricEventRecord> ListBiometricEvents(Transaction&, const std::string&) override;

  Result                                UpsertRecording(Transaction&, const model::RecordingRecord&) override;
  std::optional<model::RecordingRecord> GetRecording(Transaction&, const std::string&) override;
  std::vector<model::RecordingRecord>   ListRecordingsInState(Transaction&, vkyc::v1::RecordingState) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::LinkRecord>    links;
    std::unordered_map<std::string, model::SessionRecord> sessions;

    // key: session_id#document_type
    std::map<std::string, model::VerificationRecord> verifications;

    // per session, ordered by sequence
    std::unordered_map<std::string, std::map<uint64_t, model::BiometricEventRecord>> biometric_events;

    std::unordered_map<std::string, model::RecordingRecord> recordings;
  };

  // Held by a live transaction for its whole lifetime.
  std::mutex write_mutex_;

  std::mutex mutex_;
  State      committed_;
};

} // namespace vkyc::db::memory
