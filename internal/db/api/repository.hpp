#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/biometric_event_record.hpp"
#include "internal/db/model/link_record.hpp"
#include "internal/db/model/recording_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/verification_record.hpp"

namespace vkyc::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateSession is a compare-and-set on version

  The DB is the source of truth for:
    links
    sessions
    verification results
    biometric events
    recordings
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Links
  // ---------------------------------------------------------------------

  virtual Result InsertLink(Transaction&, const model::LinkRecord&) = 0;

  virtual std::optional<model::LinkRecord> GetLink(Transaction&, const std::string& token) = 0;

  virtual Result UpdateLink(Transaction&, const model::LinkRecord&) = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  // Conflict unless the stored version equals expected_version.
  virtual Result UpdateSession(Transaction&, const model::SessionRecord&, uint64_t expected_version) = 0;

  virtual std::vector<model::SessionRecord> ListSessions(Transaction&) = 0;

  virtual std::vector<model::SessionRecord> ListSessionsInStates(Transaction&, const std::vector<vkyc::v1::SessionState>& states) = 0;

  // ---------------------------------------------------------------------
  // Verification results
  // ---------------------------------------------------------------------

  virtual Result UpsertVerification(Transaction&, const model::VerificationRecord&) = 0;

  virtual std::optional<model::VerificationRecord> GetVerification(Transaction&, const std::string& session_id,
                                                                   vkyc::v1::DocumentType document_type) = 0;

  virtual std::vector<model::VerificationRecord> ListVerifications(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Biometric events (append-only)
  // ---------------------------------------------------------------------

  virtual Result AppendBiometricEvents(Transaction&, const std::vector<model::BiometricEventRecord>& events) = 0;

  // Ordered by sequence.
  virtual std::vector<model::BiometricEventRecord> ListBiometricEvents(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Recordings
  // ---------------------------------------------------------------------

  virtual Result UpsertRecording(Transaction&, const model::RecordingRecord&) = 0;

  virtual std::optional<model::RecordingRecord> GetRecording(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::RecordingRecord> ListRecordingsInState(Transaction&, vkyc::v1::RecordingState state) = 0;
};

} // namespace vkyc::db
