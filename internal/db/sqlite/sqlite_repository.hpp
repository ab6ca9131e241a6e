#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vkyc::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace vkyc::db::sqlite
