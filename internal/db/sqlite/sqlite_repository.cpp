#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>

#include "internal/db/sql/sql_queries.hpp"

namespace vkyc::db::sqlite {

using vkyc::db::ErrorCode;
using vkyc::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }
  explicit operator bool() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::LinkRecord ReadLink(sqlite3_stmt* st) {
  model::LinkRecord r;
  r.token         = ColText(st, 0);
  r.customer_id   = ColText(st, 1);
  r.issued_at_ms  = ColI64(st, 2);
  r.expires_at_ms = ColI64(st, 3);
  r.consumed      = ColI32(st, 4) != 0;
  r.superseded_by = ColText(st, 5);
  r.session_id    = ColText(st, 6);
  return r;
}

model::SessionRecord ReadSession(sqlite3_stmt* st) {
  model::SessionRecord r;
  r.id                   = ColText(st, 0);
  r.link_token           = ColText(st, 1);
  r.customer_id          = ColText(st, 2);
  r.mode                 = static_cast<vkyc::v1::SessionMode>(ColI32(st, 3));
  r.state                = static_cast<vkyc::v1::SessionState>(ColI32(st, 4));
  r.scheduled_at_ms      = ColI64(st, 5);
  r.created_at_ms        = ColI64(st, 6);
  r.started_at_ms        = ColI64(st, 7);
  r.ended_at_ms          = ColI64(st, 8);
  r.termination_reason   = static_cast<vkyc::v1::TerminationReason>(ColI32(st, 9));
  r.termination_detail   = ColText(st, 10);
  r.manual_review        = ColI32(st, 11) != 0;
  r.version              = ColU64(st, 12);
  r.agent_id             = ColText(st, 13);
  r.agent_assigned_at_ms = ColI64(st, 14);
  return r;
}

model::VerificationRecord ReadVerification(sqlite3_stmt* st) {
  model::VerificationRecord r;
  r.session_id        = ColText(st, 0);
  r.document_type     = static_cast<vkyc::v1::DocumentType>(ColI32(st, 1));
  r.fields_json       = ColText(st, 2);
  r.ocr_confidence    = sqlite3_column_double(st, 3);
  r.registry_status   = static_cast<vkyc::v1::RegistryStatus>(ColI32(st, 4));
  r.ocr_attempts      = static_cast<uint32_t>(ColI32(st, 5));
  r.registry_attempts = static_cast<uint32_t>(ColI32(st, 6));
  r.updated_at_ms     = ColI64(st, 7);
  r.detail            = ColText(st, 8);
  return r;
}

model::RecordingRecord ReadRecording(sqlite3_stmt* st) {
  model::RecordingRecord r;
  r.session_id       = ColText(st, 0);
  r.state            = static_cast<vkyc::v1::RecordingState>(ColI32(st, 1));
  r.buffered_ms      = ColU64(st, 2);
  r.cap_reached      = ColI32(st, 3) != 0;
  r.location         = ColText(st, 4);
  r.raw_bytes        = ColU64(st, 5);
  r.compressed_bytes = ColU64(st, 6);
  r.error            = ColText(st, 7);
  r.updated_at_ms    = ColI64(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result SqliteRepository::InsertLink(Transaction& t, const model::LinkRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_LINK);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.token);
  BindText(st.get(), 2, r.customer_id);
  BindI64(st.get(), 3, r.issued_at_ms);
  BindI64(st.get(), 4, r.expires_at_ms);
  BindI32(st.get(), 5, r.consumed ? 1 : 0);
  BindText(st.get(), 6, r.superseded_by);
  BindText(st.get(), 7, r.session_id);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "link token exists");
  return Translate(db, rc);
}

std::optional<model::LinkRecord> SqliteRepository::GetLink(Transaction& t, const std::string& token) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_LINK);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, token);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadLink(st.get());
}

Result SqliteRepository::UpdateLink(Transaction& t, const model::LinkRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_LINK);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.customer_id);
  BindI64(st.get(), 2, r.issued_at_ms);
  BindI64(st.get(), 3, r.expires_at_ms);
  BindI32(st.get(), 4, r.consumed ? 1 : 0);
  BindText(st.get(), 5, r.superseded_by);
  BindText(st.get(), 6, r.session_id);
  BindText(st.get(), 7, r.token);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "link not found");
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_SESSION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.link_token);
  BindText(st.get(), 3, r.customer_id);
  BindI32(st.get(), 4, static_cast<int>(r.mode));
  BindI32(st.get(), 5, static_cast<int>(r.state));
  BindI64(st.get(), 6, r.scheduled_at_ms);
  BindI64(st.get(), 7, r.created_at_ms);
  BindI64(st.get(), 8, r.started_at_ms);
  BindI64(st.get(), 9, r.ended_at_ms);
  BindI32(st.get(), 10, static_cast<int>(r.termination_reason));
  BindText(st.get(), 11, r.termination_detail);
  BindI32(st.get(), 12, r.manual_review ? 1 : 0);
  BindU64(st.get(), 13, r.version);
  BindText(st.get(), 14, r.agent_id);
  BindI64(st.get(), 15, r.agent_assigned_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "session exists");
  return Translate(db, rc);
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SESSION);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadSession(st.get());
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r, uint64_t expected_version) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_SESSION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.link_token);
  BindText(st.get(), 2, r.customer_id);
  BindI32(st.get(), 3, static_cast<int>(r.mode));
  BindI32(st.get(), 4, static_cast<int>(r.state));
  BindI64(st.get(), 5, r.scheduled_at_ms);
  BindI64(st.get(), 6, r.created_at_ms);
  BindI64(st.get(), 7, r.started_at_ms);
  BindI64(st.get(), 8, r.ended_at_ms);
  BindI32(st.get(), 9, static_cast<int>(r.termination_reason));
  BindText(st.get(), 10, r.termination_detail);
  BindI32(st.get(), 11, r.manual_review ? 1 : 0);
  BindU64(st.get(), 12, r.version);
  BindText(st.get(), 13, r.agent_id);
  BindI64(st.get(), 14, r.agent_assigned_at_ms);
  BindText(st.get(), 15, r.id);
  BindU64(st.get(), 16, expected_version);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) > 0) return Result::Ok();

  // Distinguish a missing row from a stale version.
  Statement exists(db, sql::SESSION_EXISTS);
  if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(exists.get(), 1, r.id);
  if (sqlite3_step(exists.get()) == SQLITE_ROW) return Result::Err(ErrorCode::Conflict, "session version changed");
  return Result::Err(ErrorCode::NotFound, "session not found");
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& t) {
  std::vector<model::SessionRecord> out;
  auto*                             db = TX(t).Handle();
  Statement                         st(db, sql::SELECT_ALL_SESSIONS);
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadSession(st.get()));
  }
  return out;
}

std::vector<model::SessionRecord> SqliteRepository::ListSessionsInStates(Transaction& t, const std::vector<vkyc::v1::SessionState>& states) {
  auto all = ListSessions(t);
  all.erase(std::remove_if(all.begin(), all.end(),
                           [&](const model::SessionRecord& r) { return std::find(states.begin(), states.end(), r.state) == states.end(); }),
            all.end());
  return all;
}

// ------------------------------------------------------------------
// Verification results
// ------------------------------------------------------------------

Result SqliteRepository::UpsertVerification(Transaction& t, const model::VerificationRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_VERIFICATION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.session_id);
  BindI32(st.get(), 2, static_cast<int>(r.document_type));
  BindText(st.get(), 3, r.fields_json.empty() ? std::string("{}") : r.fields_json);
  BindDouble(st.get(), 4, r.ocr_confidence);
  BindI32(st.get(), 5, static_cast<int>(r.registry_status));
  BindI32(st.get(), 6, static_cast<int>(r.ocr_attempts));
  BindI32(st.get(), 7, static_cast<int>(r.registry_attempts));
  BindI64(st.get(), 8, r.updated_at_ms);
  BindText(st.get(), 9, r.detail);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::VerificationRecord> SqliteRepository::GetVerification(Transaction& t, const std::string& session_id,
                                                                          vkyc::v1::DocumentType document_type) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_VERIFICATION);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, session_id);
  BindI32(st.get(), 2, static_cast<int>(document_type));
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadVerification(st.get());
}

std::vector<model::VerificationRecord> SqliteRepository::ListVerifications(Transaction& t, const std::string& session_id) {
  std::vector<model::VerificationRecord> out;
  auto*                                  db = TX(t).Handle();
  Statement                              st(db, sql::SELECT_SESSION_VERIFICATIONS);
  if (!st) return out;

  BindText(st.get(), 1, session_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadVerification(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Biometric events
// ------------------------------------------------------------------

Result SqliteRepository::AppendBiometricEvents(Transaction& t, const std::vector<model::BiometricEventRecord>& events) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_BIOMETRIC_EVENT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& event : events) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());

    BindText(st.get(), 1, event.session_id);
    BindU64(st.get(), 2, event.sequence);
    BindI32(st.get(), 3, static_cast<int>(event.kind));
    BindText(st.get(), 4, event.payload_json);
    BindI64(st.get(), 5, event.recorded_at_us);
    BindI64(st.get(), 6, event.client_time_ms);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::BiometricEventRecord> SqliteRepository::ListBiometricEvents(Transaction& t, const std::string& session_id) {
  std::vector<model::BiometricEventRecord> out;
  auto*                                    db = TX(t).Handle();
  Statement                                st(db, sql::SELECT_BIOMETRIC_EVENTS);
  if (!st) return out;

  BindText(st.get(), 1, session_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::BiometricEventRecord r;
    r.session_id     = ColText(st.get(), 0);
    r.sequence       = ColU64(st.get(), 1);
    r.kind           = static_cast<vkyc::v1::BiometricKind>(ColI32(st.get(), 2));
    r.payload_json   = ColText(st.get(), 3);
    r.recorded_at_us = ColI64(st.get(), 4);
    r.client_time_ms = ColI64(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Recordings
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRecording(Transaction& t, const model::RecordingRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_RECORDING);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.session_id);
  BindI32(st.get(), 2, static_cast<int>(r.state));
  BindU64(st.get(), 3, r.buffered_ms);
  BindI32(st.get(), 4, r.cap_reached ? 1 : 0);
  BindText(st.get(), 5, r.location);
  BindU64(st.get(), 6, r.raw_bytes);
  BindU64(st.get(), 7, r.compressed_bytes);
  BindText(st.get(), 8, r.error);
  BindI64(st.get(), 9, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RecordingRecord> SqliteRepository::GetRecording(Transaction& t, const std::string& session_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_RECORDING);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, session_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRecording(st.get());
}

std::vector<model::RecordingRecord> SqliteRepository::ListRecordingsInState(Transaction& t, vkyc::v1::RecordingState state) {
  std::vector<model::RecordingRecord> out;
  auto*                               db = TX(t).Handle();
  Statement                           st(db, sql::SELECT_RECORDINGS_IN_STATE);
  if (!st) return out;

  BindI32(st.get(), 1, static_cast<int>(state));
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRecording(st.get()));
  }
  return out;
}

} // namespace vkyc::db::sqlite
