#pragma once

namespace vkyc::db::sql {

/*
  Canonical SQL used by the SQL backends.

  IMPORTANT:
  Written in the SQLite dialect with positional ? parameters.
*/

// links

static constexpr const char* INSERT_LINK =
    "INSERT INTO vkyc_link(token,customer_id,issued_at_ms,expires_at_ms,consumed,superseded_by,session_id)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LINK =
    "SELECT token,customer_id,issued_at_ms,expires_at_ms,consumed,superseded_by,session_id"
    " FROM vkyc_link WHERE token=?;";

static constexpr const char* UPDATE_LINK =
    "UPDATE vkyc_link SET customer_id=?,issued_at_ms=?,expires_at_ms=?,consumed=?,superseded_by=?,session_id=?"
    " WHERE token=?;";

// sessions

#define VKYC_SESSION_COLUMNS                                                                                                        \
  "id,link_token,customer_id,mode,state,scheduled_at_ms,created_at_ms,started_at_ms,ended_at_ms,termination_reason,"                \
  "termination_detail,manual_review,version,agent_id,agent_assigned_at_ms"

static constexpr const char* INSERT_SESSION = "INSERT INTO vkyc_session(" VKYC_SESSION_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SESSION = "SELECT " VKYC_SESSION_COLUMNS " FROM vkyc_session WHERE id=?;";

static constexpr const char* SELECT_ALL_SESSIONS = "SELECT " VKYC_SESSION_COLUMNS " FROM vkyc_session ORDER BY created_at_ms;";

static constexpr const char* UPDATE_SESSION =
    "UPDATE vkyc_session SET link_token=?,customer_id=?,mode=?,state=?,scheduled_at_ms=?,created_at_ms=?,started_at_ms=?,"
    "ended_at_ms=?,termination_reason=?,termination_detail=?,manual_review=?,version=?,agent_id=?,agent_assigned_at_ms=?"
    " WHERE id=? AND version=?;";

static constexpr const char* SESSION_EXISTS = "SELECT 1 FROM vkyc_session WHERE id=?;";

#undef VKYC_SESSION_COLUMNS

// verification results

static constexpr const char* UPSERT_VERIFICATION =
    "INSERT INTO vkyc_verification(session_id,document_type,fields_json,ocr_confidence,registry_status,ocr_attempts,"
    "registry_attempts,updated_at_ms,detail) VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(session_id,document_type) DO UPDATE SET fields_json=excluded.fields_json,"
    "ocr_confidence=excluded.ocr_confidence,registry_status=excluded.registry_status,ocr_attempts=excluded.ocr_attempts,"
    "registry_attempts=excluded.registry_attempts,updated_at_ms=excluded.updated_at_ms,detail=excluded.detail;";

static constexpr const char* SELECT_VERIFICATION =
    "SELECT session_id,document_type,fields_json,ocr_confidence,registry_status,ocr_attempts,registry_attempts,updated_at_ms,detail"
    " FROM vkyc_verification WHERE session_id=? AND document_type=?;";

static constexpr const char* SELECT_SESSION_VERIFICATIONS =
    "SELECT session_id,document_type,fields_json,ocr_confidence,registry_status,ocr_attempts,registry_attempts,updated_at_ms,detail"
    " FROM vkyc_verification WHERE session_id=? ORDER BY document_type;";

// biometric events

static constexpr const char* INSERT_BIOMETRIC_EVENT =
    "INSERT INTO vkyc_biometric_event(session_id,sequence,kind,payload_json,recorded_at_us,client_time_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_BIOMETRIC_EVENTS =
    "SELECT session_id,sequence,kind,payload_json,recorded_at_us,client_time_ms"
    " FROM vkyc_biometric_event WHERE session_id=? ORDER BY sequence;";

// recordings

static constexpr const char* UPSERT_RECORDING =
    "INSERT INTO vkyc_recording(session_id,state,buffered_ms,cap_reached,location,raw_bytes,compressed_bytes,error,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(session_id) DO UPDATE SET state=excluded.state,buffered_ms=excluded.buffered_ms,"
    "cap_reached=excluded.cap_reached,location=excluded.location,raw_bytes=excluded.raw_bytes,"
    "compressed_bytes=excluded.compressed_bytes,error=excluded.error,updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_RECORDING =
    "SELECT session_id,state,buffered_ms,cap_reached,location,raw_bytes,compressed_bytes,error,updated_at_ms"
    " FROM vkyc_recording WHERE session_id=?;";

static constexpr const char* SELECT_RECORDINGS_IN_STATE =
    "SELECT session_id,state,buffered_ms,cap_reached,location,raw_bytes,compressed_bytes,error,updated_at_ms"
    " FROM vkyc_recording WHERE state=?;";

} // namespace vkyc::db::sql
