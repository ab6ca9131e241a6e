#include "migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace vkyc::db::sql {

using observability::IntField;
using observability::StringField;

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "links and sessions",
       {"CREATE TABLE IF NOT EXISTS vkyc_link (token TEXT PRIMARY KEY, customer_id TEXT NOT NULL, issued_at_ms INTEGER NOT NULL, "
        "expires_at_ms INTEGER NOT NULL, consumed INTEGER NOT NULL DEFAULT 0, superseded_by TEXT NOT NULL DEFAULT '', "
        "session_id TEXT NOT NULL DEFAULT '');",
        "CREATE TABLE IF NOT EXISTS vkyc_session (id TEXT PRIMARY KEY, link_token TEXT NOT NULL, customer_id TEXT NOT NULL, "
        "mode INTEGER NOT NULL, state INTEGER NOT NULL, scheduled_at_ms INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, "
        "started_at_ms INTEGER NOT NULL DEFAULT 0, ended_at_ms INTEGER NOT NULL DEFAULT 0, termination_reason INTEGER NOT NULL DEFAULT 0, "
        "termination_detail TEXT NOT NULL DEFAULT '', manual_review INTEGER NOT NULL DEFAULT 0, version INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS vkyc_session_state_idx ON vkyc_session(state);"}},
      {2,
       "verification, biometrics and recordings",
       {"CREATE TABLE IF NOT EXISTS vkyc_verification (session_id TEXT NOT NULL REFERENCES vkyc_session(id), "
        "document_type INTEGER NOT NULL, fields_json TEXT NOT NULL DEFAULT '{}', ocr_confidence REAL NOT NULL DEFAULT 0, "
        "registry_status INTEGER NOT NULL DEFAULT 0, ocr_attempts INTEGER NOT NULL DEFAULT 0, registry_attempts INTEGER NOT NULL DEFAULT 0, "
        "updated_at_ms INTEGER NOT NULL, detail TEXT NOT NULL DEFAULT '', PRIMARY KEY (session_id, document_type));",
        "CREATE TABLE IF NOT EXISTS vkyc_biometric_event (session_id TEXT NOT NULL, sequence INTEGER NOT NULL, kind INTEGER NOT NULL, "
        "payload_json TEXT NOT NULL, recorded_at_us INTEGER NOT NULL, client_time_ms INTEGER NOT NULL DEFAULT 0, "
        "PRIMARY KEY (session_id, sequence));",
        "CREATE TABLE IF NOT EXISTS vkyc_recording (session_id TEXT PRIMARY KEY, state INTEGER NOT NULL, buffered_ms INTEGER NOT NULL DEFAULT 0, "
        "cap_reached INTEGER NOT NULL DEFAULT 0, location TEXT NOT NULL DEFAULT '', raw_bytes INTEGER NOT NULL DEFAULT 0, "
        "compressed_bytes INTEGER NOT NULL DEFAULT 0, error TEXT NOT NULL DEFAULT '', updated_at_ms INTEGER NOT NULL);"}},
      {3,
       "agent assignment",
       {"ALTER TABLE vkyc_session ADD COLUMN agent_id TEXT NOT NULL DEFAULT '';",
        "ALTER TABLE vkyc_session ADD COLUMN agent_assigned_at_ms INTEGER NOT NULL DEFAULT 0;"}}};
  return kMigrations;
}

int LatestSchemaVersion() {
  const auto& migrations = SchemaMigrations();
  return migrations.empty() ? 0 : migrations.back().version;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  const int stored = executor.SchemaVersion();
  if (!migrations.empty() && stored > migrations.back().version) {
    throw std::runtime_error("database schema version " + std::to_string(stored) + " is newer than supported version " +
                             std::to_string(migrations.back().version));
  }

  int applied = 0;
  for (const auto& migration : migrations) {
    if (migration.version <= stored) {
      continue;
    }

    executor.ExecuteSQL("BEGIN IMMEDIATE;");
    try {
      for (const auto& sql : migration.statements) {
        executor.ExecuteSQL(sql);
      }
      executor.SetSchemaVersion(migration.version);
      executor.ExecuteSQL("COMMIT;");
    } catch (...) {
      executor.ExecuteSQL("ROLLBACK;");
      throw;
    }

    VKYC_LOG_INFO("schema migration applied", {IntField("version", migration.version), StringField("description", migration.description)});
    ++applied;
  }
  return applied;
}

} // namespace vkyc::db::sql
