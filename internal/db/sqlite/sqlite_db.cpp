#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace vkyc::db::sqlite {

using observability::BoolField;
using observability::StringField;

namespace {

bool IsInMemoryPath(const std::string& path) {
  return path.empty() || path == ":memory:" || path.rfind("file::memory:", 0) == 0;
}

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("sqlite: cannot create directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  const bool in_memory = IsInMemoryPath(path_);
  if (!in_memory) {
    EnsureParentDirectory(path_);
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
  if (sqlite3_open_v2(in_memory ? ":memory:" : path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = "sqlite: open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  // journal_mode=WAL has no effect on an in-memory database
  Configure(wal_mode && !in_memory, busy_timeout);

  VKYC_LOG_INFO("session store opened", {StringField("path", in_memory ? ":memory:" : path_), BoolField("wal", wal_mode && !in_memory)});
}

SqliteDB::~SqliteDB() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = "sqlite: " + std::string(err ? err : sqlite3_errmsg(db_));
    sqlite3_free(err);
    throw std::runtime_error(msg + " [" + sql.substr(0, 48) + "]");
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite: user_version: ") + sqlite3_errmsg(db_));
  }

  int version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(bool wal_mode, std::chrono::milliseconds busy_timeout) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite: busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace vkyc::db::sqlite
