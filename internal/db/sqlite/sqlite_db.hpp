#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace vkyc::db::sqlite {

/*
  Owns the single sqlite3 connection of the session store.

  Every thread shares it; TxMutex() admits one transaction at a time.
  The schema version lives in PRAGMA user_version.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  int  SchemaVersion() override;
  void SetSchemaVersion(int version) override;

 private:
  void Configure(bool wal_mode, std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace vkyc::db::sqlite
