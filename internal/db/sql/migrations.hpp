#pragma once

#include <string>
#include <vector>

namespace vkyc::db::sql {

/*
  Versioned schema migrations.

  A backend exposes its stored schema version and plain statement execution;
  RunMigrations applies every migration newer than the stored version, each
  one in its own transaction together with the version bump.
*/

struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual int  SchemaVersion()               = 0;
  virtual void SetSchemaVersion(int version) = 0;
};

// Ascending by version.
const std::vector<Migration>& SchemaMigrations();

int LatestSchemaVersion();

// Returns the number of migrations applied. Throws if the stored version is
// newer than this build knows about.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

} // namespace vkyc::db::sql
