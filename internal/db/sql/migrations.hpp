#pragma once

#include <string>
#include <vector>

#include "internal/db/api/schema_mode.hpp"

namespace chronicle::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and reports which migration
  versions are already recorded in chronicle_schema_migrations.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Empty when the migrations table does not exist yet.
  virtual std::vector<int> AppliedVersions() = 0;

  virtual void RecordVersion(int version) = 0;
};

enum class Dialect {
  kSqlite,
  kPostgres,
};

struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

// Ordered by version.
const std::vector<Migration>& Migrations(Dialect dialect);

/*
  SchemaMode semantics:

    None           - touch nothing
    CreateOnly     - create a fresh schema; refuse to upgrade one that
                     already has migrations recorded
    CreateOrUpdate - apply every pending migration
    CreateAll      - like CreateOrUpdate, but drop and recreate when the
                     database records migrations this build does not know
*/
void ApplySchema(MigrationExecutor& executor, Dialect dialect, SchemaMode mode);

void DropSchema(MigrationExecutor& executor, Dialect dialect);

} // namespace chronicle::db::sql
