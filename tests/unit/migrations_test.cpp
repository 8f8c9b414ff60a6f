#include "internal/db/sql/migrations.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#if CHRONICLE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/time.hpp"
#endif

namespace {

using chronicle::db::SchemaMode;
using chronicle::db::sql::Dialect;

// Records statements instead of running them.
class RecordingExecutor final : public chronicle::db::sql::MigrationExecutor {
 public:
  void ExecuteSQL(const std::string& sql) override {
    statements.push_back(sql);
    if (sql.rfind("DROP TABLE IF EXISTS chronicle_schema_migrations", 0) == 0) {
      versions.clear();
    }
  }

  std::vector<int> AppliedVersions() override {
    return versions;
  }

  void RecordVersion(int version) override {
    versions.push_back(version);
  }

  std::vector<std::string> statements;
  std::vector<int>         versions;
};

std::size_t KnownVersions() {
  return chronicle::db::sql::Migrations(Dialect::kSqlite).size();
}

void TestMigrationsAreOrderedPerDialect() {
  for (auto dialect : {Dialect::kSqlite, Dialect::kPostgres}) {
    const auto& migrations = chronicle::db::sql::Migrations(dialect);
    assert(!migrations.empty());
    for (std::size_t i = 0; i < migrations.size(); ++i) {
      assert(migrations[i].version == static_cast<int>(i + 1));
      assert(!migrations[i].statements.empty());
    }
  }
  assert(chronicle::db::sql::Migrations(Dialect::kPostgres)[0].statements[2].find("BIGSERIAL") != std::string::npos);
}

void TestNoneTouchesNothing() {
  RecordingExecutor executor;
  chronicle::db::sql::ApplySchema(executor, Dialect::kSqlite, SchemaMode::None);
  assert(executor.statements.empty());
  assert(executor.versions.empty());
}

void TestCreateOrUpdateAppliesOnlyPending() {
  RecordingExecutor executor;
  executor.versions = {1};

  chronicle::db::sql::ApplySchema(executor, Dialect::kSqlite, SchemaMode::CreateOrUpdate);
  assert(executor.versions.size() == KnownVersions());
  assert(std::none_of(executor.statements.begin(), executor.statements.end(),
                      [](const std::string& s) { return s.find("CREATE TABLE") != std::string::npos; }));

  const auto before = executor.statements.size();
  chronicle::db::sql::ApplySchema(executor, Dialect::kSqlite, SchemaMode::CreateOrUpdate);
  assert(executor.statements.size() == before);

  executor.versions.push_back(999);
  bool threw = false;
  try {
    chronicle::db::sql::ApplySchema(executor, Dialect::kSqlite, SchemaMode::CreateOrUpdate);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestCreateOnlyRefusesToUpgrade() {
  RecordingExecutor fresh;
  chronicle::db::sql::ApplySchema(fresh, Dialect::kPostgres, SchemaMode::CreateOnly);
  assert(fresh.versions.size() == chronicle::db::sql::Migrations(Dialect::kPostgres).size());

  // already current: nothing to do
  const auto before = fresh.statements.size();
  chronicle::db::sql::ApplySchema(fresh, Dialect::kPostgres, SchemaMode::CreateOnly);
  assert(fresh.statements.size() == before);

  RecordingExecutor outdated;
  outdated.versions = {1};
  bool threw        = false;
  try {
    chronicle::db::sql::ApplySchema(outdated, Dialect::kSqlite, SchemaMode::CreateOnly);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(outdated.statements.empty());
}

void TestCreateAllRecreatesForeignSchema() {
  RecordingExecutor executor;
  executor.versions = {1, 2, 42};

  chronicle::db::sql::ApplySchema(executor, Dialect::kSqlite, SchemaMode::CreateAll);
  assert(executor.statements.front() == "DROP TABLE IF EXISTS chronicle_events;");
  assert(executor.versions.size() == KnownVersions());
  assert(std::find(executor.versions.begin(), executor.versions.end(), 42) == executor.versions.end());
}

#if CHRONICLE_DB_SQLITE
void TestSqliteSchemaLifecycle() {
  const auto path =
      (std::filesystem::temp_directory_path() / ("chronicle_migrations_" + std::to_string(chronicle::util::ToUnixMillis(chronicle::util::Now())) + ".db"))
          .string();

  {
    auto repo = std::make_shared<chronicle::db::sqlite::SqliteRepository>(std::make_shared<chronicle::db::sqlite::SqliteDB>(path));
    repo->ApplySchema(SchemaMode::CreateOnly);
    repo->ApplySchema(SchemaMode::CreateOrUpdate);

    auto                                 tx = repo->Begin();
    chronicle::db::model::DocumentRecord doc{"chronicle.catalog.v1.User", "u1", R"({"id":"u1"})", "t1", 1};
    assert(repo->InsertDocument(*tx, doc));
    tx->Commit();
  }

  {
    // reopening keeps data; create-only accepts a current schema
    auto repo = std::make_shared<chronicle::db::sqlite::SqliteRepository>(std::make_shared<chronicle::db::sqlite::SqliteDB>(path));
    repo->ApplySchema(SchemaMode::CreateOnly);

    auto tx = repo->Begin();
    assert(repo->GetDocument(*tx, "chronicle.catalog.v1.User", "u1").has_value());
    tx->Rollback();

    repo->DropSchema();
    repo->ApplySchema(SchemaMode::CreateAll);

    auto after = repo->Begin();
    assert(!repo->GetDocument(*after, "chronicle.catalog.v1.User", "u1").has_value());
    after->Rollback();
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}
#endif

} // namespace

int main() {
  TestMigrationsAreOrderedPerDialect();
  TestNoneTouchesNothing();
  TestCreateOrUpdateAppliesOnlyPending();
  TestCreateOnlyRefusesToUpgrade();
  TestCreateAllRecreatesForeignSchema();
#if CHRONICLE_DB_SQLITE
  TestSqliteSchemaLifecycle();
#endif

  std::cout << "chronicle_unit_migrations: pass\n";
  return 0;
}
