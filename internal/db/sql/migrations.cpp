#include "internal/db/sql/migrations.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace chronicle::db::sql {

namespace {

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "event streams, events and documents",
       {"CREATE TABLE IF NOT EXISTS chronicle_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS chronicle_streams (id TEXT PRIMARY KEY, aggregate_type TEXT NOT NULL, version INTEGER NOT NULL, "
        "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS chronicle_events (seq_id INTEGER PRIMARY KEY AUTOINCREMENT, stream_id TEXT NOT NULL REFERENCES "
        "chronicle_streams(id), version INTEGER NOT NULL, type TEXT NOT NULL, data TEXT NOT NULL, recorded_at_ms INTEGER NOT NULL, "
        "UNIQUE(stream_id, version));",
        "CREATE TABLE IF NOT EXISTS chronicle_documents (type TEXT NOT NULL, id TEXT NOT NULL, data TEXT NOT NULL, version_token TEXT NOT NULL, "
        "updated_at_ms INTEGER NOT NULL, PRIMARY KEY (type, id));"}},
      {2,
       "stream listing by aggregate type",
       {"CREATE INDEX IF NOT EXISTS chronicle_streams_aggregate_type_idx ON chronicle_streams(aggregate_type, id);"}},
  };
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "event streams, events and documents",
       {"CREATE TABLE IF NOT EXISTS chronicle_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);",
        "CREATE TABLE IF NOT EXISTS chronicle_streams (id TEXT PRIMARY KEY, aggregate_type TEXT NOT NULL, version BIGINT NOT NULL, "
        "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
        "CREATE TABLE IF NOT EXISTS chronicle_events (seq_id BIGSERIAL PRIMARY KEY, stream_id TEXT NOT NULL REFERENCES chronicle_streams(id), "
        "version BIGINT NOT NULL, type TEXT NOT NULL, data JSONB NOT NULL, recorded_at_ms BIGINT NOT NULL, UNIQUE(stream_id, version));",
        "CREATE TABLE IF NOT EXISTS chronicle_documents (type TEXT NOT NULL, id TEXT NOT NULL, data JSONB NOT NULL, version_token TEXT NOT NULL, "
        "updated_at_ms BIGINT NOT NULL, PRIMARY KEY (type, id));"}},
      {2,
       "stream listing by aggregate type",
       {"CREATE INDEX IF NOT EXISTS chronicle_streams_aggregate_type_idx ON chronicle_streams(aggregate_type, id);"}},
  };
  return kMigrations;
}

void RunPending(MigrationExecutor& executor, Dialect dialect, const std::vector<int>& applied) {
  for (const auto& migration : Migrations(dialect)) {
    if (std::find(applied.begin(), applied.end(), migration.version) != applied.end()) {
      continue;
    }
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.RecordVersion(migration.version);
    CHRONICLE_LOG_INFO("Applied schema migration",
                       {observability::IntField("version", migration.version), observability::StringField("description", migration.description)});
  }
}

bool HasUnknownVersions(Dialect dialect, const std::vector<int>& applied) {
  const auto& known = Migrations(dialect);
  return std::any_of(applied.begin(), applied.end(), [&](int version) {
    return std::none_of(known.begin(), known.end(), [&](const Migration& m) { return m.version == version; });
  });
}

} // namespace

const std::vector<Migration>& Migrations(Dialect dialect) {
  return dialect == Dialect::kPostgres ? PostgresMigrations() : SqliteMigrations();
}

void ApplySchema(MigrationExecutor& executor, Dialect dialect, SchemaMode mode) {
  if (mode == SchemaMode::None) {
    return;
  }

  auto applied = executor.AppliedVersions();

  switch (mode) {
    case SchemaMode::None:
      return;

    case SchemaMode::CreateOnly:
      if (!applied.empty()) {
        if (applied.size() != Migrations(dialect).size() || HasUnknownVersions(dialect, applied)) {
          throw std::runtime_error("schema mode create-only: existing schema differs from this build and will not be updated");
        }
        return;
      }
      RunPending(executor, dialect, applied);
      return;

    case SchemaMode::CreateOrUpdate:
      if (HasUnknownVersions(dialect, applied)) {
        throw std::runtime_error("schema mode create-or-update: database records migrations unknown to this build");
      }
      RunPending(executor, dialect, applied);
      return;

    case SchemaMode::CreateAll:
      if (HasUnknownVersions(dialect, applied)) {
        CHRONICLE_LOG_WARN("Schema does not match this build; dropping and recreating");
        DropSchema(executor, dialect);
        applied.clear();
      }
      RunPending(executor, dialect, applied);
      return;
  }
}

void DropSchema(MigrationExecutor& executor, Dialect) {
  // dependents first
  executor.ExecuteSQL("DROP TABLE IF EXISTS chronicle_events;");
  executor.ExecuteSQL("DROP TABLE IF EXISTS chronicle_streams;");
  executor.ExecuteSQL("DROP TABLE IF EXISTS chronicle_documents;");
  executor.ExecuteSQL("DROP TABLE IF EXISTS chronicle_schema_migrations;");
  CHRONICLE_LOG_INFO("Dropped chronicle schema");
}

} // namespace chronicle::db::sql
