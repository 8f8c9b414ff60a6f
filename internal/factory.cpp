#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if CHRONICLE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CHRONICLE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace chronicle::factory {

std::shared_ptr<db::Repository> BuildRepository(const chronicle::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CHRONICLE_DB_SQLITE
    CHRONICLE_LOG_INFO("Opening sqlite database", {observability::StringField("path", database.sqlite().path())});
    auto sqlite_db = util::GuardStorage(database.sqlite().path(), [&] { return std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path()); });
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CHRONICLE_DB_POSTGRES
    const auto& pg = database.postgres();
    CHRONICLE_LOG_INFO("Using postgres database", {observability::IntField("max_connections", pg.max_connections())});
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? 16 : pg.max_connections());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CHRONICLE_LOG_INFO("Using in-memory database");
  return std::make_shared<db::memory::MemoryRepository>();
}

db::SchemaMode ToSchemaMode(chronicle::runtime::config::SchemaMode mode) {
  switch (mode) {
    case chronicle::runtime::config::SCHEMA_MODE_CREATE_ALL:
      return db::SchemaMode::CreateAll;
    case chronicle::runtime::config::SCHEMA_MODE_CREATE_OR_UPDATE:
      return db::SchemaMode::CreateOrUpdate;
    case chronicle::runtime::config::SCHEMA_MODE_CREATE_ONLY:
      return db::SchemaMode::CreateOnly;
    default:
      return db::SchemaMode::None;
  }
}

std::shared_ptr<core::Store> Build(const chronicle::runtime::config::RuntimeConfig& config, core::StoreOptions options) {
  if (config.events().fetch_page_size() > 0) {
    options.fetch_page_size = config.events().fetch_page_size();
  }

  auto store = std::make_shared<core::Store>(BuildRepository(config), std::move(options));
  store->ApplySchema(ToSchemaMode(config.database().auto_create()));
  return store;
}

} // namespace chronicle::factory
