#include "pg_repository.hpp"

#include <algorithm>
#include <limits>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"

namespace chronicle::db::postgres {

namespace {

// BIGINT columns; open upper bounds saturate
int64_t Clamp(uint64_t v) {
  return static_cast<int64_t>(std::min<uint64_t>(v, static_cast<uint64_t>(std::numeric_limits<int64_t>::max())));
}

std::optional<int64_t> Limit(std::optional<uint64_t> v) {
  if (!v.has_value()) return std::nullopt;
  return Clamp(*v);
}

model::StreamRecord ReadStreamRow(const pqxx::row& row) {
  model::StreamRecord r;
  r.id             = row[0].c_str();
  r.aggregate_type = row[1].c_str();
  r.version        = row[2].as<uint64_t>();
  r.created_at_ms  = row[3].as<uint64_t>();
  r.updated_at_ms  = row[4].as<uint64_t>();
  return r;
}

model::EventRecord ReadEventRow(const pqxx::row& row) {
  model::EventRecord e;
  e.sequence       = row[0].as<uint64_t>();
  e.stream_id      = row[1].c_str();
  e.version        = row[2].as<uint64_t>();
  e.type           = row[3].c_str();
  e.data           = row[4].c_str();
  e.recorded_at_ms = row[5].as<uint64_t>();
  return e;
}

model::DocumentRecord ReadDocumentRow(const pqxx::row& row) {
  model::DocumentRecord d;
  d.type          = row[0].c_str();
  d.id            = row[1].c_str();
  d.data          = row[2].c_str();
  d.version_token = row[3].c_str();
  d.updated_at_ms = row[4].as<uint64_t>();
  return d;
}

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& work) : work_(work) {
  }

  void ExecuteSQL(const std::string& sql) override {
    work_.exec(sql);
  }

  std::vector<int> AppliedVersions() override {
    std::vector<int> out;
    auto exists = work_.exec("SELECT to_regclass('chronicle_schema_migrations') IS NOT NULL;");
    if (!exists[0][0].as<bool>()) return out;

    for (const auto& row : work_.exec("SELECT version FROM chronicle_schema_migrations ORDER BY version;")) {
      out.push_back(row[0].as<int>());
    }
    return out;
  }

  void RecordVersion(int version) override {
    work_.exec_params("INSERT INTO chronicle_schema_migrations(version,applied_at_ms) VALUES($1,$2);", version,
                      Clamp(util::ToUnixMillis(util::Now())));
  }

 private:
  pqxx::work& work_;
};

// serializes concurrent schema changes from several processes
constexpr int64_t kSchemaLockKey = 0x6368726f6e69636cLL;

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ---------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------

void PgRepository::ApplySchema(SchemaMode mode) {
  if (mode == SchemaMode::None) return;

  PgTransaction tx(pool_);
  tx.Work().exec_params("SELECT pg_advisory_xact_lock($1);", kSchemaLockKey);
  PgMigrationExecutor executor(tx.Work());
  sql::ApplySchema(executor, sql::Dialect::kPostgres, mode);
  tx.Commit();
}

void PgRepository::DropSchema() {
  PgTransaction tx(pool_);
  tx.Work().exec_params("SELECT pg_advisory_xact_lock($1);", kSchemaLockKey);
  PgMigrationExecutor executor(tx.Work());
  sql::DropSchema(executor, sql::Dialect::kPostgres);
  tx.Commit();
}

// ---------------------------------------------------------------------
// Streams
// ---------------------------------------------------------------------

std::optional<model::StreamRecord> PgRepository::GetStream(Transaction& t, const std::string& stream_id) {
  auto res = TX(t).Work().exec_prepared("get_stream", stream_id);
  if (res.empty()) return std::nullopt;
  return ReadStreamRow(res[0]);
}

std::optional<model::StreamRecord> PgRepository::LockStream(Transaction& t, const std::string& stream_id) {
  auto res = TX(t).Work().exec_prepared("lock_stream", stream_id);
  if (res.empty()) return std::nullopt;
  return ReadStreamRow(res[0]);
}

std::vector<model::StreamRecord> PgRepository::ListStreams(Transaction& t, const std::string& aggregate_type) {
  auto res = aggregate_type.empty()
                 ? TX(t).Work().exec("SELECT id,aggregate_type,version,created_at_ms,updated_at_ms FROM chronicle_streams ORDER BY id ASC;")
                 : TX(t).Work().exec_params(
                       "SELECT id,aggregate_type,version,created_at_ms,updated_at_ms FROM chronicle_streams "
                       "WHERE aggregate_type=$1 ORDER BY id ASC;",
                       aggregate_type);

  std::vector<model::StreamRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadStreamRow(row));
  return out;
}

Result PgRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
  try {
    // ON CONFLICT keeps the transaction usable after a duplicate
    auto res = TX(t).Work().exec_params(
        "INSERT INTO chronicle_streams(id,aggregate_type,version,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT (id) DO NOTHING;",
        r.id, r.aggregate_type, Clamp(r.version), Clamp(r.created_at_ms), Clamp(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "stream " + r.id + " already exists");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateStreamVersion(Transaction& t, const std::string& stream_id, uint64_t expected_version, uint64_t new_version,
                                         uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("update_stream_version", stream_id, Clamp(expected_version), Clamp(new_version),
                                          Clamp(updated_at_ms));
    if (res.affected_rows() == 0) {
      if (TX(t).Work().exec_prepared("get_stream", stream_id).empty()) {
        return Result::Err(ErrorCode::NotFound, "stream " + stream_id + " not found");
      }
      return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " is not at version " + std::to_string(expected_version));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteStream(Transaction& t, const std::string& stream_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM chronicle_events WHERE stream_id=$1;", stream_id);
    TX(t).Work().exec_params("DELETE FROM chronicle_streams WHERE id=$1;", stream_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ---------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------

Result PgRepository::AppendEvents(Transaction& t, std::vector<model::EventRecord>& events) {
  const uint64_t now = util::ToUnixMillis(util::Now());

  try {
    for (auto& e : events) {
      auto res         = TX(t).Work().exec_prepared("insert_event", e.stream_id, Clamp(e.version), e.type, e.data, Clamp(now));
      e.sequence       = res[0][0].as<uint64_t>();
      e.recorded_at_ms = now;
    }
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::Conflict, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadStreamEvents(Transaction& t, const std::string& stream_id, uint64_t from_version,
                                                               uint64_t to_version, std::optional<uint64_t> max_events) {
  // LIMIT NULL is LIMIT ALL
  auto res = TX(t).Work().exec_params(
      "SELECT seq_id,stream_id,version,type,data::text,recorded_at_ms FROM chronicle_events "
      "WHERE stream_id=$1 AND version>=$2 AND version<=$3 ORDER BY version ASC LIMIT $4;",
      stream_id, Clamp(from_version), Clamp(to_version), Limit(max_events));

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadEventRow(row));
  return out;
}

std::vector<model::EventRecord> PgRepository::ReadAllEvents(Transaction& t, uint64_t after_sequence, std::optional<uint64_t> max_events) {
  auto res = TX(t).Work().exec_params(
      "SELECT seq_id,stream_id,version,type,data::text,recorded_at_ms FROM chronicle_events "
      "WHERE seq_id>$1 ORDER BY seq_id ASC LIMIT $2;",
      Clamp(after_sequence), Limit(max_events));

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadEventRow(row));
  return out;
}

Result PgRepository::DeleteAllEventData(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM chronicle_events;");
    TX(t).Work().exec("DELETE FROM chronicle_streams;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ---------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------

std::optional<model::DocumentRecord> PgRepository::GetDocument(Transaction& t, const std::string& type, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_document", type, id);
  if (res.empty()) return std::nullopt;
  return ReadDocumentRow(res[0]);
}

std::optional<model::DocumentRecord> PgRepository::LockDocument(Transaction& t, const std::string& type, const std::string& id) {
  // the advisory lock also covers documents that do not exist yet
  TX(t).Work().exec_prepared("lock_document_key", type, id);
  auto res = TX(t).Work().exec_prepared("lock_document", type, id);
  if (res.empty()) return std::nullopt;
  return ReadDocumentRow(res[0]);
}

std::vector<model::DocumentRecord> PgRepository::ListDocuments(Transaction& t, const std::string& type) {
  auto res = TX(t).Work().exec_params(
      "SELECT type,id,data::text,version_token,updated_at_ms FROM chronicle_documents WHERE type=$1 ORDER BY id ASC;", type);

  std::vector<model::DocumentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDocumentRow(row));
  return out;
}

Result PgRepository::InsertDocument(Transaction& t, const model::DocumentRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO chronicle_documents(type,id,data,version_token,updated_at_ms) VALUES($1,$2,$3::jsonb,$4,$5) "
        "ON CONFLICT (type, id) DO NOTHING;",
        r.type, r.id, r.data, r.version_token, Clamp(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, r.type + "/" + r.id + " already exists");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r, const std::string& expected_token) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE chronicle_documents SET data=$3::jsonb,version_token=$4,updated_at_ms=$5 WHERE type=$1 AND id=$2 AND version_token=$6;",
        r.type, r.id, r.data, r.version_token, Clamp(r.updated_at_ms), expected_token);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::Conflict, r.type + "/" + r.id + " version token mismatch");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_document", r.type, r.id, r.data, r.version_token, Clamp(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDocument(Transaction& t, const std::string& type, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM chronicle_documents WHERE type=$1 AND id=$2;", type, id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, type + "/" + id + " not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteAllDocuments(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM chronicle_documents;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace chronicle::db::postgres
