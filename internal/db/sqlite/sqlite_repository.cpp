#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"

namespace chronicle::db::sqlite {

using chronicle::db::ErrorCode;
using chronicle::db::Result;

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Read paths have no Result to report through; storage errors surface as
// exceptions and are mapped to StorageUnavailable by the callers.
Stmt PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Stmt(st);
}

void ThrowStep(sqlite3* db, int rc) {
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// sqlite integers are signed 64-bit; open upper bounds saturate
void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    constexpr uint64_t kMax = static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max());
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(std::min(v, kMax)));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::StreamRecord ReadStreamRow(sqlite3_stmt* st) {
    model::StreamRecord r;
    r.id             = ColText(st, 0);
    r.aggregate_type = ColText(st, 1);
    r.version        = ColU64(st, 2);
    r.created_at_ms  = ColU64(st, 3);
    r.updated_at_ms  = ColU64(st, 4);
    return r;
}

model::EventRecord ReadEventRow(sqlite3_stmt* st) {
    model::EventRecord e;
    e.sequence       = ColU64(st, 0);
    e.stream_id      = ColText(st, 1);
    e.version        = ColU64(st, 2);
    e.type           = ColText(st, 3);
    e.data           = ColText(st, 4);
    e.recorded_at_ms = ColU64(st, 5);
    return e;
}

model::DocumentRecord ReadDocumentRow(sqlite3_stmt* st) {
    model::DocumentRecord d;
    d.type          = ColText(st, 0);
    d.id            = ColText(st, 1);
    d.data          = ColText(st, 2);
    d.version_token = ColText(st, 3);
    d.updated_at_ms = ColU64(st, 4);
    return d;
}

/*
  Runs migrations on the connection of an open transaction so a failed
  migration leaves no half-applied schema behind.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
public:
    explicit SqliteMigrationExecutor(SqliteTransaction& tx) : tx_(tx) {}

    void ExecuteSQL(const std::string& sql) override {
        char* err = nullptr;
        int   rc  = sqlite3_exec(tx_.Handle(), sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "sqlite exec failed";
            sqlite3_free(err);
            throw std::runtime_error("sqlite migration: " + msg);
        }
    }

    std::vector<int> AppliedVersions() override {
        std::vector<int> out;
        auto* db = tx_.Handle();

        auto exists = PrepareOrThrow(db, "SELECT 1 FROM sqlite_master WHERE type='table' AND name='chronicle_schema_migrations';");
        int  rc     = sqlite3_step(exists.get());
        ThrowStep(db, rc);
        if (rc != SQLITE_ROW) return out;

        auto st = PrepareOrThrow(db, "SELECT version FROM chronicle_schema_migrations ORDER BY version;");
        while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
            out.push_back(sqlite3_column_int(st.get(), 0));
        }
        ThrowStep(db, rc);
        return out;
    }

    void RecordVersion(int version) override {
        auto* db = tx_.Handle();
        auto  st = PrepareOrThrow(db, "INSERT INTO chronicle_schema_migrations(version,applied_at_ms) VALUES(?,?);");
        sqlite3_bind_int(st.get(), 1, version);
        BindU64(st.get(), 2, util::ToUnixMillis(util::Now()));
        ThrowStep(db, sqlite3_step(st.get()));
    }

private:
    SqliteTransaction& tx_;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Schema
// ------------------------------------------------------------------

void SqliteRepository::ApplySchema(SchemaMode mode) {
    if (mode == SchemaMode::None) return;

    SqliteTransaction       tx(db_);
    SqliteMigrationExecutor executor(tx);
    sql::ApplySchema(executor, sql::Dialect::kSqlite, mode);
    tx.Commit();
}

void SqliteRepository::DropSchema() {
    SqliteTransaction       tx(db_);
    SqliteMigrationExecutor executor(tx);
    sql::DropSchema(executor, sql::Dialect::kSqlite);
    tx.Commit();
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

std::optional<model::StreamRecord>
SqliteRepository::GetStream(Transaction& t, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT id,aggregate_type,version,created_at_ms,updated_at_ms FROM chronicle_streams WHERE id=?;");
    BindText(st.get(), 1, stream_id);

    int rc = sqlite3_step(st.get());
    ThrowStep(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadStreamRow(st.get());
}

std::optional<model::StreamRecord>
SqliteRepository::LockStream(Transaction& t, const std::string& stream_id) {
    // BEGIN IMMEDIATE already holds the database write lock
    return GetStream(t, stream_id);
}

std::vector<model::StreamRecord>
SqliteRepository::ListStreams(Transaction& t, const std::string& aggregate_type) {
    auto* db = TX(t).Handle();

    std::string sql = "SELECT id,aggregate_type,version,created_at_ms,updated_at_ms FROM chronicle_streams";
    if (!aggregate_type.empty()) sql += " WHERE aggregate_type=?";
    sql += " ORDER BY id ASC;";

    auto st = PrepareOrThrow(db, sql.c_str());
    if (!aggregate_type.empty()) BindText(st.get(), 1, aggregate_type);

    std::vector<model::StreamRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadStreamRow(st.get()));
    }
    ThrowStep(db, rc);
    return out;
}

Result SqliteRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO chronicle_streams(id,aggregate_type,version,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(raw, 1, r.id);
    BindText(raw, 2, r.aggregate_type);
    BindU64(raw, 3, r.version);
    BindU64(raw, 4, r.created_at_ms);
    BindU64(raw, 5, r.updated_at_ms);

    int rc = sqlite3_step(raw);
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "stream " + r.id + " already exists");
    return Translate(db, rc);
}

Result SqliteRepository::UpdateStreamVersion(Transaction& t, const std::string& stream_id, uint64_t expected_version,
                                             uint64_t new_version, uint64_t updated_at_ms) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE chronicle_streams SET version=?,updated_at_ms=? WHERE id=? AND version=?;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindU64(raw, 1, new_version);
    BindU64(raw, 2, updated_at_ms);
    BindText(raw, 3, stream_id);
    BindU64(raw, 4, expected_version);

    int rc = sqlite3_step(raw);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) {
        if (!GetStream(t, stream_id))
            return Result::Err(ErrorCode::NotFound, "stream " + stream_id + " not found");
        return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " is not at version " + std::to_string(expected_version));
    }
    return Result::Ok();
}

Result SqliteRepository::DeleteStream(Transaction& t, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    for (const char* sql : {"DELETE FROM chronicle_events WHERE stream_id=?;", "DELETE FROM chronicle_streams WHERE id=?;"}) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        Stmt st(raw);

        BindText(raw, 1, stream_id);
        int rc = sqlite3_step(raw);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvents(Transaction& t, std::vector<model::EventRecord>& events) {
    auto* db = TX(t).Handle();

    const char* ins_sql =
        "INSERT INTO chronicle_events(stream_id,version,type,data,recorded_at_ms) VALUES(?,?,?,?,?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, ins_sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt ins_st(raw);

    const uint64_t now = util::ToUnixMillis(util::Now());

    for (auto& e : events) {
        sqlite3_reset(raw);
        sqlite3_clear_bindings(raw);

        BindText(raw, 1, e.stream_id);
        BindU64(raw, 2, e.version);
        BindText(raw, 3, e.type);
        BindText(raw, 4, e.data);
        BindU64(raw, 5, now);

        int rc = sqlite3_step(raw);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            return Result::Err(ErrorCode::Conflict,
                               "stream " + e.stream_id + " already has version " + std::to_string(e.version));
        }
        if (rc != SQLITE_DONE) return Translate(db, rc);

        e.sequence       = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
        e.recorded_at_ms = now;
    }

    return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ReadStreamEvents(
    Transaction& t, const std::string& stream_id, uint64_t from_version, uint64_t to_version,
    std::optional<uint64_t> max_events) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT seq_id,stream_id,version,type,data,recorded_at_ms FROM chronicle_events "
        "WHERE stream_id=? AND version>=? AND version<=? ORDER BY version ASC";
    if (max_events.has_value()) sql += " LIMIT ?";
    sql += ";";

    auto st = PrepareOrThrow(db, sql.c_str());
    BindText(st.get(), 1, stream_id);
    BindU64(st.get(), 2, from_version);
    BindU64(st.get(), 3, to_version);
    if (max_events.has_value()) BindU64(st.get(), 4, *max_events);

    std::vector<model::EventRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadEventRow(st.get()));
    }
    ThrowStep(db, rc);
    return out;
}

std::vector<model::EventRecord> SqliteRepository::ReadAllEvents(
    Transaction& t, uint64_t after_sequence, std::optional<uint64_t> max_events) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT seq_id,stream_id,version,type,data,recorded_at_ms FROM chronicle_events "
        "WHERE seq_id>? ORDER BY seq_id ASC";
    if (max_events.has_value()) sql += " LIMIT ?";
    sql += ";";

    auto st = PrepareOrThrow(db, sql.c_str());
    BindU64(st.get(), 1, after_sequence);
    if (max_events.has_value()) BindU64(st.get(), 2, *max_events);

    std::vector<model::EventRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadEventRow(st.get()));
    }
    ThrowStep(db, rc);
    return out;
}

Result SqliteRepository::DeleteAllEventData(Transaction& t) {
    auto* db = TX(t).Handle();

    char* err = nullptr;
    int   rc  = sqlite3_exec(db, "DELETE FROM chronicle_events; DELETE FROM chronicle_streams;", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        sqlite3_free(err);
        return Translate(db, rc);
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

std::optional<model::DocumentRecord>
SqliteRepository::GetDocument(Transaction& t, const std::string& type, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT type,id,data,version_token,updated_at_ms FROM chronicle_documents WHERE type=? AND id=?;");
    BindText(st.get(), 1, type);
    BindText(st.get(), 2, id);

    int rc = sqlite3_step(st.get());
    ThrowStep(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadDocumentRow(st.get());
}

std::optional<model::DocumentRecord>
SqliteRepository::LockDocument(Transaction& t, const std::string& type, const std::string& id) {
    // BEGIN IMMEDIATE already holds the database write lock
    return GetDocument(t, type, id);
}

std::vector<model::DocumentRecord>
SqliteRepository::ListDocuments(Transaction& t, const std::string& type) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT type,id,data,version_token,updated_at_ms FROM chronicle_documents WHERE type=? ORDER BY id ASC;");
    BindText(st.get(), 1, type);

    std::vector<model::DocumentRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadDocumentRow(st.get()));
    }
    ThrowStep(db, rc);
    return out;
}

Result SqliteRepository::InsertDocument(Transaction& t, const model::DocumentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO chronicle_documents(type,id,data,version_token,updated_at_ms) VALUES(?,?,?,?,?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(raw, 1, r.type);
    BindText(raw, 2, r.id);
    BindText(raw, 3, r.data);
    BindText(raw, 4, r.version_token);
    BindU64(raw, 5, r.updated_at_ms);

    int rc = sqlite3_step(raw);
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, r.type + "/" + r.id + " already exists");
    return Translate(db, rc);
}

Result SqliteRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r, const std::string& expected_token) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE chronicle_documents SET data=?,version_token=?,updated_at_ms=? WHERE type=? AND id=? AND version_token=?;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(raw, 1, r.data);
    BindText(raw, 2, r.version_token);
    BindU64(raw, 3, r.updated_at_ms);
    BindText(raw, 4, r.type);
    BindText(raw, 5, r.id);
    BindText(raw, 6, expected_token);

    int rc = sqlite3_step(raw);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::Conflict, r.type + "/" + r.id + " version token mismatch");
    return Result::Ok();
}

Result SqliteRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO chronicle_documents(type,id,data,version_token,updated_at_ms) VALUES(?,?,?,?,?) "
        "ON CONFLICT(type,id) DO UPDATE SET data=excluded.data, version_token=excluded.version_token, "
        "updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(raw, 1, r.type);
    BindText(raw, 2, r.id);
    BindText(raw, 3, r.data);
    BindText(raw, 4, r.version_token);
    BindU64(raw, 5, r.updated_at_ms);

    return Translate(db, sqlite3_step(raw));
}

Result SqliteRepository::DeleteDocument(Transaction& t, const std::string& type, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM chronicle_documents WHERE type=? AND id=?;";
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(raw, 1, type);
    BindText(raw, 2, id);

    int rc = sqlite3_step(raw);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, type + "/" + id + " not found");
    return Result::Ok();
}

Result SqliteRepository::DeleteAllDocuments(Transaction& t) {
    auto* db = TX(t).Handle();

    char* err = nullptr;
    int   rc  = sqlite3_exec(db, "DELETE FROM chronicle_documents;", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        sqlite3_free(err);
        return Translate(db, rc);
    }
    return Result::Ok();
}

} // namespace chronicle::db::sqlite
