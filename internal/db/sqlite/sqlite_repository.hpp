#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace chronicle::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  void ApplySchema(SchemaMode mode) override;
  void DropSchema() override;

  std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& stream_id) override;
  std::optional<model::StreamRecord> LockStream(Transaction&, const std::string& stream_id) override;
  std::vector<model::StreamRecord> ListStreams(Transaction&, const std::string& aggregate_type) override;
  Result InsertStream(Transaction&, const model::StreamRecord&) override;
  Result UpdateStreamVersion(Transaction&, const std::string& stream_id, uint64_t expected_version, uint64_t new_version,
                             uint64_t updated_at_ms) override;
  Result DeleteStream(Transaction&, const std::string& stream_id) override;

  Result AppendEvents(Transaction&, std::vector<model::EventRecord>& events) override;
  std::vector<model::EventRecord> ReadStreamEvents(Transaction&, const std::string& stream_id, uint64_t from_version,
                                                   uint64_t to_version, std::optional<uint64_t> max_events) override;
  std::vector<model::EventRecord> ReadAllEvents(Transaction&, uint64_t after_sequence, std::optional<uint64_t> max_events) override;
  Result DeleteAllEventData(Transaction&) override;

  std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string& type, const std::string& id) override;
  std::optional<model::DocumentRecord> LockDocument(Transaction&, const std::string& type, const std::string& id) override;
  std::vector<model::DocumentRecord> ListDocuments(Transaction&, const std::string& type) override;
  Result InsertDocument(Transaction&, const model::DocumentRecord&) override;
  Result UpdateDocument(Transaction&, const model::DocumentRecord&, const std::string& expected_token) override;
  Result UpsertDocument(Transaction&, const model::DocumentRecord&) override;
  Result DeleteDocument(Transaction&, const std::string& type, const std::string& id) override;
  Result DeleteAllDocuments(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
