#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/schema_mode.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/stream_record.hpp"

namespace chronicle::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - (stream_id, version) is unique in the event table
  - Document updates compare-and-swap the version token atomically
    with the data

  The DB is the source of truth for:
    event streams
    stream versions
    documents (plain and projected)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Schema
  // ---------------------------------------------------------------------

  virtual void ApplySchema(SchemaMode mode) = 0;

  virtual void DropSchema() = 0;

  // ---------------------------------------------------------------------
  // Streams
  // ---------------------------------------------------------------------

  virtual std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& stream_id) = 0;

  // Same as GetStream but holds the stream row until the transaction ends.
  virtual std::optional<model::StreamRecord> LockStream(Transaction&, const std::string& stream_id) = 0;

  virtual std::vector<model::StreamRecord> ListStreams(Transaction&, const std::string& aggregate_type) = 0;

  virtual Result InsertStream(Transaction&, const model::StreamRecord&) = 0;

  // Conflict when the stored version is not expected_version.
  virtual Result UpdateStreamVersion(Transaction&, const std::string& stream_id, uint64_t expected_version, uint64_t new_version,
                                     uint64_t updated_at_ms) = 0;

  virtual Result DeleteStream(Transaction&, const std::string& stream_id) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Assigns sequence and recorded_at_ms on each record.
  virtual Result AppendEvents(Transaction&, std::vector<model::EventRecord>& events) = 0;

  virtual std::vector<model::EventRecord> ReadStreamEvents(Transaction&, const std::string& stream_id, uint64_t from_version,
                                                           uint64_t to_version, std::optional<uint64_t> max_events) = 0;

  virtual std::vector<model::EventRecord> ReadAllEvents(Transaction&, uint64_t after_sequence, std::optional<uint64_t> max_events) = 0;

  virtual Result DeleteAllEventData(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Documents
  // ---------------------------------------------------------------------

  virtual std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string& type, const std::string& id) = 0;

  // Same as GetDocument but excludes other writers of (type, id) until the
  // transaction ends, whether or not the document exists yet.
  virtual std::optional<model::DocumentRecord> LockDocument(Transaction&, const std::string& type, const std::string& id) = 0;

  virtual std::vector<model::DocumentRecord> ListDocuments(Transaction&, const std::string& type) = 0;

  // AlreadyExists when (type, id) is taken.
  virtual Result InsertDocument(Transaction&, const model::DocumentRecord&) = 0;

  // Conflict unless the stored token equals expected_token.
  virtual Result UpdateDocument(Transaction&, const model::DocumentRecord&, const std::string& expected_token) = 0;

  virtual Result UpsertDocument(Transaction&, const model::DocumentRecord&) = 0;

  virtual Result DeleteDocument(Transaction&, const std::string& type, const std::string& id) = 0;

  virtual Result DeleteAllDocuments(Transaction&) = 0;
};

} // namespace chronicle::db
