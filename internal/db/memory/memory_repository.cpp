#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace chronicle::db::memory {

MemoryRepository::MemoryRepository(std::chrono::milliseconds busy_timeout) : busy_timeout_(busy_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// No schema objects to manage in memory.
void MemoryRepository::ApplySchema(SchemaMode) {
}

void MemoryRepository::DropSchema() {
  MemoryTransaction tx(*this);
  tx.Mutable() = State{};
  tx.Commit();
}

// ---------------------------------------------------------------------
// Streams
// ---------------------------------------------------------------------

std::optional<model::StreamRecord> MemoryRepository::GetStream(Transaction& t, const std::string& stream_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.streams.find(stream_id);
  if (it == s.streams.end()) return std::nullopt;
  return it->second;
}

std::optional<model::StreamRecord> MemoryRepository::LockStream(Transaction& t, const std::string& stream_id) {
  // the transaction already holds the repository write lock
  return GetStream(t, stream_id);
}

std::vector<model::StreamRecord> MemoryRepository::ListStreams(Transaction& t, const std::string& aggregate_type) {
  std::vector<model::StreamRecord> out;
  for (const auto& [_, stream] : TX(t).View().streams) {
    if (aggregate_type.empty() || stream.aggregate_type == aggregate_type) out.push_back(stream);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.streams.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "stream " + r.id + " already exists");
  s.streams[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateStreamVersion(Transaction& t, const std::string& stream_id, uint64_t expected_version, uint64_t new_version,
                                             uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.streams.find(stream_id);
  if (it == s.streams.end()) return Result::Err(ErrorCode::NotFound, "stream " + stream_id + " not found");
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "stream " + stream_id + " is at version " + std::to_string(it->second.version));
  }
  it->second.version       = new_version;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteStream(Transaction& t, const std::string& stream_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.stream_events.find(stream_id);
  if (it != s.stream_events.end()) {
    for (const auto& e : it->second) s.sequence_index.erase(e.sequence);
    s.stream_events.erase(it);
  }
  s.streams.erase(stream_id);
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------

Result MemoryRepository::AppendEvents(Transaction& t, std::vector<model::EventRecord>& events) {
  auto& s = TX(t).Mutable();
  const auto now = util::ToUnixMillis(util::Now());

  for (auto& e : events) {
    auto& stream_events = s.stream_events[e.stream_id];
    const uint64_t last = stream_events.empty() ? 0 : stream_events.back().version;
    if (e.version <= last) {
      return Result::Err(ErrorCode::Conflict, "stream " + e.stream_id + " already has version " + std::to_string(e.version));
    }
    if (e.version != last + 1) {
      return Result::Err(ErrorCode::ConstraintViolation, "stream " + e.stream_id + " version gap at " + std::to_string(e.version));
    }

    e.sequence       = s.next_sequence++;
    e.recorded_at_ms = now;
    stream_events.push_back(e);
    s.sequence_index.emplace(e.sequence, std::make_pair(e.stream_id, stream_events.size() - 1));
  }
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadStreamEvents(Transaction& t, const std::string& stream_id, uint64_t from_version,
                                                                   uint64_t to_version, std::optional<uint64_t> max_events) {
  std::vector<model::EventRecord> out;
  const auto& s  = TX(t).View();
  const auto  it = s.stream_events.find(stream_id);
  if (it == s.stream_events.end()) return out;

  for (const auto& e : it->second) {
    if (e.version < from_version) continue;
    if (e.version > to_version) break;
    out.push_back(e);
    if (max_events.has_value() && out.size() >= *max_events) break;
  }
  return out;
}

std::vector<model::EventRecord> MemoryRepository::ReadAllEvents(Transaction& t, uint64_t after_sequence, std::optional<uint64_t> max_events) {
  std::vector<model::EventRecord> out;
  const auto& s = TX(t).View();

  for (auto it = s.sequence_index.upper_bound(after_sequence); it != s.sequence_index.end(); ++it) {
    const auto& [stream_id, index] = it->second;
    out.push_back(s.stream_events.at(stream_id).at(index));
    if (max_events.has_value() && out.size() >= *max_events) break;
  }
  return out;
}

Result MemoryRepository::DeleteAllEventData(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.streams.clear();
  s.stream_events.clear();
  s.sequence_index.clear();
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------

std::optional<model::DocumentRecord> MemoryRepository::GetDocument(Transaction& t, const std::string& type, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  by_type = s.documents.find(type);
  if (by_type == s.documents.end()) return std::nullopt;
  const auto it = by_type->second.find(id);
  if (it == by_type->second.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DocumentRecord> MemoryRepository::LockDocument(Transaction& t, const std::string& type, const std::string& id) {
  // the transaction already holds the repository write lock
  return GetDocument(t, type, id);
}

std::vector<model::DocumentRecord> MemoryRepository::ListDocuments(Transaction& t, const std::string& type) {
  std::vector<model::DocumentRecord> out;
  const auto& s       = TX(t).View();
  const auto  by_type = s.documents.find(type);
  if (by_type == s.documents.end()) return out;

  out.reserve(by_type->second.size());
  for (const auto& [_, doc] : by_type->second) out.push_back(doc);
  return out;
}

Result MemoryRepository::InsertDocument(Transaction& t, const model::DocumentRecord& r) {
  auto& docs = TX(t).Mutable().documents[r.type];
  if (docs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.type + "/" + r.id + " already exists");
  docs[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r, const std::string& expected_token) {
  auto& docs = TX(t).Mutable().documents[r.type];
  auto  it   = docs.find(r.id);
  if (it == docs.end() || it->second.version_token != expected_token) {
    return Result::Err(ErrorCode::Conflict, r.type + "/" + r.id + " version token mismatch");
  }
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
  TX(t).Mutable().documents[r.type][r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteDocument(Transaction& t, const std::string& type, const std::string& id) {
  auto& s       = TX(t).Mutable();
  auto  by_type = s.documents.find(type);
  if (by_type == s.documents.end() || by_type->second.erase(id) == 0) {
    return Result::Err(ErrorCode::NotFound, type + "/" + id + " not found");
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteAllDocuments(Transaction& t) {
  TX(t).Mutable().documents.clear();
  return Result::Ok();
}

} // namespace chronicle::db::memory
