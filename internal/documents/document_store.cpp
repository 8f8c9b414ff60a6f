#include "internal/documents/document_store.hpp"

#include <algorithm>

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chronicle::documents {

namespace {

std::string KeyOf(const std::string& type, const std::string& id) {
  return type + "/" + id;
}

struct Parsed {
  const Document*             doc;
  google::protobuf::Struct    fields;
};

google::protobuf::Struct ParseFields(const Document& doc) {
  google::protobuf::Struct out;
  const auto status = google::protobuf::util::JsonStringToMessage(doc.data, &out);
  if (!status.ok()) {
    throw util::SerializationError(KeyOf(doc.type, doc.id), "document is not a JSON object: " + status.ToString());
  }
  return out;
}

bool MatchesAll(const google::protobuf::Struct& fields, const Filter& filter) {
  return std::all_of(filter.begin(), filter.end(), [&](const Predicate& p) { return Matches(fields, p); });
}

} // namespace

DocumentStore::DocumentStore(std::shared_ptr<db::Repository> repo, std::shared_ptr<const codec::Codec> codec, IndexRegistry indexes)
    : repo_(std::move(repo)), codec_(std::move(codec)), indexes_(std::move(indexes)) {
}

void DocumentStore::CheckIndexed(const std::string& type, const std::string& field) const {
  if (!indexes_.IsIndexed(type, field)) {
    throw util::InvalidArgument(type, "field '" + field + "' is not an indexed field of " + type);
  }
}

std::optional<Document> DocumentStore::Get(const std::string& type, const std::string& id) const {
  return util::GuardStorage(KeyOf(type, id), [&] {
    auto tx  = repo_->Begin();
    auto doc = repo_->GetDocument(*tx, type, id);
    tx->Rollback();
    return doc;
  });
}

PutResult DocumentStore::Put(const std::string& type, const std::string& id, const std::string& data,
                             const std::optional<std::string>& expected_token) {
  if (type.empty() || id.empty()) {
    throw util::InvalidArgument(KeyOf(type, id), "document type and id must not be empty");
  }

  const auto key = KeyOf(type, id);

  Document record;
  record.type          = type;
  record.id            = id;
  record.data          = data;
  record.version_token = util::NewVersionToken();
  record.updated_at_ms = util::ToUnixMillis(util::Now());

  PutResult result = util::GuardStorage(key, [&] {
    auto tx = repo_->Begin();

    const auto r = expected_token.has_value() ? repo_->UpdateDocument(*tx, record, *expected_token) : repo_->UpsertDocument(*tx, record);

    PutResult out;
    if (r.IsRace()) {
      out.status  = util::WriteStatus::kConcurrencyConflict;
      out.message = r.message;
      return out;
    }
    if (!r) {
      throw util::StorageUnavailable(key, r.Describe());
    }

    tx->Commit();
    out.version_token = record.version_token;
    return out;
  });

  if (result.ok()) {
    CHRONICLE_LOG_DEBUG("Stored document", {observability::StringField("type", type), observability::StringField("id", id)});
  } else {
    CHRONICLE_LOG_WARN("Document write rejected", {observability::StringField("type", type), observability::StringField("id", id),
                                                   observability::StringField("status", util::Describe(result.status))});
  }
  return result;
}

bool DocumentStore::Delete(const std::string& type, const std::string& id) {
  const auto key = KeyOf(type, id);
  return util::GuardStorage(key, [&] {
    auto       tx = repo_->Begin();
    const auto r  = repo_->DeleteDocument(*tx, type, id);
    if (r.code == db::ErrorCode::NotFound) return false;
    if (!r) {
      throw util::StorageUnavailable(key, r.message);
    }
    tx->Commit();
    return true;
  });
}

std::size_t DocumentStore::DeleteWhere(const std::string& type, const Filter& filter) {
  for (const auto& p : filter) CheckIndexed(type, p.field);

  const auto deleted = util::GuardStorage(type, [&] {
    auto        tx    = repo_->Begin();
    std::size_t count = 0;

    for (const auto& doc : repo_->ListDocuments(*tx, type)) {
      if (!filter.empty() && !MatchesAll(ParseFields(doc), filter)) continue;

      const auto r = repo_->DeleteDocument(*tx, type, doc.id);
      if (!r) {
        throw util::StorageUnavailable(KeyOf(type, doc.id), r.message);
      }
      ++count;
    }

    tx->Commit();
    return count;
  });

  CHRONICLE_LOG_INFO("Deleted documents", {observability::StringField("type", type), observability::UintField("count", deleted)});
  return deleted;
}

std::vector<Document> DocumentStore::Query(const std::string& type, const DocumentQuery& query) const {
  for (const auto& p : query.filter) CheckIndexed(type, p.field);
  CheckIndexed(type, query.order_by);

  auto docs = util::GuardStorage(type, [&] {
    auto tx   = repo_->Begin();
    auto list = repo_->ListDocuments(*tx, type);
    tx->Rollback();
    return list;
  });

  std::vector<Parsed> matched;
  matched.reserve(docs.size());
  for (const auto& doc : docs) {
    auto fields = ParseFields(doc);
    if (MatchesAll(fields, query.filter)) matched.push_back({&doc, std::move(fields)});
  }

  const bool by_id = query.order_by.empty() || query.order_by == "id";
  std::stable_sort(matched.begin(), matched.end(), [&](const Parsed& a, const Parsed& b) {
    int c = by_id ? 0 : CompareField(Lookup(a.fields, query.order_by), Lookup(b.fields, query.order_by));
    if (c == 0) c = a.doc->id.compare(b.doc->id);
    return query.descending ? c > 0 : c < 0;
  });

  std::vector<Document> out;
  if (query.offset < matched.size()) {
    const std::size_t remaining = matched.size() - query.offset;
    const std::size_t end       = query.offset + (query.limit.has_value() ? std::min(*query.limit, remaining) : remaining);
    for (std::size_t i = query.offset; i < end; ++i) out.push_back(*matched[i].doc);
  }

  CHRONICLE_LOG_DEBUG("Queried documents", {observability::StringField("type", type), observability::UintField("matched", matched.size()),
                                            observability::UintField("returned", out.size())});
  return out;
}

std::size_t DocumentStore::Count(const std::string& type, const Filter& filter) const {
  DocumentQuery query;
  query.filter = filter;
  return Query(type, query).size();
}

void DocumentStore::DeleteAllDocuments() {
  util::GuardStorage("$documents", [&] {
    auto       tx = repo_->Begin();
    const auto r  = repo_->DeleteAllDocuments(*tx);
    if (!r) {
      throw util::StorageUnavailable("$documents", r.message);
    }
    tx->Commit();
  });
  CHRONICLE_LOG_WARN("Deleted all documents");
}

} // namespace chronicle::documents
