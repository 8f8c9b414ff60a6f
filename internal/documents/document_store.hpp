#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/codec/codec.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/documents/document_query.hpp"
#include "internal/documents/index_registry.hpp"
#include "internal/documents/put_result.hpp"

namespace chronicle::documents {

using Document = db::model::DocumentRecord;

template <typename TDoc>
struct Loaded {
  TDoc        doc;
  std::string version_token;
};

/*
  DocumentStore

  Keyed JSON documents with a version token that changes on every write.

  Put(expected_token = nullopt)  last write wins, creates if absent
  Put(expected_token = t)        compare-and-swap; a mismatch, or a
                                 missing document, is kConcurrencyConflict

  Projection documents live in the same table and may be read through
  this store like any other document.
*/
class DocumentStore {
 public:
  DocumentStore(std::shared_ptr<db::Repository> repo, std::shared_ptr<const codec::Codec> codec, IndexRegistry indexes);

  // nullopt when absent
  std::optional<Document> Get(const std::string& type, const std::string& id) const;

  PutResult Put(const std::string& type, const std::string& id, const std::string& data,
                const std::optional<std::string>& expected_token = std::nullopt);

  // false when absent
  bool Delete(const std::string& type, const std::string& id);

  std::size_t DeleteWhere(const std::string& type, const Filter& filter);

  // Throws util::InvalidArgument for fields not declared in the IndexRegistry.
  std::vector<Document> Query(const std::string& type, const DocumentQuery& query) const;

  std::size_t Count(const std::string& type, const Filter& filter = {}) const;

  void DeleteAllDocuments();

  const IndexRegistry& Indexes() const {
    return indexes_;
  }

  // ---------------------------------------------------------------------
  // Typed helpers; the document type is the message's full name
  // ---------------------------------------------------------------------

  template <typename TDoc>
  std::optional<Loaded<TDoc>> Load(const std::string& id) const {
    const auto& type = TDoc::descriptor()->full_name();
    auto        doc  = Get(type, id);
    if (!doc) return std::nullopt;
    return Loaded<TDoc>{codec_->DecodeAs<TDoc>(type, doc->data), doc->version_token};
  }

  template <typename TDoc>
  PutResult Store(const std::string& id, const TDoc& doc, const std::optional<std::string>& expected_token = std::nullopt) {
    return Put(TDoc::descriptor()->full_name(), id, codec_->Encode(doc).data, expected_token);
  }

  template <typename TDoc>
  std::vector<TDoc> QueryAs(const DocumentQuery& query) const {
    const auto&       type = TDoc::descriptor()->full_name();
    std::vector<TDoc> out;
    for (const auto& doc : Query(type, query)) out.push_back(codec_->DecodeAs<TDoc>(type, doc.data));
    return out;
  }

 private:
  void CheckIndexed(const std::string& type, const std::string& field) const;

  std::shared_ptr<db::Repository>     repo_;
  std::shared_ptr<const codec::Codec> codec_;
  IndexRegistry                       indexes_;
};

} // namespace chronicle::documents
