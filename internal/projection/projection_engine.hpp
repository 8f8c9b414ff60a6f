#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/codec/codec.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/projection/projection.hpp"

namespace chronicle::projection {

/*
  ProjectionEngine

  Holds the projections registered at startup and an index from event
  type to the projections that have a rule for it. Both are immutable
  after construction.

  Apply() runs inside the caller's append transaction: any failure
  propagates and the caller rolls back the whole append.
*/
class ProjectionEngine {
 public:
  ProjectionEngine(std::vector<std::shared_ptr<const Projection>> projections, std::shared_ptr<const codec::Codec> codec);

  void Apply(db::Repository& repo, db::Transaction& tx, const std::vector<events::RecordedEvent>& events) const;

  /*
    Deletes every document of document_type and replays the whole log
    through its projection in one transaction. Returns the number of
    events the projection had a rule for.
  */
  uint64_t Rebuild(db::Repository& repo, const std::string& document_type, uint32_t page_size) const;

  bool HasDocumentType(const std::string& document_type) const;

  std::vector<std::string> DocumentTypes() const;

 private:
  // true when a document was written
  bool ApplyOne(db::Repository& repo, db::Transaction& tx, const Projection& projection, const events::RecordedEvent& event) const;

  std::vector<std::shared_ptr<const Projection>>                         projections_;
  std::unordered_map<std::string, std::vector<const Projection*>>        by_event_type_;
  std::unordered_map<std::string, const Projection*>                     by_document_type_;
  std::shared_ptr<const codec::Codec>                                    codec_;
};

} // namespace chronicle::projection
